#pragma once
#include "config.hpp"
#include "payload.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace cliai {

// Payload transform applied once per turn, after the payload is built and
// before the allowlist gate. Throwing fails the turn before any network access.
class Interceptor {
public:
    virtual ~Interceptor() = default;

    virtual Payload transform(Payload payload) = 0;
    virtual std::string name() const = 0;

    // Human-readable state for /redact-style inspection (empty = nothing to show)
    virtual std::string describe() const { return {}; }

    // Maps model output back for display and history, undoing what
    // transform() masked.
    virtual std::string restore(const std::string& text) const { return text; }

    // Length of a trailing fragment of streamed output that may still grow
    // into something restore() rewrites; it is held back until it can't.
    virtual size_t pending_suffix(const std::string& /*text*/) const { return 0; }
};

class IdentityInterceptor : public Interceptor {
public:
    Payload transform(Payload payload) override { return payload; }
    std::string name() const override { return "none"; }
};

// Adapts a plain function, e.g. one supplied by an embedding application.
class FunctionInterceptor : public Interceptor {
public:
    using Fn = std::function<Payload(Payload)>;

    FunctionInterceptor(std::string name, Fn fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    Payload transform(Payload payload) override { return fn_(std::move(payload)); }
    std::string name() const override { return name_; }

private:
    std::string name_;
    Fn fn_;
};

using InterceptorFactory = std::function<std::unique_ptr<Interceptor>(
    const InterceptorConfig& config)>;

// Registry of named interceptors, filled by file-scope registrars.
// All methods are thread-safe.
class InterceptorRegistry {
public:
    static InterceptorRegistry& instance();

    void register_interceptor(const std::string& name, InterceptorFactory factory);

    // Throws ChatError(ConfigInvalid) for an unknown name.
    std::unique_ptr<Interceptor> create(const std::string& name,
                                        const InterceptorConfig& config) const;

    std::vector<std::string> names() const;
    bool has(const std::string& name) const;

private:
    InterceptorRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, InterceptorFactory> factories_;
};

struct InterceptorRegistrar {
    InterceptorRegistrar(const std::string& name, InterceptorFactory factory) {
        InterceptorRegistry::instance().register_interceptor(name, std::move(factory));
    }
};

} // namespace cliai
