#pragma once
#include "../interceptor.hpp"
#include <functional>
#include <string>

namespace cliai {

// Prefixes the most recent user message with "[sent <UTC timestamp>] ".
class AuditInterceptor : public Interceptor {
public:
    using Clock = std::function<std::string()>;

    explicit AuditInterceptor(Clock clock = {});

    Payload transform(Payload payload) override;
    std::string name() const override { return "audit"; }

private:
    Clock clock_;
};

} // namespace cliai
