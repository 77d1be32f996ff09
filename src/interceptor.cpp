#include "interceptor.hpp"
#include "error.hpp"
#include <algorithm>

static cliai::InterceptorRegistrar reg_none("none",
    [](const cliai::InterceptorConfig&) {
        return std::make_unique<cliai::IdentityInterceptor>();
    });

namespace cliai {

InterceptorRegistry& InterceptorRegistry::instance() {
    static InterceptorRegistry registry;
    return registry;
}

void InterceptorRegistry::register_interceptor(const std::string& name,
                                               InterceptorFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[name] = std::move(factory);
}

std::unique_ptr<Interceptor> InterceptorRegistry::create(const std::string& name,
                                                         const InterceptorConfig& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factories_.find(name.empty() ? "none" : name);
    if (it == factories_.end()) {
        throw ChatError(ErrorKind::ConfigInvalid, "Unknown interceptor: " + name);
    }
    return it->second(config);
}

std::vector<std::string> InterceptorRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool InterceptorRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(name) > 0;
}

} // namespace cliai
