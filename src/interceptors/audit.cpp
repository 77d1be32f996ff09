#include "audit.hpp"
#include "../util.hpp"

static cliai::InterceptorRegistrar reg_audit("audit",
    [](const cliai::InterceptorConfig&) {
        return std::make_unique<cliai::AuditInterceptor>();
    });

namespace cliai {

AuditInterceptor::AuditInterceptor(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(timestamp_now)) {}

Payload AuditInterceptor::transform(Payload payload) {
    for (auto it = payload.messages.rbegin(); it != payload.messages.rend(); ++it) {
        if (it->role == Role::User) {
            it->content = "[sent " + clock_() + "] " + it->content;
            break;
        }
    }
    return payload;
}

} // namespace cliai
