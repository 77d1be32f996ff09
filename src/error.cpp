#include "error.hpp"

namespace cliai {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::HostNotAllowed:    return "HostNotAllowed";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::RateLimited:       return "RateLimited";
        case ErrorKind::ProviderError:     return "ProviderError";
        case ErrorKind::StreamCorrupt:     return "StreamCorrupt";
        case ErrorKind::Cancelled:         return "Cancelled";
        case ErrorKind::ConfigInvalid:     return "ConfigInvalid";
        case ErrorKind::ConnectionFailed:  return "ConnectionFailed";
        case ErrorKind::InterceptorFailed: return "InterceptorFailed";
    }
    return "Unknown";
}

ChatError::ChatError(ErrorKind kind, const std::string& message,
                     long status_code, uint32_t attempts, uint64_t elapsed_ms)
    : std::runtime_error(message),
      kind_(kind), status_code_(status_code),
      attempts_(attempts), elapsed_ms_(elapsed_ms) {}

bool ChatError::retryable() const {
    switch (kind_) {
        case ErrorKind::Timeout:
        case ErrorKind::RateLimited:
        case ErrorKind::ConnectionFailed:
        case ErrorKind::StreamCorrupt:
        case ErrorKind::Cancelled:
            return true;
        case ErrorKind::ProviderError:
            return status_code_ >= 500;
        default:
            return false;
    }
}

} // namespace cliai
