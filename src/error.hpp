#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

namespace cliai {

enum class ErrorKind {
    HostNotAllowed,
    Timeout,
    RateLimited,
    ProviderError,
    StreamCorrupt,
    Cancelled,
    ConfigInvalid,
    ConnectionFailed,
    InterceptorFailed
};

// Stable display name, e.g. "HostNotAllowed"
const char* error_kind_name(ErrorKind kind);

// Every failure a turn can end with. Thrown by the core components and
// converted into the terminal Error event by the session worker.
class ChatError : public std::runtime_error {
public:
    ChatError(ErrorKind kind, const std::string& message,
              long status_code = 0, uint32_t attempts = 0, uint64_t elapsed_ms = 0);

    ErrorKind kind() const { return kind_; }
    long status_code() const { return status_code_; }
    uint32_t attempts() const { return attempts_; }
    uint64_t elapsed_ms() const { return elapsed_ms_; }

    // True for failures a later /retry may get past (transient transport).
    bool retryable() const;

private:
    ErrorKind kind_;
    long status_code_;
    uint32_t attempts_;
    uint64_t elapsed_ms_;
};

} // namespace cliai
