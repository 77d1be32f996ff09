#pragma once
#include "error.hpp"
#include "message.hpp"
#include <cstdint>
#include <string>
#include <optional>

namespace cliai {

// One item of a turn's event sequence. TextDelta carries incremental
// assistant text; Done and Error are terminal and end the sequence.
struct StreamEvent {
    enum class Type { TextDelta, Done, Error };

    Type type = Type::TextDelta;
    std::string text;                 // TextDelta
    std::string finish_reason;        // Done
    std::optional<TokenUsage> usage;  // Done
    ErrorKind error_kind = ErrorKind::ProviderError; // Error
    long status_code = 0;             // Error
    std::string message;              // Error
    uint32_t attempts = 0;            // Error, when raised by the transport
    uint64_t elapsed_ms = 0;          // Error

    bool is_terminal() const { return type != Type::TextDelta; }
    bool is_delta() const { return type == Type::TextDelta; }
    bool is_done() const { return type == Type::Done; }
    bool is_error() const { return type == Type::Error; }

    static StreamEvent delta(std::string text) {
        StreamEvent ev;
        ev.type = Type::TextDelta;
        ev.text = std::move(text);
        return ev;
    }

    static StreamEvent done(std::string finish_reason = "stop",
                            std::optional<TokenUsage> usage = std::nullopt) {
        StreamEvent ev;
        ev.type = Type::Done;
        ev.finish_reason = std::move(finish_reason);
        ev.usage = usage;
        return ev;
    }

    static StreamEvent error(ErrorKind kind, std::string message, long status_code = 0) {
        StreamEvent ev;
        ev.type = Type::Error;
        ev.error_kind = kind;
        ev.message = std::move(message);
        ev.status_code = status_code;
        return ev;
    }

    static StreamEvent error(const ChatError& e) {
        StreamEvent ev = error(e.kind(), e.what(), e.status_code());
        ev.attempts = e.attempts();
        ev.elapsed_ms = e.elapsed_ms();
        return ev;
    }
};

} // namespace cliai
