#pragma once
#include "stream_event.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>

namespace cliai {

struct SSEEvent {
    std::string event; // event type from "event:" (empty = default "message")
    std::string data;  // data lines joined with '\n'
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental SSE line parser. Chunks may split lines (or CRLF pairs)
// anywhere; the pending event survives across feed() calls.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback stopped parsing.
    bool feed(const char* data, size_t len, const SSECallback& callback);
    bool feed(const std::string& chunk, const SSECallback& callback) {
        return feed(chunk.data(), chunk.size(), callback);
    }

    // Dispatch a trailing unterminated line/event at end of body
    bool flush(const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    bool process_line(std::string line, const SSECallback& callback);
    bool dispatch(const SSECallback& callback);

    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
};

// Receives decoded events. Return false to stop decoding.
using EventSink = std::function<bool(const StreamEvent& event)>;

struct DecoderOptions {
    uint32_t max_consecutive_malformed = 3;
};

// Turns an OpenAI-compatible SSE body into TextDelta events followed by
// exactly one terminal Done or Error. Single pass; not restartable.
class StreamDecoder {
public:
    explicit StreamDecoder(DecoderOptions options = {});

    // Returns false once a terminal event was emitted or the sink stopped.
    bool feed(const char* data, size_t len, const EventSink& sink);

    // End of body: emits the terminal event if none was emitted yet.
    void finish(const EventSink& sink);

    bool finished() const { return finished_; }
    const std::string& text() const { return text_; }
    const std::optional<TokenUsage>& usage() const { return usage_; }
    const std::string& finish_reason() const { return finish_reason_; }

private:
    bool handle(const SSEEvent& sse, const EventSink& sink);
    bool emit_terminal(const StreamEvent& event, const EventSink& sink);

    DecoderOptions options_;
    SSEParser parser_;
    std::string text_;
    std::string finish_reason_;
    std::optional<TokenUsage> usage_;
    uint32_t malformed_run_ = 0;
    bool finished_ = false;
    bool stopped_ = false;
};

// Non-streaming adapter: {"choices":[{"message":{"content":...}}]} becomes
// TextDelta (when non-empty) + Done, or a single Error.
std::vector<StreamEvent> decode_completion(const std::string& body);

} // namespace cliai
