#include "sse.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace cliai {

// ── SSEParser ──────────────────────────────────────────────────

bool SSEParser::feed(const char* data, size_t len, const SSECallback& callback) {
    buffer_.append(data, len);

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete line stays buffered

        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        if (!process_line(std::move(line), callback)) {
            buffer_.erase(0, pos);
            return false;
        }
    }
    buffer_.erase(0, pos);
    return true;
}

bool SSEParser::flush(const SSECallback& callback) {
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!process_line(std::move(line), callback)) return false;
    }
    return dispatch(callback);
}

bool SSEParser::process_line(std::string line, const SSECallback& callback) {
    // Remove trailing \r if present
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (line.empty()) return dispatch(callback);
    if (line[0] == ':') return true; // comment / keep-alive

    std::string field = line;
    std::string value;
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        // Handle both "data: payload" (with space) and "data:payload" (without)
        size_t start = colon + 1;
        if (start < line.size() && line[start] == ' ') ++start;
        value = line.substr(start);
    }

    if (field == "data") {
        if (has_data_) data_ += '\n';
        data_ += value;
        has_data_ = true;
    } else if (field == "event") {
        event_ = value;
    }
    // id / retry / unknown fields are ignored
    return true;
}

bool SSEParser::dispatch(const SSECallback& callback) {
    if (!has_data_) {
        event_.clear();
        return true;
    }
    SSEEvent event{std::move(event_), std::move(data_)};
    event_.clear();
    data_.clear();
    has_data_ = false;
    return callback(event);
}

void SSEParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
}

// ── StreamDecoder ──────────────────────────────────────────────

StreamDecoder::StreamDecoder(DecoderOptions options) : options_(options) {
    if (options_.max_consecutive_malformed == 0) options_.max_consecutive_malformed = 1;
}

// Null, negative or non-numeric counts read as absent.
static uint32_t token_count(const json& u, const char* key, uint32_t fallback) {
    auto it = u.find(key);
    if (it == u.end() || !it->is_number_unsigned()) return fallback;
    return it->get<uint32_t>();
}

static TokenUsage parse_usage(const json& u) {
    TokenUsage usage;
    usage.prompt_tokens = token_count(u, "prompt_tokens", 0);
    usage.completion_tokens = token_count(u, "completion_tokens", 0);
    usage.total_tokens = token_count(u, "total_tokens",
                                     usage.prompt_tokens + usage.completion_tokens);
    return usage;
}

static std::string error_message_of(const json& err) {
    if (err.is_string()) return err.get<std::string>();
    if (err.is_object()) {
        if (err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
    }
    return err.dump();
}

bool StreamDecoder::emit_terminal(const StreamEvent& event, const EventSink& sink) {
    finished_ = true;
    sink(event);
    return false;
}

bool StreamDecoder::handle(const SSEEvent& sse, const EventSink& sink) {
    std::string data = trim(sse.data);
    if (data == "[DONE]") {
        return emit_terminal(StreamEvent::done(
            finish_reason_.empty() ? "stop" : finish_reason_, usage_), sink);
    }

    if (sse.event == "error") {
        std::string message = data;
        try {
            json err = json::parse(data);
            message = error_message_of(err.contains("error") ? err["error"] : err);
        } catch (const json::exception&) { // NOLINT(bugprone-empty-catch)
        }
        return emit_terminal(StreamEvent::error(ErrorKind::ProviderError,
                                                "Provider error: " + message), sink);
    }

    if (data.empty()) return true;

    json payload;
    try {
        payload = json::parse(data);
    } catch (const json::exception&) {
        payload = nullptr;
    }

    if (!payload.is_object()) {
        ++malformed_run_;
        std::cerr << "[sse] Skipping malformed event (" << malformed_run_ << "/"
                  << options_.max_consecutive_malformed << "): "
                  << truncate(data, 80) << '\n';
        if (malformed_run_ >= options_.max_consecutive_malformed) {
            return emit_terminal(StreamEvent::error(ErrorKind::StreamCorrupt,
                std::to_string(malformed_run_) + " consecutive malformed stream events"), sink);
        }
        return true;
    }
    malformed_run_ = 0;

    if (payload.contains("error") && !payload["error"].is_null()) {
        long status = 0;
        const auto& err = payload["error"];
        if (err.is_object() && err.contains("code") && err["code"].is_number_integer())
            status = err["code"].get<long>();
        return emit_terminal(StreamEvent::error(ErrorKind::ProviderError,
            "Provider error: " + error_message_of(err), status), sink);
    }

    if (payload.contains("usage") && payload["usage"].is_object()) {
        usage_ = parse_usage(payload["usage"]);
    }

    std::string text;
    if (payload.contains("choices") && payload["choices"].is_array() &&
        !payload["choices"].empty()) {
        const auto& choice = payload["choices"][0];
        if (choice.contains("delta") && choice["delta"].is_object()) {
            const auto& delta = choice["delta"];
            if (delta.contains("content") && delta["content"].is_string())
                text = delta["content"].get<std::string>();
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string())
            finish_reason_ = choice["finish_reason"].get<std::string>();
    } else if (payload.contains("delta") && payload["delta"].is_string()) {
        text = payload["delta"].get<std::string>();
    }

    if (text.empty()) return true;
    text_ += text;
    if (!sink(StreamEvent::delta(std::move(text)))) {
        stopped_ = true;
        return false;
    }
    return true;
}

bool StreamDecoder::feed(const char* data, size_t len, const EventSink& sink) {
    if (finished_ || stopped_) return false;
    parser_.feed(data, len, [&](const SSEEvent& sse) { return handle(sse, sink); });
    return !finished_ && !stopped_;
}

void StreamDecoder::finish(const EventSink& sink) {
    if (finished_ || stopped_) return;
    parser_.flush([&](const SSEEvent& sse) { return handle(sse, sink); });
    if (finished_ || stopped_) return;

    if (!finish_reason_.empty()) {
        emit_terminal(StreamEvent::done(finish_reason_, usage_), sink);
        return;
    }
    std::cerr << "[sse] Stream ended without [DONE] after " << text_.size() << " chars\n";
    emit_terminal(StreamEvent::error(ErrorKind::StreamCorrupt,
                                     "Stream ended before completion (truncated response)"),
                  sink);
}

// ── Non-streaming adapter ──────────────────────────────────────

std::vector<StreamEvent> decode_completion(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return {StreamEvent::error(ErrorKind::StreamCorrupt,
                                   std::string("Malformed response body: ") + e.what())};
    }

    if (j.is_object() && j.contains("error") && !j["error"].is_null()) {
        return {StreamEvent::error(ErrorKind::ProviderError,
                                   "Provider error: " + error_message_of(j["error"]))};
    }
    if (!j.is_object() || !j.contains("choices") || !j["choices"].is_array() ||
        j["choices"].empty()) {
        return {StreamEvent::error(ErrorKind::StreamCorrupt,
                                   "Unexpected response shape: " + truncate(body, 120))};
    }

    const auto& choice = j["choices"][0];
    std::string content;
    if (choice.contains("message") && choice["message"].is_object()) {
        const auto& msg = choice["message"];
        if (msg.contains("content") && msg["content"].is_string())
            content = msg["content"].get<std::string>();
    }
    std::string finish_reason = "stop";
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string())
        finish_reason = choice["finish_reason"].get<std::string>();

    std::optional<TokenUsage> usage;
    if (j.contains("usage") && j["usage"].is_object()) usage = parse_usage(j["usage"]);

    std::vector<StreamEvent> events;
    if (!content.empty()) events.push_back(StreamEvent::delta(content));
    events.push_back(StreamEvent::done(finish_reason, usage));
    return events;
}

} // namespace cliai
