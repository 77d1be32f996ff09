#pragma once
#include "config.hpp"
#include "conversation.hpp"
#include "message.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cliai {

// Request body for one turn. Built fresh per turn; only an interceptor may
// change it afterwards.
struct Payload {
    std::string model;
    std::vector<Message> messages;
    std::optional<double> temperature;
    std::optional<uint32_t> max_tokens;
    bool stream = true;
    nlohmann::json extra = nlohmann::json::object(); // provider fields passed through verbatim

    // {model, messages:[{role,content}], stream, temperature?, max_tokens?, ...extra}
    nlohmann::json to_json() const;
    std::string dump() const { return to_json().dump(); }
};

// Per-call overrides of the profile's sampling options.
struct PayloadOverrides {
    std::optional<std::string> model;
    std::optional<double> temperature;
    std::optional<uint32_t> max_tokens;
    std::optional<bool> stream;
};

struct PayloadLimits {
    double min_temperature = 0.0;
    double max_temperature = 2.0;
    uint32_t max_tokens_cap = 4096;
    size_t max_input_chars = 100000;
};

class PayloadBuilder {
public:
    explicit PayloadBuilder(PayloadLimits limits = {});

    // History from `conversation` (system prompt first), then `user_text`.
    // Throws ChatError(ConfigInvalid) on out-of-range options.
    Payload build(const ConnectionProfile& profile,
                  const Conversation& conversation,
                  const std::string& user_text,
                  const PayloadOverrides& overrides = {}) const;

    const PayloadLimits& limits() const { return limits_; }

private:
    void validate(const Payload& payload, const std::string& user_text) const;

    PayloadLimits limits_;
};

} // namespace cliai
