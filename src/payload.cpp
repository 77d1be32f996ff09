#include "payload.hpp"
#include "error.hpp"
#include "util.hpp"

#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace cliai {

json Payload::to_json() const {
    json request = extra.is_object() ? extra : json::object();
    request["model"] = model;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    request["stream"] = stream;

    if (temperature.has_value()) request["temperature"] = *temperature;
    if (max_tokens.has_value()) request["max_tokens"] = *max_tokens;

    // Ask for a final usage chunk when streaming
    if (stream && !request.contains("stream_options")) {
        request["stream_options"] = {{"include_usage", true}};
    }
    return request;
}

PayloadBuilder::PayloadBuilder(PayloadLimits limits) : limits_(limits) {}

Payload PayloadBuilder::build(const ConnectionProfile& profile,
                              const Conversation& conversation,
                              const std::string& user_text,
                              const PayloadOverrides& overrides) const {
    Payload payload;
    payload.model = overrides.model.value_or(profile.model);
    payload.temperature = overrides.temperature.has_value()
        ? overrides.temperature : profile.temperature;
    payload.max_tokens = overrides.max_tokens.has_value()
        ? overrides.max_tokens : profile.max_tokens;
    payload.stream = overrides.stream.value_or(profile.stream);

    payload.messages = conversation.wire_messages();
    payload.messages.push_back(Message{Role::User, user_text});

    validate(payload, user_text);
    return payload;
}

void PayloadBuilder::validate(const Payload& payload, const std::string& user_text) const {
    if (trim(payload.model).empty()) {
        throw ChatError(ErrorKind::ConfigInvalid, "No model configured");
    }
    if (trim(user_text).empty()) {
        throw ChatError(ErrorKind::ConfigInvalid, "Message is empty");
    }
    if (payload.temperature.has_value()) {
        double t = *payload.temperature;
        if (!std::isfinite(t) || t < limits_.min_temperature || t > limits_.max_temperature) {
            std::ostringstream msg;
            msg << "temperature " << t << " outside valid range ["
                << limits_.min_temperature << ", " << limits_.max_temperature << "]";
            throw ChatError(ErrorKind::ConfigInvalid, msg.str());
        }
    }
    if (payload.max_tokens.has_value()) {
        uint32_t n = *payload.max_tokens;
        if (n == 0 || n > limits_.max_tokens_cap) {
            throw ChatError(ErrorKind::ConfigInvalid,
                            "max_tokens " + std::to_string(n) + " outside valid range [1, " +
                            std::to_string(limits_.max_tokens_cap) + "]");
        }
    }
    if (user_text.size() > limits_.max_input_chars) {
        throw ChatError(ErrorKind::ConfigInvalid,
                        "Message is " + std::to_string(user_text.size()) +
                        " characters; limit is " + std::to_string(limits_.max_input_chars));
    }
}

} // namespace cliai
