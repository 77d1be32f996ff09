#include "conversation.hpp"
#include "error.hpp"

namespace cliai {

Conversation::Conversation(std::string system_prompt)
    : system_prompt_(std::move(system_prompt)) {}

void Conversation::add_user(const std::string& content) {
    messages_.push_back(Message{Role::User, content});
}

void Conversation::add_assistant(const std::string& content) {
    messages_.push_back(Message{Role::Assistant, content});
}

std::vector<Message> Conversation::wire_messages() const {
    std::vector<Message> out;
    out.reserve(messages_.size() + 1);
    if (!system_prompt_.empty()) {
        out.push_back(Message{Role::System, system_prompt_});
    }
    out.insert(out.end(), messages_.begin(), messages_.end());
    return out;
}

std::optional<std::string> Conversation::last_user_message() const {
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (it->role == Role::User) return it->content;
    }
    return std::nullopt;
}

bool Conversation::ends_with_exchange(const std::string& user_text) const {
    size_t n = messages_.size();
    if (n < 2) return false;
    return messages_[n - 1].role == Role::Assistant &&
           messages_[n - 2].role == Role::User &&
           messages_[n - 2].content == user_text;
}

std::optional<std::string> Conversation::pop_last_exchange() {
    for (size_t i = messages_.size(); i-- > 0; ) {
        if (messages_[i].role == Role::Assistant) {
            messages_.erase(messages_.begin() + static_cast<std::ptrdiff_t>(i));
            break;
        }
    }
    for (size_t i = messages_.size(); i-- > 0; ) {
        if (messages_[i].role == Role::User) {
            std::string content = std::move(messages_[i].content);
            messages_.erase(messages_.begin() + static_cast<std::ptrdiff_t>(i));
            return content;
        }
    }
    return std::nullopt;
}

void Conversation::trim_to_last_n(size_t n) {
    if (messages_.size() > n) {
        messages_.erase(messages_.begin(),
                        messages_.end() - static_cast<std::ptrdiff_t>(n));
    }
}

nlohmann::json Conversation::to_json() const {
    nlohmann::json msgs = nlohmann::json::array();
    for (const auto& m : messages_) {
        msgs.push_back({{"role", role_to_string(m.role)}, {"content", m.content}});
    }
    return {{"system_prompt", system_prompt_}, {"messages", msgs}};
}

Conversation Conversation::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ChatError(ErrorKind::ConfigInvalid, "transcript must be a JSON object");
    }
    Conversation conv(j.value("system_prompt", ""));
    if (j.contains("messages") && j["messages"].is_array()) {
        for (const auto& m : j["messages"]) {
            if (!m.is_object()) continue;
            auto role = role_from_string(m.value("role", ""));
            if (!role || *role == Role::System) {
                throw ChatError(ErrorKind::ConfigInvalid,
                                "transcript has invalid role: " + m.value("role", ""));
            }
            conv.messages_.push_back(Message{*role, m.value("content", "")});
        }
    }
    return conv;
}

} // namespace cliai
