#pragma once
#include "message.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace cliai {

// Ordered transcript of one chat. Append-only during turns; clear, pop and
// trim are caller operations between turns.
class Conversation {
public:
    explicit Conversation(std::string system_prompt = "");

    const std::string& system_prompt() const { return system_prompt_; }
    void set_system_prompt(const std::string& prompt) { system_prompt_ = prompt; }

    void add_user(const std::string& content);
    void add_assistant(const std::string& content);

    const std::vector<Message>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

    // Messages in submission order: system prompt (if set) first.
    std::vector<Message> wire_messages() const;

    std::optional<std::string> last_user_message() const;

    // True when the transcript ends with user_text followed by an assistant reply.
    bool ends_with_exchange(const std::string& user_text) const;

    // Remove the last assistant message and the last user message.
    // Returns the user content for re-sending, or nullopt.
    std::optional<std::string> pop_last_exchange();

    // Clear messages (keeps the system prompt)
    void clear() { messages_.clear(); }

    // Keep only the last n messages
    void trim_to_last_n(size_t n);

    nlohmann::json to_json() const;
    static Conversation from_json(const nlohmann::json& j);

private:
    std::string system_prompt_;
    std::vector<Message> messages_;
};

} // namespace cliai
