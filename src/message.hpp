#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace cliai {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

inline std::optional<Role> role_from_string(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    return std::nullopt;
}

struct Message {
    Role role;
    std::string content;
};

inline bool operator==(const Message& a, const Message& b) {
    return a.role == b.role && a.content == b.content;
}

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

} // namespace cliai
