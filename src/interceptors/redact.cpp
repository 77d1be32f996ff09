#include "redact.hpp"
#include "../util.hpp"
#include <algorithm>
#include <regex>

static cliai::InterceptorRegistrar reg_redact("redact",
    [](const cliai::InterceptorConfig& config) {
        return std::make_unique<cliai::RedactingInterceptor>(config.redact_terms);
    });

namespace cliai {

namespace {

struct Pattern {
    const char* category;
    std::regex re;
};

// Ordered so that wider matches (bearer headers, keys) are seen before the
// shorter values they may contain.
const std::vector<Pattern>& patterns() {
    static const std::vector<Pattern> kPatterns = {
        {"BEARER",  std::regex(R"([Bb]earer\s+[A-Za-z0-9._~+/=-]{16,})")},
        {"API_KEY", std::regex(R"(\b(?:sk|gsk|pk|rk)[-_][A-Za-z0-9_-]{16,})")},
        {"AWS_KEY", std::regex(R"(\bAKIA[0-9A-Z]{16}\b)")},
        {"EMAIL",   std::regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})")},
        {"UUID",    std::regex(R"(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\b)")},
        {"IPV4",    std::regex(R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)")},
    };
    return kPatterns;
}

} // namespace

Redactor::Redactor(std::unordered_map<std::string, std::string> user_terms) {
    for (auto& [term, placeholder] : user_terms) {
        if (!term.empty()) user_terms_.emplace_back(term, placeholder);
    }
    std::sort(user_terms_.begin(), user_terms_.end(),
              [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
}

void Redactor::remember(const std::string& original, const std::string& placeholder) {
    if (forward_.count(original)) return;
    forward_[original] = placeholder;
    reverse_[placeholder] = original;
    order_.push_back(original);
}

std::string Redactor::placeholder_for(const std::string& value, const std::string& category) {
    auto it = forward_.find(value);
    if (it != forward_.end()) return it->second;
    std::string placeholder = "[" + category + "_" + std::to_string(++counters_[category]) + "]";
    remember(value, placeholder);
    return placeholder;
}

std::string Redactor::redact(const std::string& text) {
    // User-defined terms take priority over pattern detection
    for (const auto& [term, placeholder] : user_terms_) {
        if (text.find(term) != std::string::npos) remember(term, placeholder);
    }

    for (const auto& p : patterns()) {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), p.re);
             it != std::sregex_iterator(); ++it) {
            std::string value = it->str();
            if (value.size() < 4 && std::string(p.category) != "IPV4") continue;
            placeholder_for(value, p.category);
        }
    }

    // Longest originals first so a value is never partially replaced
    std::vector<std::string> present;
    for (const auto& original : order_) {
        if (text.find(original) != std::string::npos) present.push_back(original);
    }
    std::sort(present.begin(), present.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    std::string out = text;
    for (const auto& original : present) {
        out = replace_all(out, original, forward_.at(original));
    }
    return out;
}

std::string Redactor::unredact(const std::string& text) const {
    std::vector<std::pair<std::string, std::string>> entries(reverse_.begin(), reverse_.end());
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
    std::string out = text;
    for (const auto& [placeholder, original] : entries) {
        out = replace_all(out, placeholder, original);
    }
    return out;
}

size_t Redactor::partial_placeholder(const std::string& text) const {
    size_t longest = 0;
    for (const auto& entry : reverse_) {
        const std::string& placeholder = entry.first;
        if (placeholder.empty()) continue;
        for (size_t k = std::min(placeholder.size() - 1, text.size()); k > longest; --k) {
            if (text.compare(text.size() - k, k, placeholder, 0, k) == 0) {
                longest = k;
                break;
            }
        }
    }
    return longest;
}

std::vector<std::string> Redactor::placeholders_in(const std::string& text) const {
    std::vector<std::string> found;
    for (const auto& entry : reverse_) {
        if (!entry.first.empty() && text.find(entry.first) != std::string::npos)
            found.push_back(entry.first);
    }
    std::sort(found.begin(), found.end());
    return found;
}

std::vector<std::pair<std::string, std::string>> Redactor::mapping() const {
    std::vector<std::pair<std::string, std::string>> result;
    result.reserve(order_.size());
    for (const auto& original : order_) {
        result.emplace_back(original, forward_.at(original));
    }
    return result;
}

RedactingInterceptor::RedactingInterceptor(std::unordered_map<std::string, std::string> user_terms)
    : redactor_(std::move(user_terms)) {}

Payload RedactingInterceptor::transform(Payload payload) {
    std::string sent;
    for (auto& msg : payload.messages) {
        msg.content = redactor_.redact(msg.content);
        sent += msg.content;
        sent += '\n';
    }

    auto tokens = redactor_.placeholders_in(sent);
    if (tokens.empty() || payload.messages.empty()) return payload;

    // Placed just before the turn's own message
    std::string hint = "Some values in this conversation were replaced with placeholder tokens: ";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) hint += ", ";
        hint += tokens[i];
    }
    hint += ". When you refer to those values, repeat the tokens exactly as written. "
            "Do not guess the original values.";
    payload.messages.insert(payload.messages.end() - 1, Message{Role::System, std::move(hint)});
    return payload;
}

std::string RedactingInterceptor::describe() const {
    auto entries = redactor_.mapping();
    if (entries.empty()) return "No redactions yet.";
    std::string out = "Redactions:\n";
    for (const auto& [original, placeholder] : entries) {
        out += "  " + placeholder + " <- " + original + "\n";
    }
    return out;
}

} // namespace cliai
