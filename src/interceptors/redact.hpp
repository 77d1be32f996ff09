#pragma once
#include "../interceptor.hpp"
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>

namespace cliai {

// Reversible masking of sensitive values. The same original always maps to
// the same placeholder for the lifetime of the Redactor.
class Redactor {
public:
    explicit Redactor(std::unordered_map<std::string, std::string> user_terms = {});

    std::string redact(const std::string& text);

    // Replace placeholders with their originals
    std::string unredact(const std::string& text) const;

    // Longest suffix of `text` that is a proper prefix of a placeholder
    size_t partial_placeholder(const std::string& text) const;

    // Placeholders occurring in `text`, sorted
    std::vector<std::string> placeholders_in(const std::string& text) const;

    // (original, placeholder) pairs in first-seen order
    std::vector<std::pair<std::string, std::string>> mapping() const;

private:
    std::string placeholder_for(const std::string& value, const std::string& category);
    void remember(const std::string& original, const std::string& placeholder);

    std::vector<std::pair<std::string, std::string>> user_terms_; // longest first
    std::unordered_map<std::string, std::string> forward_;
    std::unordered_map<std::string, std::string> reverse_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, uint32_t> counters_;
};

// Redacts every message's content before transmission and tells the model
// to echo placeholders verbatim, so replies can be unredacted locally.
class RedactingInterceptor : public Interceptor {
public:
    explicit RedactingInterceptor(std::unordered_map<std::string, std::string> user_terms = {});

    Payload transform(Payload payload) override;
    std::string name() const override { return "redact"; }
    std::string describe() const override;
    std::string restore(const std::string& text) const override {
        return redactor_.unredact(text);
    }
    size_t pending_suffix(const std::string& text) const override {
        return redactor_.partial_placeholder(text);
    }

    Redactor& redactor() { return redactor_; }

private:
    Redactor redactor_;
};

} // namespace cliai
