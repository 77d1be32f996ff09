#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace cliai {

// Fully resolved endpoint settings. Immutable for the duration of a turn.
struct ConnectionProfile {
    std::string name = "default";
    std::string endpoint = "http://localhost:11434/v1";
    std::string api_key;
    std::string model = "llama3";
    std::optional<double> temperature = 0.7;
    std::optional<uint32_t> max_tokens;
    std::string system_prompt;
    bool stream = true;
    long timeout_seconds = 120;

    // <endpoint>/chat/completions, tolerating a trailing slash on endpoint
    std::string chat_url() const;

    // Masked API key for display
    std::string display_key() const;
};

struct AllowlistPolicy {
    bool enforced = false;
    std::vector<std::string> hosts; // "api.openai.com", "*.groq.com", "10.0.0.0/8"
};

struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double jitter = 0.1; // +/- fraction of the computed delay
    std::vector<long> retryable_status{429, 500, 502, 503, 504};
    bool retry_on_timeout = true;
    bool retry_on_connection_error = true;

    bool is_retryable_status(long status) const;
};

struct StreamConfig {
    uint32_t max_consecutive_malformed = 3;
    size_t queue_capacity = 64;
};

struct LimitsConfig {
    uint32_t max_tokens_cap = 4096;
    size_t max_input_chars = 100000;
};

struct InterceptorConfig {
    std::string name = "none";
    std::unordered_map<std::string, std::string> redact_terms; // term -> placeholder
};

struct Config {
    std::string default_profile = "default";
    std::unordered_map<std::string, ConnectionProfile> profiles;
    AllowlistPolicy security;
    RetryPolicy retry;
    StreamConfig stream;
    LimitsConfig limits;
    InterceptorConfig interceptor;

    // Load ~/.cliai/config.json (defaults when absent or malformed), then
    // apply CLIAI_* environment overrides. Never writes the file.
    static Config load();

    // Parse a config document merged over defaults_json().
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Security overrides: CLIAI_ALLOWED_HOSTS, CLIAI_ENFORCE_ALLOWLIST
    void apply_env();

    // Named profile (empty = CLIAI_PROFILE, then default_profile) with
    // CLIAI_ENDPOINT/API_KEY/MODEL/... overrides applied.
    // Throws ChatError(ConfigInvalid) for an unknown profile.
    ConnectionProfile resolve_profile(const std::string& name = "") const;
};

} // namespace cliai
