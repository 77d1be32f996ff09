#include "config.hpp"
#include "error.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace cliai {

std::string ConnectionProfile::chat_url() const {
    std::string base = endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/chat/completions";
}

std::string ConnectionProfile::display_key() const {
    if (api_key.empty()) return "(none)";
    if (api_key.size() <= 8) return "****";
    return api_key.substr(0, 4) + "..." + api_key.substr(api_key.size() - 4);
}

bool RetryPolicy::is_retryable_status(long status) const {
    return std::find(retryable_status.begin(), retryable_status.end(), status) !=
           retryable_status.end();
}

nlohmann::json Config::defaults_json() {
    return {
        {"default_profile", "default"},
        {"profiles", {
            {"default", {
                {"endpoint", "http://localhost:11434/v1"},
                {"api_key", ""},
                {"model", "llama3"},
                {"temperature", 0.7},
                {"max_tokens", nullptr},
                {"system_prompt", ""},
                {"stream", true},
                {"timeout", 120}
            }}
        }},
        {"security", {
            {"enforce_allowlist", false},
            {"allowed_hosts", nlohmann::json::array()}
        }},
        {"retry", {
            {"max_attempts", 3},
            {"base_delay_ms", 1000},
            {"max_delay_ms", 30000},
            {"jitter", 0.1}
        }},
        {"stream", {
            {"max_consecutive_malformed", 3},
            {"queue_capacity", 64}
        }},
        {"limits", {
            {"max_tokens_cap", 4096},
            {"max_input_chars", 100000}
        }},
        {"interceptor", {
            {"name", "none"},
            {"redact_terms", nlohmann::json::object()}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object() && key != "profiles") {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static ConnectionProfile parse_profile(const std::string& name, const nlohmann::json& p) {
    ConnectionProfile prof;
    prof.name = name;
    if (p.contains("endpoint") && p["endpoint"].is_string())
        prof.endpoint = p["endpoint"].get<std::string>();
    if (p.contains("api_key") && p["api_key"].is_string())
        prof.api_key = p["api_key"].get<std::string>();
    if (p.contains("model") && p["model"].is_string())
        prof.model = p["model"].get<std::string>();
    if (p.contains("temperature")) {
        if (p["temperature"].is_number())
            prof.temperature = p["temperature"].get<double>();
        else if (p["temperature"].is_null())
            prof.temperature = std::nullopt;
    }
    if (p.contains("max_tokens") && p["max_tokens"].is_number_unsigned())
        prof.max_tokens = p["max_tokens"].get<uint32_t>();
    if (p.contains("system_prompt") && p["system_prompt"].is_string())
        prof.system_prompt = p["system_prompt"].get<std::string>();
    if (p.contains("stream") && p["stream"].is_boolean())
        prof.stream = p["stream"].get<bool>();
    if (p.contains("timeout") && p["timeout"].is_number_unsigned())
        prof.timeout_seconds = p["timeout"].get<long>();
    return prof;
}

Config Config::from_json(const nlohmann::json& doc) {
    Config cfg;
    nlohmann::json j = merge_defaults(doc.is_object() ? doc : nlohmann::json::object(),
                                      defaults_json());

    if (j.contains("default_profile") && j["default_profile"].is_string())
        cfg.default_profile = j["default_profile"].get<std::string>();

    if (j.contains("profiles") && j["profiles"].is_object()) {
        for (auto& [name, obj] : j["profiles"].items()) {
            if (!obj.is_object()) continue;
            cfg.profiles[name] = parse_profile(name, obj);
        }
    }

    if (j.contains("security") && j["security"].is_object()) {
        auto& s = j["security"];
        if (s.contains("enforce_allowlist") && s["enforce_allowlist"].is_boolean())
            cfg.security.enforced = s["enforce_allowlist"].get<bool>();
        if (s.contains("allowed_hosts") && s["allowed_hosts"].is_array()) {
            for (const auto& h : s["allowed_hosts"]) {
                if (h.is_string()) cfg.security.hosts.push_back(h.get<std::string>());
            }
        }
    }

    if (j.contains("retry") && j["retry"].is_object()) {
        auto& r = j["retry"];
        if (r.contains("max_attempts") && r["max_attempts"].is_number_unsigned())
            cfg.retry.max_attempts = r["max_attempts"].get<uint32_t>();
        if (r.contains("base_delay_ms") && r["base_delay_ms"].is_number_unsigned())
            cfg.retry.base_delay = std::chrono::milliseconds(r["base_delay_ms"].get<uint64_t>());
        if (r.contains("max_delay_ms") && r["max_delay_ms"].is_number_unsigned())
            cfg.retry.max_delay = std::chrono::milliseconds(r["max_delay_ms"].get<uint64_t>());
        if (r.contains("jitter") && r["jitter"].is_number())
            cfg.retry.jitter = std::clamp(r["jitter"].get<double>(), 0.0, 1.0);
    }

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        if (s.contains("max_consecutive_malformed") && s["max_consecutive_malformed"].is_number_unsigned())
            cfg.stream.max_consecutive_malformed = s["max_consecutive_malformed"].get<uint32_t>();
        if (s.contains("queue_capacity") && s["queue_capacity"].is_number_unsigned())
            cfg.stream.queue_capacity = s["queue_capacity"].get<size_t>();
    }

    if (j.contains("limits") && j["limits"].is_object()) {
        auto& l = j["limits"];
        if (l.contains("max_tokens_cap") && l["max_tokens_cap"].is_number_unsigned())
            cfg.limits.max_tokens_cap = l["max_tokens_cap"].get<uint32_t>();
        if (l.contains("max_input_chars") && l["max_input_chars"].is_number_unsigned())
            cfg.limits.max_input_chars = l["max_input_chars"].get<size_t>();
    }

    if (j.contains("interceptor") && j["interceptor"].is_object()) {
        auto& i = j["interceptor"];
        if (i.contains("name") && i["name"].is_string())
            cfg.interceptor.name = i["name"].get<std::string>();
        if (i.contains("redact_terms") && i["redact_terms"].is_object()) {
            for (auto& [term, placeholder] : i["redact_terms"].items()) {
                if (placeholder.is_string())
                    cfg.interceptor.redact_terms[term] = placeholder.get<std::string>();
            }
        }
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.cliai/config.json");
    nlohmann::json j = nlohmann::json::object();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Failed to parse " << config_path << ": "
                      << e.what() << " (using defaults)\n";
            j = nlohmann::json::object();
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("CLIAI_ALLOWED_HOSTS")) {
        security.hosts.clear();
        for (const auto& h : split(v, ',')) {
            std::string host = trim(h);
            if (!host.empty()) security.hosts.push_back(host);
        }
    }
    if (const char* v = std::getenv("CLIAI_ENFORCE_ALLOWLIST"))
        security.enforced = parse_bool(v);
}

ConnectionProfile Config::resolve_profile(const std::string& name) const {
    std::string wanted = name;
    if (wanted.empty()) {
        const char* env = std::getenv("CLIAI_PROFILE");
        wanted = (env && *env) ? env : default_profile;
    }

    ConnectionProfile prof;
    auto it = profiles.find(wanted);
    if (it != profiles.end()) {
        prof = it->second;
    } else if (!profiles.empty() || wanted != "default") {
        std::string available;
        for (const auto& [n, _] : profiles) {
            if (!available.empty()) available += ", ";
            available += n;
        }
        throw ChatError(ErrorKind::ConfigInvalid,
                        "Profile '" + wanted + "' not found. Available: " +
                        (available.empty() ? "(none)" : available));
    }
    prof.name = wanted;

    if (const char* v = std::getenv("CLIAI_ENDPOINT")) prof.endpoint = v;
    if (const char* v = std::getenv("CLIAI_API_KEY")) prof.api_key = v;
    if (const char* v = std::getenv("CLIAI_MODEL")) prof.model = v;
    if (const char* v = std::getenv("CLIAI_SYSTEM_PROMPT")) prof.system_prompt = v;
    if (const char* v = std::getenv("CLIAI_STREAM")) prof.stream = parse_bool(v);
    if (const char* v = std::getenv("CLIAI_TEMPERATURE")) {
        try { prof.temperature = std::stod(v); }
        catch (const std::exception&) {
            std::cerr << "[config] Ignoring non-numeric CLIAI_TEMPERATURE\n";
        }
    }
    if (const char* v = std::getenv("CLIAI_MAX_TOKENS")) {
        try { prof.max_tokens = static_cast<uint32_t>(std::stoul(v)); }
        catch (const std::exception&) {
            std::cerr << "[config] Ignoring non-numeric CLIAI_MAX_TOKENS\n";
        }
    }
    return prof;
}

} // namespace cliai
