#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "error.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace cliai;

namespace {

const char* kProfileEnv[] = {
    "CLIAI_PROFILE", "CLIAI_ENDPOINT", "CLIAI_API_KEY", "CLIAI_MODEL",
    "CLIAI_TEMPERATURE", "CLIAI_MAX_TOKENS", "CLIAI_SYSTEM_PROMPT", "CLIAI_STREAM",
    "CLIAI_ALLOWED_HOSTS", "CLIAI_ENFORCE_ALLOWLIST"
};

std::string make_temp_dir() {
    std::string tmpl = "/tmp/cliai_config_test_XXXXXX";
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* name : kProfileEnv) unsetenv(name);
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        for (const char* name : kProfileEnv) unsetenv(name);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.cliai/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.cliai");
        std::ofstream f(config_path());
        f << content;
    }
};

} // namespace

// ── Defaults ─────────────────────────────────────────────────────

TEST_CASE("Config: default profile values", "[config]") {
    ConnectionProfile p;
    REQUIRE(p.endpoint == "http://localhost:11434/v1");
    REQUIRE(p.model == "llama3");
    REQUIRE(p.temperature.has_value());
    REQUIRE(*p.temperature == 0.7);
    REQUIRE_FALSE(p.max_tokens.has_value());
    REQUIRE(p.stream);
}

TEST_CASE("Config: default retry policy", "[config]") {
    RetryPolicy r;
    REQUIRE(r.max_attempts == 3);
    REQUIRE(r.base_delay == std::chrono::milliseconds(1000));
    REQUIRE(r.is_retryable_status(429));
    REQUIRE(r.is_retryable_status(503));
    REQUIRE_FALSE(r.is_retryable_status(400));
    REQUIRE_FALSE(r.is_retryable_status(401));
}

TEST_CASE("ConnectionProfile::chat_url: tolerates trailing slash", "[config]") {
    ConnectionProfile p;
    p.endpoint = "https://api.groq.com/openai/v1/";
    REQUIRE(p.chat_url() == "https://api.groq.com/openai/v1/chat/completions");
}

TEST_CASE("ConnectionProfile::display_key: masks the key", "[config]") {
    ConnectionProfile p;
    REQUIRE(p.display_key() == "(none)");
    p.api_key = "short";
    REQUIRE(p.display_key() == "****");
    p.api_key = "sk-1234567890abcdef";
    REQUIRE(p.display_key() == "sk-1...cdef");
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: empty document yields defaults", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::object());
    REQUIRE(cfg.default_profile == "default");
    REQUIRE(cfg.profiles.count("default") == 1);
    REQUIRE_FALSE(cfg.security.enforced);
    REQUIRE(cfg.stream.max_consecutive_malformed == 3);
    REQUIRE(cfg.interceptor.name == "none");
}

TEST_CASE("Config::from_json: partial sections merge over defaults", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "retry": { "max_attempts": 5 },
        "security": { "enforce_allowlist": true, "allowed_hosts": ["api.openai.com", "*.groq.com"] }
    })"));
    REQUIRE(cfg.retry.max_attempts == 5);
    REQUIRE(cfg.retry.max_delay == std::chrono::milliseconds(30000));
    REQUIRE(cfg.security.enforced);
    REQUIRE(cfg.security.hosts.size() == 2);
    REQUIRE(cfg.security.hosts[1] == "*.groq.com");
}

TEST_CASE("Config::from_json: profiles replace the default set", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "default_profile": "groq",
        "profiles": {
            "groq": {
                "endpoint": "https://api.groq.com/openai/v1",
                "api_key": "gsk_test",
                "model": "llama-3.1-8b-instant",
                "temperature": null,
                "max_tokens": 512,
                "stream": false,
                "timeout": 30
            }
        }
    })"));
    REQUIRE(cfg.profiles.size() == 1);
    const auto& p = cfg.profiles.at("groq");
    REQUIRE(p.name == "groq");
    REQUIRE(p.model == "llama-3.1-8b-instant");
    REQUIRE_FALSE(p.temperature.has_value());
    REQUIRE(p.max_tokens == 512u);
    REQUIRE_FALSE(p.stream);
    REQUIRE(p.timeout_seconds == 30);
}

TEST_CASE("Config::from_json: redact terms and interceptor name", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "interceptor": { "name": "redact", "redact_terms": { "Project Falcon": "[PROJECT]" } }
    })"));
    REQUIRE(cfg.interceptor.name == "redact");
    REQUIRE(cfg.interceptor.redact_terms.at("Project Falcon") == "[PROJECT]");
}

TEST_CASE("Config::from_json: jitter is clamped", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({"retry": {"jitter": 4.0}})"));
    REQUIRE(cfg.retry.jitter == 1.0);
}

// ── load / environment ───────────────────────────────────────────

TEST_CASE("Config::load: missing file gives defaults", "[config]") {
    ConfigTestGuard g;
    auto cfg = Config::load();
    REQUIRE(cfg.profiles.count("default") == 1);
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({
        "default_profile": "work",
        "profiles": { "work": { "endpoint": "https://api.openai.com/v1", "model": "gpt-4o-mini" } },
        "limits": { "max_tokens_cap": 2048 }
    })");

    auto cfg = Config::load();
    REQUIRE(cfg.default_profile == "work");
    REQUIRE(cfg.limits.max_tokens_cap == 2048);
    auto p = cfg.resolve_profile();
    REQUIRE(p.endpoint == "https://api.openai.com/v1");
    REQUIRE(p.model == "gpt-4o-mini");
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    auto cfg = Config::load();
    REQUIRE(cfg.default_profile == "default");
    REQUIRE(cfg.retry.max_attempts == 3);
}

TEST_CASE("Config::load: allowlist environment overrides", "[config]") {
    ConfigTestGuard g;
    setenv("CLIAI_ALLOWED_HOSTS", "api.openai.com, *.groq.com ,", 1);
    setenv("CLIAI_ENFORCE_ALLOWLIST", "true", 1);
    auto cfg = Config::load();
    REQUIRE(cfg.security.enforced);
    REQUIRE(cfg.security.hosts.size() == 2);
    REQUIRE(cfg.security.hosts[0] == "api.openai.com");
    REQUIRE(cfg.security.hosts[1] == "*.groq.com");
}

TEST_CASE("Config::resolve_profile: environment overrides profile", "[config]") {
    ConfigTestGuard g;
    setenv("CLIAI_ENDPOINT", "http://127.0.0.1:8080/v1", 1);
    setenv("CLIAI_MODEL", "mistral", 1);
    setenv("CLIAI_TEMPERATURE", "0.2", 1);
    setenv("CLIAI_MAX_TOKENS", "256", 1);
    setenv("CLIAI_STREAM", "0", 1);

    auto p = Config::load().resolve_profile();
    REQUIRE(p.endpoint == "http://127.0.0.1:8080/v1");
    REQUIRE(p.model == "mistral");
    REQUIRE(*p.temperature == 0.2);
    REQUIRE(p.max_tokens == 256u);
    REQUIRE_FALSE(p.stream);
}

TEST_CASE("Config::resolve_profile: non-numeric env values are ignored", "[config]") {
    ConfigTestGuard g;
    setenv("CLIAI_TEMPERATURE", "warm", 1);
    auto p = Config::load().resolve_profile();
    REQUIRE(*p.temperature == 0.7);
}

TEST_CASE("Config::resolve_profile: unknown profile is ConfigInvalid", "[config]") {
    ConfigTestGuard g;
    auto cfg = Config::load();
    try {
        cfg.resolve_profile("missing");
        FAIL("expected ChatError");
    } catch (const ChatError& e) {
        REQUIRE(e.kind() == ErrorKind::ConfigInvalid);
    }
}

TEST_CASE("Config::resolve_profile: CLIAI_PROFILE selects profile", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"profiles": {"a": {"model": "m-a"}, "b": {"model": "m-b"}}})");
    setenv("CLIAI_PROFILE", "b", 1);
    auto p = Config::load().resolve_profile();
    REQUIRE(p.name == "b");
    REQUIRE(p.model == "m-b");
}
