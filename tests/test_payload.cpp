#include <catch2/catch_test_macros.hpp>
#include "payload.hpp"
#include "error.hpp"

using namespace cliai;

namespace {

ConnectionProfile make_profile() {
    ConnectionProfile p;
    p.model = "gpt-4o-mini";
    p.temperature = 0.5;
    return p;
}

ErrorKind build_error(const PayloadBuilder& builder, const ConnectionProfile& p,
                      const std::string& text, const PayloadOverrides& o = {}) {
    try {
        builder.build(p, Conversation(), text, o);
    } catch (const ChatError& e) {
        return e.kind();
    }
    FAIL("expected ChatError");
    return ErrorKind::ProviderError;
}

} // namespace

// ── Assembly ─────────────────────────────────────────────────────

TEST_CASE("PayloadBuilder: history then new user message", "[payload]") {
    Conversation conv("You are terse.");
    conv.add_user("hi");
    conv.add_assistant("hey");

    PayloadBuilder builder;
    auto payload = builder.build(make_profile(), conv, "what's up?");

    REQUIRE(payload.model == "gpt-4o-mini");
    REQUIRE(payload.messages.size() == 4);
    REQUIRE(payload.messages[0].role == Role::System);
    REQUIRE(payload.messages[3].role == Role::User);
    REQUIRE(payload.messages[3].content == "what's up?");
    REQUIRE(conv.size() == 2);
}

TEST_CASE("PayloadBuilder: overrides win over profile", "[payload]") {
    PayloadOverrides o;
    o.model = "other";
    o.temperature = 1.5;
    o.max_tokens = 100;
    o.stream = false;

    auto payload = PayloadBuilder().build(make_profile(), Conversation(), "x", o);
    REQUIRE(payload.model == "other");
    REQUIRE(*payload.temperature == 1.5);
    REQUIRE(*payload.max_tokens == 100);
    REQUIRE_FALSE(payload.stream);
}

// ── Validation ───────────────────────────────────────────────────

TEST_CASE("PayloadBuilder: temperature outside [0, 2] is ConfigInvalid", "[payload]") {
    PayloadBuilder builder;
    PayloadOverrides hot;
    hot.temperature = 2.5;
    REQUIRE(build_error(builder, make_profile(), "x", hot) == ErrorKind::ConfigInvalid);
    PayloadOverrides cold;
    cold.temperature = -0.1;
    REQUIRE(build_error(builder, make_profile(), "x", cold) == ErrorKind::ConfigInvalid);
}

TEST_CASE("PayloadBuilder: temperature boundaries accepted", "[payload]") {
    PayloadBuilder builder;
    PayloadOverrides o;
    o.temperature = 2.0;
    REQUIRE_NOTHROW(builder.build(make_profile(), Conversation(), "x", o));
    o.temperature = 0.0;
    REQUIRE_NOTHROW(builder.build(make_profile(), Conversation(), "x", o));
}

TEST_CASE("PayloadBuilder: max_tokens zero or above cap", "[payload]") {
    PayloadLimits limits;
    limits.max_tokens_cap = 1000;
    PayloadBuilder builder(limits);

    PayloadOverrides zero;
    zero.max_tokens = 0;
    REQUIRE(build_error(builder, make_profile(), "x", zero) == ErrorKind::ConfigInvalid);
    PayloadOverrides big;
    big.max_tokens = 1001;
    REQUIRE(build_error(builder, make_profile(), "x", big) == ErrorKind::ConfigInvalid);
}

TEST_CASE("PayloadBuilder: empty model or message", "[payload]") {
    PayloadBuilder builder;
    auto p = make_profile();
    REQUIRE(build_error(builder, p, "   ") == ErrorKind::ConfigInvalid);
    p.model = "";
    REQUIRE(build_error(builder, p, "x") == ErrorKind::ConfigInvalid);
}

TEST_CASE("PayloadBuilder: input above character cap", "[payload]") {
    PayloadLimits limits;
    limits.max_input_chars = 10;
    PayloadBuilder builder(limits);
    REQUIRE(build_error(builder, make_profile(), std::string(11, 'a')) == ErrorKind::ConfigInvalid);
    REQUIRE_NOTHROW(builder.build(make_profile(), Conversation(), std::string(10, 'a')));
}

// ── Wire format ──────────────────────────────────────────────────

TEST_CASE("Payload::to_json: streaming request shape", "[payload]") {
    auto payload = PayloadBuilder().build(make_profile(), Conversation(), "hi");
    auto j = payload.to_json();
    REQUIRE(j["model"] == "gpt-4o-mini");
    REQUIRE(j["stream"] == true);
    REQUIRE(j["temperature"] == 0.5);
    REQUIRE_FALSE(j.contains("max_tokens"));
    REQUIRE(j["messages"][0]["role"] == "user");
    REQUIRE(j["messages"][0]["content"] == "hi");
    REQUIRE(j["stream_options"]["include_usage"] == true);
}

TEST_CASE("Payload::to_json: no stream_options when not streaming", "[payload]") {
    auto p = make_profile();
    p.stream = false;
    p.temperature = std::nullopt;
    auto j = PayloadBuilder().build(p, Conversation(), "hi").to_json();
    REQUIRE(j["stream"] == false);
    REQUIRE_FALSE(j.contains("stream_options"));
    REQUIRE_FALSE(j.contains("temperature"));
}

TEST_CASE("Payload::to_json: extra fields carried verbatim", "[payload]") {
    auto payload = PayloadBuilder().build(make_profile(), Conversation(), "hi");
    payload.extra["top_p"] = 0.9;
    payload.extra["user"] = "alice";
    auto j = payload.to_json();
    REQUIRE(j["top_p"] == 0.9);
    REQUIRE(j["user"] == "alice");
    REQUIRE(j["model"] == "gpt-4o-mini");
}
