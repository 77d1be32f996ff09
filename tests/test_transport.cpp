#include <catch2/catch_test_macros.hpp>
#include "transport.hpp"
#include "error.hpp"
#include "mock_http_client.hpp"
#include <thread>

using namespace cliai;
using std::chrono::milliseconds;

namespace {

AllowlistPolicy open_policy() {
    return AllowlistPolicy{};
}

AllowlistPolicy only(std::vector<std::string> hosts) {
    AllowlistPolicy p;
    p.enforced = true;
    p.hosts = std::move(hosts);
    return p;
}

RetryPolicy fast_policy(uint32_t attempts = 3) {
    RetryPolicy r;
    r.max_attempts = attempts;
    r.base_delay = milliseconds(1000);
    r.max_delay = milliseconds(30000);
    r.jitter = 0.1;
    return r;
}

TransportRequest make_request(bool stream = true) {
    TransportRequest req;
    req.url = "https://api.example.com/v1/chat/completions";
    req.body = R"({"model":"m"})";
    req.stream = stream;
    return req;
}

struct Harness {
    MockHttpClient http;
    AllowlistGate gate;
    RetryingTransport transport;
    RecordingSleeper sleeper;
    std::vector<TransportState> states;
    std::string received;

    explicit Harness(RetryPolicy policy = fast_policy(), AllowlistPolicy allow = open_policy())
        : gate(std::move(allow), [](const std::string&) { return std::vector<std::string>{}; }),
          transport(http, gate, std::move(policy)) {
        transport.set_sleeper(sleeper);
        transport.set_jitter_source([] { return 0.5; }); // no jitter
        transport.set_observer([this](TransportState s, uint32_t) { states.push_back(s); });
    }

    TransportResult run(const TransportRequest& req = make_request()) {
        CancelToken cancel;
        return run(req, cancel);
    }

    TransportResult run(const TransportRequest& req, const CancelToken& cancel) {
        return transport.execute(req, [this](const char* d, size_t n) {
            received.append(d, n);
            return true;
        }, cancel);
    }

    ChatError run_error(const TransportRequest& req = make_request()) {
        try {
            run(req);
        } catch (const ChatError& e) {
            return e;
        }
        FAIL("expected ChatError");
        return ChatError(ErrorKind::ProviderError, "");
    }
};

} // namespace

// ── Success paths ────────────────────────────────────────────────

TEST_CASE("RetryingTransport: streams 2xx body to the callback", "[transport]") {
    Harness h;
    h.http.queue(MockReply::stream({"data: a\n\n", "data: b\n\n"}));
    auto result = h.run();
    REQUIRE(result.status_code == 200);
    REQUIRE(result.attempts == 1);
    REQUIRE(h.received == "data: a\n\ndata: b\n\n");
    REQUIRE(h.transport.state() == TransportState::Success);
    REQUIRE(h.http.last_body == R"({"model":"m"})");
}

TEST_CASE("RetryingTransport: non-streaming returns JSON body", "[transport]") {
    Harness h;
    h.http.queue(MockReply::status(200, R"({"choices":[]})"));
    auto result = h.run(make_request(false));
    REQUIRE(result.body == R"({"choices":[]})");
    REQUIRE(h.received.empty());
}

TEST_CASE("RetryingTransport: malformed non-streaming body fails immediately", "[transport]") {
    Harness h;
    h.http.queue(MockReply::status(200, "<html>oops</html>"));
    auto e = h.run_error(make_request(false));
    REQUIRE(e.kind() == ErrorKind::StreamCorrupt);
    REQUIRE(h.http.call_count.load() == 1);
}

TEST_CASE("RetryingTransport: state sequence for first-try success", "[transport]") {
    Harness h;
    h.http.queue(MockReply::stream({"x"}));
    h.run();
    REQUIRE(h.states == std::vector<TransportState>{
        TransportState::Idle, TransportState::Attempting, TransportState::Success});
}

// ── Retry behaviour ──────────────────────────────────────────────

TEST_CASE("RetryingTransport: always-503 makes exactly max_attempts attempts", "[transport]") {
    Harness h;
    h.http.next_response.status_code = 503;
    auto e = h.run_error();

    REQUIRE(h.http.call_count.load() == 3);
    REQUIRE(e.kind() == ErrorKind::ProviderError);
    REQUIRE(e.status_code() == 503);
    REQUIRE(e.attempts() == 3);
    REQUIRE(h.transport.state() == TransportState::Failed);

    const auto& delays = *h.sleeper.delays;
    REQUIRE(delays.size() == 2);
    REQUIRE(delays[0] == milliseconds(1000));
    REQUIRE(delays[1] == milliseconds(2000));
    REQUIRE(delays[0] <= delays[1]);
}

TEST_CASE("RetryingTransport: recovers after transient failures", "[transport]") {
    Harness h;
    h.http.queue(MockReply::status(502));
    h.http.queue(MockReply::net_error(NetError::ConnectionReset));
    h.http.queue(MockReply::stream({"ok"}));
    auto result = h.run();
    REQUIRE(result.attempts == 3);
    REQUIRE(h.received == "ok");
}

TEST_CASE("RetryingTransport: Retry-After seconds overrides backoff", "[transport]") {
    Harness h;
    h.http.queue(MockReply::status(429, R"({"error":{"message":"slow down"}})",
                                   {{"retry-after", "5"}}));
    h.http.queue(MockReply::stream({"ok"}));
    h.run();
    REQUIRE(h.sleeper.delays->size() == 1);
    REQUIRE(h.sleeper.delays->at(0) >= milliseconds(5000));
}

TEST_CASE("RetryingTransport: huge Retry-After is capped", "[transport]") {
    Harness h;
    h.http.queue(MockReply::status(503, "", {{"retry-after", "86400"}}));
    h.http.queue(MockReply::stream({"ok"}));
    h.run();
    REQUIRE(h.sleeper.delays->size() == 1);
    REQUIRE(h.sleeper.delays->at(0) == milliseconds(kMaxRetryAfter));
}

TEST_CASE("RetryingTransport: 429 exhaustion is RateLimited with hint", "[transport]") {
    Harness h(fast_policy(2));
    h.http.next_response.status_code = 429;
    h.http.next_response.body = R"({"error":{"message":"quota"}})";
    auto e = h.run_error();
    REQUIRE(e.kind() == ErrorKind::RateLimited);
    std::string msg = e.what();
    REQUIRE(msg.find("[429] quota") != std::string::npos);
    REQUIRE(msg.find("Rate limited") != std::string::npos);
    REQUIRE(msg.find("2 attempts") != std::string::npos);
}

TEST_CASE("RetryingTransport: other 4xx fails without retry", "[transport]") {
    Harness h;
    h.http.queue(MockReply::status(401, R"({"error":{"message":"bad key"}})"));
    auto e = h.run_error();
    REQUIRE(h.http.call_count.load() == 1);
    REQUIRE(e.kind() == ErrorKind::ProviderError);
    REQUIRE(e.status_code() == 401);
    REQUIRE(std::string(e.what()).find("Check your API key") != std::string::npos);
    REQUIRE(h.sleeper.delays->empty());
}

TEST_CASE("RetryingTransport: timeout exhaustion is Timeout", "[transport]") {
    Harness h(fast_policy(2));
    h.http.next_response.error = NetError::Timeout;
    auto e = h.run_error();
    REQUIRE(e.kind() == ErrorKind::Timeout);
    REQUIRE(h.http.call_count.load() == 2);
}

TEST_CASE("RetryingTransport: retry_on_timeout=false fails at once", "[transport]") {
    auto policy = fast_policy();
    policy.retry_on_timeout = false;
    Harness h(policy);
    h.http.next_response.error = NetError::Timeout;
    h.run_error();
    REQUIRE(h.http.call_count.load() == 1);
}

TEST_CASE("RetryingTransport: DNS failure is retried as ConnectionFailed", "[transport]") {
    Harness h;
    h.http.next_response.error = NetError::DnsFailure;
    auto e = h.run_error();
    REQUIRE(e.kind() == ErrorKind::ConnectionFailed);
    REQUIRE(h.http.call_count.load() == 3);
}

TEST_CASE("RetryingTransport: failure after body bytes is not retried", "[transport]") {
    Harness h;
    auto reply = MockReply::stream({"data: {\"delta\":\"Hel\"}\n\n"});
    reply.response.error = NetError::ConnectionReset;
    h.http.queue(reply);
    auto e = h.run_error();
    REQUIRE(e.kind() == ErrorKind::ConnectionFailed);
    REQUIRE(h.http.call_count.load() == 1);
    REQUIRE(std::string(e.what()).find("Stream interrupted") != std::string::npos);
}

TEST_CASE("RetryingTransport: consumer stop after bytes counts as success", "[transport]") {
    Harness h;
    h.http.queue(MockReply::stream({"a", "b", "c"}));
    CancelToken cancel;
    std::string got;
    auto result = h.transport.execute(make_request(), [&](const char* d, size_t n) {
        got.append(d, n);
        return got.size() < 2;
    }, cancel);
    REQUIRE(result.attempts == 1);
    REQUIRE(got == "ab");
}

// ── Backoff computation ──────────────────────────────────────────

TEST_CASE("RetryingTransport: backoff doubles and caps", "[transport]") {
    MockHttpClient http;
    AllowlistGate gate(open_policy());
    auto policy = fast_policy();
    policy.max_delay = milliseconds(3000);
    policy.jitter = 0;
    RetryingTransport t(http, gate, policy);
    REQUIRE(t.backoff_delay(1, milliseconds(0)) == milliseconds(1000));
    REQUIRE(t.backoff_delay(2, milliseconds(0)) == milliseconds(2000));
    REQUIRE(t.backoff_delay(3, milliseconds(0)) == milliseconds(3000));
    REQUIRE(t.backoff_delay(10, milliseconds(0)) == milliseconds(3000));
}

TEST_CASE("RetryingTransport: jitter is bounded and monotonic", "[transport]") {
    MockHttpClient http;
    AllowlistGate gate(open_policy());
    RetryingTransport t(http, gate, fast_policy());

    t.set_jitter_source([] { return 0.0; }); // -10%
    REQUIRE(t.backoff_delay(1, milliseconds(0)) == milliseconds(900));
    t.set_jitter_source([] { return 0.999999; }); // ~+10%
    REQUIRE(t.backoff_delay(1, milliseconds(0)) <= milliseconds(1100));
    // never shorter than the previous delay
    t.set_jitter_source([] { return 0.0; });
    REQUIRE(t.backoff_delay(2, milliseconds(1950)) == milliseconds(1950));
}

// ── Allowlist re-validation ──────────────────────────────────────

TEST_CASE("RetryingTransport: rejected host makes no HTTP call", "[transport]") {
    Harness h(fast_policy(), only({"api.openai.com"}));
    auto e = h.run_error();
    REQUIRE(e.kind() == ErrorKind::HostNotAllowed);
    REQUIRE(h.http.call_count.load() == 0);
}

TEST_CASE("RetryingTransport: follows allowed redirect with same POST", "[transport]") {
    Harness h(fast_policy(), only({"api.example.com", "*.example.com"}));
    h.http.queue(MockReply::status(307, "", {{"location", "https://eu.example.com/v1/chat/completions"}}));
    h.http.queue(MockReply::stream({"ok"}));
    auto result = h.run();
    REQUIRE(h.http.call_count.load() == 2);
    REQUIRE(h.http.urls[1] == "https://eu.example.com/v1/chat/completions");
    REQUIRE(h.http.bodies[1] == h.http.bodies[0]);
    REQUIRE(result.final_url == "https://eu.example.com/v1/chat/completions");
}

TEST_CASE("RetryingTransport: redirect to disallowed host is rejected", "[transport]") {
    Harness h(fast_policy(), only({"api.example.com"}));
    h.http.queue(MockReply::status(302, "", {{"location", "https://evil.test/collect"}}));
    auto e = h.run_error();
    REQUIRE(e.kind() == ErrorKind::HostNotAllowed);
    REQUIRE(h.http.call_count.load() == 1);
}

TEST_CASE("RetryingTransport: client receives the approved destination", "[transport]") {
    MockHttpClient http;
    AllowlistGate gate(only({"10.0.0.0/8"}), [](const std::string&) {
        return std::vector<std::string>{"10.7.0.1", "198.51.100.4"};
    });
    RetryingTransport transport(http, gate, fast_policy());
    http.queue(MockReply::stream({"ok"}));
    CancelToken cancel;
    auto req = make_request();
    req.url = "http://llm.internal:8000/v1/chat/completions";
    transport.execute(req, [](const char*, size_t) { return true; }, cancel);

    REQUIRE(http.last_dest.host == "llm.internal");
    REQUIRE(http.last_dest.port == 8000);
    REQUIRE(http.last_dest.target == "/v1/chat/completions");
    REQUIRE(http.last_dest.addresses == std::vector<std::string>{"10.7.0.1"});
}

TEST_CASE("RetryingTransport: credentials in the URL are a config error", "[transport]") {
    Harness h;
    auto req = make_request();
    req.url = "https://api.example.com@10.0.0.1/v1/chat/completions";
    auto e = h.run_error(req);
    REQUIRE(e.kind() == ErrorKind::ConfigInvalid);
    REQUIRE(h.http.call_count.load() == 0);
}

TEST_CASE("RetryingTransport: relative redirect keeps origin", "[transport]") {
    Harness h;
    h.http.queue(MockReply::status(308, "", {{"location", "/v2/chat/completions"}}));
    h.http.queue(MockReply::stream({"ok"}));
    h.run();
    REQUIRE(h.http.urls[1] == "https://api.example.com/v2/chat/completions");
}

TEST_CASE("RetryingTransport: redirect loop stops after five hops", "[transport]") {
    Harness h;
    h.http.next_response.status_code = 302;
    h.http.next_response.headers = {{"location", "https://api.example.com/loop"}};
    auto e = h.run_error();
    REQUIRE(e.kind() == ErrorKind::ProviderError);
    REQUIRE(h.http.call_count.load() == kMaxRedirects + 1);
}

// ── Cancellation ─────────────────────────────────────────────────

TEST_CASE("RetryingTransport: cancel during retry wait fails fast", "[transport]") {
    Harness h;
    h.http.next_response.status_code = 503;
    CancelToken cancel;
    h.transport.set_sleeper([&](milliseconds, const CancelToken& c) {
        cancel.cancel();
        return !c.cancelled();
    });
    try {
        h.run(make_request(), cancel);
        FAIL("expected ChatError");
    } catch (const ChatError& e) {
        REQUIRE(e.kind() == ErrorKind::Cancelled);
    }
    REQUIRE(h.http.call_count.load() == 1);
    REQUIRE(h.transport.state() == TransportState::Failed);
}

TEST_CASE("RetryingTransport: real sleeper wakes on cancel", "[transport]") {
    MockHttpClient http;
    http.next_response.status_code = 503;
    AllowlistGate gate(open_policy());
    auto policy = fast_policy();
    policy.base_delay = milliseconds(60000);
    RetryingTransport t(http, gate, policy);

    CancelToken cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(milliseconds(50));
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(t.execute(make_request(), [](const char*, size_t) { return true; }, cancel),
                      ChatError);
    canceller.join();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

// ── Helpers ──────────────────────────────────────────────────────

TEST_CASE("parse_retry_after: seconds and HTTP-date", "[transport]") {
    REQUIRE(parse_retry_after("5") == milliseconds(5000));
    REQUIRE_FALSE(parse_retry_after("").has_value());
    REQUIRE_FALSE(parse_retry_after("soon").has_value());

    auto now = std::chrono::system_clock::from_time_t(1445412470); // 07:27:50 GMT
    auto d = parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT", now);
    REQUIRE(d.has_value());
    REQUIRE(*d == milliseconds(10000));
}

TEST_CASE("describe_http_error: extracts provider message", "[transport]") {
    REQUIRE(describe_http_error(404, R"({"error":{"message":"model not found"}})") ==
            "[404] model not found\nHint: Endpoint not found. Check the endpoint URL and model name.");
    REQUIRE(describe_http_error(500, "upstream exploded") == "[500] upstream exploded");
    REQUIRE(describe_http_error(502, "") == "[502] HTTP error");
}

TEST_CASE("resolve_redirect: absolute, scheme-relative and relative", "[transport]") {
    std::string base = "https://a.example/v1/chat/completions";
    REQUIRE(resolve_redirect(base, "https://b.example/x") == "https://b.example/x");
    REQUIRE(resolve_redirect(base, "//c.example/y") == "https://c.example/y");
    REQUIRE(resolve_redirect(base, "/z") == "https://a.example/z");
    REQUIRE(resolve_redirect(base, "other") == "https://a.example/v1/chat/other");
}
