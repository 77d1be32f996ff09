#pragma once
#include "allowlist.hpp"
#include "cancel.hpp"
#include "config.hpp"
#include "http.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cliai {

enum class TransportState { Idle, Attempting, RetryWait, Success, Failed };

const char* transport_state_name(TransportState state);

struct TransportRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 120;
    bool stream = true;
};

struct TransportResult {
    long status_code = 0;
    std::string body;      // non-streaming responses only
    uint32_t attempts = 0;
    uint64_t elapsed_ms = 0;
    std::string final_url; // after redirects
};

// Waits for a backoff delay. Returns false if cancelled before it elapsed.
using Sleeper = std::function<bool(std::chrono::milliseconds delay, const CancelToken& cancel)>;
using StateObserver = std::function<void(TransportState state, uint32_t attempt)>;
// Uniform random value in [0, 1)
using JitterSource = std::function<double()>;

constexpr int kMaxRedirects = 5;
// Longest Retry-After wait honoured; larger server values are clamped.
constexpr std::chrono::seconds kMaxRetryAfter{300};

// Sends one turn's request with allowlist re-validation on every attempt and
// redirect hop, and exponential backoff between retryable failures.
class RetryingTransport {
public:
    RetryingTransport(HttpClient& http, const AllowlistGate& gate, RetryPolicy policy);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_jitter_source(JitterSource jitter) { jitter_ = std::move(jitter); }
    void set_observer(StateObserver observer) { observer_ = std::move(observer); }

    // Streaming requests pass 2xx body bytes to on_chunk; once any byte has
    // been delivered the attempt is committed and no longer retried.
    // Throws ChatError on terminal failure.
    TransportResult execute(const TransportRequest& request,
                            const RawChunkCallback& on_chunk,
                            const CancelToken& cancel);

    // Backoff before attempt `attempt + 1`, never shorter than `previous`.
    std::chrono::milliseconds backoff_delay(uint32_t attempt,
                                            std::chrono::milliseconds previous) const;

    TransportState state() const { return state_; }
    const RetryPolicy& policy() const { return policy_; }

private:
    void set_state(TransportState state, uint32_t attempt);

    HttpClient& http_;
    const AllowlistGate& gate_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    JitterSource jitter_;
    StateObserver observer_;
    TransportState state_ = TransportState::Idle;
};

// Retry-After as delta-seconds or an HTTP-date relative to `now`.
std::optional<std::chrono::milliseconds> parse_retry_after(
    const std::string& value,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// "[401] Invalid API key\nHint: ..." from a provider error body
std::string describe_http_error(long status, const std::string& body);

// Resolve a Location header against the request URL
std::string resolve_redirect(const std::string& base_url, const std::string& location);

} // namespace cliai
