#include "transport.hpp"
#include "error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iostream>
#include <random>

using json = nlohmann::json;

namespace cliai {

const char* transport_state_name(TransportState state) {
    switch (state) {
        case TransportState::Idle: return "idle";
        case TransportState::Attempting: return "attempting";
        case TransportState::RetryWait: return "retry-wait";
        case TransportState::Success: return "success";
        case TransportState::Failed: return "failed";
    }
    return "unknown";
}

// ── Helpers ────────────────────────────────────────────────────

std::optional<std::chrono::milliseconds> parse_retry_after(
    const std::string& value, std::chrono::system_clock::time_point now) {
    std::string v = trim(value);
    if (v.empty()) return std::nullopt;

    if (std::all_of(v.begin(), v.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        if (v.size() > 9) return std::nullopt;
        return std::chrono::milliseconds(std::stoll(v) * 1000);
    }

    // IMF-fixdate: "Wed, 21 Oct 2015 07:28:00 GMT"
    std::tm tm{};
    const char* end = strptime(v.c_str(), "%a, %d %b %Y %H:%M:%S", &tm);
    if (!end) return std::nullopt;
    auto when = std::chrono::system_clock::from_time_t(timegm(&tm));
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(when - now);
    return std::max(delta, std::chrono::milliseconds(0));
}

static const char* status_hint(long status) {
    switch (status) {
        case 401: return "Authentication failed. Check your API key.";
        case 403: return "Access forbidden. Your API key may not have permission for this model.";
        case 404: return "Endpoint not found. Check the endpoint URL and model name.";
        case 422: return "Invalid request. The server rejected the payload.";
        case 429: return "Rate limited. Too many requests.";
        default: return nullptr;
    }
}

std::string describe_http_error(long status, const std::string& body) {
    std::string detail;
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string())
                detail = err["message"].get<std::string>();
            else if (err.is_string())
                detail = err.get<std::string>();
        } else if (j.is_object() && j.contains("message") && j["message"].is_string()) {
            detail = j["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        detail = truncate(trim(body), 200);
    }
    if (detail.empty()) detail = "HTTP error";

    std::string msg = "[" + std::to_string(status) + "] " + detail;
    if (const char* hint = status_hint(status)) {
        msg += "\nHint: ";
        msg += hint;
    }
    return msg;
}

std::string resolve_redirect(const std::string& base_url, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;

    size_t scheme_end = base_url.find("://");
    if (scheme_end == std::string::npos) return location;
    if (location.rfind("//", 0) == 0) {
        return base_url.substr(0, scheme_end + 1) + location;
    }
    size_t path_start = base_url.find('/', scheme_end + 3);
    std::string origin = path_start == std::string::npos ? base_url
                                                         : base_url.substr(0, path_start);
    if (!location.empty() && location[0] == '/') return origin + location;

    // Relative path: replace the last segment
    std::string path = path_start == std::string::npos ? "/" : base_url.substr(path_start);
    size_t q = path.find('?');
    if (q != std::string::npos) path.erase(q);
    path.erase(path.rfind('/') + 1);
    return origin + path + location;
}

static bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

static bool default_sleep(std::chrono::milliseconds delay, const CancelToken& cancel) {
    return cancel.wait_for(delay);
}

// ── RetryingTransport ──────────────────────────────────────────

RetryingTransport::RetryingTransport(HttpClient& http, const AllowlistGate& gate,
                                     RetryPolicy policy)
    : http_(http), gate_(gate), policy_(std::move(policy)), sleeper_(default_sleep) {
    if (policy_.max_attempts == 0) policy_.max_attempts = 1;
    jitter_ = [] {
        thread_local std::mt19937 rng{std::random_device{}()};
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
    };
}

void RetryingTransport::set_state(TransportState state, uint32_t attempt) {
    state_ = state;
    if (observer_) observer_(state, attempt);
}

std::chrono::milliseconds RetryingTransport::backoff_delay(
    uint32_t attempt, std::chrono::milliseconds previous) const {
    double base = static_cast<double>(policy_.base_delay.count());
    double cap = static_cast<double>(policy_.max_delay.count());
    int exponent = static_cast<int>(std::min<uint32_t>(attempt > 0 ? attempt - 1 : 0, 30));
    double delay = std::min(cap, base * std::pow(2.0, exponent));

    if (policy_.jitter > 0 && jitter_) {
        double u = jitter_();
        delay *= 1.0 + policy_.jitter * (2.0 * u - 1.0);
    }
    auto result = std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, delay)));
    return std::max(result, previous);
}

TransportResult RetryingTransport::execute(const TransportRequest& request,
                                           const RawChunkCallback& on_chunk,
                                           const CancelToken& cancel) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&] {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    };

    uint32_t attempt = 0;
    auto fail = [&](ErrorKind kind, const std::string& message, long status) -> ChatError {
        set_state(TransportState::Failed, attempt);
        return ChatError(kind, message, status, attempt, elapsed_ms());
    };
    auto summary = [&] {
        return " (" + std::to_string(attempt) + " attempt" + (attempt == 1 ? "" : "s") +
               ", " + std::to_string(elapsed_ms()) + " ms)";
    };

    set_state(TransportState::Idle, 0);
    std::chrono::milliseconds previous_delay{0};

    for (attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (cancel.cancelled()) throw fail(ErrorKind::Cancelled, "Request cancelled", 0);
        set_state(TransportState::Attempting, attempt);

        std::string url = request.url;
        bool committed = false;
        HttpResponse resp;

        for (int hops = 0;; ++hops) {
            Destination dest;
            try {
                dest = gate_.approve(url);
            } catch (const ChatError& e) {
                throw fail(e.kind(), e.what(), 0);
            }
            url = dest.url();

            if (request.stream) {
                resp = http_.stream_post_raw(
                    dest, request.body, request.headers,
                    [&](const char* data, size_t len) {
                        committed = true;
                        return on_chunk(data, len);
                    },
                    request.timeout_seconds, &cancel);
            } else {
                resp = http_.post(dest, request.body, request.headers,
                                  request.timeout_seconds, &cancel);
            }

            if (resp.error != NetError::None || !is_redirect(resp.status_code)) break;

            std::string location = resp.header("location");
            if (location.empty()) {
                throw fail(ErrorKind::ProviderError,
                           "Redirect (HTTP " + std::to_string(resp.status_code) +
                           ") without Location header", resp.status_code);
            }
            if (hops + 1 > kMaxRedirects) {
                throw fail(ErrorKind::ProviderError,
                           "Too many redirects (more than " + std::to_string(kMaxRedirects) + ")",
                           resp.status_code);
            }
            url = resolve_redirect(url, location);
            std::cerr << "[transport] Following HTTP " << resp.status_code
                      << " redirect to " << truncate(url, 120) << '\n';
        }

        if (cancel.cancelled()) throw fail(ErrorKind::Cancelled, "Request cancelled", 0);

        ErrorKind kind = ErrorKind::ProviderError;
        std::string cause;
        long status = 0;
        bool retryable = false;

        if (resp.error != NetError::None) {
            // The consumer stopped reading after its terminal event
            if (resp.error == NetError::Aborted && committed) {
                set_state(TransportState::Success, attempt);
                return {resp.status_code, "", attempt, elapsed_ms(), url};
            }
            kind = resp.error == NetError::Timeout ? ErrorKind::Timeout
                                                   : ErrorKind::ConnectionFailed;
            cause = resp.error_message.empty() ? net_error_name(resp.error)
                                               : resp.error_message;
            if (committed) {
                throw fail(kind, "Stream interrupted: " + cause + summary(), resp.status_code);
            }
            switch (resp.error) {
                case NetError::InvalidUrl:
                    throw fail(ErrorKind::ConfigInvalid, "Invalid endpoint URL: " + url, 0);
                case NetError::Timeout:
                    retryable = policy_.retry_on_timeout;
                    break;
                case NetError::TlsFailure:
                    retryable = false;
                    break;
                default:
                    retryable = policy_.retry_on_connection_error;
                    break;
            }
        } else if (resp.status_code >= 200 && resp.status_code < 300) {
            if (!request.stream) {
                try {
                    (void)json::parse(resp.body);
                } catch (const json::exception&) {
                    throw fail(ErrorKind::StreamCorrupt,
                               "Malformed response body: " + truncate(resp.body, 120),
                               resp.status_code);
                }
            }
            set_state(TransportState::Success, attempt);
            return {resp.status_code, std::move(resp.body), attempt, elapsed_ms(), url};
        } else {
            status = resp.status_code;
            cause = describe_http_error(status, resp.body);
            kind = status == 429 ? ErrorKind::RateLimited : ErrorKind::ProviderError;
            retryable = policy_.is_retryable_status(status);
        }

        if (!retryable || attempt >= policy_.max_attempts) {
            throw fail(kind, cause + summary(), status);
        }

        auto delay = backoff_delay(attempt, previous_delay);
        if (status == 429 || status == 503) {
            if (auto ra = parse_retry_after(resp.header("retry-after"))) {
                if (*ra > kMaxRetryAfter) {
                    std::cerr << "[transport] Retry-After of " << ra->count()
                              << " ms capped to " << kMaxRetryAfter.count() << " s\n";
                    ra = std::chrono::milliseconds(kMaxRetryAfter);
                }
                delay = std::max(*ra, previous_delay);
            }
        }
        previous_delay = delay;

        std::cerr << "[transport] Attempt " << attempt << "/" << policy_.max_attempts
                  << " failed: " << cause.substr(0, cause.find('\n')) << "; retrying in "
                  << delay.count() << " ms\n";

        set_state(TransportState::RetryWait, attempt);
        if (!sleeper_(delay, cancel)) {
            throw fail(ErrorKind::Cancelled, "Request cancelled during retry wait", 0);
        }
    }

    // Unreachable: the final attempt either returns or throws
    attempt = policy_.max_attempts;
    throw fail(ErrorKind::ProviderError, "Retries exhausted" + summary(), 0);
}

} // namespace cliai
