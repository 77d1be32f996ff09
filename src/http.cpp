#include "http.hpp"
#include "cancel.hpp"

#include <curl/curl.h>
#include <cctype>
#include <string>

namespace cliai {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int cancel_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* cancel = static_cast<const CancelToken*>(clientp);
    if (cancel && cancel->cancelled()) return 1;
    return 0;
}

// Collects the status code and headers; also detects which status the body
// belongs to so streaming only forwards 2xx bodies.
struct ResponseContext {
    HttpResponse* response;
    RawChunkCallback* callback = nullptr;
    bool aborted = false;
};

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* ctx = static_cast<ResponseContext*>(userdata);
    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    if (line.rfind("HTTP/", 0) == 0) {
        // New response head (e.g. after 100 Continue)
        ctx->response->headers.clear();
        size_t sp = line.find(' ');
        if (sp != std::string::npos)
            ctx->response->status_code = std::strtol(line.c_str() + sp + 1, nullptr, 10);
        return total;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string name = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    while (!value.empty() && (value[0] == ' ' || value[0] == '\t')) value.erase(0, 1);
    for (auto& c : name) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    ctx->response->headers.emplace_back(std::move(name), std::move(value));
    return total;
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<ResponseContext*>(userdata);
    if (ctx->aborted) return 0;

    long status = ctx->response->status_code;
    bool success = status >= 200 && status < 300;
    if (!success || !ctx->callback) {
        ctx->response->body.append(ptr, total);
        return total;
    }
    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

static NetError map_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return NetError::InvalidUrl;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetError::DnsFailure;
        case CURLE_COULDNT_CONNECT:
            return NetError::ConnectFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return NetError::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return NetError::TlsFailure;
        case CURLE_ABORTED_BY_CALLBACK:
        case CURLE_WRITE_ERROR:
            return NetError::Aborted;
        default:
            return NetError::ConnectionReset;
    }
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;
    curl_slist* resolve = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        curl_slist_free_all(resolve);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

// "host:port:addr1,addr2" so curl connects only to the approved addresses.
static curl_slist* build_resolve(const Destination& dest) {
    if (dest.addresses.empty()) return nullptr;
    std::string entry = dest.host + ":" + std::to_string(dest.port) + ":";
    for (size_t i = 0; i < dest.addresses.size(); ++i) {
        if (i) entry += ",";
        const auto& addr = dest.addresses[i];
        entry += addr.find(':') != std::string::npos ? "[" + addr + "]" : addr;
    }
    return curl_slist_append(nullptr, entry.c_str());
}

static HttpResponse do_post(const Destination& dest,
                            const std::string& body,
                            const std::vector<Header>& headers,
                            RawChunkCallback* callback,
                            long timeout_seconds,
                            const CancelToken* cancel) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = NetError::ConnectFailed;
        response.error_message = "curl_easy_init failed";
        return response;
    }

    std::string url = dest.url();
    req.hlist = build_headers(headers);
    req.resolve = build_resolve(dest);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    if (req.resolve) curl_easy_setopt(req.curl, CURLOPT_RESOLVE, req.resolve);
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
    // Idle timeout: abort when under 1 byte/s for timeout_seconds
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_TIME, timeout_seconds);

    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    if (cancel) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, cancel_progress_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, cancel);
    }

    ResponseContext ctx;
    ctx.response = &response;
    ctx.callback = callback;
    curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) {
        response.error = (cancel && cancel->cancelled()) ? NetError::Aborted
                                                         : map_curl_error(res);
        response.error_message = curl_easy_strerror(res);
        return response;
    }
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const Destination& dest,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds,
                                   const CancelToken* cancel) {
    return http_post(dest, body, headers, timeout_seconds, cancel);
}

HttpResponse http_post(const Destination& dest,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds,
                       const CancelToken* cancel) {
    return do_post(dest, body, headers, nullptr, timeout_seconds, cancel);
}

HttpResponse http_stream_post_raw(const Destination& dest,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   RawChunkCallback callback,
                                   long timeout_seconds,
                                   const CancelToken* cancel) {
    return do_post(dest, body, headers, &callback, timeout_seconds, cancel);
}

} // namespace cliai
