#include "http.hpp"
#include "util.hpp"

namespace cliai {

const char* net_error_name(NetError err) {
    switch (err) {
        case NetError::None: return "none";
        case NetError::InvalidUrl: return "invalid URL";
        case NetError::DnsFailure: return "DNS lookup failed";
        case NetError::ConnectFailed: return "connection refused";
        case NetError::Timeout: return "timed out";
        case NetError::ConnectionReset: return "connection reset";
        case NetError::TlsFailure: return "TLS handshake failed";
        case NetError::Aborted: return "aborted";
    }
    return "unknown";
}

std::string HttpResponse::header(const std::string& name) const {
    std::string key = to_lower(name);
    for (const auto& h : headers) {
        if (h.first == key) return h.second;
    }
    return {};
}

// Default base-class implementation delegates to http_stream_post_raw.
HttpResponse HttpClient::stream_post_raw(const Destination& dest,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds,
                                         const CancelToken* cancel) {
    return http_stream_post_raw(dest, body, headers, std::move(callback),
                                timeout_seconds, cancel);
}

} // namespace cliai
