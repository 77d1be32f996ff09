#pragma once
#include "destination.hpp"
#include <string>
#include <vector>
#include <functional>
#include <utility>

namespace cliai {

class CancelToken;

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

// Connection-level failure, set when no HTTP status was obtained
// (or the body was cut short).
enum class NetError {
    None,
    InvalidUrl,
    DnsFailure,
    ConnectFailed,
    Timeout,
    ConnectionReset,
    TlsFailure,
    Aborted
};

const char* net_error_name(NetError err);

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::vector<Header> headers; // names lower-cased, values verbatim
    NetError error = NetError::None;
    std::string error_message;

    // First header value by (case-insensitive) name, empty if absent
    std::string header(const std::string& name) const;

    bool ok() const { return error == NetError::None && status_code >= 200 && status_code < 300; }
};

// Raw-chunk streaming callback: receives raw bytes from a 2xx response body.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing).
// Clients connect to `dest` as parsed and approved by the allowlist gate,
// never re-reading a URL string. Redirects are never followed; the caller
// sees the 3xx and its Location.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const Destination& dest,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120,
                              const CancelToken* cancel = nullptr) = 0;

    // Non-2xx bodies are collected into HttpResponse::body instead of
    // being passed to the callback.
    virtual HttpResponse stream_post_raw(const Destination& dest,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds = 300,
                                         const CancelToken* cancel = nullptr);
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const Destination& dest,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120,
                      const CancelToken* cancel = nullptr) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const Destination& dest,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120,
                      const CancelToken* cancel = nullptr) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// HTTP POST with JSON body
HttpResponse http_post(const Destination& dest,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120,
                       const CancelToken* cancel = nullptr);

// HTTP POST with raw-chunk streaming (no SSE parsing, caller parses).
// timeout_seconds bounds connect and each idle gap between reads.
HttpResponse http_stream_post_raw(const Destination& dest,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  RawChunkCallback callback,
                                  long timeout_seconds = 300,
                                  const CancelToken* cancel = nullptr);

} // namespace cliai
