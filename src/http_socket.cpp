// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "cancel.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <string>
#include <vector>

namespace cliai {

void http_init() {}
void http_cleanup() {}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    using Clock = std::chrono::steady_clock;

    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    const CancelToken* cancel = nullptr;
    long idle_limit_secs = 120;
    NetError last_error = NetError::None;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Connects to the destination's pinned addresses when it has any,
    // otherwise to whatever dest.host resolves to. Every wait (connect,
    // TLS handshake) runs in 1-second slices that check cancellation.
    NetError connect(const Destination& dest, long timeout_secs) {
        if (timeout_secs < 1) timeout_secs = 1;
        std::string port = std::to_string(dest.port);
        bool pinned = !dest.addresses.empty();
        std::vector<std::string> candidates = pinned ? dest.addresses
                                                     : std::vector<std::string>{dest.host};

        NetError result = NetError::DnsFailure;
        for (const auto& candidate : candidates) {
            if (cancelled()) return NetError::Aborted;

            struct addrinfo hints{};
            hints.ai_family   = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            if (pinned) hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

            struct addrinfo* res = nullptr;
            if (getaddrinfo(candidate.c_str(), port.c_str(), &hints, &res) != 0) continue;
            if (result == NetError::DnsFailure) result = NetError::ConnectFailed;

            for (auto* ai = res; ai; ai = ai->ai_next) {
                NetError err = connect_one(ai, Clock::now() + std::chrono::seconds(timeout_secs));
                if (err == NetError::None || err == NetError::Aborted) {
                    freeaddrinfo(res);
                    return err == NetError::None ? handshake(dest, timeout_secs) : err;
                }
                if (err == NetError::Timeout) result = NetError::Timeout;
            }
            freeaddrinfo(res);
        }
        if (cancelled()) return NetError::Aborted;
        return result;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error (see last_error).
    // Each expired 1-second slice checks cancellation and the idle limit.
    ssize_t read_some(char* buf, size_t len) {
        long idle_slices = 0;
        while (true) {
            if (cancel && cancel->cancelled()) {
                last_error = NetError::Aborted;
                return -1;
            }

            ssize_t n;
            bool slice_expired = false;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                    slice_expired = true;
                } else if (err == SSL_ERROR_SYSCALL &&
                           (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    slice_expired = true;
                } else if (err == SSL_ERROR_SYSCALL && n == 0) {
                    return 0; // peer closed without close_notify
                } else {
                    last_error = NetError::ConnectionReset;
                    return -1;
                }
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    slice_expired = true;
                } else {
                    last_error = NetError::ConnectionReset;
                    return -1;
                }
            }

            if (slice_expired && ++idle_slices > idle_limit_secs) {
                last_error = NetError::Timeout;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (cancel && cancel->cancelled()) {
                last_error = NetError::Aborted;
                return false;
            }
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    last_error = NetError::ConnectionReset;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    last_error = NetError::ConnectionReset;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool cancelled() const { return cancel && cancel->cancelled(); }

    // Wait until fd is writable (or readable), in slices of at most a second.
    NetError wait_ready(bool for_write, Clock::time_point deadline) {
        while (true) {
            if (cancelled()) return NetError::Aborted;
            auto now = Clock::now();
            if (now >= deadline) return NetError::Timeout;
            auto slice = std::min<std::chrono::microseconds>(
                std::chrono::duration_cast<std::chrono::microseconds>(deadline - now),
                std::chrono::seconds(1));

            fd_set set;
            FD_ZERO(&set);
            FD_SET(fd, &set);
            struct timeval tv{static_cast<time_t>(slice.count() / 1000000),
                              static_cast<suseconds_t>(slice.count() % 1000000)};
            int rc = for_write ? select(fd + 1, nullptr, &set, nullptr, &tv)
                               : select(fd + 1, &set, nullptr, nullptr, &tv);
            if (rc > 0) return NetError::None;
            if (rc < 0 && errno != EINTR) return NetError::ConnectFailed;
        }
    }

    // Non-blocking connect to one address. The socket stays non-blocking
    // until the handshake is done.
    NetError connect_one(const struct addrinfo* ai, Clock::time_point deadline) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) return NetError::ConnectFailed;
        blocking_flags_ = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, blocking_flags_ | O_NONBLOCK);

        NetError err = NetError::None;
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                err = NetError::ConnectFailed;
            } else {
                err = wait_ready(true, deadline);
                if (err == NetError::None) {
                    int so_err = 0;
                    socklen_t elen = sizeof(so_err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &elen);
                    if (so_err != 0) err = NetError::ConnectFailed;
                }
            }
        }
        if (err != NetError::None) {
            ::close(fd);
            fd = -1;
        }
        return err;
    }

    NetError handshake(const Destination& dest, long timeout_secs) {
        if (dest.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return NetError::TlsFailure;
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return NetError::TlsFailure;
            SSL_set_fd(ssl, fd);
            if (is_ip_literal(dest.host)) {
                X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), dest.host.c_str());
            } else {
                SSL_set_tlsext_host_name(ssl, dest.host.c_str()); // SNI
                SSL_set1_host(ssl, dest.host.c_str());
            }

            auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);
            while (true) {
                int rc = SSL_connect(ssl);
                if (rc == 1) break;
                int err = SSL_get_error(ssl, rc);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE)
                    return NetError::TlsFailure;
                NetError waited = wait_ready(err == SSL_ERROR_WANT_WRITE, deadline);
                if (waited != NetError::None) return waited;
            }
        }

        // Back to blocking I/O with a 1-second slice timeout for the body
        // (enables cancel polling in read_some).
        fcntl(fd, F_SETFL, blocking_flags_);
        set_socket_timeout(1);
        return NetError::None;
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int blocking_flags_ = 0;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const Destination& dest,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + dest.target + " HTTP/1.1\r\n";
    req += "Host: " + dest.authority() + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF or error before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
    std::vector<Header> headers;
};

// Parse status line + headers. Header names are lower-cased; values are
// kept verbatim (Location is case-sensitive).
static bool parse_response_head(Connection& conn, std::string& leftover, ResponseHead& head) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return false;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) return false;
    head.status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (head.status < 100 || head.status > 999) return false;

    while (true) {
        std::string line;
        if (!read_line(conn, leftover, line)) return false;
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            value.pop_back();

        for (auto& c : name) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            std::string lower = value;
            for (auto& c : lower) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
            head.is_chunked = (lower.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            head.content_length = std::strtoul(value.c_str(), nullptr, 10);
            head.has_length = true;
        }
        head.headers.emplace_back(std::move(name), std::move(value));
    }
    return true;
}

// Deliver the body to `sink`, dechunking if needed. Returns false if the
// body ended early (conn.last_error says why) or the sink aborted.
template <typename Sink>
static bool read_body(Connection& conn, std::string& leftover,
                      const ResponseHead& head, Sink&& sink) {
    auto deliver_exactly = [&](size_t n) -> bool {
        while (n > 0) {
            if (!leftover.empty()) {
                size_t take = std::min(n, leftover.size());
                if (!sink(leftover.data(), take)) {
                    conn.last_error = NetError::Aborted;
                    return false;
                }
                leftover.erase(0, take);
                n -= take;
                continue;
            }
            char buf[4096];
            ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
            if (got <= 0) {
                if (got == 0) conn.last_error = NetError::ConnectionReset;
                return false;
            }
            if (!sink(buf, static_cast<size_t>(got))) {
                conn.last_error = NetError::Aborted;
                return false;
            }
            n -= static_cast<size_t>(got);
        }
        return true;
    };

    if (head.is_chunked) {
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line)) {
                if (conn.last_error == NetError::None)
                    conn.last_error = NetError::ConnectionReset;
                return false;
            }
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!deliver_exactly(chunk_size)) return false;
            std::string crlf;
            read_line(conn, leftover, crlf); // trailing \r\n
        }
    }
    if (head.has_length) return deliver_exactly(head.content_length);

    // Read to close
    if (!leftover.empty()) {
        if (!sink(leftover.data(), leftover.size())) {
            conn.last_error = NetError::Aborted;
            return false;
        }
        leftover.clear();
    }
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        if (!sink(buf, static_cast<size_t>(n))) {
            conn.last_error = NetError::Aborted;
            return false;
        }
    }
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse fail(NetError err, const std::string& detail) {
    HttpResponse resp;
    resp.error = err;
    resp.error_message = std::string(net_error_name(err)) +
                         (detail.empty() ? "" : ": " + detail);
    return resp;
}

// POST and deliver a 2xx body to `callback` (or collect it when callback
// is null). Non-2xx bodies always land in resp.body.
static HttpResponse do_post(const Destination& dest,
                            const std::string& body,
                            const std::vector<Header>& headers,
                            RawChunkCallback* callback,
                            long timeout_secs,
                            const CancelToken* cancel) {
    Connection conn;
    conn.cancel = cancel;
    conn.idle_limit_secs = timeout_secs;
    NetError err = conn.connect(dest, timeout_secs);
    if (err != NetError::None) return fail(err, dest.authority());

    std::string request = build_request("POST", dest, body, headers);
    if (!conn.write_all(request.c_str(), request.size()))
        return fail(conn.last_error, "sending request");

    std::string leftover;
    ResponseHead head;
    if (!parse_response_head(conn, leftover, head)) {
        return fail(conn.last_error == NetError::None ? NetError::ConnectionReset
                                                      : conn.last_error,
                    "reading response headers");
    }

    HttpResponse resp;
    resp.status_code = head.status;
    resp.headers = std::move(head.headers);

    bool success = head.status >= 200 && head.status < 300;
    bool complete;
    if (success && callback) {
        complete = read_body(conn, leftover, head, *callback);
    } else {
        complete = read_body(conn, leftover, head, [&](const char* data, size_t len) {
            resp.body.append(data, len);
            return true;
        });
    }
    if (!complete) {
        resp.error = conn.last_error == NetError::None ? NetError::ConnectionReset
                                                       : conn.last_error;
        resp.error_message = std::string(net_error_name(resp.error)) + " while reading body";
    }
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const Destination& dest,
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

#endif // __linux__
