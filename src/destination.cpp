#include "destination.hpp"
#include "error.hpp"
#include "util.hpp"

#include <arpa/inet.h>

namespace cliai {

static bool valid_port(const std::string& s, uint16_t& out) {
    if (s.empty() || s.size() > 5) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    int port = std::stoi(s);
    if (port <= 0 || port > 65535) return false;
    out = static_cast<uint16_t>(port);
    return true;
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[16];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

Destination parse_destination(const std::string& url) {
    for (char c : url) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f || c == '\\') {
            throw ChatError(ErrorKind::ConfigInvalid,
                            "Invalid character in URL: " + truncate(url, 120));
        }
    }

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ChatError(ErrorKind::ConfigInvalid, "Invalid URL (missing scheme): " + url);
    }
    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        throw ChatError(ErrorKind::ConfigInvalid, "Unsupported URL scheme: " + scheme);
    }

    Destination dest;
    dest.tls = (scheme == "https");

    // The authority ends at the first '/', '?' or '#', whatever follows
    size_t auth_start = scheme_end + 3;
    size_t auth_end = url.find_first_of("/?#", auth_start);
    std::string authority = url.substr(auth_start,
        auth_end == std::string::npos ? std::string::npos : auth_end - auth_start);
    if (authority.find('@') != std::string::npos) {
        throw ChatError(ErrorKind::ConfigInvalid,
                        "Credentials in URLs are not supported: " + truncate(url, 120));
    }

    std::string rest = auth_end == std::string::npos ? "" : url.substr(auth_end);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);
    if (rest.empty()) rest = "/";
    else if (rest[0] == '?') rest.insert(0, "/");
    dest.target = rest;

    std::string host = authority;
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw ChatError(ErrorKind::ConfigInvalid, "Invalid IPv6 host in URL: " + url);
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw ChatError(ErrorKind::ConfigInvalid, "Invalid IPv6 host in URL: " + url);
            }
            port = authority.substr(close + 2);
            if (port.empty()) {
                throw ChatError(ErrorKind::ConfigInvalid, "Invalid port in URL: " + url);
            }
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
            if (port.empty()) {
                throw ChatError(ErrorKind::ConfigInvalid, "Invalid port in URL: " + url);
            }
        }
    }

    host = to_lower(host);
    while (!host.empty() && host.back() == '.') host.pop_back();
    if (host.empty() || host.find_first_of("[]:") != std::string::npos) {
        if (host.empty() || !is_ip_literal(host)) {
            throw ChatError(ErrorKind::ConfigInvalid, "URL has no valid host: " + url);
        }
    }
    dest.host = host;

    if (port.empty()) {
        dest.port = dest.tls ? 443 : 80;
    } else if (!valid_port(port, dest.port)) {
        throw ChatError(ErrorKind::ConfigInvalid, "Invalid port in URL: " + url);
    }
    return dest;
}

std::string Destination::authority() const {
    std::string out = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    uint16_t default_port = tls ? 443 : 80;
    if (port != default_port) out += ":" + std::to_string(port);
    return out;
}

std::string Destination::url() const {
    return std::string(tls ? "https://" : "http://") + authority() + target;
}

} // namespace cliai
