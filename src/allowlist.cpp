#include "allowlist.hpp"
#include "error.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <algorithm>
#include <cstring>
#include <iostream>

namespace cliai {

namespace {

// Parse a port suffix; returns -1 when absent or invalid.
int parse_port(const std::string& s) {
    if (s.empty() || s.size() > 5) return -1;
    for (char c : s) {
        if (c < '0' || c > '9') return -1;
    }
    int port = std::stoi(s);
    return (port > 0 && port <= 65535) ? port : -1;
}

// Parse an address into raw bytes (4 or 16), returns 0 on failure.
size_t to_bytes(const std::string& address, unsigned char out[16]) {
    if (inet_pton(AF_INET, address.c_str(), out) == 1) return 4;
    if (inet_pton(AF_INET6, address.c_str(), out) == 1) return 16;
    return 0;
}

} // namespace

// ── Pattern parsing ────────────────────────────────────────────

AllowlistGate::Pattern AllowlistGate::parse_pattern(const std::string& raw) {
    Pattern p;
    p.raw = raw;
    std::string s = to_lower(trim(raw));

    if (!s.empty() && s[0] == '[') {
        // [v6]:port
        size_t close = s.find(']');
        if (close != std::string::npos) {
            if (close + 1 < s.size() && s[close + 1] == ':') {
                p.port = parse_port(s.substr(close + 2));
            }
            s = s.substr(1, close - 1);
        }
    } else if (std::count(s.begin(), s.end(), ':') == 1) {
        // host:port or v4-cidr:port; bare IPv6 has several colons
        size_t colon = s.find(':');
        int port = parse_port(s.substr(colon + 1));
        if (port > 0) {
            p.port = port;
            s = s.substr(0, colon);
        }
    }

    while (!s.empty() && s.back() == '.') s.pop_back();
    p.host = s;
    p.wildcard = s.size() > 2 && s.compare(0, 2, "*.") == 0;
    p.cidr = s.find('/') != std::string::npos;
    return p;
}

// ── Matching primitives ────────────────────────────────────────

bool wildcard_matches(const std::string& pattern, const std::string& host) {
    if (pattern.size() < 3 || pattern.compare(0, 2, "*.") != 0) return false;
    std::string suffix = pattern.substr(1); // ".example.com"
    if (host.size() <= suffix.size()) return false;
    if (host.compare(host.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    std::string label = host.substr(0, host.size() - suffix.size());
    return !label.empty() && label.find('.') == std::string::npos;
}

bool cidr_contains(const std::string& cidr, const std::string& address) {
    size_t slash = cidr.find('/');
    if (slash == std::string::npos) return false;

    unsigned char net[16];
    unsigned char addr[16];
    size_t net_len = to_bytes(cidr.substr(0, slash), net);
    size_t addr_len = to_bytes(address, addr);
    if (net_len == 0 || net_len != addr_len) return false;

    std::string bits_str = cidr.substr(slash + 1);
    if (bits_str.empty() || bits_str.size() > 3) return false;
    for (char c : bits_str) {
        if (c < '0' || c > '9') return false;
    }
    int bits = std::stoi(bits_str);
    if (bits > static_cast<int>(net_len * 8)) return false;

    size_t full = static_cast<size_t>(bits / 8);
    if (std::memcmp(net, addr, full) != 0) return false;
    int rest = bits % 8;
    if (rest == 0) return true;
    auto mask = static_cast<unsigned char>(0xFF << (8 - rest));
    return (net[full] & mask) == (addr[full] & mask);
}

std::vector<std::string> resolve_host(const std::string& host) {
    std::vector<std::string> result;
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0) return result;

    for (auto* ai = res; ai; ai = ai->ai_next) {
        char buf[INET6_ADDRSTRLEN] = {};
        const void* src = nullptr;
        if (ai->ai_family == AF_INET) {
            src = &reinterpret_cast<struct sockaddr_in*>(ai->ai_addr)->sin_addr;
        } else if (ai->ai_family == AF_INET6) {
            src = &reinterpret_cast<struct sockaddr_in6*>(ai->ai_addr)->sin6_addr;
        }
        if (src && inet_ntop(ai->ai_family, src, buf, sizeof(buf))) {
            result.emplace_back(buf);
        }
    }
    freeaddrinfo(res);
    return result;
}

// ── AllowlistGate ──────────────────────────────────────────────

AllowlistGate::AllowlistGate(AllowlistPolicy policy, HostResolver resolver)
    : policy_(std::move(policy)), resolver_(std::move(resolver)) {
    for (const auto& raw : policy_.hosts) {
        if (trim(raw).empty()) continue;
        Pattern p = parse_pattern(raw);
        if (p.cidr) has_cidr_ = true;
        patterns_.push_back(std::move(p));
    }
}

std::string AllowlistGate::match(const Destination& dest) const {
    return match_pinned(dest, nullptr);
}

std::string AllowlistGate::match_pinned(const Destination& dest,
                                        std::vector<std::string>* pinned) const {
    auto port_ok = [&](const Pattern& p) {
        return p.port < 0 || p.port == dest.port;
    };

    // 1. exact hostname (or bare IP)
    for (const auto& p : patterns_) {
        if (!p.wildcard && !p.cidr && p.host == dest.host && port_ok(p)) return p.raw;
    }
    // 2. single-label wildcard
    for (const auto& p : patterns_) {
        if (p.wildcard && port_ok(p) && wildcard_matches(p.host, dest.host)) return p.raw;
    }
    // 3. CIDR, against the literal or its resolved addresses
    if (!has_cidr_) return {};
    bool literal = is_ip_literal(dest.host);
    std::vector<std::string> addresses;
    if (literal) {
        addresses.push_back(dest.host);
    } else if (resolver_) {
        addresses = resolver_(dest.host);
    }

    std::string admitted;
    std::vector<std::string> in_range;
    for (const auto& addr : addresses) {
        for (const auto& p : patterns_) {
            if (p.cidr && port_ok(p) && cidr_contains(p.host, addr)) {
                if (admitted.empty()) admitted = p.raw;
                in_range.push_back(addr);
                break;
            }
        }
    }
    if (!admitted.empty() && pinned && !literal) *pinned = std::move(in_range);
    return admitted;
}

bool AllowlistGate::allows(const std::string& url) const {
    if (!policy_.enforced) return true;
    Destination dest = parse_destination(url);
    return !match(dest).empty();
}

Destination AllowlistGate::approve(const std::string& url) const {
    Destination dest = parse_destination(url);
    if (!policy_.enforced) return dest;
    if (!match_pinned(dest, &dest.addresses).empty()) return dest;

    std::cerr << "[allowlist] Rejected " << dest.host << ":" << dest.port
              << " (" << truncate(url, 120) << ")\n";
    throw ChatError(ErrorKind::HostNotAllowed,
                    "Host '" + dest.host + "' is not in the allowlist. "
                    "Add it to security.allowed_hosts in ~/.cliai/config.json "
                    "or CLIAI_ALLOWED_HOSTS.");
}

} // namespace cliai
