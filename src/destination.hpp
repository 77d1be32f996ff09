#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace cliai {

// A request URL parsed once. The allowlist gate approves this value and
// the HTTP clients connect to exactly what it names.
struct Destination {
    std::string host;   // lower-case, no brackets, no trailing dot
    uint16_t port = 0;
    bool tls = false;
    std::string target = "/"; // path and query, never empty, no fragment

    // Addresses the gate approved for a hostname admitted by a CIDR rule.
    // When set, clients connect only to these and never resolve `host`.
    std::vector<std::string> addresses;

    // "api.example.com", "[::1]:8080"; the port is omitted when default
    std::string authority() const;

    // Canonical scheme://authority/target
    std::string url() const;
};

// Throws ChatError(ConfigInvalid) on a URL without http(s) scheme or host,
// with credentials in the authority, or with whitespace/control characters.
Destination parse_destination(const std::string& url);

bool is_ip_literal(const std::string& host);

} // namespace cliai
