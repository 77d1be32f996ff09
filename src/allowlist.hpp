#pragma once
#include "config.hpp"
#include "destination.hpp"
#include <functional>
#include <string>
#include <vector>

namespace cliai {

// "*.example.com" matches "api.example.com" but neither "example.com"
// nor "a.b.example.com".
bool wildcard_matches(const std::string& pattern, const std::string& host);

// "10.0.0.0/8" or "fd00::/8" containment. False for malformed input.
bool cidr_contains(const std::string& cidr, const std::string& address);

// Returns the IP addresses a hostname resolves to (empty on failure).
using HostResolver = std::function<std::vector<std::string>(const std::string& host)>;

// getaddrinfo-based resolver
std::vector<std::string> resolve_host(const std::string& host);

// Decides whether a destination may be contacted. Runs before every
// connection attempt, including retries and redirect hops.
class AllowlistGate {
public:
    explicit AllowlistGate(AllowlistPolicy policy, HostResolver resolver = resolve_host);

    // Pattern that admits the destination, or empty if none does.
    std::string match(const Destination& dest) const;

    bool allows(const std::string& url) const;

    // Parses `url` and returns the destination to connect to. A hostname
    // admitted only through a CIDR rule comes back with the in-range
    // addresses pinned. Throws ChatError(HostNotAllowed) when enforced and
    // nothing matches, ChatError(ConfigInvalid) for a malformed URL.
    Destination approve(const std::string& url) const;

    void check(const std::string& url) const { (void)approve(url); }

    const AllowlistPolicy& policy() const { return policy_; }

private:
    struct Pattern {
        std::string host;     // lower-case; "*.d", IP, CIDR or hostname
        int port = -1;        // -1 = any
        bool wildcard = false;
        bool cidr = false;
        std::string raw;
    };

    static Pattern parse_pattern(const std::string& raw);

    // As match(); fills `pinned` when the admitting rule is a CIDR range
    // and the host is a name rather than an address.
    std::string match_pinned(const Destination& dest, std::vector<std::string>* pinned) const;

    AllowlistPolicy policy_;
    HostResolver resolver_;
    std::vector<Pattern> patterns_;
    bool has_cidr_ = false;
};

} // namespace cliai
