#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client_request.hpp"
#include "rate_limit_config.hpp"

namespace turnstile {

// Returns the authenticated user id for a request, or std::nullopt.
using UserLookup = std::function<std::optional<std::string>(const ClientRequest&)>;

struct IpResolverOptions {
    int ipv4_prefix = 32;     // e.g. 24 to share one quota per /24
    int ipv6_prefix = 128;    // e.g. 64 to share one quota per /64
};

// Collaborators handed to every resolver built by make_resolver().
struct ResolverDeps {
    UserLookup user_lookup;
    std::string session_cookie = "session_id";
    std::string token_salt;
    std::vector<std::string> fallback_headers = {"Authorization", "X-Auth-Token", "X-Client-ID"};
    IpResolverOptions ip;
};

 
// Maps a request to the identifier its quota is counted under.
// resolve() is total: it never throws and always returns a non-empty key.
class KeyResolver {
public:
    virtual ~KeyResolver() = default;

    virtual std::string resolve(const ClientRequest& request) const = 0;
    virtual std::string name() const = 0;
};

/**
 * Builds the resolver a route config asks for.
 * @throws ConfigError for a composite config that cannot be built.
 */
std::unique_ptr<KeyResolver> make_resolver(const RateLimitConfig& config, const ResolverDeps& deps);

} 
