#pragma once

#include "resolvers/ip_key_resolver.hpp"

namespace turnstile {

// "user:<id>" for authenticated callers, "session:<id>" for callers holding a
// session cookie, otherwise the IP key.
class UserKeyResolver : public KeyResolver {
public:
    UserKeyResolver(UserLookup lookup, std::string session_cookie, IpResolverOptions ip_options = {});

    std::string resolve(const ClientRequest& request) const override;
    std::string name() const override { return "user"; }

private:
    std::optional<std::string> authenticated_user(const ClientRequest& request) const;

    UserLookup lookup_;
    std::string session_cookie_;
    IpKeyResolver ip_;
};

} 
