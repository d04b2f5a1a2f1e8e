#pragma once

#include <vector>

#include "resolvers/ip_key_resolver.hpp"

namespace turnstile {

// "header:<sha256>" of a caller-supplied token such as an API key.
// The raw token never appears in a key or a log line.
class HeaderKeyResolver : public KeyResolver {
public:
    HeaderKeyResolver(std::string header_name,
                      std::string salt,
                      std::vector<std::string> fallback_headers = {},
                      IpResolverOptions ip_options = {});

    std::string resolve(const ClientRequest& request) const override;
    std::string name() const override { return "header"; }

    // Token from the primary header, else the first fallback header present.
    std::optional<std::string> token(const ClientRequest& request) const;

    // Lowercase hex SHA-256 of salt + token.
    std::string fingerprint(const std::string& token) const;

private:
    std::string header_name_;
    std::string salt_;
    std::vector<std::string> fallback_headers_;
    IpKeyResolver ip_;
};

} 
