#pragma once

#include <boost/asio/ip/address.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "resolvers/key_resolver.hpp"

namespace turnstile {

// Resolves "ip:<address>" from proxy headers or the transport peer.
// Forwarded headers are trusted only when they carry a public address.
class IpKeyResolver : public KeyResolver {
public:
    static constexpr const char* kUnknownKey = "unknown";

    explicit IpKeyResolver(IpResolverOptions options = {});

    std::string resolve(const ClientRequest& request) const override;
    std::string name() const override { return "ip"; }

    // Canonical client address after subnet aggregation, if any candidate validates.
    std::optional<std::string> client_address(const ClientRequest& request) const;

    // Parses a literal IPv4/IPv6 address, tolerating brackets and an IPv4 port suffix.
    static std::optional<boost::asio::ip::address> parse_address(std::string_view text);

    // False for private, loopback, link-local, multicast, reserved and unspecified ranges.
    static bool is_public(const boost::asio::ip::address& addr);

private:
    std::string canonical(boost::asio::ip::address addr) const;

    IpResolverOptions options_;
};

} 
