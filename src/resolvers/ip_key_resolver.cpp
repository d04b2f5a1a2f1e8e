#include "resolvers/ip_key_resolver.hpp"
#include "rate_limit_errors.hpp"
#include "security_logger.hpp"

#include <array>
#include <cstdint>

namespace turnstile {

namespace ip = boost::asio::ip;

namespace {

// Proxy headers in the order they are trusted.
constexpr std::array<const char*, 3> kForwardHeaders = {
    "X-Forwarded-For",
    "X-Real-IP",
    "CF-Connecting-IP"
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool is_public_v4(const ip::address_v4& addr) {
    const auto b = addr.to_bytes();
    if (b[0] == 0 || b[0] == 10 || b[0] == 127) return false;
    if (b[0] >= 224) return false;                                  // multicast and 240/4
    if (b[0] == 169 && b[1] == 254) return false;
    if (b[0] == 172 && (b[1] & 0xF0) == 16) return false;
    if (b[0] == 192 && b[1] == 168) return false;
    if (b[0] == 100 && (b[1] & 0xC0) == 64) return false;           // carrier-grade NAT
    if (b[0] == 192 && b[1] == 0 && (b[2] == 0 || b[2] == 2)) return false;
    if (b[0] == 198 && (b[1] & 0xFE) == 18) return false;
    if (b[0] == 198 && b[1] == 51 && b[2] == 100) return false;
    if (b[0] == 203 && b[1] == 0 && b[2] == 113) return false;
    return true;
}

}

IpKeyResolver::IpKeyResolver(IpResolverOptions options)
    : options_(options)
{
    if (options_.ipv4_prefix < 0 || options_.ipv4_prefix > 32) {
        throw ConfigError("IPv4 subnet prefix must be within 0..32");
    }
    if (options_.ipv6_prefix < 0 || options_.ipv6_prefix > 128) {
        throw ConfigError("IPv6 subnet prefix must be within 0..128");
    }
}

std::optional<ip::address> IpKeyResolver::parse_address(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    if (text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        text = text.substr(1, close - 1);
    } else if (text.find('.') != std::string_view::npos && text.find(':') == text.rfind(':')
               && text.find(':') != std::string_view::npos) {
        text = text.substr(0, text.find(':'));
    }

    boost::system::error_code ec;
    auto addr = ip::make_address(std::string(text), ec);
    if (ec) {
        return std::nullopt;
    }
    return addr;
}

bool IpKeyResolver::is_public(const ip::address& addr) {
    if (addr.is_v4()) {
        return is_public_v4(addr.to_v4());
    }

    const auto v6 = addr.to_v6();
    if (v6.is_v4_mapped()) {
        return is_public_v4(ip::make_address_v4(ip::v4_mapped, v6));
    }
    if (v6.is_unspecified() || v6.is_loopback() || v6.is_link_local()
        || v6.is_site_local() || v6.is_multicast()) {
        return false;
    }
    const auto b = v6.to_bytes();
    if ((b[0] & 0xFE) == 0xFC) return false;                        // unique local
    if (b[0] == 0x20 && b[1] == 0x01 && b[2] == 0x0D && b[3] == 0xB8) return false;
    return true;
}

std::string IpKeyResolver::canonical(ip::address addr) const {
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        addr = ip::make_address_v4(ip::v4_mapped, addr.to_v6());
    }

    if (addr.is_v4()) {
        std::uint32_t bits = addr.to_v4().to_uint();
        if (options_.ipv4_prefix < 32) {
            const std::uint32_t mask = options_.ipv4_prefix == 0
                ? 0u : (0xFFFFFFFFu << (32 - options_.ipv4_prefix));
            bits &= mask;
        }
        return ip::address_v4(bits).to_string();
    }

    auto bytes = addr.to_v6().to_bytes();
    if (options_.ipv6_prefix < 128) {
        const int full = options_.ipv6_prefix / 8;
        const int partial = options_.ipv6_prefix % 8;
        for (int i = full; i < 16; ++i) {
            if (i == full && partial > 0) {
                bytes[i] &= static_cast<unsigned char>(0xFF << (8 - partial));
            } else {
                bytes[i] = 0;
            }
        }
    }
    // Zone ids are dropped so every interface shares one key.
    return ip::address_v6(bytes).to_string();
}

std::optional<std::string> IpKeyResolver::client_address(const ClientRequest& request) const {
    for (const char* name : kForwardHeaders) {
        auto value = request.header(name);
        if (!value) {
            continue;
        }
        std::string_view first(*value);
        first = first.substr(0, first.find(','));

        auto addr = parse_address(first);
        if (addr && is_public(*addr)) {
            return canonical(*addr);
        }
    }

    // The transport peer may be private, e.g. behind a local proxy or in development.
    if (auto addr = parse_address(request.remote_address())) {
        return canonical(*addr);
    }
    return std::nullopt;
}

std::string IpKeyResolver::resolve(const ClientRequest& request) const {
    if (auto addr = client_address(request)) {
        return "ip:" + *addr;
    }
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::KEY_FALLBACK,
                        kUnknownKey, "No valid client address; using the shared unknown bucket");
    return kUnknownKey;
}

}
