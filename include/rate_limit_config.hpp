#pragma once

#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace turnstile {

enum class StrategyKind {
    Fixed,
    Sliding,
    TokenBucket
};

enum class IdentifierKind {
    Ip,
    User,
    Header,
    Composite
};

StrategyKind parse_strategy(std::string_view name);
IdentifierKind parse_identifier(std::string_view name);

std::string to_string(StrategyKind kind);
std::string to_string(IdentifierKind kind);

 
// Validated limit for one protected route. Immutable once built: every field
// is fixed by the constructor, which throws ConfigError on bad input.
class RateLimitConfig {
public:
    static constexpr const char* kDefaultHeader = "X-API-Key";
    // Longest window whose store TTL (at most 2 * window + 300) fits an int.
    static constexpr int kMaxWindowSeconds = (std::numeric_limits<int>::max() - 300) / 2;

    RateLimitConfig(int limit,
                    int window_seconds,
                    StrategyKind strategy = StrategyKind::Fixed,
                    IdentifierKind identifier = IdentifierKind::Ip,
                    std::string header_name = kDefaultHeader,
                    std::vector<IdentifierKind> composite_parts = {IdentifierKind::Ip, IdentifierKind::User});

    /**
     * Builds a config from the route-declaration surface.
     * @param requests Requests admitted per window.
     * @param window_minutes Window length in minutes.
     */
    static RateLimitConfig from_minutes(int requests,
                                        int window_minutes,
                                        StrategyKind strategy = StrategyKind::Fixed,
                                        IdentifierKind identifier = IdentifierKind::Ip);

    int limit() const { return limit_; }
    int window_seconds() const { return window_seconds_; }
    StrategyKind strategy() const { return strategy_; }
    IdentifierKind identifier() const { return identifier_; }
    const std::string& header_name() const { return header_name_; }
    const std::vector<IdentifierKind>& composite_parts() const { return composite_parts_; }

    // e.g. "60/60s sliding user"
    std::string describe() const;

private:
    int limit_;
    int window_seconds_;
    StrategyKind strategy_;
    IdentifierKind identifier_;
    std::string header_name_;
    std::vector<IdentifierKind> composite_parts_;
};

/**
 * Parses the compact route grammar used in configuration files and env vars.
 *
 *   limit,windowMinutes[,strategy[,identifier]]   one limit
 *   60,1|1000,60                                  several limits, all enforced
 *
 * identifier is one of ip, user, header, composite, header:<Header-Name>,
 * or a '+' joined list such as ip+user.
 * @throws ConfigError on any malformed part.
 */
std::vector<RateLimitConfig> parse_throttle(std::string_view text);

} 
