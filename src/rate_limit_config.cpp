#include "rate_limit_config.hpp"
#include "rate_limit_errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <utility>

namespace turnstile {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while ((pos = s.find(sep)) != std::string_view::npos) {
        parts.push_back(s.substr(0, pos));
        s.remove_prefix(pos + 1);
    }
    parts.push_back(s);
    return parts;
}

int parse_positive(std::string_view text, const char* what) {
    text = trim(text);
    bool digits = std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
    if (text.empty() || !digits || text.size() > 9) {
        throw ConfigError(std::string(what) + " must be a positive integer, got '" + std::string(text) + "'");
    }
    int value = std::stoi(std::string(text));
    if (value <= 0) {
        throw ConfigError(std::string(what) + " must be a positive integer, got '" + std::string(text) + "'");
    }
    return value;
}

RateLimitConfig parse_single(std::string_view text) {
    auto parts = split(text, ',');
    if (parts.size() < 2) {
        throw ConfigError("throttle rule requires at least limit and window: '" + std::string(text) + "'");
    }
    if (parts.size() > 4) {
        throw ConfigError("throttle rule has too many fields: '" + std::string(text) + "'");
    }

    int requests = parse_positive(parts[0], "limit");
    int minutes = parse_positive(parts[1], "window");
    if (minutes > RateLimitConfig::kMaxWindowSeconds / 60) {
        throw ConfigError("window is too large: " + std::to_string(minutes) + " minutes");
    }

    StrategyKind strategy = StrategyKind::Fixed;
    if (parts.size() > 2) {
        strategy = parse_strategy(trim(parts[2]));
    }

    if (parts.size() < 4) {
        return RateLimitConfig::from_minutes(requests, minutes, strategy, IdentifierKind::Ip);
    }

    std::string_view identifier = trim(parts[3]);
    std::string header = RateLimitConfig::kDefaultHeader;
    std::vector<IdentifierKind> composite = {IdentifierKind::Ip, IdentifierKind::User};
    IdentifierKind kind;

    if (identifier.find('+') != std::string_view::npos) {
        kind = IdentifierKind::Composite;
        composite.clear();
        for (auto part : split(identifier, '+')) {
            composite.push_back(parse_identifier(trim(part)));
        }
    } else if (identifier.rfind("header:", 0) == 0) {
        kind = IdentifierKind::Header;
        header = std::string(trim(identifier.substr(7)));
        if (header.empty()) {
            throw ConfigError("header identifier requires a header name");
        }
    } else {
        kind = parse_identifier(identifier);
    }

    return RateLimitConfig(requests, minutes * 60, strategy, kind, header, composite);
}

} // namespace

StrategyKind parse_strategy(std::string_view name) {
    if (name == "fixed") return StrategyKind::Fixed;
    if (name == "sliding") return StrategyKind::Sliding;
    if (name == "token_bucket") return StrategyKind::TokenBucket;
    throw ConfigError("Invalid strategy '" + std::string(name) + "'. Valid strategies: fixed, sliding, token_bucket");
}

IdentifierKind parse_identifier(std::string_view name) {
    if (name == "ip") return IdentifierKind::Ip;
    if (name == "user") return IdentifierKind::User;
    if (name == "header") return IdentifierKind::Header;
    if (name == "composite") return IdentifierKind::Composite;
    throw ConfigError("Invalid identifier '" + std::string(name) + "'. Valid identifiers: ip, user, header, composite");
}

std::string to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Fixed: return "fixed";
        case StrategyKind::Sliding: return "sliding";
        case StrategyKind::TokenBucket: return "token_bucket";
    }
    return "unknown";
}

std::string to_string(IdentifierKind kind) {
    switch (kind) {
        case IdentifierKind::Ip: return "ip";
        case IdentifierKind::User: return "user";
        case IdentifierKind::Header: return "header";
        case IdentifierKind::Composite: return "composite";
    }
    return "unknown";
}

RateLimitConfig::RateLimitConfig(int limit,
                                 int window_seconds,
                                 StrategyKind strategy,
                                 IdentifierKind identifier,
                                 std::string header_name,
                                 std::vector<IdentifierKind> composite_parts)
    : limit_(limit)
    , window_seconds_(window_seconds)
    , strategy_(strategy)
    , identifier_(identifier)
    , header_name_(std::move(header_name))
    , composite_parts_(std::move(composite_parts))
{
    if (limit_ <= 0 || window_seconds_ <= 0) {
        throw ConfigError("Rate limit and window must be positive integers");
    }
    if (window_seconds_ > kMaxWindowSeconds) {
        throw ConfigError("window is too large: " + std::to_string(window_seconds_)
                          + " seconds (max " + std::to_string(kMaxWindowSeconds) + ")");
    }

    if (identifier_ == IdentifierKind::Header && header_name_.empty()) {
        throw ConfigError("header identifier requires a header name");
    }

    if (identifier_ == IdentifierKind::Composite) {
        if (composite_parts_.size() < 2) {
            throw ConfigError("composite identifier needs at least two parts");
        }
        for (auto part : composite_parts_) {
            if (part == IdentifierKind::Composite) {
                throw ConfigError("composite identifier cannot nest another composite");
            }
        }
    }
}

RateLimitConfig RateLimitConfig::from_minutes(int requests,
                                              int window_minutes,
                                              StrategyKind strategy,
                                              IdentifierKind identifier) {
    if (window_minutes <= 0) {
        throw ConfigError("Rate limit and window must be positive integers");
    }
    if (window_minutes > kMaxWindowSeconds / 60) {
        throw ConfigError("window is too large: " + std::to_string(window_minutes) + " minutes");
    }
    return RateLimitConfig(requests, window_minutes * 60, strategy, identifier);
}

std::string RateLimitConfig::describe() const {
    std::ostringstream ss;
    ss << limit_ << "/" << window_seconds_ << "s " << to_string(strategy_) << " ";
    if (identifier_ == IdentifierKind::Composite) {
        for (size_t i = 0; i < composite_parts_.size(); ++i) {
            if (i > 0) ss << "+";
            ss << to_string(composite_parts_[i]);
        }
    } else if (identifier_ == IdentifierKind::Header) {
        ss << "header:" << header_name_;
    } else {
        ss << to_string(identifier_);
    }
    return ss.str();
}

std::vector<RateLimitConfig> parse_throttle(std::string_view text) {
    std::vector<RateLimitConfig> limits;
    for (auto rule : split(text, '|')) {
        rule = trim(rule);
        if (rule.empty()) {
            throw ConfigError("empty throttle rule in '" + std::string(text) + "'");
        }
        limits.push_back(parse_single(rule));
    }
    return limits;
}

} 
