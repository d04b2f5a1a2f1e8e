#pragma once

#include <stdexcept>
#include <string>

#include "rate_limit_config.hpp"
#include "rate_limit_result.hpp"

namespace turnstile {

// Denial raised by RateLimitMiddleware::enforce(). Never thrown by the engine.
class RateLimitExceeded : public std::runtime_error {
public:
    static constexpr const char* kErrorCode = "RATE_001";

    RateLimitExceeded(RateLimitResult result, int window_seconds, IdentifierKind identifier);

    int limit() const { return result_.limit; }
    int window_seconds() const { return window_seconds_; }
    long long retry_after() const { return result_.retry_after.value_or(1); }
    IdentifierKind identifier() const { return identifier_; }
    const RateLimitResult& result() const { return result_; }

private:
    static std::string build_message(const RateLimitResult& result, int window_seconds, IdentifierKind identifier);

    RateLimitResult result_;
    int window_seconds_;
    IdentifierKind identifier_;
};

} 
