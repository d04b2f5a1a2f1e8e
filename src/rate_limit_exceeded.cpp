#include "rate_limit_exceeded.hpp"

#include <utility>

namespace turnstile {

RateLimitExceeded::RateLimitExceeded(RateLimitResult result, int window_seconds, IdentifierKind identifier)
    : std::runtime_error(build_message(result, window_seconds, identifier))
    , result_(std::move(result))
    , window_seconds_(window_seconds)
    , identifier_(identifier)
{}

std::string RateLimitExceeded::build_message(const RateLimitResult& result, int window_seconds,
                                             IdentifierKind identifier) {
    return "Rate limit exceeded for " + to_string(identifier)
        + ". Limit: " + std::to_string(result.limit)
        + " requests per " + std::to_string(window_seconds) + " seconds"
        + ". Try again in " + std::to_string(result.retry_after.value_or(1)) + " seconds.";
}

}
