#include "strategies/rate_limit_strategy.hpp"
#include "strategies/fixed_window_strategy.hpp"
#include "strategies/sliding_window_strategy.hpp"
#include "strategies/token_bucket_strategy.hpp"
#include "rate_limit_errors.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace turnstile {

RateLimitStrategy::RateLimitStrategy(CounterStore& store, std::string key_prefix)
    : store_(store)
    , prefix_(std::move(key_prefix))
{}

std::string RateLimitStrategy::record_key(const std::string& key) const {
    return prefix_ + ":" + name() + ":" + key;
}

int RateLimitStrategy::record_ttl(int window_sec, int multiplier, int slack_sec) {
    const std::int64_t ttl = static_cast<std::int64_t>(window_sec) * multiplier + slack_sec;
    return static_cast<int>(std::clamp<std::int64_t>(ttl, 1, std::numeric_limits<int>::max()));
}

std::unique_ptr<RateLimitStrategy> make_strategy(StrategyKind kind,
                                                 CounterStore& store,
                                                 const StrategyOptions& options) {
    switch (kind) {
        case StrategyKind::Fixed:
            return std::make_unique<FixedWindowStrategy>(store, options.key_prefix);
        case StrategyKind::Sliding:
            return std::make_unique<SlidingWindowStrategy>(store, options.key_prefix);
        case StrategyKind::TokenBucket:
            return std::make_unique<TokenBucketStrategy>(store, options.key_prefix, options.initial_tokens);
    }
    throw ConfigError("Unknown rate limit strategy");
}

}
