#pragma once

#include "strategies/rate_limit_strategy.hpp"

namespace turnstile {

// Bucket of `limit` tokens refilled continuously at limit/window per second.
// Admits bursts up to capacity while enforcing the long-run average rate.
class TokenBucketStrategy : public RateLimitStrategy {
public:
    static constexpr int kTtlSlackSec = 300;

    /**
     * @param initial_tokens Tokens granted to a caller seen for the first time.
     *                       Clamped to [0, limit] on use.
     */
    TokenBucketStrategy(CounterStore& store, std::string key_prefix, double initial_tokens = 0.0);

    RateLimitResult attempt(const std::string& key, int limit, int window_sec, Timestamp now) override;
    bool clear(const std::string& key, int window_sec, Timestamp now) override;
    RateLimitUsage usage(const std::string& key, int limit, int window_sec, Timestamp now) override;
    std::string name() const override { return "token_bucket"; }

    // Fills the caller's bucket to capacity.
    void refill(const std::string& key, int limit, int window_sec, Timestamp now);

    double initial_tokens() const { return initial_tokens_; }

private:
    struct BucketState {
        double tokens;
        Timestamp last_refill;
    };

    // Stored state advanced to `now`, or a fresh bucket when none is stored.
    BucketState load(const std::string& record, int limit, int window_sec, Timestamp now);
    void save(const std::string& record, const BucketState& state, int window_sec);

    double initial_tokens_;
};

} 
