#pragma once

#include "strategies/rate_limit_strategy.hpp"

namespace turnstile {

// Counts requests in aligned buckets [k*window, (k+1)*window).
// Bursts of up to 2*limit are possible across a bucket boundary.
class FixedWindowStrategy : public RateLimitStrategy {
public:
    static constexpr int kTtlSlackSec = 60;

    FixedWindowStrategy(CounterStore& store, std::string key_prefix);

    RateLimitResult attempt(const std::string& key, int limit, int window_sec, Timestamp now) override;
    bool clear(const std::string& key, int window_sec, Timestamp now) override;
    RateLimitUsage usage(const std::string& key, int limit, int window_sec, Timestamp now) override;
    std::string name() const override { return "fixed"; }

    static Timestamp window_start(Timestamp now, int window_sec);

private:
    std::string bucket_key(const std::string& key, Timestamp start) const;
};

} 
