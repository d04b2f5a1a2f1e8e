#pragma once

#include <vector>

#include "strategies/rate_limit_strategy.hpp"

namespace turnstile {

// Keeps the timestamp of every admitted request in the trailing window.
// Denied requests are not recorded, so a denial never extends the wait.
class SlidingWindowStrategy : public RateLimitStrategy {
public:
    static constexpr int kTtlSlackSec = 60;

    SlidingWindowStrategy(CounterStore& store, std::string key_prefix);

    RateLimitResult attempt(const std::string& key, int limit, int window_sec, Timestamp now) override;
    bool clear(const std::string& key, int window_sec, Timestamp now) override;
    RateLimitUsage usage(const std::string& key, int limit, int window_sec, Timestamp now) override;
    std::string name() const override { return "sliding"; }

private:
    // Ascending timestamps newer than now - window_sec.
    std::vector<Timestamp> load_live(const std::string& record, int window_sec, Timestamp now);
};

} 
