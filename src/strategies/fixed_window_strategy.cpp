#include "strategies/fixed_window_strategy.hpp"

#include <algorithm>
#include <utility>

namespace turnstile {

FixedWindowStrategy::FixedWindowStrategy(CounterStore& store, std::string key_prefix)
    : RateLimitStrategy(store, std::move(key_prefix))
{}

Timestamp FixedWindowStrategy::window_start(Timestamp now, int window_sec) {
    Timestamp bucket = now / window_sec;
    if (now % window_sec != 0 && now < 0) {
        --bucket;
    }
    return bucket * window_sec;
}

std::string FixedWindowStrategy::bucket_key(const std::string& key, Timestamp start) const {
    return record_key(key) + ":" + std::to_string(start);
}

// The store increments atomically, so the count returned here is this
// request's position in the bucket.
RateLimitResult FixedWindowStrategy::attempt(const std::string& key, int limit, int window_sec, Timestamp now) {
    const Timestamp start = window_start(now, window_sec);
    const Timestamp reset = start + window_sec;

    const std::int64_t count = store_.increment(bucket_key(key, start), record_ttl(window_sec, 1, kTtlSlackSec));

    if (count > limit) {
        return RateLimitResult::denied(limit, reset, reset - now, key, name());
    }
    const std::int64_t left = std::max<std::int64_t>(0, limit - count);
    return RateLimitResult::admitted(limit, static_cast<int>(left), reset, key, name());
}

bool FixedWindowStrategy::clear(const std::string& key, int window_sec, Timestamp now) {
    return store_.forget(bucket_key(key, window_start(now, window_sec)));
}

RateLimitUsage FixedWindowStrategy::usage(const std::string& key, int /*limit*/, int window_sec, Timestamp now) {
    RateLimitUsage u;
    u.window_start = window_start(now, window_sec);
    u.window_end = u.window_start + window_sec;

    auto raw = store_.get(bucket_key(key, u.window_start));
    if (raw) {
        try {
            u.count = std::stoll(*raw);
        } catch (const std::exception&) {
            u.count = 0;
        }
    }
    u.tokens = static_cast<double>(u.count);
    return u;
}

}
