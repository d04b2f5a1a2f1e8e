#include "strategies/token_bucket_strategy.hpp"
#include "security_logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <boost/json.hpp>

namespace turnstile {

namespace json = boost::json;

namespace {

// Absorbs floating-point error so that e.g. 0.9999999999 tokens counts as one.
constexpr double kEpsilon = 1e-9;

long long ceil_seconds(double seconds) {
    if (seconds <= kEpsilon) {
        return 0;
    }
    return static_cast<long long>(std::ceil(seconds - kEpsilon));
}

}

TokenBucketStrategy::TokenBucketStrategy(CounterStore& store, std::string key_prefix, double initial_tokens)
    : RateLimitStrategy(store, std::move(key_prefix))
    , initial_tokens_(initial_tokens)
{}

TokenBucketStrategy::BucketState TokenBucketStrategy::load(const std::string& record, int limit,
                                                           int window_sec, Timestamp now) {
    const double capacity = static_cast<double>(limit);
    const double rate = capacity / window_sec;

    BucketState state{std::clamp(initial_tokens_, 0.0, capacity), now};

    auto raw = store_.get(record);
    if (raw) {
        try {
            const json::value parsed = json::parse(*raw);
            const json::object& doc = parsed.as_object();
            state.tokens = json::value_to<double>(doc.at("tokens"));
            state.last_refill = json::value_to<Timestamp>(doc.at("last_refill"));
        } catch (const std::exception& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_FAILURE,
                                "internal", std::string("Discarding malformed token bucket record: ") + e.what());
            state = BucketState{std::clamp(initial_tokens_, 0.0, capacity), now};
        }
    }

    // A clock that went backwards refills nothing, and the refill mark never
    // moves back, so an interval is only ever credited once.
    const Timestamp elapsed = std::max<Timestamp>(0, now - state.last_refill);
    state.tokens = std::clamp(state.tokens + static_cast<double>(elapsed) * rate, 0.0, capacity);
    state.last_refill = std::max(state.last_refill, now);
    return state;
}

void TokenBucketStrategy::save(const std::string& record, const BucketState& state, int window_sec) {
    json::object doc;
    doc["tokens"] = state.tokens;
    doc["last_refill"] = state.last_refill;
    store_.put(record, json::serialize(doc), record_ttl(window_sec, 2, kTtlSlackSec));
}

RateLimitResult TokenBucketStrategy::attempt(const std::string& key, int limit, int window_sec, Timestamp now) {
    const std::string record = record_key(key);
    const double capacity = static_cast<double>(limit);
    const double rate = capacity / window_sec;

    BucketState state = load(record, limit, window_sec, now);
    const bool admit = state.tokens + kEpsilon >= 1.0;
    if (admit) {
        state.tokens = std::max(0.0, state.tokens - 1.0);
    }
    save(record, state, window_sec);

    const Timestamp reset = now + ceil_seconds((capacity - state.tokens) / rate);
    if (!admit) {
        const long long retry = std::max<long long>(1, ceil_seconds((1.0 - state.tokens) / rate));
        return RateLimitResult::denied(limit, reset, retry, key, name());
    }

    const int left = static_cast<int>(std::floor(state.tokens + kEpsilon));
    return RateLimitResult::admitted(limit, left, reset, key, name());
}

bool TokenBucketStrategy::clear(const std::string& key, int /*window_sec*/, Timestamp /*now*/) {
    return store_.forget(record_key(key));
}

RateLimitUsage TokenBucketStrategy::usage(const std::string& key, int limit, int window_sec, Timestamp now) {
    const BucketState state = load(record_key(key), limit, window_sec, now);
    const double rate = static_cast<double>(limit) / window_sec;

    RateLimitUsage u;
    u.tokens = state.tokens;
    u.count = static_cast<long long>(std::floor(state.tokens + kEpsilon));
    u.window_start = now;
    u.window_end = now + ceil_seconds((limit - state.tokens) / rate);
    return u;
}

void TokenBucketStrategy::refill(const std::string& key, int limit, int window_sec, Timestamp now) {
    save(record_key(key), BucketState{static_cast<double>(limit), now}, window_sec);
}

}
