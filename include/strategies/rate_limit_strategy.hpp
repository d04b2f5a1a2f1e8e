#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "clock.hpp"
#include "counter_store.hpp"
#include "rate_limit_config.hpp"
#include "rate_limit_result.hpp"

namespace turnstile {

struct StrategyOptions {
    std::string key_prefix = "rate_limit";
    double initial_tokens = 0.0;    // Token bucket only
};

 
// Admission algorithm evaluated against a CounterStore.
// Implementations keep no per-key state of their own; everything lives in the store,
// so any number of instances may share one backend.
class RateLimitStrategy {
public:
    RateLimitStrategy(CounterStore& store, std::string key_prefix);
    virtual ~RateLimitStrategy() = default;

    RateLimitStrategy(const RateLimitStrategy&) = delete;
    RateLimitStrategy& operator=(const RateLimitStrategy&) = delete;

    /**
     * Counts one request against the caller's record and decides admission.
     * @param key Caller identifier produced by a KeyResolver.
     * @param limit Requests admitted per window.
     * @param window_sec Window length in seconds.
     * @param now Current Unix time in seconds.
     * @throws StoreError when the store cannot answer.
     */
    virtual RateLimitResult attempt(const std::string& key, int limit, int window_sec, Timestamp now) = 0;

    // Deletes the caller's record. Returns true if one existed.
    virtual bool clear(const std::string& key, int window_sec, Timestamp now) = 0;

    // Reads the caller's record without counting a request.
    virtual RateLimitUsage usage(const std::string& key, int limit, int window_sec, Timestamp now) = 0;

    virtual std::string name() const = 0;

protected:
    // <prefix>:<name>:<key>
    std::string record_key(const std::string& key) const;

    // window * multiplier + slack, saturated at the largest TTL a store accepts.
    static int record_ttl(int window_sec, int multiplier, int slack_sec);

    CounterStore& store_;
    std::string prefix_;
};

std::unique_ptr<RateLimitStrategy> make_strategy(StrategyKind kind,
                                                 CounterStore& store,
                                                 const StrategyOptions& options = {});

} 
