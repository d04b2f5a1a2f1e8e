#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "clock.hpp"

namespace turnstile {

 
// Outcome of one admission attempt.
// Invariants: remaining <= limit, and remaining == 0 with retry_after set
// whenever allowed is false.
struct RateLimitResult {
    bool allowed = true;
    int limit = 0;
    int remaining = 0;
    Timestamp reset_time = 0;               // Unix seconds
    std::optional<long long> retry_after;   // Seconds, only when denied

    std::string key;
    std::string strategy;

    // Set on the fail-open result produced while the store is unavailable.
    bool approximate = false;

    bool exceeded() const { return !allowed; }

    static RateLimitResult admitted(int limit, int remaining, Timestamp reset_time,
                                    std::string key = "", std::string strategy = "") {
        RateLimitResult r;
        r.allowed = true;
        r.limit = limit;
        r.remaining = std::clamp(remaining, 0, limit);
        r.reset_time = reset_time;
        r.key = std::move(key);
        r.strategy = std::move(strategy);
        return r;
    }

    static RateLimitResult denied(int limit, Timestamp reset_time, long long retry_after,
                                  std::string key = "", std::string strategy = "") {
        RateLimitResult r;
        r.allowed = false;
        r.limit = limit;
        r.remaining = 0;
        r.reset_time = reset_time;
        r.retry_after = retry_after;
        r.key = std::move(key);
        r.strategy = std::move(strategy);
        return r;
    }
};

// Read-only view of a caller's counter, for diagnostics.
struct RateLimitUsage {
    long long count = 0;          // Requests counted (tokens held for the token bucket)
    double tokens = 0.0;
    Timestamp window_start = 0;
    Timestamp window_end = 0;
};

} 
