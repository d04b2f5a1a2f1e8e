#pragma once

#include <memory>
#include <vector>

#include "rate_limiter.hpp"

namespace turnstile {

// Outcome of a policy evaluation: the reported result and the limiter that produced it.
struct PolicyDecision {
    RateLimitResult result;
    const RateLimiter* limiter = nullptr;
};

 
// Several limits enforced together on one route, e.g. "60 per minute and 1000 per hour".
// Limiters run in order and evaluation stops at the first denial, so a denied
// request is not charged against the remaining limits.
class RateLimitPolicy {
public:
    // @throws ConfigError when limiters is empty.
    explicit RateLimitPolicy(std::vector<std::unique_ptr<RateLimiter>> limiters);

    /**
     * Builds one RateLimiter per config, all sharing a store.
     * @throws ConfigError on an empty list or a config no resolver can serve.
     */
    static RateLimitPolicy build(const std::vector<RateLimitConfig>& configs,
                                 CounterStore& store,
                                 const ResolverDeps& deps = {},
                                 NowFn now = system_now,
                                 const StrategyOptions& options = {});

    // First denial, or the admitted result with the fewest remaining requests.
    PolicyDecision evaluate(const ClientRequest& request);

    RateLimitResult attempt(const ClientRequest& request) { return evaluate(request).result; }

    // Clears the caller's counters under every limit. True if any was cleared.
    bool reset(const ClientRequest& request);

    size_t size() const { return limiters_.size(); }
    const RateLimiter& limiter(size_t i) const { return *limiters_.at(i); }

private:
    std::vector<std::unique_ptr<RateLimiter>> limiters_;
};

} 
