#include "rate_limit_policy.hpp"
#include "rate_limit_errors.hpp"

#include <utility>

namespace turnstile {

RateLimitPolicy::RateLimitPolicy(std::vector<std::unique_ptr<RateLimiter>> limiters)
    : limiters_(std::move(limiters))
{
    if (limiters_.empty()) {
        throw ConfigError("A rate limit policy needs at least one limit");
    }
    for (const auto& l : limiters_) {
        if (!l) {
            throw ConfigError("A rate limit policy cannot hold a null limiter");
        }
    }
}

RateLimitPolicy RateLimitPolicy::build(const std::vector<RateLimitConfig>& configs,
                                       CounterStore& store,
                                       const ResolverDeps& deps,
                                       NowFn now,
                                       const StrategyOptions& options) {
    std::vector<std::unique_ptr<RateLimiter>> limiters;
    limiters.reserve(configs.size());
    for (size_t i = 0; i < configs.size(); ++i) {
        // Limits of one policy must not share records, even when their windows align.
        StrategyOptions limit_options = options;
        if (configs.size() > 1) {
            limit_options.key_prefix += ":" + std::to_string(i);
        }
        limiters.push_back(std::make_unique<RateLimiter>(configs[i], store, deps, now, limit_options));
    }
    return RateLimitPolicy(std::move(limiters));
}

PolicyDecision RateLimitPolicy::evaluate(const ClientRequest& request) {
    PolicyDecision best;
    for (const auto& limiter : limiters_) {
        RateLimitResult r = limiter->attempt(request);
        if (!r.allowed) {
            return PolicyDecision{std::move(r), limiter.get()};
        }
        if (!best.limiter || r.remaining < best.result.remaining) {
            best = PolicyDecision{std::move(r), limiter.get()};
        }
    }
    return best;
}

bool RateLimitPolicy::reset(const ClientRequest& request) {
    bool cleared = false;
    for (const auto& limiter : limiters_) {
        cleared = limiter->reset(request) || cleared;
    }
    return cleared;
}

}
