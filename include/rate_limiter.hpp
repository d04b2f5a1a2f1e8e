#pragma once

#include <memory>
#include <string>

#include "clock.hpp"
#include "client_request.hpp"
#include "counter_store.hpp"
#include "rate_limit_config.hpp"
#include "rate_limit_result.hpp"
#include "resolvers/key_resolver.hpp"
#include "strategies/rate_limit_strategy.hpp"

namespace turnstile {

 
// Admission engine for one configured limit.
// Resolves the caller's key, runs the configured strategy against the shared
// CounterStore and returns the result as-is. Never throws on the request path:
// a failing store yields an approximate "allowed" result (fail-open).
class RateLimiter {
public:
    RateLimiter(RateLimitConfig config,
                CounterStore& store,
                const ResolverDeps& deps = {},
                NowFn now = system_now,
                const StrategyOptions& options = {});
    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Counts one request and decides admission.
     * @param request Inbound request; only read.
     * @return Decision with header data. approximate is set when the store failed.
     */
    RateLimitResult attempt(const ClientRequest& request);

    // Clears the caller's counter. Returns false if nothing was cleared or the store failed.
    bool reset(const ClientRequest& request);

    // Caller's current usage without counting a request.
    // @throws StoreError when the store cannot answer.
    RateLimitUsage usage(const ClientRequest& request);

    std::string resolve_key(const ClientRequest& request) const;

    const RateLimitConfig& config() const { return config_; }
    RateLimitStrategy& strategy() { return *strategy_; }
    const KeyResolver& resolver() const { return *resolver_; }

private:
    RateLimitResult fail_open(const ClientRequest& request, const std::string& key,
                              Timestamp now, const std::string& reason);

    RateLimitConfig config_;
    std::unique_ptr<RateLimitStrategy> strategy_;
    std::unique_ptr<KeyResolver> resolver_;
    NowFn now_;
};

} 
