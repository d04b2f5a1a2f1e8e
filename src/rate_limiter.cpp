#include "rate_limiter.hpp"
#include "metrics.hpp"
#include "rate_limit_errors.hpp"
#include "security_logger.hpp"

#include <utility>

namespace turnstile {

RateLimiter::RateLimiter(RateLimitConfig config,
                         CounterStore& store,
                         const ResolverDeps& deps,
                         NowFn now,
                         const StrategyOptions& options)
    : config_(std::move(config))
    , strategy_(make_strategy(config_.strategy(), store, options))
    , resolver_(make_resolver(config_, deps))
    , now_(now ? std::move(now) : NowFn(system_now))
{}

std::string RateLimiter::resolve_key(const ClientRequest& request) const {
    return resolver_->resolve(request);
}

// Evaluates one request. Denials are ordinary results; only store faults are
// caught here, and they admit the request.
RateLimitResult RateLimiter::attempt(const ClientRequest& request) {
    const std::string key = resolve_key(request);
    const Timestamp now = now_();

    RateLimitResult result;
    try {
        result = strategy_->attempt(key, config_.limit(), config_.window_seconds(), now);
    } catch (const StoreError& e) {
        return fail_open(request, key, now, e.what());
    }

    auto& metrics = MetricsRegistry::instance();
    const MetricLabels labels = {{"strategy", strategy_->name()}, {"identifier", to_string(config_.identifier())}};
    if (result.allowed) {
        metrics.increment_counter("rate_limit_allowed_total", labels);
    } else {
        metrics.increment_counter("rate_limit_denied_total", labels);
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                            request.remote_address(),
                            "Limit " + config_.describe() + " exceeded on " + request.target()
                            + ", retry in " + std::to_string(result.retry_after.value_or(0)) + "s");
    }
    return result;
}

RateLimitResult RateLimiter::fail_open(const ClientRequest& request, const std::string& key,
                                       Timestamp now, const std::string& reason) {
    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("rate_limit_store_errors_total");
    metrics.increment_counter("rate_limit_fail_open_total");
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORE_FAILURE,
                        request.remote_address(), "Counter store unavailable, admitting request: " + reason);

    RateLimitResult r = RateLimitResult::admitted(config_.limit(), config_.limit() - 1,
                                                  now + config_.window_seconds(), key, strategy_->name());
    r.approximate = true;
    return r;
}

bool RateLimiter::reset(const ClientRequest& request) {
    const std::string key = resolve_key(request);
    try {
        return strategy_->clear(key, config_.window_seconds(), now_());
    } catch (const StoreError& e) {
        MetricsRegistry::instance().increment_counter("rate_limit_store_errors_total");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORE_FAILURE,
                            request.remote_address(), std::string("Counter reset failed: ") + e.what());
        return false;
    }
}

RateLimitUsage RateLimiter::usage(const ClientRequest& request) {
    return strategy_->usage(resolve_key(request), config_.limit(), config_.window_seconds(), now_());
}

}
