#include "route_table.hpp"
#include "rate_limit_errors.hpp"

#include <algorithm>
#include <utility>

namespace turnstile {

std::unique_ptr<RouteTable> RouteTable::build(const ServerConfig& config, CounterStore& store,
                                              const ResolverDeps& deps, NowFn now) {
    StrategyOptions options;
    options.key_prefix = config.key_prefix;
    options.initial_tokens = config.initial_tokens;

    auto table = std::make_unique<RouteTable>();
    for (const auto& route : config.routes) {
        // Each route counts separately even when two routes share a limit shape.
        StrategyOptions route_options = options;
        route_options.key_prefix = options.key_prefix + ":" + route.prefix;

        auto policy = RateLimitPolicy::build(route.limits, store, deps, now, route_options);
        table->add(route.prefix, std::make_unique<RateLimitMiddleware>(std::move(policy),
                                                                       RateLimitHeaders(config.header_names)));
    }
    return table;
}

void RouteTable::add(std::string prefix, std::unique_ptr<RateLimitMiddleware> middleware) {
    if (prefix.empty() || prefix.front() != '/') {
        throw ConfigError("Route prefix must start with '/'");
    }
    if (!middleware) {
        throw ConfigError("Route '" + prefix + "' has no middleware");
    }
    routes_.push_back(Entry{std::move(prefix), std::move(middleware)});
    std::stable_sort(routes_.begin(), routes_.end(), [](const Entry& a, const Entry& b) {
        return a.prefix.size() > b.prefix.size();
    });
}

bool RouteTable::prefix_matches(std::string_view prefix, std::string_view path) {
    if (path.substr(0, prefix.size()) != prefix) {
        return false;
    }
    return prefix.back() == '/' || path.size() == prefix.size() || path[prefix.size()] == '/';
}

RateLimitMiddleware* RouteTable::match(std::string_view target) const {
    const std::string_view path = target.substr(0, target.find('?'));
    for (const auto& entry : routes_) {
        if (prefix_matches(entry.prefix, path)) {
            return entry.middleware.get();
        }
    }
    return nullptr;
}

}
