#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rate_limit_middleware.hpp"
#include "server_config.hpp"

namespace turnstile {

// Maps request paths to the middleware guarding them.
// The longest matching prefix wins; a prefix matches whole path segments only.
class RouteTable {
public:
    RouteTable() = default;

    RouteTable(const RouteTable&) = delete;
    RouteTable& operator=(const RouteTable&) = delete;

    /**
     * Builds one middleware per configured route.
     * @throws ConfigError if any route cannot be built.
     */
    static std::unique_ptr<RouteTable> build(const ServerConfig& config, CounterStore& store,
                                             const ResolverDeps& deps, NowFn now = system_now);

    void add(std::string prefix, std::unique_ptr<RateLimitMiddleware> middleware);

    // Middleware for a request target (query string ignored), or nullptr.
    RateLimitMiddleware* match(std::string_view target) const;

    size_t size() const { return routes_.size(); }

    static bool prefix_matches(std::string_view prefix, std::string_view path);

private:
    struct Entry {
        std::string prefix;
        std::unique_ptr<RateLimitMiddleware> middleware;
    };

    std::vector<Entry> routes_;  // Sorted by descending prefix length
};

} 
