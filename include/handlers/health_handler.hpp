#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "counter_store.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace turnstile {

// Unthrottled operational endpoints: /health and /metrics.
class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, CounterStore& store)
        : config_(config), store_(store) {}

    // 200 when the counter store answers, 503 otherwise.
    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);
    
    // Admin token check used for /metrics from non-loopback peers.
    bool verify_admin_request(const http::request<http::string_body>& req) const;

private:
    const ServerConfig& config_;
    CounterStore& store_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("Cache-Control", "no-store");
    }
};

} 
