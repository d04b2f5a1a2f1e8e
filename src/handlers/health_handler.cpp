#include "handlers/health_handler.hpp"

#include <openssl/crypto.h>

namespace turnstile {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    const bool store_up = store_.ping();
    MetricsRegistry::instance().set_gauge("rate_limit_store_up", store_up ? 1.0 : 0.0);

    json::object response;
    response["status"] = store_up ? "healthy" : "degraded";
    response["store"] = store_.backend();
    response["store_reachable"] = store_up;
    // A degraded store means every request is admitted unchecked.
    response["fail_open"] = !store_up;
    
    http::response<http::string_body> res{store_up ? http::status::ok : http::status::service_unavailable, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    
    add_security_headers(res);
    
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();
    
    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();
    
    add_security_headers(res);
    
    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) const {
    // If no token is configured, admin access is disabled.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    const auto provided = auth_it->value();
    return provided.size() == config_.admin_token.size()
        && CRYPTO_memcmp(provided.data(), config_.admin_token.data(), provided.size()) == 0;
}

}
