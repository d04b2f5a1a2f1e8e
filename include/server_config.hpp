#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <functional>
#include <vector>

#include "rate_limit_config.hpp"
#include "rate_limit_headers.hpp"

namespace turnstile {

// Limits enforced on every request whose target starts with prefix.
struct RouteLimit {
    std::string prefix;
    std::vector<RateLimitConfig> limits;
};

 
// Service configuration. Defaults suit local development; production values
// come from TURNSTILE_* environment variables via load_config_from_env().
struct ServerConfig {
    static constexpr const char* kDefaultSalt = "CHANGE_ME_IN_PRODUCTION_VIA_ENV";

    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency
    size_t max_message_size = 64 * 1024;
    int connection_timeout_sec = 60;

    // --- Counter Store ---
    std::string store_backend = "memory";  // memory | redis
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string key_prefix = "rate_limit";
    int purge_interval_sec = 300;          // Memory store expiry sweep

    // --- Key Resolution ---
    std::string secret_salt = kDefaultSalt;    // Salts hashed header tokens
    std::string session_cookie = "session_id";
    std::string trusted_user_header = "";      // Honoured only from loopback peers
    int ipv4_prefix = 32;
    int ipv6_prefix = 128;

    std::string admin_token = "";  // Grants /metrics to non-loopback peers

    // --- Strategies & Responses ---
    double initial_tokens = 0.0;
    HeaderNames header_names;

    // --- Protected routes, matched longest prefix first ---
    std::vector<RouteLimit> routes = {
        {"/", parse_throttle("60,1")}
    };
};

using EnvLookup = std::function<const char*(const char*)>;

/**
 * Parses "prefix=throttle;prefix=throttle", e.g. "/api=60,1,sliding,ip;/login=5,1".
 * @throws ConfigError on a malformed entry or a prefix not starting with '/'.
 */
std::vector<RouteLimit> parse_routes(std::string_view text);

/**
 * Parses a TCP port given as plain decimal text.
 * @throws ConfigError unless the whole text is an integer in 1..65535.
 */
uint16_t parse_port(const std::string& text);

/**
 * Applies TURNSTILE_* overrides on top of base.
 * @param env Variable lookup; std::getenv when empty.
 * @throws ConfigError on any value that does not parse or is out of range.
 */
ServerConfig load_config_from_env(ServerConfig base = {}, const EnvLookup& env = nullptr);

} 
