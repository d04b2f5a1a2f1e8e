#include "server_config.hpp"
#include "rate_limit_errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <limits>
#include <utility>

namespace turnstile {

namespace {

std::string trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return std::string(s);
}

long long parse_integer(const char* name, const std::string& value, long long min, long long max) {
    size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be an integer");
    }
    if (used != value.size() || parsed < min || parsed > max) {
        throw ConfigError(std::string(name) + " must be within " + std::to_string(min) + ".." + std::to_string(max));
    }
    return parsed;
}

double parse_double(const char* name, const std::string& value) {
    size_t used = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be a number");
    }
    if (used != value.size() || parsed < 0.0) {
        throw ConfigError(std::string(name) + " must be a non-negative number");
    }
    return parsed;
}

std::string non_empty(const char* name, const std::string& value) {
    if (value.empty()) {
        throw ConfigError(std::string(name) + " cannot be empty");
    }
    return value;
}

}

uint16_t parse_port(const std::string& text) {
    return static_cast<uint16_t>(parse_integer("port", text, 1, 65535));
}

std::vector<RouteLimit> parse_routes(std::string_view text) {
    std::vector<RouteLimit> routes;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(';', start);
        if (end == std::string_view::npos) end = text.size();

        const std::string entry = trim(text.substr(start, end - start));
        start = end + 1;
        if (entry.empty()) {
            continue;
        }

        const auto eq = entry.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Route entry '" + entry + "' must look like /prefix=limit,minutes");
        }
        std::string prefix = trim(std::string_view(entry).substr(0, eq));
        if (prefix.empty() || prefix.front() != '/') {
            throw ConfigError("Route prefix '" + prefix + "' must start with '/'");
        }
        auto same = [&prefix](const RouteLimit& r) { return r.prefix == prefix; };
        if (std::any_of(routes.begin(), routes.end(), same)) {
            throw ConfigError("Route prefix '" + prefix + "' is declared twice");
        }
        routes.push_back(RouteLimit{std::move(prefix), parse_throttle(std::string_view(entry).substr(eq + 1))});
    }

    if (routes.empty()) {
        throw ConfigError("Route table is empty");
    }
    return routes;
}

ServerConfig load_config_from_env(ServerConfig config, const EnvLookup& env) {
    auto get = [&env](const char* name) -> const char* {
        return env ? env(name) : std::getenv(name);
    };

    if (const char* e = get("TURNSTILE_ADDR")) config.address = non_empty("TURNSTILE_ADDR", e);
    if (const char* e = get("TURNSTILE_PORT")) {
        config.port = static_cast<uint16_t>(parse_integer("TURNSTILE_PORT", e, 1, 65535));
    }
    if (const char* e = get("TURNSTILE_THREADS")) {
        config.thread_count = static_cast<int>(parse_integer("TURNSTILE_THREADS", e, 0, 1024));
    }
    if (const char* e = get("TURNSTILE_MAX_BODY")) {
        config.max_message_size = static_cast<size_t>(
            parse_integer("TURNSTILE_MAX_BODY", e, 1, std::numeric_limits<int>::max()));
    }
    if (const char* e = get("TURNSTILE_TIMEOUT_SEC")) {
        config.connection_timeout_sec = static_cast<int>(parse_integer("TURNSTILE_TIMEOUT_SEC", e, 1, 3600));
    }

    if (const char* e = get("TURNSTILE_STORE")) {
        std::string backend = e;
        if (backend != "memory" && backend != "redis") {
            throw ConfigError("TURNSTILE_STORE must be 'memory' or 'redis'");
        }
        config.store_backend = backend;
    }
    if (const char* e = get("TURNSTILE_REDIS_URL")) config.redis_url = non_empty("TURNSTILE_REDIS_URL", e);
    if (const char* e = get("TURNSTILE_KEY_PREFIX")) config.key_prefix = non_empty("TURNSTILE_KEY_PREFIX", e);
    if (const char* e = get("TURNSTILE_PURGE_INTERVAL_SEC")) {
        config.purge_interval_sec = static_cast<int>(parse_integer("TURNSTILE_PURGE_INTERVAL_SEC", e, 1, 86400));
    }

    if (const char* e = get("TURNSTILE_SECRET_SALT")) config.secret_salt = non_empty("TURNSTILE_SECRET_SALT", e);
    if (const char* e = get("TURNSTILE_ADMIN_TOKEN")) config.admin_token = e;
    if (const char* e = get("TURNSTILE_SESSION_COOKIE")) config.session_cookie = e;
    if (const char* e = get("TURNSTILE_TRUSTED_USER_HEADER")) config.trusted_user_header = e;
    if (const char* e = get("TURNSTILE_IPV4_PREFIX")) {
        config.ipv4_prefix = static_cast<int>(parse_integer("TURNSTILE_IPV4_PREFIX", e, 0, 32));
    }
    if (const char* e = get("TURNSTILE_IPV6_PREFIX")) {
        config.ipv6_prefix = static_cast<int>(parse_integer("TURNSTILE_IPV6_PREFIX", e, 0, 128));
    }

    if (const char* e = get("TURNSTILE_INITIAL_TOKENS")) {
        config.initial_tokens = parse_double("TURNSTILE_INITIAL_TOKENS", e);
    }
    if (const char* e = get("TURNSTILE_HEADER_LIMIT")) config.header_names.limit = non_empty("TURNSTILE_HEADER_LIMIT", e);
    if (const char* e = get("TURNSTILE_HEADER_REMAINING")) config.header_names.remaining = non_empty("TURNSTILE_HEADER_REMAINING", e);
    if (const char* e = get("TURNSTILE_HEADER_RESET")) config.header_names.reset = non_empty("TURNSTILE_HEADER_RESET", e);
    if (const char* e = get("TURNSTILE_HEADER_RETRY_AFTER")) config.header_names.retry_after = non_empty("TURNSTILE_HEADER_RETRY_AFTER", e);

    if (const char* e = get("TURNSTILE_ROUTES")) config.routes = parse_routes(e);

    return config;
}

}
