#include "redis_store.hpp"

#include <chrono>
#include <iostream>
#include <vector>

namespace turnstile {

RedisStore::RedisStore(const std::string& redis_url) {
    try {
        // The client connects lazily from its pool, so a server that is down
        // now is picked up again by the first call after it comes back.
        redis_ = std::make_unique<sw::redis::Redis>(redis_url);
    } catch (const std::exception& e) {
        std::cerr << "[!] Invalid Redis URL: " << e.what() << "\n";
        return;
    }

    if (ping()) {
        std::cout << "[*] Redis counter store connected: " << redis_url << "\n";
    } else {
        std::cerr << "[!] Redis unreachable at " << redis_url << ", retrying on each request\n";
    }
}

sw::redis::Redis& RedisStore::client() {
    if (!redis_) {
        throw StoreError("redis counter store has no client");
    }
    return *redis_;
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    try {
        auto val = client().get(key);
        connected_ = true;
        if (val) return *val;
        return std::nullopt;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis GET failed: ") + e.what());
    }
}

void RedisStore::put(const std::string& key, const std::string& value, int ttl_sec) {
    try {
        client().set(key, value, std::chrono::seconds(ttl_sec));
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis SET failed: ") + e.what());
    }
}

bool RedisStore::forget(const std::string& key) {
    try {
        const bool removed = client().del(key) > 0;
        connected_ = true;
        return removed;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis DEL failed: ") + e.what());
    }
}

// Atomic increment-and-get. The TTL is only attached by the call that creates
// the key so the window boundary of a fixed-window counter never moves.
std::int64_t RedisStore::increment(const std::string& key, int ttl_sec) {
    static const std::string script = R"(
        local value = redis.call('INCR', KEYS[1])
        if value == 1 then
            redis.call('EXPIRE', KEYS[1], tonumber(ARGV[1]))
        end
        return value
    )";

    try {
        std::vector<std::string> keys = {key};
        std::vector<std::string> args = {std::to_string(ttl_sec)};
        const long long value = client().eval<long long>(script, keys.begin(), keys.end(), args.begin(), args.end());
        connected_ = true;
        return value;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis INCR failed: ") + e.what());
    }
}

bool RedisStore::ping() {
    if (!redis_) {
        return false;
    }
    try {
        redis_->ping();
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        if (connected_) {
            std::cerr << "[!] Redis ping failed: " << e.what() << "\n";
        }
        connected_ = false;
    }
    return connected_;
}

}
