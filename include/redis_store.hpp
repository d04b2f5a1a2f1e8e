#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <sw/redis++/redis++.h>

#include "counter_store.hpp"

namespace turnstile {

 
// Redis-backed CounterStore shared by every node of a deployment.
// While the server is unreachable every call throws StoreError, which the
// engine turns into a fail-open decision. Each call retries the connection.
class RedisStore : public CounterStore {
public:
    explicit RedisStore(const std::string& redis_url);
    ~RedisStore() override = default;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value, int ttl_sec) override;
    bool forget(const std::string& key) override;

    // INCR plus first-hit EXPIRE in one Lua script, atomic on the server.
    std::int64_t increment(const std::string& key, int ttl_sec) override;

    bool ping() override;
    std::string backend() const override { return "redis"; }

    // Outcome of the most recent command or ping.
    bool is_connected() const { return connected_; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};

    sw::redis::Redis& client();
};

} 
