#pragma once

#include <string>
#include <unordered_map>
#include <shared_mutex>

#include "clock.hpp"
#include "counter_store.hpp"

namespace turnstile {

// In-process CounterStore for single-node deployments and tests.
// Expiry is lazy: stale entries are dropped when touched or by purge_expired().
class MemoryStore : public CounterStore {
public:
    explicit MemoryStore(NowFn now = system_now);
    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value, int ttl_sec) override;
    bool forget(const std::string& key) override;

    // Atomic under the write lock; never over-counts under concurrency.
    std::int64_t increment(const std::string& key, int ttl_sec) override;

    std::string backend() const override { return "memory"; }

    // Removes every expired entry. Returns how many were dropped.
    size_t purge_expired();

    size_t size() const;

private:
    struct Entry {
        std::string value;
        Timestamp expires_at;
    };

    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;
    NowFn now_;
};

} 
