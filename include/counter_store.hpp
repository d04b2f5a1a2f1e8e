#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "rate_limit_errors.hpp"

namespace turnstile {

 
// Abstract key/value store holding rate-limit counter records.
// Every operation throws StoreError when the backend cannot answer.
class CounterStore {
public:
    virtual ~CounterStore() = default;

    /**
     * Reads a record.
     * @param key Fully prefixed store key.
     * @return The stored bytes, or std::nullopt when absent or expired.
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * Writes a record, replacing any previous value and TTL.
     * @param ttl_sec Seconds until the record expires.
     */
    virtual void put(const std::string& key, const std::string& value, int ttl_sec) = 0;

    // Deletes a record. Returns true if something was removed.
    virtual bool forget(const std::string& key) = 0;

    /**
     * Increments an integer record by one and returns the new value.
     * Overrides apply the TTL only when the record is created by this call.
     *
     * The base version is a plain get() followed by put() that also refreshes
     * the TTL. Two workers racing on the same key can both read the old value,
     * so each racing worker may lose one increment. Stores with a native
     * atomic primitive override it.
     */
    virtual std::int64_t increment(const std::string& key, int ttl_sec);

    // Whether the backend currently answers. Never throws.
    virtual bool ping() { return true; }

    virtual std::string backend() const = 0;
};

} 
