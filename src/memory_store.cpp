#include "memory_store.hpp"

#include <mutex>
#include <exception>
#include <utility>

namespace turnstile {

MemoryStore::MemoryStore(NowFn now) : now_(std::move(now)) {
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    const Timestamp now = now_();
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (it->second.expires_at > now) {
            return it->second.value;
        }
    }

    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.expires_at <= now) {
        entries_.erase(it);
    }
    return std::nullopt;
}

void MemoryStore::put(const std::string& key, const std::string& value, int ttl_sec) {
    const Timestamp now = now_();
    std::unique_lock lock(mutex_);
    entries_[key] = Entry{value, now + ttl_sec};
}

bool MemoryStore::forget(const std::string& key) {
    std::unique_lock lock(mutex_);
    return entries_.erase(key) > 0;
}

std::int64_t MemoryStore::increment(const std::string& key, int ttl_sec) {
    const Timestamp now = now_();
    std::unique_lock lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.expires_at <= now) {
        entries_[key] = Entry{"1", now + ttl_sec};
        return 1;
    }

    std::int64_t value = 0;
    try {
        value = std::stoll(it->second.value);
    } catch (const std::exception&) {
        throw StoreError("counter at '" + key + "' is not an integer");
    }
    ++value;
    it->second.value = std::to_string(value);
    return value;
}

size_t MemoryStore::purge_expired() {
    const Timestamp now = now_();
    std::unique_lock lock(mutex_);

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MemoryStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} 
