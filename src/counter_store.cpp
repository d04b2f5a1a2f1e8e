#include "counter_store.hpp"

#include <exception>

namespace turnstile {

std::int64_t CounterStore::increment(const std::string& key, int ttl_sec) {
    std::int64_t value = 0;
    if (auto raw = get(key)) {
        try {
            value = std::stoll(*raw);
        } catch (const std::exception&) {
            value = 0;
        }
    }
    ++value;
    put(key, std::to_string(value), ttl_sec);
    return value;
}

} 
