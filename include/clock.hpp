#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace turnstile {

// Unix time in whole seconds.
using Timestamp = std::int64_t;

// Injected time source. Strategies and stores never read the clock directly.
using NowFn = std::function<Timestamp()>;

inline Timestamp system_now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

} 
