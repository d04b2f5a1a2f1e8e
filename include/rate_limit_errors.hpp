#pragma once

#include <stdexcept>
#include <string>

namespace turnstile {

// Raised while building limits (bad numbers, unknown names, bad env values).
// Never raised on the request path.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Raised by CounterStore implementations when the backend cannot serve a call.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what)
        : std::runtime_error(what) {}
};

} 
