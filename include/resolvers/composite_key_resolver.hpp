#pragma once

#include <memory>
#include <vector>

#include "resolvers/key_resolver.hpp"

namespace turnstile {

// Joins the keys of two or more child resolvers so that callers differing in
// any component get separate quotas.
class CompositeKeyResolver : public KeyResolver {
public:
    static constexpr char kSeparator = '|';

    // @throws ConfigError with fewer than two children.
    explicit CompositeKeyResolver(std::vector<std::unique_ptr<KeyResolver>> children);

    std::string resolve(const ClientRequest& request) const override;
    std::string name() const override;

    // Percent-escapes '%' and the separator.
    static std::string escape(const std::string& part);

private:
    std::vector<std::unique_ptr<KeyResolver>> children_;
};

} 
