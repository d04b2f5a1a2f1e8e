#include "resolvers/key_resolver.hpp"
#include "resolvers/composite_key_resolver.hpp"
#include "resolvers/header_key_resolver.hpp"
#include "resolvers/ip_key_resolver.hpp"
#include "resolvers/user_key_resolver.hpp"
#include "rate_limit_errors.hpp"

#include <utility>

namespace turnstile {

namespace {

std::unique_ptr<KeyResolver> make_single(IdentifierKind kind, const std::string& header_name,
                                         const ResolverDeps& deps) {
    switch (kind) {
        case IdentifierKind::Ip:
            return std::make_unique<IpKeyResolver>(deps.ip);
        case IdentifierKind::User:
            return std::make_unique<UserKeyResolver>(deps.user_lookup, deps.session_cookie, deps.ip);
        case IdentifierKind::Header:
            return std::make_unique<HeaderKeyResolver>(header_name, deps.token_salt,
                                                       deps.fallback_headers, deps.ip);
        case IdentifierKind::Composite:
            break;
    }
    throw ConfigError("Composite identifiers cannot be nested");
}

}

std::unique_ptr<KeyResolver> make_resolver(const RateLimitConfig& config, const ResolverDeps& deps) {
    if (config.identifier() != IdentifierKind::Composite) {
        return make_single(config.identifier(), config.header_name(), deps);
    }

    std::vector<std::unique_ptr<KeyResolver>> children;
    for (IdentifierKind part : config.composite_parts()) {
        children.push_back(make_single(part, config.header_name(), deps));
    }
    return std::make_unique<CompositeKeyResolver>(std::move(children));
}

}
