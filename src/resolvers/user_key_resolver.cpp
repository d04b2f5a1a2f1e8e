#include "resolvers/user_key_resolver.hpp"
#include "security_logger.hpp"

#include <exception>
#include <utility>

namespace turnstile {

UserKeyResolver::UserKeyResolver(UserLookup lookup, std::string session_cookie, IpResolverOptions ip_options)
    : lookup_(std::move(lookup))
    , session_cookie_(std::move(session_cookie))
    , ip_(ip_options)
{}

std::optional<std::string> UserKeyResolver::authenticated_user(const ClientRequest& request) const {
    if (request.user_id() && !request.user_id()->empty()) {
        return request.user_id();
    }
    if (!lookup_) {
        return std::nullopt;
    }

    // A failing authenticator downgrades the caller to anonymous.
    try {
        auto id = lookup_(request);
        if (id && !id->empty()) {
            return id;
        }
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::KEY_FALLBACK,
                            request.remote_address(), std::string("User lookup failed: ") + e.what());
    }
    return std::nullopt;
}

std::string UserKeyResolver::resolve(const ClientRequest& request) const {
    if (auto id = authenticated_user(request)) {
        return "user:" + *id;
    }
    if (!session_cookie_.empty()) {
        auto session = request.cookie(session_cookie_);
        if (session && !session->empty()) {
            return "session:" + *session;
        }
    }
    return ip_.resolve(request);
}

}
