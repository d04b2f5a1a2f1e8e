#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include <utility>
#include <vector>

#include "rate_limit_result.hpp"

namespace turnstile {

struct HeaderNames {
    std::string limit = "X-RateLimit-Limit";
    std::string remaining = "X-RateLimit-Remaining";
    std::string reset = "X-RateLimit-Reset";
    std::string retry_after = "Retry-After";
};

// Stamps rate-limit headers on responses.
// Limit, Remaining and Reset are always present; Retry-After only on denial.
class RateLimitHeaders {
public:
    explicit RateLimitHeaders(HeaderNames names = {});

    // Ordered name/value pairs for a result.
    std::vector<std::pair<std::string, std::string>> fields(const RateLimitResult& result) const;

    template<class Body, class Fields>
    void apply(boost::beast::http::response<Body, Fields>& res, const RateLimitResult& result) const {
        if (result.allowed) {
            res.erase(boost::beast::string_view(names_.retry_after));
        }
        for (const auto& [name, value] : fields(result)) {
            res.set(boost::beast::string_view(name), value);
        }
    }

    const HeaderNames& names() const { return names_; }

private:
    HeaderNames names_;
};

} 
