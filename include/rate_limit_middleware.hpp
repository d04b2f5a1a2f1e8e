#pragma once

#include <boost/beast/http.hpp>
#include <functional>

#include "rate_limit_exceeded.hpp"
#include "rate_limit_headers.hpp"
#include "rate_limit_policy.hpp"

namespace turnstile {

using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RequestHandler = std::function<HttpResponse(const ClientRequest&)>;

 
// Guards a route: runs the policy, short-circuits denied requests with a 429
// and stamps rate-limit headers on every response it lets through.
class RateLimitMiddleware {
public:
    explicit RateLimitMiddleware(RateLimitPolicy policy, RateLimitHeaders headers = RateLimitHeaders{});

    /**
     * Admits the request or signals the denial.
     * @return The admitted result, for header stamping.
     * @throws RateLimitExceeded when any limit denies the request.
     */
    RateLimitResult enforce(const ClientRequest& request);

    // Runs next() for admitted requests; answers 429 otherwise.
    HttpResponse handle(const ClientRequest& request, const RequestHandler& next);

    // 429 response with a JSON body and the rate-limit headers.
    HttpResponse too_many_requests(const RateLimitExceeded& denial, unsigned version) const;

    RateLimitPolicy& policy() { return policy_; }
    const RateLimitHeaders& headers() const { return headers_; }

private:
    RateLimitPolicy policy_;
    RateLimitHeaders headers_;
};

} 
