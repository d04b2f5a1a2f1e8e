#include "rate_limit_middleware.hpp"

#include <boost/json.hpp>
#include <utility>

namespace json = boost::json;
namespace http = boost::beast::http;

namespace turnstile {

RateLimitMiddleware::RateLimitMiddleware(RateLimitPolicy policy, RateLimitHeaders headers)
    : policy_(std::move(policy))
    , headers_(std::move(headers))
{}

RateLimitResult RateLimitMiddleware::enforce(const ClientRequest& request) {
    PolicyDecision decision = policy_.evaluate(request);
    if (!decision.result.allowed) {
        const RateLimitConfig& cfg = decision.limiter->config();
        throw RateLimitExceeded(std::move(decision.result), cfg.window_seconds(), cfg.identifier());
    }
    return std::move(decision.result);
}

HttpResponse RateLimitMiddleware::handle(const ClientRequest& request, const RequestHandler& next) {
    RateLimitResult admitted;
    try {
        admitted = enforce(request);
    } catch (const RateLimitExceeded& denial) {
        return too_many_requests(denial, request.raw().version());
    }

    HttpResponse res = next(request);
    headers_.apply(res, admitted);
    return res;
}

HttpResponse RateLimitMiddleware::too_many_requests(const RateLimitExceeded& denial, unsigned version) const {
    json::object body;
    body["error"] = "Rate limit exceeded";
    body["code"] = RateLimitExceeded::kErrorCode;
    body["message"] = denial.what();
    body["limit"] = denial.limit();
    body["window_seconds"] = denial.window_seconds();
    body["retry_after"] = denial.retry_after();
    body["identifier"] = to_string(denial.identifier());

    HttpResponse res{http::status::too_many_requests, version};
    res.set(http::field::content_type, "application/json");
    headers_.apply(res, denial.result());
    res.body() = json::serialize(body);
    res.prepare_payload();

    // Long waits are not worth holding the connection for.
    if (denial.retry_after() >= 60) {
        res.keep_alive(false);
    }
    return res;
}

}
