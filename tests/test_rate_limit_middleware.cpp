#include <gtest/gtest.h>
#include "rate_limit_middleware.hpp"
#include "memory_store.hpp"
#include "test_support.hpp"

#include <boost/json.hpp>

using namespace turnstile;
using turnstile::testing::ManualClock;
using turnstile::testing::make_request;
namespace http = boost::beast::http;

class RateLimitMiddlewareTest : public ::testing::Test {
protected:
    RateLimitMiddleware make(const std::string& throttle) {
        return RateLimitMiddleware(RateLimitPolicy::build(parse_throttle(throttle), store, {}, clock.fn()));
    }

    static HttpResponse ok(const ClientRequest&) {
        HttpResponse res{http::status::ok, 11};
        res.body() = "fine";
        res.prepare_payload();
        return res;
    }

    ManualClock clock;
    MemoryStore store{clock.fn()};
};

TEST_F(RateLimitMiddlewareTest, EnforceThrowsWithDenialDetails) {
    auto mw = make("1,2,fixed,user");
    auto req = make_request();
    ClientRequest request(req, "93.184.216.34");

    auto admitted = mw.enforce(request);
    EXPECT_TRUE(admitted.allowed);

    try {
        mw.enforce(request);
        FAIL() << "second request should be denied";
    } catch (const RateLimitExceeded& e) {
        EXPECT_EQ(e.limit(), 1);
        EXPECT_EQ(e.window_seconds(), 120);
        EXPECT_EQ(e.retry_after(), 120);
        EXPECT_EQ(e.identifier(), IdentifierKind::User);
        EXPECT_NE(std::string(e.what()).find("Rate limit exceeded for user"), std::string::npos);
    }
}

TEST_F(RateLimitMiddlewareTest, AdmittedResponseGetsHeaders) {
    auto mw = make("3,1");
    auto req = make_request();
    ClientRequest request(req, "93.184.216.34");

    auto res = mw.handle(request, ok);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "fine");
    EXPECT_EQ(res["X-RateLimit-Limit"], "3");
    EXPECT_EQ(res["X-RateLimit-Remaining"], "2");
    EXPECT_EQ(res["X-RateLimit-Reset"], "60");
    EXPECT_EQ(res.find("Retry-After"), res.end());
}

TEST_F(RateLimitMiddlewareTest, DeniedRequestNeverReachesHandler) {
    auto mw = make("1,1");
    auto req = make_request();
    ClientRequest request(req, "93.184.216.34");
    mw.handle(request, ok);

    clock.now = 15;
    int calls = 0;
    auto res = mw.handle(request, [&calls](const ClientRequest& r) {
        ++calls;
        return ok(r);
    });

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(res.result(), http::status::too_many_requests);
    EXPECT_EQ(res["Retry-After"], "45");
    EXPECT_EQ(res["X-RateLimit-Remaining"], "0");
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_TRUE(res.keep_alive());

    auto body = boost::json::parse(res.body()).as_object();
    EXPECT_STREQ(body.at("code").as_string().c_str(), "RATE_001");
    EXPECT_EQ(body.at("retry_after").to_number<long long>(), 45);
    EXPECT_EQ(body.at("limit").to_number<int>(), 1);
    EXPECT_STREQ(body.at("identifier").as_string().c_str(), "ip");
}

TEST_F(RateLimitMiddlewareTest, LongWaitClosesConnection) {
    auto mw = make("1,10");
    auto req = make_request();
    ClientRequest request(req, "93.184.216.34");
    mw.handle(request, ok);

    auto res = mw.handle(request, ok);
    EXPECT_EQ(res.result(), http::status::too_many_requests);
    EXPECT_FALSE(res.keep_alive());
}
