#include <gtest/gtest.h>
#include "handlers/health_handler.hpp"
#include "memory_store.hpp"
#include "test_support.hpp"

using namespace turnstile;
using turnstile::testing::FailingStore;
using turnstile::testing::make_request;

TEST(HealthHandlerTest, HealthyStore) {
    ServerConfig config;
    MemoryStore store;
    HealthHandler handler(config, store);

    auto res = handler.handle_health(11);
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body()).as_object();
    EXPECT_STREQ(body.at("status").as_string().c_str(), "healthy");
    EXPECT_STREQ(body.at("store").as_string().c_str(), "memory");
    EXPECT_FALSE(body.at("fail_open").as_bool());
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("rate_limit_store_up"), 1.0);
}

TEST(HealthHandlerTest, UnreachableStoreIsDegraded) {
    ServerConfig config;
    FailingStore store;
    HealthHandler handler(config, store);

    auto res = handler.handle_health(11);
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    auto body = json::parse(res.body()).as_object();
    EXPECT_STREQ(body.at("status").as_string().c_str(), "degraded");
    EXPECT_TRUE(body.at("fail_open").as_bool());
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("rate_limit_store_up"), 0.0);
}

TEST(HealthHandlerTest, AdminTokenGate) {
    ServerConfig config;
    MemoryStore store;

    HealthHandler disabled(config, store);
    EXPECT_FALSE(disabled.verify_admin_request(make_request("/metrics", {{"X-Admin-Token", ""}})));

    config.admin_token = "s3cret";
    HealthHandler handler(config, store);
    EXPECT_TRUE(handler.verify_admin_request(make_request("/metrics", {{"X-Admin-Token", "s3cret"}})));
    EXPECT_FALSE(handler.verify_admin_request(make_request("/metrics", {{"X-Admin-Token", "s3cres"}})));
    EXPECT_FALSE(handler.verify_admin_request(make_request("/metrics", {{"X-Admin-Token", "s3cret!"}})));
    EXPECT_FALSE(handler.verify_admin_request(make_request("/metrics")));
}

TEST(HealthHandlerTest, MetricsAreExported) {
    ServerConfig config;
    MemoryStore store;
    HealthHandler handler(config, store);

    MetricsRegistry::instance().increment_counter("rate_limit_allowed_total", {{"strategy", "fixed"}, {"identifier", "ip"}});
    auto res = handler.handle_metrics(11);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("# TYPE rate_limit_allowed_total counter"), std::string::npos);
}
