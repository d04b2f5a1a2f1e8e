#include <gtest/gtest.h>
#include "route_table.hpp"
#include "memory_store.hpp"
#include "test_support.hpp"

using namespace turnstile;
using turnstile::testing::ManualClock;
using turnstile::testing::make_request;

TEST(RouteTableTest, PrefixMatchesWholeSegments) {
    EXPECT_TRUE(RouteTable::prefix_matches("/api", "/api"));
    EXPECT_TRUE(RouteTable::prefix_matches("/api", "/api/users"));
    EXPECT_FALSE(RouteTable::prefix_matches("/api", "/apix"));
    EXPECT_TRUE(RouteTable::prefix_matches("/", "/anything"));
    EXPECT_TRUE(RouteTable::prefix_matches("/api/", "/api/users"));
}

TEST(RouteTableTest, LongestPrefixWins) {
    ManualClock clock;
    MemoryStore store(clock.fn());

    ServerConfig config;
    config.routes = parse_routes("/=100,1;/api=10,1;/api/login=2,1");
    auto table = RouteTable::build(config, store, {}, clock.fn());
    ASSERT_EQ(table->size(), 3u);

    auto* login = table->match("/api/login?next=/home");
    auto* api = table->match("/api/items");
    auto* root = table->match("/static/app.js");
    ASSERT_NE(login, nullptr);
    ASSERT_NE(api, nullptr);
    ASSERT_NE(root, nullptr);
    EXPECT_NE(login, api);
    EXPECT_NE(api, root);

    auto req = make_request("/api/login");
    ClientRequest request(req, "93.184.216.34");
    EXPECT_EQ(login->enforce(request).remaining, 1);
    // Routes count independently.
    EXPECT_EQ(api->enforce(request).remaining, 9);
}

TEST(RouteTableTest, UnmatchedTarget) {
    ManualClock clock;
    MemoryStore store(clock.fn());

    ServerConfig config;
    config.routes = parse_routes("/api=10,1");
    auto table = RouteTable::build(config, store, {}, clock.fn());
    EXPECT_EQ(table->match("/health-check"), nullptr);
    EXPECT_EQ(table->match("/ap"), nullptr);
}

TEST(RouteTableTest, RejectsBadPrefix) {
    RouteTable table;
    MemoryStore store;
    auto mw = std::make_unique<RateLimitMiddleware>(RateLimitPolicy::build(parse_throttle("1,1"), store));
    EXPECT_THROW(table.add("api", std::move(mw)), ConfigError);
}
