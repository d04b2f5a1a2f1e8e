#include <gtest/gtest.h>
#include "memory_store.hpp"
#include "strategies/token_bucket_strategy.hpp"
#include "test_support.hpp"

#include <boost/json.hpp>

using namespace turnstile;
using turnstile::testing::ManualClock;

class TokenBucketTest : public ::testing::Test {
protected:
    ManualClock clock;
    MemoryStore store{clock.fn()};
    TokenBucketStrategy strategy{store, "rl"};
};

TEST_F(TokenBucketTest, EmptyStartThenBurstThenThrottle) {
    auto first = strategy.attempt("k", 2, 2, 0);
    EXPECT_FALSE(first.allowed);
    EXPECT_EQ(*first.retry_after, 1);

    clock.now = 2;
    auto a = strategy.attempt("k", 2, 2, 2);
    EXPECT_TRUE(a.allowed);
    EXPECT_EQ(a.remaining, 1);

    auto b = strategy.attempt("k", 2, 2, 2);
    EXPECT_TRUE(b.allowed);
    EXPECT_EQ(b.remaining, 0);
    EXPECT_EQ(b.reset_time, 4);

    auto c = strategy.attempt("k", 2, 2, 2);
    EXPECT_FALSE(c.allowed);
    EXPECT_EQ(c.remaining, 0);
    EXPECT_EQ(*c.retry_after, 1);
    EXPECT_EQ(c.strategy, "token_bucket");
}

TEST_F(TokenBucketTest, InitialTokensGrantBurstOnFirstSight) {
    TokenBucketStrategy primed(store, "rl2", 2.0);
    EXPECT_TRUE(primed.attempt("k", 2, 2, 0).allowed);
    EXPECT_TRUE(primed.attempt("k", 2, 2, 0).allowed);
    EXPECT_FALSE(primed.attempt("k", 2, 2, 0).allowed);
}

TEST_F(TokenBucketTest, FractionalRateRefillsExactly) {
    strategy.refill("k", 5, 60, 0);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(strategy.attempt("k", 5, 60, 0).allowed);
    }
    auto denied = strategy.attempt("k", 5, 60, 0);
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(*denied.retry_after, 12);

    EXPECT_FALSE(strategy.attempt("k", 5, 60, 11).allowed);
    EXPECT_TRUE(strategy.attempt("k", 5, 60, 12).allowed);
}

TEST_F(TokenBucketTest, TokensNeverExceedCapacity) {
    strategy.refill("k", 3, 3, 0);
    auto r = strategy.attempt("k", 3, 3, 1000);
    EXPECT_TRUE(r.allowed);
    EXPECT_EQ(r.remaining, 2);
}

TEST_F(TokenBucketTest, ClockGoingBackwardsRefillsNothing) {
    strategy.refill("k", 2, 2, 100);
    strategy.attempt("k", 2, 2, 100);
    strategy.attempt("k", 2, 2, 100);
    EXPECT_FALSE(strategy.attempt("k", 2, 2, 90).allowed);
}

TEST_F(TokenBucketTest, BackwardsStepDoesNotRefillTwice) {
    strategy.refill("k", 2, 2, 100);
    strategy.attempt("k", 2, 2, 100);
    strategy.attempt("k", 2, 2, 100);
    EXPECT_FALSE(strategy.attempt("k", 2, 2, 90).allowed);

    auto raw = store.get("rl:token_bucket:k");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(boost::json::parse(*raw).as_object().at("last_refill").to_number<std::int64_t>(), 100);

    // One second past the last refill buys exactly one token.
    auto next = strategy.attempt("k", 2, 2, 101);
    EXPECT_TRUE(next.allowed);
    EXPECT_EQ(next.remaining, 0);
    EXPECT_FALSE(strategy.attempt("k", 2, 2, 101).allowed);
}

TEST_F(TokenBucketTest, LongestWindowKeepsState) {
    const int window = RateLimitConfig::kMaxWindowSeconds;
    clock.now = 1000;
    strategy.refill("k", 1, window, 1000);
    EXPECT_TRUE(strategy.attempt("k", 1, window, 1000).allowed);
    EXPECT_FALSE(strategy.attempt("k", 1, window, 1000).allowed);

    clock.now = 1000 + 2 * static_cast<Timestamp>(window);
    EXPECT_TRUE(store.get("rl:token_bucket:k").has_value());
}

TEST_F(TokenBucketTest, StateIsStoredAsJson) {
    strategy.refill("k", 4, 60, 7);
    strategy.attempt("k", 4, 60, 7);

    auto raw = store.get("rl:token_bucket:k");
    ASSERT_TRUE(raw.has_value());
    auto doc = boost::json::parse(*raw).as_object();
    EXPECT_DOUBLE_EQ(doc.at("tokens").to_number<double>(), 3.0);
    EXPECT_EQ(doc.at("last_refill").to_number<std::int64_t>(), 7);
}

TEST_F(TokenBucketTest, UsageDoesNotConsume) {
    strategy.refill("k", 4, 60, 0);
    auto u = strategy.usage("k", 4, 60, 0);
    EXPECT_DOUBLE_EQ(u.tokens, 4.0);
    EXPECT_EQ(u.count, 4);
    EXPECT_EQ(strategy.attempt("k", 4, 60, 0).remaining, 3);
}

TEST_F(TokenBucketTest, ClearForgetsBucket) {
    strategy.refill("k", 2, 2, 0);
    EXPECT_TRUE(strategy.clear("k", 2, 0));
    EXPECT_FALSE(strategy.attempt("k", 2, 2, 0).allowed);
}
