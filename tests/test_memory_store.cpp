#include <gtest/gtest.h>
#include "memory_store.hpp"
#include "test_support.hpp"

#include <map>

using namespace turnstile;
using turnstile::testing::ManualClock;

namespace {

// Exercises the generic read-then-write increment.
class PlainStore : public CounterStore {
public:
    std::optional<std::string> get(const std::string& key) override {
        auto it = data.find(key);
        if (it == data.end()) return std::nullopt;
        return it->second.first;
    }
    void put(const std::string& key, const std::string& value, int ttl_sec) override {
        data[key] = {value, ttl_sec};
    }
    bool forget(const std::string& key) override { return data.erase(key) > 0; }
    std::string backend() const override { return "plain"; }

    std::map<std::string, std::pair<std::string, int>> data;
};

}

TEST(MemoryStoreTest, PutGetForget) {
    ManualClock clock;
    MemoryStore store(clock.fn());

    EXPECT_FALSE(store.get("k").has_value());
    store.put("k", "v", 10);
    ASSERT_TRUE(store.get("k").has_value());
    EXPECT_EQ(*store.get("k"), "v");

    EXPECT_TRUE(store.forget("k"));
    EXPECT_FALSE(store.forget("k"));
    EXPECT_FALSE(store.get("k").has_value());
}

TEST(MemoryStoreTest, EntriesExpireAfterTtl) {
    ManualClock clock;
    MemoryStore store(clock.fn());

    store.put("k", "v", 10);
    clock.now = 9;
    EXPECT_TRUE(store.get("k").has_value());
    clock.now = 10;
    EXPECT_FALSE(store.get("k").has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(MemoryStoreTest, IncrementKeepsCreationTtl) {
    ManualClock clock;
    MemoryStore store(clock.fn());

    EXPECT_EQ(store.increment("c", 10), 1);
    clock.now = 8;
    EXPECT_EQ(store.increment("c", 10), 2);

    // The second increment must not have pushed the expiry to t=18.
    clock.now = 10;
    EXPECT_EQ(store.increment("c", 10), 1);
}

TEST(MemoryStoreTest, IncrementRejectsNonInteger) {
    MemoryStore store;
    store.put("c", "[1,2]", 60);
    EXPECT_THROW(store.increment("c", 60), StoreError);
}

TEST(MemoryStoreTest, PurgeExpired) {
    ManualClock clock;
    MemoryStore store(clock.fn());

    store.put("short", "1", 5);
    store.put("long", "1", 50);
    clock.now = 6;

    EXPECT_EQ(store.purge_expired(), 1u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.get("long").has_value());
}

TEST(CounterStoreTest, DefaultIncrementReadsThenWrites) {
    PlainStore store;
    EXPECT_EQ(store.increment("c", 30), 1);
    EXPECT_EQ(store.increment("c", 30), 2);
    EXPECT_EQ(store.data["c"].first, "2");
    EXPECT_EQ(store.data["c"].second, 30);

    store.put("bad", "garbage", 30);
    EXPECT_EQ(store.increment("bad", 30), 1);
}
