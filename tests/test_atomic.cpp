// test/test_atomic.cpp
#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

#include "../src/cache/InMemoryCache.hpp"
#include "../src/core/CacheErrors.hpp"

using json = nlohmann::json;

class AtomicOpsTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryCache> cache = std::make_shared<InMemoryCache>();

    void TearDown() override { cache->close(); }
};

TEST_F(AtomicOpsTest, IncrementCreatesAbsentKey) {
    EXPECT_EQ(cache->increment("counter"), 1);
    EXPECT_EQ(cache->increment("counter", 5), 6);
    EXPECT_EQ(cache->decrement("counter", 10), -4);
    EXPECT_EQ(*cache->get("counter"), -4);
}

TEST_F(AtomicOpsTest, IncrementKeepsExpiry) {
    cache->set("counter", 10, 100);
    cache->increment("counter");
    auto left = cache->ttl("counter");
    ASSERT_TRUE(left.has_value());
    EXPECT_GT(*left, 98);
}

TEST_F(AtomicOpsTest, IncrementRejectsNonInteger) {
    cache->set("text", "abc");
    cache->set("real", 1.5);
    EXPECT_THROW(cache->increment("text"), ValidationError);
    EXPECT_THROW(cache->increment("real"), ValidationError);
    EXPECT_EQ(*cache->get("text"), "abc");
}

TEST_F(AtomicOpsTest, IncrementRejectsOverflow) {
    cache->set("big", std::numeric_limits<int64_t>::max());
    EXPECT_THROW(cache->increment("big"), ValidationError);
    cache->set("small", std::numeric_limits<int64_t>::min());
    EXPECT_THROW(cache->decrement("small"), ValidationError);
}

TEST_F(AtomicOpsTest, IncrementRejectsUnsignedAboveSignedRange) {
    cache->set("u", std::numeric_limits<uint64_t>::max());
    EXPECT_THROW(cache->increment("u"), ValidationError);
    EXPECT_THROW(cache->decrement("u"), ValidationError);
    EXPECT_EQ(*cache->get("u"), std::numeric_limits<uint64_t>::max());

    // Unsigned values that fit are ordinary integers
    cache->set("small_u", static_cast<uint64_t>(41));
    EXPECT_EQ(cache->increment("small_u"), 42);
}

TEST_F(AtomicOpsTest, DecrementByInt64MinIsRangeChecked) {
    const int64_t min = std::numeric_limits<int64_t>::min();
    EXPECT_THROW(cache->decrement("d", min), ValidationError);
    EXPECT_FALSE(cache->exists("d"));

    cache->set("neg", -1);
    EXPECT_EQ(cache->decrement("neg", min), std::numeric_limits<int64_t>::max());

    cache->set("pos", 1);
    EXPECT_THROW(cache->decrement("pos", min), ValidationError);
    EXPECT_EQ(*cache->get("pos"), 1);
}

TEST_F(AtomicOpsTest, ConcurrentIncrementsAreNotLost) {
    const int thread_count = 8;
    const int per_thread = 500;
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < per_thread; ++i) {
                cache->increment("hits");
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(*cache->get("hits"), thread_count * per_thread);
}

TEST_F(AtomicOpsTest, SetIfAbsent) {
    EXPECT_TRUE(cache->set_if_absent("lock", "owner-1"));
    EXPECT_FALSE(cache->set_if_absent("lock", "owner-2"));
    EXPECT_EQ(*cache->get("lock"), "owner-1");
}

TEST_F(AtomicOpsTest, SetIfAbsentSucceedsOnExpiredKey) {
    cache->set("lock", "stale", 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_TRUE(cache->set_if_absent("lock", "fresh"));
    EXPECT_EQ(*cache->get("lock"), "fresh");
}

TEST_F(AtomicOpsTest, SetIfAbsentHasOneWinner) {
    const int thread_count = 16;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([this, t, &winners]() {
            if (cache->set_if_absent("leader", t)) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
}

TEST_F(AtomicOpsTest, CompareAndSwap) {
    json v1 = {{"state", "pending"}};
    json v2 = {{"state", "done"}};
    cache->set("job", v1, 100);

    EXPECT_FALSE(cache->compare_and_swap("job", v2, v1));
    EXPECT_TRUE(cache->compare_and_swap("job", v1, v2));
    EXPECT_EQ(*cache->get("job"), v2);
    // TTL survives the swap
    EXPECT_TRUE(cache->ttl("job").has_value());
}

TEST_F(AtomicOpsTest, CompareAndSwapComparesSerializedValues) {
    cache->set("n", 1);
    EXPECT_FALSE(cache->compare_and_swap("n", 1.0, 2));
    EXPECT_EQ(*cache->get("n"), 1);
    // Signed and unsigned 1 serialize the same way
    EXPECT_TRUE(cache->compare_and_swap("n", static_cast<uint64_t>(1), 2));

    nlohmann::json doc = {{"b", 2}, {"a", 1}};
    cache->set("doc", doc);
    EXPECT_TRUE(cache->compare_and_swap("doc", json{{"a", 1}, {"b", 2}}, "swapped"));
}

TEST_F(AtomicOpsTest, CompareAndSwapOnAbsentKeyFails) {
    EXPECT_FALSE(cache->compare_and_swap("nothing", nullptr, 1));
    EXPECT_FALSE(cache->exists("nothing"));
}

TEST_F(AtomicOpsTest, ConcurrentCompareAndSwapCountsEveryStep) {
    cache->set("n", 0);
    const int thread_count = 4;
    const int per_thread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([this]() {
            int done = 0;
            while (done < per_thread) {
                auto current = cache->get("n");
                if (cache->compare_and_swap("n", *current, current->get<int64_t>() + 1)) {
                    ++done;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(*cache->get("n"), thread_count * per_thread);
}
