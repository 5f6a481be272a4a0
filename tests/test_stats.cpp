// test/test_stats.cpp
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/cache/InMemoryCache.hpp"
#include "../src/cache/StatsTracker.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/interfaces/IStatsDClient.hpp"

using ::testing::_;
using ::testing::NiceMock;

// Mock class for StatsDClient
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, decrement, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
};

TEST(CacheStatsTest, CountsHitsAndMisses) {
    auto cache = std::make_shared<InMemoryCache>();
    EXPECT_FALSE(cache->get("k").has_value());
    cache->set("k", "v");
    cache->get("k");
    cache->get("k");

    auto stats = cache->cache_stats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.size, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 2.0 / 3.0);
    cache->close();
}

TEST(CacheStatsTest, ClearStatsZeroesCountersButKeepsEntries) {
    auto cache = std::make_shared<InMemoryCache>();
    cache->set("k", "v");
    cache->get("k");
    cache->get("missing");
    auto before = cache->cache_stats().last_reset_at;

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    cache->clear_stats();

    auto stats = cache->cache_stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.evictions, 0u);
    EXPECT_EQ(stats.size, 1u);
    EXPECT_GT(stats.last_reset_at, before);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.0);
    cache->close();
}

TEST(CacheStatsTest, ExistsDoesNotCountAsHit) {
    auto cache = std::make_shared<InMemoryCache>();
    cache->set("k", 1);
    cache->exists("k");
    cache->exists("nope");
    auto stats = cache->cache_stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    cache->close();
}

TEST(CacheStatsTest, TrackingDisabledLeavesCountersAtZero) {
    auto cache = std::make_shared<InMemoryCache>(0, 1, false);
    cache->get("missing");
    cache->set("a", 1);
    cache->set("b", 2);
    cache->get("b");

    auto stats = cache->cache_stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.evictions, 0u);
    EXPECT_EQ(stats.size, 1u);
    cache->close();
}

TEST(CacheStatsTest, ToJsonCarriesCounters) {
    CacheStats stats;
    stats.size = 3;
    stats.hits = 1;
    stats.misses = 1;
    auto json = stats.to_json();
    EXPECT_EQ(json["size"], 3);
    EXPECT_EQ(json["hits"], 1);
    EXPECT_DOUBLE_EQ(json["hit_rate"].get<double>(), 0.5);
    EXPECT_NE(stats.to_string().find("hits: 1"), std::string::npos);
}

TEST(StatsTrackerTest, ForwardsCountersToStatsD) {
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_HIT, 1)).Times(2);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_MISS, 1)).Times(1);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_EVICTION, 1)).Times(1);

    StatsTracker tracker(true, statsd);
    tracker.recordHit();
    tracker.recordHit();
    tracker.recordMiss();
    tracker.recordEviction();

    auto stats = tracker.snapshot(0);
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.evictions, 1u);
}

TEST(StatsTrackerTest, DisabledTrackerSendsNothing) {
    auto statsd = std::make_shared<MockStatsDClient>();
    EXPECT_CALL(*statsd, increment(_, _)).Times(0);

    StatsTracker tracker(false, statsd);
    tracker.recordHit();
    tracker.recordMiss();
    tracker.recordEviction();
}

TEST(StatsTrackerTest, EvictionsFromCacheReachStatsD) {
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_EVICTION, 1)).Times(2);

    auto cache = std::make_shared<InMemoryCache>(0, 1, true, std::chrono::seconds(60), nullptr, statsd);
    cache->set("a", 1);
    cache->set("b", 2);
    cache->set("c", 3);
    cache->close();
}
