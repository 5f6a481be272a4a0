// test/test_rediscache.cpp
// Runs against a live Redis server named by DISTCACHE_REDIS_TEST_HOST ("host" or
// "host:port"). Every test is skipped when it is unset. Database 15 is flushed.
#include <chrono>
#include <cstdlib>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/cache/RedisCache.hpp"
#include "../src/cache/RedisConnectionPool.hpp"
#include "../src/cache/TenantCache.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/core/CacheErrors.hpp"
#include "../src/interfaces/ILogger.hpp"

using json = nlohmann::json;
using ::testing::NiceMock;

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

class RedisCacheTest : public ::testing::Test {
protected:
    AppConfig config;
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<RedisCache> cache;

    void SetUp() override {
        const char* host = std::getenv("DISTCACHE_REDIS_TEST_HOST");
        if (host == nullptr || std::string(host).empty()) {
            GTEST_SKIP() << "DISTCACHE_REDIS_TEST_HOST not set";
        }
        std::string endpoint(host);
        auto colon = endpoint.find(':');
        config.redis_host = endpoint.substr(0, colon);
        if (colon != std::string::npos) {
            config.redis_port = std::stoi(endpoint.substr(colon + 1));
        }
        config.redis_database = 15;
        config.redis_pool_max_total = 4;
        config.redis_pool_max_idle = 4;
        config.redis_pool_min_idle = 1;

        cache = RedisCache::fromConfig(config, logger);
        ASSERT_TRUE(cache->isConnected()) << "Redis at " << endpoint << " is not reachable";
        cache->flush_all();
    }

    void TearDown() override {
        if (cache) {
            cache->flush_all();
            cache->close();
        }
    }
};

TEST_F(RedisCacheTest, SetAndGetJson) {
    json value = {{"name", "TestCo"}, {"employees", 12}};
    cache->set("company:1", value);
    auto retrieved = cache->get("company:1");
    ASSERT_TRUE(retrieved.has_value());
    EXPECT_EQ(*retrieved, value);
    EXPECT_FALSE(cache->get("company:2").has_value());
}

TEST_F(RedisCacheTest, RemoveAndExists) {
    cache->set("k", 1);
    EXPECT_TRUE(cache->exists("k"));
    EXPECT_TRUE(cache->remove("k"));
    EXPECT_FALSE(cache->remove("k"));
    EXPECT_FALSE(cache->exists("k"));
}

TEST_F(RedisCacheTest, TtlAndExpiry) {
    cache->set("short", "v", 1);
    auto left = cache->ttl("short");
    ASSERT_TRUE(left.has_value());
    EXPECT_GT(*left, 0);
    EXPECT_LE(*left, 1);

    cache->set("forever", "v", 0);
    EXPECT_FALSE(cache->ttl("forever").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_FALSE(cache->exists("short"));
    EXPECT_TRUE(cache->exists("forever"));
}

TEST_F(RedisCacheTest, ExpireSetsAndClearsTtl) {
    cache->set("k", 1);
    EXPECT_TRUE(cache->expire("k", 100));
    ASSERT_TRUE(cache->ttl("k").has_value());
    EXPECT_TRUE(cache->expire("k", 0));
    EXPECT_FALSE(cache->ttl("k").has_value());
    EXPECT_TRUE(cache->exists("k"));
    EXPECT_FALSE(cache->expire("absent", 0));
    EXPECT_FALSE(cache->expire("absent", 10));
}

TEST_F(RedisCacheTest, BulkOperations) {
    cache->set_many(CacheValueMap{{"a", 1}, {"b", "two"}});
    auto found = cache->get_many({"a", "b", "c"});
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found.at("b"), "two");
    EXPECT_EQ(cache->delete_many({"a", "b", "c"}), 2u);
}

TEST_F(RedisCacheTest, IncrementAndValidation) {
    EXPECT_EQ(cache->increment("n", 5), 5);
    EXPECT_EQ(cache->decrement("n", 2), 3);
    EXPECT_EQ(*cache->get("n"), 3);

    cache->set("text", "abc");
    EXPECT_THROW(cache->increment("text"), ValidationError);
}

TEST_F(RedisCacheTest, ConcurrentIncrements) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 100; ++i) {
                cache->increment("shared");
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(*cache->get("shared"), 400);
}

TEST_F(RedisCacheTest, SetIfAbsentAndCompareAndSwap) {
    EXPECT_TRUE(cache->set_if_absent("lock", "a", 100));
    EXPECT_FALSE(cache->set_if_absent("lock", "b"));

    EXPECT_FALSE(cache->compare_and_swap("lock", "b", "c"));
    EXPECT_TRUE(cache->compare_and_swap("lock", "a", "c"));
    EXPECT_EQ(*cache->get("lock"), "c");
    EXPECT_TRUE(cache->ttl("lock").has_value());
    EXPECT_FALSE(cache->compare_and_swap("missing", nullptr, 1));
}

TEST_F(RedisCacheTest, PatternOperations) {
    cache->set("user:1", 1);
    cache->set("user:2", 2);
    cache->set("user:[x]", 3);
    cache->set("order:1", 4);

    EXPECT_EQ(cache->keys_matching("user:?"), (std::set<std::string>{"user:1", "user:2"}));
    EXPECT_EQ(cache->keys_matching("user:[x]"), (std::set<std::string>{"user:[x]"}));
    EXPECT_EQ(cache->count_matching("*"), 4u);
    EXPECT_EQ(cache->delete_matching("user:*"), 3u);
    EXPECT_TRUE(cache->exists("order:1"));
}

TEST_F(RedisCacheTest, QuestionMarkMatchesMultibyteCharacter) {
    cache->set("k:\xC3\xBC", 1);
    cache->set("k:ab", 2);
    EXPECT_EQ(cache->keys_matching("k:?"), (std::set<std::string>{"k:\xC3\xBC"}));
}

TEST_F(RedisCacheTest, CompareAndSwapComparesSerializedValues) {
    cache->set("n", 1);
    EXPECT_FALSE(cache->compare_and_swap("n", 1.0, 2));
    EXPECT_TRUE(cache->compare_and_swap("n", 1, 2));
}

TEST_F(RedisCacheTest, LargeTtlIsKept) {
    cache->set("big_ttl", 1, 10000000000LL);
    EXPECT_TRUE(cache->exists("big_ttl"));
    EXPECT_TRUE(cache->ttl("big_ttl").has_value());
}

TEST_F(RedisCacheTest, NamespacesAndTenants) {
    auto ns = cache->with_namespace("app");
    ns->set("k", 1);
    EXPECT_TRUE(cache->exists("app:k"));
    EXPECT_EQ(ns->keys_matching("*"), (std::set<std::string>{"k"}));

    auto tenant = createTenantCache(cache, "acme");
    tenant->set("k", 2);
    EXPECT_TRUE(cache->exists("tenant:acme:k"));

    EXPECT_EQ(cache->clear_namespace("app"), 1u);
    EXPECT_TRUE(cache->exists("tenant:acme:k"));
    EXPECT_EQ(tenant->flush_all(), 1u);
}

TEST_F(RedisCacheTest, StatsComeFromServer) {
    cache->clear_stats();
    cache->set("k", 1);
    cache->get("k");
    cache->get("nope");

    auto stats = cache->cache_stats();
    EXPECT_GE(stats.hits, 1u);
    EXPECT_GE(stats.misses, 1u);
    EXPECT_EQ(stats.size, 1u);
}

TEST_F(RedisCacheTest, PoolExhaustionTimesOut) {
    RedisPoolOptions options = RedisPoolOptions::fromConfig(config);
    options.max_total = 1;
    options.min_idle = 0;
    options.wait_timeout = std::chrono::milliseconds(50);
    RedisConnectionPool pool(options, logger);

    auto held = pool.acquire();
    EXPECT_THROW(pool.acquire(), PoolExhaustedError);
    EXPECT_EQ(pool.totalCount(), 1u);
}

TEST_F(RedisCacheTest, ClosedCacheReportsUnreachable) {
    cache->close();
    EXPECT_FALSE(cache->ping());
    EXPECT_THROW(cache->get("k"), ConnectionError);
    cache.reset();
}

TEST(RedisConnectionTest, UnreachableServerFailsPing) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    AppConfig config;
    config.redis_host = "127.0.0.1";
    config.redis_port = 1; // nothing listens here
    config.redis_connect_timeout_millis = 200;
    config.redis_pool_min_idle = 0;

    auto cache = RedisCache::fromConfig(config, logger);
    EXPECT_FALSE(cache->isConnected());
    EXPECT_THROW(cache->get("k"), ConnectionError);
    cache->close();
}
