#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "RedisConnectionPool.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IStatsDClient.hpp"

class ILogger;

// Cache contract over Redis. Values are stored as their JSON text.
// Atomic operations map onto server-side primitives (INCRBY, SET NX, an EVAL
// script for compare-and-swap); no client lock is held across a round trip.
// Stats come from the server's INFO counters, so they are database-wide.
class RedisCache : public CacheInterface {
public:
    RedisCache(std::shared_ptr<RedisConnectionPool> pool,
               int default_ttl_seconds,
               std::shared_ptr<ILogger> logger);
    ~RedisCache() override;

    static std::shared_ptr<RedisCache> fromConfig(const AppConfig& config,
                                                  std::shared_ptr<ILogger> logger,
                                                  std::shared_ptr<IStatsDClient> statsd_client = nullptr);

    std::optional<CacheValue> get(const std::string& key) override;
    void set(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl = std::nullopt) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    std::optional<int64_t> ttl(const std::string& key) override;
    bool expire(const std::string& key, int64_t ttl) override;

    void set_many(const CacheValueMap& values, std::optional<int64_t> ttl = std::nullopt) override;
    CacheValueMap get_many(const std::vector<std::string>& keys) override;
    size_t delete_many(const std::vector<std::string>& keys) override;

    int64_t increment(const std::string& key, int64_t delta = 1) override;
    int64_t decrement(const std::string& key, int64_t delta = 1) override;
    bool set_if_absent(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl = std::nullopt) override;
    bool compare_and_swap(const std::string& key, const CacheValue& expected, const CacheValue& desired) override;

    std::set<std::string> keys_matching(const std::string& pattern) override;
    size_t count_matching(const std::string& pattern) override;
    size_t delete_matching(const std::string& pattern) override;

    std::shared_ptr<CacheInterface> with_namespace(const std::string& ns) override;
    size_t clear_namespace(const std::string& ns) override;

    CacheStats cache_stats() override;
    void clear_stats() override;

    size_t flush_all() override;
    bool ping() override;
    void close() override;

    // Check if the cache can currently reach Redis
    bool isConnected();

private:
    using Command = std::vector<std::string>;

    // Sends one command on a pooled connection. Throws ConnectionError when the
    // connection fails and CacheBackendError on an error reply.
    RedisReplyPtr execute(const Command& command);
    std::vector<RedisReplyPtr> executePipeline(const std::vector<Command>& commands);

    int64_t effectiveTtl(std::optional<int64_t> ttl) const;
    std::optional<CacheValue> decode(const std::string& key, const char* data, size_t len) const;

    std::shared_ptr<RedisConnectionPool> pool_;
    const int default_ttl_seconds_;
    std::shared_ptr<ILogger> logger_;
    std::mutex stats_mutex_;
    std::chrono::system_clock::time_point last_reset_at_;
};
