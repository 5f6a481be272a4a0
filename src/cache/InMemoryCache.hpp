#ifndef INMEMORYCACHE_HPP
#define INMEMORYCACHE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "AtomicCoordinator.hpp"
#include "EntryStore.hpp"
#include "StatsTracker.hpp"
#include "../config/AppConfig.hpp"
#include "../core/ExpirySweeper.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Process-local cache: EntryStore for the data, LruTracker for the size bound,
// AtomicCoordinator for read-modify-write ops, StatsTracker for counters and an
// ExpirySweeper purging expired entries in the background.
// Create through std::make_shared: with_namespace() hands out views that share
// ownership of this cache.
class InMemoryCache : public CacheInterface {
public:
    explicit InMemoryCache(int default_ttl_seconds = 0,
                           int max_size = 0,
                           bool track_stats = true,
                           std::chrono::milliseconds sweep_interval = std::chrono::seconds(60),
                           std::shared_ptr<ILogger> logger = nullptr,
                           std::shared_ptr<IStatsDClient> statsd_client = nullptr);

    static std::shared_ptr<InMemoryCache> fromConfig(const AppConfig& config,
                                                     std::shared_ptr<ILogger> logger = nullptr,
                                                     std::shared_ptr<IStatsDClient> statsd_client = nullptr);

    ~InMemoryCache() override;

    InMemoryCache(const InMemoryCache&) = delete;
    InMemoryCache& operator=(const InMemoryCache&) = delete;

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

    // Runs one sweep pass immediately; returns how many expired entries went.
    size_t purgeExpired();

    // Mutation counter of the live entry at key, 0 if absent.
    uint64_t version(const std::string& key);

private:
    std::optional<CacheClock::time_point> expiryFor(std::optional<int64_t> ttl, CacheClock::time_point now) const;

    const int default_ttl_seconds_;
    std::shared_ptr<ILogger> logger_;
    StatsTracker stats_;
    EntryStore store_;
    AtomicCoordinator atomics_;
    std::unique_ptr<ExpirySweeper> sweeper_;
    std::atomic<bool> closed_{false};
};

#endif // INMEMORYCACHE_HPP
