#include "InMemoryCache.hpp"

#include <chrono>
#include <utility>

#include "NamespacedCache.hpp"
#include "../utils/GlobPattern.hpp"
#include "../utils/Utils.hpp"

using namespace std::chrono;

InMemoryCache::InMemoryCache(int default_ttl_seconds,
                             int max_size,
                             bool track_stats,
                             std::chrono::milliseconds sweep_interval,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client)
    : default_ttl_seconds_(Utils::requireNonNegative(default_ttl_seconds, "default_ttl")),
      logger_(std::move(logger)),
      stats_(track_stats, std::move(statsd_client)),
      store_(static_cast<size_t>(Utils::requireNonNegative(max_size, "max_size")), stats_),
      atomics_(store_) {
    sweeper_ = std::make_unique<ExpirySweeper>(sweep_interval, [this]() { return store_.purgeExpired(steady_clock::now()); }, logger_);
    sweeper_->start();
    if (logger_) {
        logger_->debug("InMemoryCache created: default_ttl=" + std::to_string(default_ttl_seconds_) +
                       "s max_size=" + std::to_string(max_size));
    }
}

std::shared_ptr<InMemoryCache> InMemoryCache::fromConfig(const AppConfig& config,
                                                         std::shared_ptr<ILogger> logger,
                                                         std::shared_ptr<IStatsDClient> statsd_client) {
    Utils::validateConfig(config);
    return std::make_shared<InMemoryCache>(config.default_ttl_seconds,
                                           config.max_size,
                                           config.track_stats,
                                           seconds(config.sweep_interval_seconds),
                                           std::move(logger),
                                           std::move(statsd_client));
}

InMemoryCache::~InMemoryCache() {
    close();
}

std::optional<CacheValue> InMemoryCache::get(const std::string& key) {
    Utils::validateKey(key);
    return store_.get(key, steady_clock::now());
}

void InMemoryCache::set(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl) {
    Utils::validateKey(key);
    auto now = steady_clock::now();
    store_.put(key, value, expiryFor(ttl, now), now);
}

bool InMemoryCache::remove(const std::string& key) {
    Utils::validateKey(key);
    return store_.erase(key, steady_clock::now());
}

bool InMemoryCache::exists(const std::string& key) {
    Utils::validateKey(key);
    return store_.contains(key, steady_clock::now());
}

std::optional<int64_t> InMemoryCache::ttl(const std::string& key) {
    Utils::validateKey(key);
    auto left = store_.remaining(key, steady_clock::now());
    if (!left) {
        return std::nullopt;
    }
    // Round up so a live key never reports 0 seconds left
    auto left_ms = duration_cast<milliseconds>(*left).count();
    return (left_ms + 999) / 1000;
}

bool InMemoryCache::expire(const std::string& key, int64_t ttl) {
    Utils::validateKey(key);
    Utils::validateTtl(ttl);
    auto now = steady_clock::now();
    return store_.setExpiry(key, expiryFor(ttl, now), now);
}

void InMemoryCache::set_many(const CacheValueMap& values, std::optional<int64_t> ttl) {
    for (const auto& [key, value] : values) {
        Utils::validateKey(key);
    }
    auto now = steady_clock::now();
    auto expire_at = expiryFor(ttl, now);
    for (const auto& [key, value] : values) {
        store_.put(key, value, expire_at, now);
    }
}

CacheValueMap InMemoryCache::get_many(const std::vector<std::string>& keys) {
    CacheValueMap found;
    for (const auto& key : keys) {
        if (auto value = get(key)) {
            found.emplace(key, std::move(*value));
        }
    }
    return found;
}

size_t InMemoryCache::delete_many(const std::vector<std::string>& keys) {
    size_t deleted = 0;
    for (const auto& key : keys) {
        if (remove(key)) {
            ++deleted;
        }
    }
    return deleted;
}

int64_t InMemoryCache::increment(const std::string& key, int64_t delta) {
    Utils::validateKey(key);
    return atomics_.increment(key, delta, steady_clock::now());
}

int64_t InMemoryCache::decrement(const std::string& key, int64_t delta) {
    Utils::validateKey(key);
    return atomics_.decrement(key, delta, steady_clock::now());
}

bool InMemoryCache::set_if_absent(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl) {
    Utils::validateKey(key);
    auto now = steady_clock::now();
    return atomics_.setIfAbsent(key, value, expiryFor(ttl, now), now);
}

bool InMemoryCache::compare_and_swap(const std::string& key, const CacheValue& expected, const CacheValue& desired) {
    Utils::validateKey(key);
    return atomics_.compareAndSwap(key, expected, desired, steady_clock::now());
}

std::set<std::string> InMemoryCache::keys_matching(const std::string& pattern) {
    Utils::validatePattern(pattern);
    GlobPattern glob(pattern);
    auto now = steady_clock::now();
    std::set<std::string> matched;
    if (glob.isLiteral()) {
        if (store_.contains(pattern, now)) {
            matched.insert(pattern);
        }
        return matched;
    }
    for (auto& key : store_.liveKeys(now)) {
        if (glob.matches(key)) {
            matched.insert(std::move(key));
        }
    }
    return matched;
}

size_t InMemoryCache::count_matching(const std::string& pattern) {
    return keys_matching(pattern).size();
}

size_t InMemoryCache::delete_matching(const std::string& pattern) {
    auto keys = keys_matching(pattern);
    auto now = steady_clock::now();
    size_t deleted = 0;
    for (const auto& key : keys) {
        if (store_.erase(key, now)) {
            ++deleted;
        }
    }
    return deleted;
}

std::shared_ptr<CacheInterface> InMemoryCache::with_namespace(const std::string& ns) {
    return std::make_shared<NamespacedCache>(shared_from_this(), ns);
}

size_t InMemoryCache::clear_namespace(const std::string& ns) {
    Utils::validateNamespace(ns);
    return delete_matching(ns + Constants::NAMESPACE_SEPARATOR + "*");
}

CacheStats InMemoryCache::cache_stats() {
    return stats_.snapshot(store_.liveCount(steady_clock::now()));
}

void InMemoryCache::clear_stats() {
    stats_.reset();
}

size_t InMemoryCache::flush_all() {
    size_t removed = store_.clear(steady_clock::now());
    if (logger_) logger_->info("InMemoryCache flushed " + std::to_string(removed) + " entries");
    return removed;
}

bool InMemoryCache::ping() {
    return !closed_;
}

void InMemoryCache::close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (sweeper_) {
        sweeper_->stop();
    }
    if (logger_) logger_->debug("InMemoryCache closed");
}

size_t InMemoryCache::purgeExpired() {
    return store_.purgeExpired(steady_clock::now());
}

uint64_t InMemoryCache::version(const std::string& key) {
    return store_.versionOf(key, steady_clock::now());
}

std::optional<CacheClock::time_point> InMemoryCache::expiryFor(std::optional<int64_t> ttl,
                                                               CacheClock::time_point now) const {
    int64_t effective_ttl = ttl ? *ttl : default_ttl_seconds_;
    Utils::validateTtl(effective_ttl);
    if (effective_ttl == 0) {
        return std::nullopt;
    }
    // TTLs past the clock's range (about 292 years of uptime) saturate
    auto headroom = duration_cast<seconds>(CacheClock::time_point::max() - now).count();
    if (effective_ttl >= headroom) {
        return CacheClock::time_point::max();
    }
    return now + seconds(effective_ttl);
}
