#include "StatsTracker.hpp"

#include <utility>

#include "../config/AppConfig.hpp"

StatsTracker::StatsTracker(bool track_stats, std::shared_ptr<IStatsDClient> statsd_client)
    : track_stats_(track_stats),
      statsd_client_(std::move(statsd_client)),
      last_reset_at_(std::chrono::system_clock::now()) {}

void StatsTracker::recordHit() {
    if (!track_stats_) return;
    hits_.fetch_add(1, std::memory_order_relaxed);
    if (statsd_client_) statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
}

void StatsTracker::recordMiss() {
    if (!track_stats_) return;
    misses_.fetch_add(1, std::memory_order_relaxed);
    if (statsd_client_) statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
}

void StatsTracker::recordEviction() {
    if (!track_stats_) return;
    evictions_.fetch_add(1, std::memory_order_relaxed);
    if (statsd_client_) statsd_client_->increment(MetricsDefinitions::CACHE_EVICTION);
}

CacheStats StatsTracker::snapshot(uint64_t size) const {
    CacheStats stats;
    stats.size = size;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(reset_mutex_);
    stats.last_reset_at = last_reset_at_;
    return stats;
}

void StatsTracker::reset() {
    std::lock_guard<std::mutex> lock(reset_mutex_);
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    evictions_.store(0, std::memory_order_relaxed);
    last_reset_at_ = std::chrono::system_clock::now();
}
