#ifndef STATSTRACKER_HPP
#define STATSTRACKER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "../interfaces/IStatsDClient.hpp"
#include "../models/CacheStats.hpp"

// Hit/miss/eviction counters for one cache instance.
// Counters are lock-free; only the reset timestamp takes a mutex.
class StatsTracker {
public:
    explicit StatsTracker(bool track_stats, std::shared_ptr<IStatsDClient> statsd_client = nullptr);

    void recordHit();
    void recordMiss();
    void recordEviction();

    // size comes from the entry store's live count, the tracker does not own it
    CacheStats snapshot(uint64_t size) const;
    void reset();

    bool enabled() const { return track_stats_; }

private:
    const bool track_stats_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    mutable std::mutex reset_mutex_;
    std::chrono::system_clock::time_point last_reset_at_;
};

#endif // STATSTRACKER_HPP
