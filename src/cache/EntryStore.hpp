#ifndef ENTRYSTORE_HPP
#define ENTRYSTORE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "LruTracker.hpp"
#include "StatsTracker.hpp"
#include "../models/CacheEntry.hpp"

// A pending write produced inside EntryStore::mutate().
struct EntryMutation {
    bool commit = false;
    CacheValue value;
    std::optional<CacheClock::time_point> expire_at;
};

// Key -> CacheEntry map with its recency order and expiry index.
// One mutex guards the map, the LruTracker and the expiry index together, so
// insertion, eviction and expiry removal never see each other half done.
// Every public method takes that lock; none of them performs I/O under it.
class EntryStore {
public:
    // max_size == 0 disables eviction
    EntryStore(size_t max_size, StatsTracker& stats);

    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;

    // Live value for key, touching its recency. Counts a hit or a miss.
    std::optional<CacheValue> get(const std::string& key, CacheClock::time_point now);

    bool contains(const std::string& key, CacheClock::time_point now);

    // Unconditional insert/replace; bumps version and evicts down to max_size.
    void put(const std::string& key, CacheValue value,
             std::optional<CacheClock::time_point> expire_at, CacheClock::time_point now);

    // True iff a live entry was removed.
    bool erase(const std::string& key, CacheClock::time_point now);

    // Time left before expiry; nullopt if absent or without expiry.
    std::optional<CacheClock::duration> remaining(const std::string& key, CacheClock::time_point now);

    // Changes expiry of a live entry without touching its value. False if absent.
    bool setExpiry(const std::string& key, std::optional<CacheClock::time_point> expire_at,
                   CacheClock::time_point now);

    // Snapshot of live keys; the store may change right after it is taken.
    std::vector<std::string> liveKeys(CacheClock::time_point now);

    // Read-modify-write under the store lock. fn(const CacheEntry* current, EntryMutation& out)
    // sees the live entry (nullptr if absent or expired) and may request a commit.
    // The commit lands before the lock is released.
    template <typename Fn>
    auto mutate(const std::string& key, CacheClock::time_point now, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        const CacheEntry* current = findLiveLocked(key, now);
        EntryMutation mutation;
        auto result = fn(current, mutation);
        if (mutation.commit) {
            commitLocked(key, std::move(mutation.value), mutation.expire_at, now);
        }
        return result;
    }

    // Removes expired entries one at a time, taking the lock per entry so
    // readers and writers interleave with a long sweep. Returns how many went.
    size_t purgeExpired(CacheClock::time_point now);

    // Number of live entries.
    size_t liveCount(CacheClock::time_point now);

    // Drops every entry; returns how many live entries there were.
    size_t clear(CacheClock::time_point now);

    uint64_t versionOf(const std::string& key, CacheClock::time_point now);

private:
    enum class RemovalReason { Deleted, Expired, Evicted };

    using EntryMap = std::unordered_map<std::string, CacheEntry>;
    using ExpiryIndex = std::set<std::pair<CacheClock::time_point, std::string>>;

    // All *Locked helpers expect mutex_ to be held by the caller.
    const CacheEntry* findLiveLocked(const std::string& key, CacheClock::time_point now);
    void commitLocked(const std::string& key, CacheValue value,
                      std::optional<CacheClock::time_point> expire_at, CacheClock::time_point now);
    void removeLocked(EntryMap::iterator it, RemovalReason reason);
    void reindexLocked(const CacheEntry& entry, std::optional<CacheClock::time_point> new_expire_at);
    size_t drainExpiredLocked(CacheClock::time_point now);
    void evictIfNeededLocked();
    void touchLocked(CacheEntry& entry);

    EntryMap entries_;
    LruTracker lru_;
    ExpiryIndex expiry_index_;
    uint64_t next_access_token_ = 0;

    mutable std::mutex mutex_;
    const size_t max_size_;
    StatsTracker& stats_;
};

#endif // ENTRYSTORE_HPP
