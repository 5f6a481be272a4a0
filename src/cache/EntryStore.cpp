#include "EntryStore.hpp"

EntryStore::EntryStore(size_t max_size, StatsTracker& stats)
    : max_size_(max_size), stats_(stats) {}

std::optional<CacheValue> EntryStore::get(const std::string& key, CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        stats_.recordMiss();
        return std::nullopt;
    }
    if (it->second.isExpired(now)) {
        // Passive expiry: reclaim now rather than waiting for the sweep
        removeLocked(it, RemovalReason::Expired);
        stats_.recordMiss();
        return std::nullopt;
    }
    touchLocked(it->second);
    stats_.recordHit();
    return it->second.value;
}

bool EntryStore::contains(const std::string& key, CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return findLiveLocked(key, now) != nullptr;
}

void EntryStore::put(const std::string& key, CacheValue value,
                     std::optional<CacheClock::time_point> expire_at, CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    commitLocked(key, std::move(value), expire_at, now);
}

bool EntryStore::erase(const std::string& key, CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    bool was_live = !it->second.isExpired(now);
    removeLocked(it, was_live ? RemovalReason::Deleted : RemovalReason::Expired);
    return was_live;
}

std::optional<CacheClock::duration> EntryStore::remaining(const std::string& key, CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const CacheEntry* entry = findLiveLocked(key, now);
    if (entry == nullptr || !entry->expire_at) {
        return std::nullopt;
    }
    return *entry->expire_at - now;
}

bool EntryStore::setExpiry(const std::string& key, std::optional<CacheClock::time_point> expire_at,
                           CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (findLiveLocked(key, now) == nullptr) {
        return false;
    }
    CacheEntry& entry = entries_.at(key);
    reindexLocked(entry, expire_at);
    entry.expire_at = expire_at;
    return true;
}

std::vector<std::string> EntryStore::liveKeys(CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        if (!entry.isExpired(now)) {
            keys.push_back(key);
        }
    }
    return keys;
}

size_t EntryStore::purgeExpired(CacheClock::time_point now) {
    size_t purged = 0;
    while (true) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (expiry_index_.empty() || expiry_index_.begin()->first > now) {
            break;
        }
        auto it = entries_.find(expiry_index_.begin()->second);
        if (it == entries_.end()) {
            // Index and map are maintained together; a stray index entry is dropped
            expiry_index_.erase(expiry_index_.begin());
            continue;
        }
        removeLocked(it, RemovalReason::Expired);
        ++purged;
    }
    return purged;
}

size_t EntryStore::liveCount(CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    drainExpiredLocked(now);
    return entries_.size();
}

size_t EntryStore::clear(CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    drainExpiredLocked(now);
    size_t removed = entries_.size();
    entries_.clear();
    lru_.clear();
    expiry_index_.clear();
    return removed;
}

uint64_t EntryStore::versionOf(const std::string& key, CacheClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const CacheEntry* entry = findLiveLocked(key, now);
    return entry ? entry->version : 0;
}

// --- Private helpers (mutex_ held) ---

const CacheEntry* EntryStore::findLiveLocked(const std::string& key, CacheClock::time_point now) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.isExpired(now)) {
        removeLocked(it, RemovalReason::Expired);
        return nullptr;
    }
    return &it->second;
}

void EntryStore::commitLocked(const std::string& key, CacheValue value,
                              std::optional<CacheClock::time_point> expire_at, CacheClock::time_point now) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.isExpired(now)) {
        // A dead entry is replaced, not updated: its version history ends here
        removeLocked(it, RemovalReason::Expired);
        it = entries_.end();
    }

    if (it == entries_.end()) {
        CacheEntry entry;
        entry.key = key;
        entry.value = std::move(value);
        entry.inserted_at = now;
        entry.version = 1;
        it = entries_.emplace(key, std::move(entry)).first;
        reindexLocked(it->second, expire_at);
        it->second.expire_at = expire_at;
    } else {
        reindexLocked(it->second, expire_at);
        it->second.value = std::move(value);
        it->second.expire_at = expire_at;
        it->second.inserted_at = now;
        ++it->second.version;
    }
    touchLocked(it->second);

    // Expired entries must not push live ones out
    drainExpiredLocked(now);
    evictIfNeededLocked();
}

void EntryStore::removeLocked(EntryMap::iterator it, RemovalReason reason) {
    if (it->second.expire_at) {
        expiry_index_.erase({*it->second.expire_at, it->first});
    }
    lru_.remove(it->first);
    entries_.erase(it);
    if (reason == RemovalReason::Evicted) {
        stats_.recordEviction();
    }
}

void EntryStore::reindexLocked(const CacheEntry& entry, std::optional<CacheClock::time_point> new_expire_at) {
    if (entry.expire_at) {
        expiry_index_.erase({*entry.expire_at, entry.key});
    }
    if (new_expire_at) {
        expiry_index_.emplace(*new_expire_at, entry.key);
    }
}

size_t EntryStore::drainExpiredLocked(CacheClock::time_point now) {
    size_t drained = 0;
    while (!expiry_index_.empty() && expiry_index_.begin()->first <= now) {
        auto it = entries_.find(expiry_index_.begin()->second);
        if (it == entries_.end()) {
            expiry_index_.erase(expiry_index_.begin());
            continue;
        }
        removeLocked(it, RemovalReason::Expired);
        ++drained;
    }
    return drained;
}

void EntryStore::evictIfNeededLocked() {
    if (max_size_ == 0) {
        return;
    }
    while (entries_.size() > max_size_) {
        auto victim = lru_.leastRecent();
        if (!victim) {
            break;
        }
        auto it = entries_.find(*victim);
        if (it == entries_.end()) {
            lru_.remove(*victim);
            continue;
        }
        removeLocked(it, RemovalReason::Evicted);
    }
}

void EntryStore::touchLocked(CacheEntry& entry) {
    entry.access_order_token = ++next_access_token_;
    lru_.touch(entry.key);
}
