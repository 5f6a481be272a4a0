#ifndef ATOMICCOORDINATOR_HPP
#define ATOMICCOORDINATOR_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "EntryStore.hpp"

// Read-modify-write operations for the in-process cache. Each one runs as a
// single EntryStore::mutate() call, so two increments on the same key can not
// both read the old value and a CAS can not succeed on a stale read.
class AtomicCoordinator {
public:
    explicit AtomicCoordinator(EntryStore& store) : store_(store) {}

    // Adds (or subtracts) delta to an integer entry, creating it if absent.
    // The entry's expiry is kept. Throws ValidationError on a non-integer value,
    // an unsigned value above INT64_MAX, or on signed overflow.
    int64_t increment(const std::string& key, int64_t delta, CacheClock::time_point now);
    int64_t decrement(const std::string& key, int64_t delta, CacheClock::time_point now);

    bool setIfAbsent(const std::string& key, const CacheValue& value,
                     std::optional<CacheClock::time_point> expire_at, CacheClock::time_point now);

    // Equality of the JSON text, not version equality. An absent key never matches.
    bool compareAndSwap(const std::string& key, const CacheValue& expected, const CacheValue& desired,
                        CacheClock::time_point now);

private:
    int64_t adjust(const std::string& key, int64_t delta, bool subtract, CacheClock::time_point now);

    EntryStore& store_;
};

#endif // ATOMICCOORDINATOR_HPP
