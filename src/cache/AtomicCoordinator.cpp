#include "AtomicCoordinator.hpp"

#include <limits>

#include "../core/CacheErrors.hpp"

int64_t AtomicCoordinator::increment(const std::string& key, int64_t delta, CacheClock::time_point now) {
    return adjust(key, delta, false, now);
}

int64_t AtomicCoordinator::decrement(const std::string& key, int64_t delta, CacheClock::time_point now) {
    return adjust(key, delta, true, now);
}

int64_t AtomicCoordinator::adjust(const std::string& key, int64_t delta, bool subtract, CacheClock::time_point now) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    return store_.mutate(key, now, [&](const CacheEntry* current, EntryMutation& out) -> int64_t {
        int64_t base = 0;
        if (current != nullptr) {
            if (!current->value.is_number_integer()) {
                throw ValidationError("Value at key '" + key + "' is not an integer");
            }
            if (current->value.is_number_unsigned() && current->value.get<uint64_t>() > static_cast<uint64_t>(max)) {
                throw ValidationError("Value at key '" + key + "' is out of the signed 64-bit range");
            }
            base = current->value.get<int64_t>();
            out.expire_at = current->expire_at;
        }
        bool overflows = subtract
            ? (delta < 0 && base > max + delta) || (delta > 0 && base < min + delta)
            : (delta > 0 && base > max - delta) || (delta < 0 && base < min - delta);
        if (overflows) {
            throw ValidationError(std::string(subtract ? "Decrement" : "Increment") + " on key '" + key +
                                  "' would overflow");
        }
        int64_t result = subtract ? base - delta : base + delta;
        out.commit = true;
        out.value = result;
        return result;
    });
}

bool AtomicCoordinator::setIfAbsent(const std::string& key, const CacheValue& value,
                                    std::optional<CacheClock::time_point> expire_at, CacheClock::time_point now) {
    return store_.mutate(key, now, [&](const CacheEntry* current, EntryMutation& out) {
        if (current != nullptr) {
            return false;
        }
        out.commit = true;
        out.value = value;
        out.expire_at = expire_at;
        return true;
    });
}

bool AtomicCoordinator::compareAndSwap(const std::string& key, const CacheValue& expected, const CacheValue& desired,
                                       CacheClock::time_point now) {
    return store_.mutate(key, now, [&](const CacheEntry* current, EntryMutation& out) {
        // Serialized form, so 1 and 1.0 differ here exactly as they do in Redis
        if (current == nullptr || current->value.dump() != expected.dump()) {
            return false;
        }
        out.commit = true;
        out.value = desired;
        out.expire_at = current->expire_at;
        return true;
    });
}
