#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using CacheValue = nlohmann::json;
using CacheClock = std::chrono::steady_clock;

struct CacheEntry {
    std::string key;
    CacheValue value;
    std::optional<CacheClock::time_point> expire_at; // nullopt = never expires
    CacheClock::time_point inserted_at;
    uint64_t access_order_token = 0; // bumped on every touch
    uint64_t version = 0;            // bumped on every value mutation

    bool isExpired(CacheClock::time_point now) const {
        return expire_at && *expire_at <= now;
    }
};

#endif // CACHEENTRY_HPP
