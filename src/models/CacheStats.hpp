#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

// --- Snapshot of a cache instance's counters ---
class CacheStats {
public:
    uint64_t size = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    std::chrono::system_clock::time_point last_reset_at;

    double hit_rate() const {
        uint64_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"size", size},
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"hit_rate", hit_rate()},
            {"last_reset_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                last_reset_at.time_since_epoch()).count()}
        };
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheStats {"
            << " size: " << size
            << ", hits: " << hits
            << ", misses: " << misses
            << ", evictions: " << evictions
            << ", hit_rate: " << hit_rate()
            << " }";
        return oss.str();
    }
};

#endif // CACHESTATS_HPP
