#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../models/CacheEntry.hpp"
#include "../models/CacheStats.hpp"

using CacheValueMap = std::map<std::string, CacheValue>;

// Backend-agnostic cache contract. Misses and CAS mismatches are return
// values; only ValidationError, ConnectionError and CacheBackendError are thrown.
// A ttl of std::nullopt means "use the cache's default TTL", 0 means "never expires".
class CacheInterface : public std::enable_shared_from_this<CacheInterface> {
public:
    virtual ~CacheInterface() = default;

    virtual std::optional<CacheValue> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl = std::nullopt) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;
    virtual std::optional<int64_t> ttl(const std::string& key) = 0;
    virtual bool expire(const std::string& key, int64_t ttl) = 0;

    virtual void set_many(const CacheValueMap& values, std::optional<int64_t> ttl = std::nullopt) = 0;
    virtual CacheValueMap get_many(const std::vector<std::string>& keys) = 0;
    virtual size_t delete_many(const std::vector<std::string>& keys) = 0;

    virtual int64_t increment(const std::string& key, int64_t delta = 1) = 0;
    virtual int64_t decrement(const std::string& key, int64_t delta = 1) = 0;
    virtual bool set_if_absent(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl = std::nullopt) = 0;
    virtual bool compare_and_swap(const std::string& key, const CacheValue& expected, const CacheValue& desired) = 0;

    virtual std::set<std::string> keys_matching(const std::string& pattern) = 0;
    virtual size_t count_matching(const std::string& pattern) = 0;
    virtual size_t delete_matching(const std::string& pattern) = 0;

    virtual std::shared_ptr<CacheInterface> with_namespace(const std::string& ns) = 0;
    virtual size_t clear_namespace(const std::string& ns) = 0;

    virtual CacheStats cache_stats() = 0;
    virtual void clear_stats() = 0;

    virtual size_t flush_all() = 0;
    virtual bool ping() = 0;
    virtual void close() = 0;
};

#endif // CACHEINTERFACE_HPP
