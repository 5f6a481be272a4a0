#ifndef NAMESPACEDCACHE_HPP
#define NAMESPACEDCACHE_HPP

#include <memory>
#include <string>

#include "../interfaces/CacheInterface.hpp"

// View of an inner cache in which every key is stored as "<ns>:<key>".
// Owns no entries: stats, ping and the data itself belong to the inner cache,
// and close() leaves the inner cache open. flush_all() only removes this
// view's keys.
class NamespacedCache : public CacheInterface {
public:
    NamespacedCache(std::shared_ptr<CacheInterface> inner, std::string ns);

    const std::string& ns() const { return ns_; }

    std::optional<CacheValue> get(const std::string& key) override;
    void set(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl = std::nullopt) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    std::optional<int64_t> ttl(const std::string& key) override;
    bool expire(const std::string& key, int64_t ttl) override;

    void set_many(const CacheValueMap& values, std::optional<int64_t> ttl = std::nullopt) override;
    CacheValueMap get_many(const std::vector<std::string>& keys) override;
    size_t delete_many(const std::vector<std::string>& keys) override;

    int64_t increment(const std::string& key, int64_t delta = 1) override;
    int64_t decrement(const std::string& key, int64_t delta = 1) override;
    bool set_if_absent(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl = std::nullopt) override;
    bool compare_and_swap(const std::string& key, const CacheValue& expected, const CacheValue& desired) override;

    std::set<std::string> keys_matching(const std::string& pattern) override;
    size_t count_matching(const std::string& pattern) override;
    size_t delete_matching(const std::string& pattern) override;

    // Nested views compose: the result stores keys as "<ns>:<inner_ns>:<key>"
    std::shared_ptr<CacheInterface> with_namespace(const std::string& ns) override;
    size_t clear_namespace(const std::string& ns) override;

    CacheStats cache_stats() override;
    void clear_stats() override;

    size_t flush_all() override;
    bool ping() override;
    void close() override;

private:
    std::string prefixed(const std::string& key) const;
    std::string stripped(const std::string& key) const;
    std::vector<std::string> prefixedAll(const std::vector<std::string>& keys) const;

    std::shared_ptr<CacheInterface> inner_;
    std::string ns_;
    std::string prefix_; // ns_ + ":"
};

#endif // NAMESPACEDCACHE_HPP
