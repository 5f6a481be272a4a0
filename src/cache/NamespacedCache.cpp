#include "NamespacedCache.hpp"

#include <stdexcept>
#include <utility>

#include "../config/AppConfig.hpp"
#include "../utils/Utils.hpp"

NamespacedCache::NamespacedCache(std::shared_ptr<CacheInterface> inner, std::string ns)
    : inner_(std::move(inner)), ns_(std::move(ns)) {
    if (!inner_) {
        throw std::invalid_argument("Inner cache cannot be null for NamespacedCache");
    }
    Utils::validateNamespace(ns_);
    prefix_ = ns_ + Constants::NAMESPACE_SEPARATOR;
}

std::string NamespacedCache::prefixed(const std::string& key) const {
    Utils::validateKey(key);
    return prefix_ + key;
}

std::string NamespacedCache::stripped(const std::string& key) const {
    if (key.compare(0, prefix_.size(), prefix_) == 0) {
        return key.substr(prefix_.size());
    }
    return key;
}

std::vector<std::string> NamespacedCache::prefixedAll(const std::vector<std::string>& keys) const {
    std::vector<std::string> out;
    out.reserve(keys.size());
    for (const auto& key : keys) {
        out.push_back(prefixed(key));
    }
    return out;
}

std::optional<CacheValue> NamespacedCache::get(const std::string& key) {
    return inner_->get(prefixed(key));
}

void NamespacedCache::set(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl) {
    inner_->set(prefixed(key), value, ttl);
}

bool NamespacedCache::remove(const std::string& key) {
    return inner_->remove(prefixed(key));
}

bool NamespacedCache::exists(const std::string& key) {
    return inner_->exists(prefixed(key));
}

std::optional<int64_t> NamespacedCache::ttl(const std::string& key) {
    return inner_->ttl(prefixed(key));
}

bool NamespacedCache::expire(const std::string& key, int64_t ttl) {
    return inner_->expire(prefixed(key), ttl);
}

void NamespacedCache::set_many(const CacheValueMap& values, std::optional<int64_t> ttl) {
    CacheValueMap scoped;
    for (const auto& [key, value] : values) {
        scoped.emplace(prefixed(key), value);
    }
    inner_->set_many(scoped, ttl);
}

CacheValueMap NamespacedCache::get_many(const std::vector<std::string>& keys) {
    CacheValueMap found;
    for (auto& [key, value] : inner_->get_many(prefixedAll(keys))) {
        found.emplace(stripped(key), std::move(value));
    }
    return found;
}

size_t NamespacedCache::delete_many(const std::vector<std::string>& keys) {
    return inner_->delete_many(prefixedAll(keys));
}

int64_t NamespacedCache::increment(const std::string& key, int64_t delta) {
    return inner_->increment(prefixed(key), delta);
}

int64_t NamespacedCache::decrement(const std::string& key, int64_t delta) {
    return inner_->decrement(prefixed(key), delta);
}

bool NamespacedCache::set_if_absent(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl) {
    return inner_->set_if_absent(prefixed(key), value, ttl);
}

bool NamespacedCache::compare_and_swap(const std::string& key, const CacheValue& expected, const CacheValue& desired) {
    return inner_->compare_and_swap(prefixed(key), expected, desired);
}

std::set<std::string> NamespacedCache::keys_matching(const std::string& pattern) {
    Utils::validatePattern(pattern);
    std::set<std::string> keys;
    for (const auto& key : inner_->keys_matching(prefix_ + pattern)) {
        keys.insert(stripped(key));
    }
    return keys;
}

size_t NamespacedCache::count_matching(const std::string& pattern) {
    Utils::validatePattern(pattern);
    return inner_->count_matching(prefix_ + pattern);
}

size_t NamespacedCache::delete_matching(const std::string& pattern) {
    Utils::validatePattern(pattern);
    return inner_->delete_matching(prefix_ + pattern);
}

std::shared_ptr<CacheInterface> NamespacedCache::with_namespace(const std::string& ns) {
    Utils::validateNamespace(ns);
    // Wrap the inner cache directly so lookups do not walk a chain of views
    return std::make_shared<NamespacedCache>(inner_, prefix_ + ns);
}

size_t NamespacedCache::clear_namespace(const std::string& ns) {
    Utils::validateNamespace(ns);
    return inner_->clear_namespace(prefix_ + ns);
}

CacheStats NamespacedCache::cache_stats() {
    return inner_->cache_stats();
}

void NamespacedCache::clear_stats() {
    inner_->clear_stats();
}

size_t NamespacedCache::flush_all() {
    return inner_->clear_namespace(ns_);
}

bool NamespacedCache::ping() {
    return inner_->ping();
}

void NamespacedCache::close() {
    // The inner cache may be shared with other views; its owner closes it
}
