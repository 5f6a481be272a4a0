#include <iostream>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "RedisCache.hpp"
#include "NamespacedCache.hpp"
#include "../core/CacheErrors.hpp"
#include "../interfaces/ILogger.hpp"
#include "../utils/GlobPattern.hpp"
#include "../utils/Utils.hpp"

using json = nlohmann::json;

namespace {
    // Swaps the value only if its stored JSON text equals ARGV[1], keeping the TTL.
    const std::string CAS_SCRIPT =
        "local current = redis.call('GET', KEYS[1])\n"
        "if current == ARGV[1] then\n"
        "  local ttl = redis.call('PTTL', KEYS[1])\n"
        "  redis.call('SET', KEYS[1], ARGV[2])\n"
        "  if ttl > 0 then redis.call('PEXPIRE', KEYS[1], ttl) end\n"
        "  return 1\n"
        "end\n"
        "return 0\n";

    // expire(key, 0): drop the TTL of an existing key, report whether it existed.
    const std::string PERSIST_SCRIPT =
        "if redis.call('EXISTS', KEYS[1]) == 1 then\n"
        "  redis.call('PERSIST', KEYS[1])\n"
        "  return 1\n"
        "end\n"
        "return 0\n";

    constexpr const char* SCAN_BATCH = "100";
    constexpr size_t DELETE_BATCH = 500;

    std::string replyString(const redisReply* reply) {
        return std::string(reply->str, reply->len);
    }
}

RedisCache::RedisCache(std::shared_ptr<RedisConnectionPool> pool,
                       int default_ttl_seconds,
                       std::shared_ptr<ILogger> logger)
    : pool_(std::move(pool)),
      default_ttl_seconds_(Utils::requireNonNegative(default_ttl_seconds, "default_ttl")),
      logger_(std::move(logger)),
      last_reset_at_(std::chrono::system_clock::now()) {
    if (!pool_) {
        throw std::invalid_argument("Connection pool cannot be null for RedisCache");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisCache");
    }
}

RedisCache::~RedisCache() {
    close();
}

std::shared_ptr<RedisCache> RedisCache::fromConfig(const AppConfig& config,
                                                   std::shared_ptr<ILogger> logger,
                                                   std::shared_ptr<IStatsDClient> statsd_client) {
    Utils::validateConfig(config);
    auto pool = std::make_shared<RedisConnectionPool>(RedisPoolOptions::fromConfig(config), logger, std::move(statsd_client));
    return std::make_shared<RedisCache>(pool, config.default_ttl_seconds, logger);
}

// --- Plumbing ---

RedisReplyPtr RedisCache::execute(const Command& command) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(command.size());
    argvlen.reserve(command.size());
    for (const auto& arg : command) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    RedisConnectionPool::Lease lease = pool_->acquire();
    RedisReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(lease.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        lease.markBroken();
        std::string error_msg = "Redis " + command.front() + " failed: " + std::string(lease.get()->errstr);
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw CacheBackendError("Redis " + command.front() + " error: " + replyString(reply.get()));
    }
    return reply;
}

std::vector<RedisReplyPtr> RedisCache::executePipeline(const std::vector<Command>& commands) {
    std::vector<RedisReplyPtr> replies;
    if (commands.empty()) {
        return replies;
    }

    RedisConnectionPool::Lease lease = pool_->acquire();
    for (const auto& command : commands) {
        std::vector<const char*> argv;
        std::vector<size_t> argvlen;
        for (const auto& arg : command) {
            argv.push_back(arg.data());
            argvlen.push_back(arg.size());
        }
        if (redisAppendCommandArgv(lease.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data()) != REDIS_OK) {
            lease.markBroken();
            throw ConnectionError("Redis pipeline append failed: " + std::string(lease.get()->errstr));
        }
    }

    // Read every reply before reporting errors so the connection stays in sync
    std::string first_error;
    replies.reserve(commands.size());
    for (size_t i = 0; i < commands.size(); ++i) {
        void* raw = nullptr;
        if (redisGetReply(lease.get(), &raw) != REDIS_OK) {
            lease.markBroken();
            std::string error_msg = "Redis pipeline failed: " + std::string(lease.get()->errstr);
            logger_->error(error_msg);
            throw ConnectionError(error_msg);
        }
        RedisReplyPtr reply(static_cast<redisReply*>(raw));
        if (reply->type == REDIS_REPLY_ERROR && first_error.empty()) {
            first_error = replyString(reply.get());
        }
        replies.push_back(std::move(reply));
    }
    if (!first_error.empty()) {
        throw CacheBackendError("Redis pipeline error: " + first_error);
    }
    return replies;
}

int64_t RedisCache::effectiveTtl(std::optional<int64_t> ttl) const {
    int64_t effective = ttl ? *ttl : default_ttl_seconds_;
    Utils::validateTtl(effective);
    return effective;
}

std::optional<CacheValue> RedisCache::decode(const std::string& key, const char* data, size_t len) const {
    try {
        return json::parse(data, data + len);
    } catch (const json::parse_error& e) {
        // Written by something other than this cache; hand it back as text
        logger_->warn("Non-JSON value at key '" + key + "', returning raw string: " + e.what());
        return CacheValue(std::string(data, len));
    }
}

// --- Basic operations ---

std::optional<CacheValue> RedisCache::get(const std::string& key) {
    Utils::validateKey(key);
    auto reply = execute({"GET", key});
    if (reply->type != REDIS_REPLY_STRING) {
        return std::nullopt;
    }
    return decode(key, reply->str, reply->len);
}

void RedisCache::set(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl) {
    Utils::validateKey(key);
    int64_t effective_ttl = effectiveTtl(ttl);
    if (effective_ttl > 0) {
        execute({"SET", key, value.dump(), "EX", std::to_string(effective_ttl)});
    } else {
        execute({"SET", key, value.dump()});
    }
}

bool RedisCache::remove(const std::string& key) {
    Utils::validateKey(key);
    auto reply = execute({"DEL", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisCache::exists(const std::string& key) {
    Utils::validateKey(key);
    auto reply = execute({"EXISTS", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

std::optional<int64_t> RedisCache::ttl(const std::string& key) {
    Utils::validateKey(key);
    // PTTL: -2 missing, -1 no expiry
    auto reply = execute({"PTTL", key});
    if (reply->type != REDIS_REPLY_INTEGER || reply->integer <= 0) {
        return std::nullopt;
    }
    return (reply->integer + 999) / 1000;
}

bool RedisCache::expire(const std::string& key, int64_t ttl) {
    Utils::validateKey(key);
    Utils::validateTtl(ttl);
    RedisReplyPtr reply = ttl == 0
        ? execute({"EVAL", PERSIST_SCRIPT, "1", key})
        : execute({"EXPIRE", key, std::to_string(ttl)});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer == 1;
}

// --- Batch operations ---

void RedisCache::set_many(const CacheValueMap& values, std::optional<int64_t> ttl) {
    int64_t effective_ttl = effectiveTtl(ttl);
    std::vector<Command> commands;
    commands.reserve(values.size());
    for (const auto& [key, value] : values) {
        Utils::validateKey(key);
        if (effective_ttl > 0) {
            commands.push_back({"SET", key, value.dump(), "EX", std::to_string(effective_ttl)});
        } else {
            commands.push_back({"SET", key, value.dump()});
        }
    }
    executePipeline(commands);
}

CacheValueMap RedisCache::get_many(const std::vector<std::string>& keys) {
    CacheValueMap found;
    if (keys.empty()) {
        return found;
    }
    Command command{"MGET"};
    for (const auto& key : keys) {
        Utils::validateKey(key);
        command.push_back(key);
    }
    auto reply = execute(command);
    if (reply->type != REDIS_REPLY_ARRAY) {
        return found;
    }
    for (size_t i = 0; i < reply->elements && i < keys.size(); ++i) {
        const redisReply* element = reply->element[i];
        if (element->type == REDIS_REPLY_STRING) {
            if (auto value = decode(keys[i], element->str, element->len)) {
                found.emplace(keys[i], std::move(*value));
            }
        }
    }
    return found;
}

size_t RedisCache::delete_many(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return 0;
    }
    size_t deleted = 0;
    for (size_t start = 0; start < keys.size(); start += DELETE_BATCH) {
        Command command{"DEL"};
        for (size_t i = start; i < keys.size() && i < start + DELETE_BATCH; ++i) {
            Utils::validateKey(keys[i]);
            command.push_back(keys[i]);
        }
        auto reply = execute(command);
        if (reply->type == REDIS_REPLY_INTEGER) {
            deleted += static_cast<size_t>(reply->integer);
        }
    }
    return deleted;
}

// --- Atomic operations ---

int64_t RedisCache::increment(const std::string& key, int64_t delta) {
    Utils::validateKey(key);
    try {
        auto reply = execute({"INCRBY", key, std::to_string(delta)});
        return reply->integer;
    } catch (const CacheBackendError& e) {
        // "value is not an integer or out of range"
        throw ValidationError("Cannot increment key '" + key + "': " + e.what());
    }
}

int64_t RedisCache::decrement(const std::string& key, int64_t delta) {
    Utils::validateKey(key);
    try {
        auto reply = execute({"DECRBY", key, std::to_string(delta)});
        return reply->integer;
    } catch (const CacheBackendError& e) {
        throw ValidationError("Cannot decrement key '" + key + "': " + e.what());
    }
}

bool RedisCache::set_if_absent(const std::string& key, const CacheValue& value, std::optional<int64_t> ttl) {
    Utils::validateKey(key);
    int64_t effective_ttl = effectiveTtl(ttl);
    RedisReplyPtr reply = effective_ttl > 0
        ? execute({"SET", key, value.dump(), "NX", "EX", std::to_string(effective_ttl)})
        : execute({"SET", key, value.dump(), "NX"});
    // OK on success, nil when the key already existed
    return reply->type == REDIS_REPLY_STATUS;
}

bool RedisCache::compare_and_swap(const std::string& key, const CacheValue& expected, const CacheValue& desired) {
    Utils::validateKey(key);
    auto reply = execute({"EVAL", CAS_SCRIPT, "1", key, expected.dump(), desired.dump()});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer == 1;
}

// --- Pattern operations ---

std::set<std::string> RedisCache::keys_matching(const std::string& pattern) {
    Utils::validatePattern(pattern);
    GlobPattern glob(pattern);
    const std::string redis_match = glob.toRedisMatch();
    std::set<std::string> keys;
    std::string cursor = "0";
    do {
        auto reply = execute({"SCAN", cursor, "MATCH", redis_match, "COUNT", SCAN_BATCH});
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            throw CacheBackendError("Unexpected SCAN reply shape");
        }
        cursor = replyString(reply->element[0]);
        const redisReply* batch = reply->element[1];
        for (size_t i = 0; i < batch->elements; ++i) {
            std::string key = replyString(batch->element[i]);
            // Redis glob is richer than ours; re-check so both backends agree
            if (glob.matches(key)) {
                keys.insert(std::move(key));
            }
        }
    } while (cursor != "0");
    return keys;
}

size_t RedisCache::count_matching(const std::string& pattern) {
    return keys_matching(pattern).size();
}

size_t RedisCache::delete_matching(const std::string& pattern) {
    auto keys = keys_matching(pattern);
    return delete_many(std::vector<std::string>(keys.begin(), keys.end()));
}

// --- Namespaces ---

std::shared_ptr<CacheInterface> RedisCache::with_namespace(const std::string& ns) {
    return std::make_shared<NamespacedCache>(shared_from_this(), ns);
}

size_t RedisCache::clear_namespace(const std::string& ns) {
    Utils::validateNamespace(ns);
    return delete_matching(ns + Constants::NAMESPACE_SEPARATOR + "*");
}

// --- Stats & management ---

CacheStats RedisCache::cache_stats() {
    auto info_reply = execute({"INFO", "stats"});
    auto fields = Utils::parseRedisInfo(replyString(info_reply.get()));
    auto counter = [&fields](const std::string& name) -> uint64_t {
        auto it = fields.find(name);
        if (it == fields.end()) {
            return 0;
        }
        auto parsed = Utils::stringToInt64(Utils::trim(it->second));
        return parsed && *parsed > 0 ? static_cast<uint64_t>(*parsed) : 0;
    };

    CacheStats stats;
    stats.hits = counter("keyspace_hits");
    stats.misses = counter("keyspace_misses");
    stats.evictions = counter("evicted_keys");
    auto size_reply = execute({"DBSIZE"});
    stats.size = size_reply->integer > 0 ? static_cast<uint64_t>(size_reply->integer) : 0;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats.last_reset_at = last_reset_at_;
    return stats;
}

void RedisCache::clear_stats() {
    execute({"CONFIG", "RESETSTAT"});
    std::lock_guard<std::mutex> lock(stats_mutex_);
    last_reset_at_ = std::chrono::system_clock::now();
}

size_t RedisCache::flush_all() {
    auto size_reply = execute({"DBSIZE"});
    execute({"FLUSHDB"});
    logger_->info("Redis database flushed");
    return size_reply->integer > 0 ? static_cast<size_t>(size_reply->integer) : 0;
}

bool RedisCache::ping() {
    try {
        auto reply = execute({"PING"});
        return reply->type == REDIS_REPLY_STATUS && replyString(reply.get()) == "PONG";
    } catch (const ConnectionError& e) {
        logger_->error(std::string("Redis ping failed: ") + e.what());
        return false;
    } catch (const CacheBackendError& e) {
        logger_->error(std::string("Redis ping failed: ") + e.what());
        return false;
    }
}

void RedisCache::close() {
    if (pool_ && !pool_->isClosed()) {
        pool_->close();
    }
}

bool RedisCache::isConnected() {
    return !pool_->isClosed() && ping();
}
