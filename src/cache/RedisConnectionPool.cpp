#include <sys/time.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include <hiredis/hiredis.h>

#include "RedisConnectionPool.hpp"
#include "../core/CacheErrors.hpp"

void RedisReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisPoolOptions RedisPoolOptions::fromConfig(const AppConfig& config) {
    RedisPoolOptions options;
    options.host = config.redis_host;
    options.port = config.redis_port;
    options.password = config.redis_password;
    options.database = config.redis_database;
    options.connect_timeout = std::chrono::milliseconds(config.redis_connect_timeout_millis);
    options.max_total = static_cast<size_t>(config.redis_pool_max_total);
    options.max_idle = static_cast<size_t>(config.redis_pool_max_idle);
    options.min_idle = static_cast<size_t>(config.redis_pool_min_idle);
    options.wait_timeout = std::chrono::milliseconds(config.redis_pool_wait_timeout_millis);
    return options;
}

// --- Lease ---

RedisConnectionPool::Lease::~Lease() {
    if (pool_ && context_) {
        pool_->release(context_, broken_);
    }
}

RedisConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), context_(other.context_), broken_(other.broken_) {
    other.pool_ = nullptr;
    other.context_ = nullptr;
}

// --- Pool ---

RedisConnectionPool::RedisConnectionPool(RedisPoolOptions options,
                                         std::shared_ptr<ILogger> logger,
                                         std::shared_ptr<IStatsDClient> statsd_client)
    : options_(std::move(options)), logger_(std::move(logger)), statsd_client_(std::move(statsd_client)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisConnectionPool");
    }
    if (options_.max_total == 0) {
        throw ValidationError("Redis pool max_total must be positive");
    }

    // Pre-open min_idle connections. An unreachable server is not fatal here:
    // callers find out through ping() or the first command.
    size_t warm = std::min(options_.min_idle, options_.max_total);
    for (size_t i = 0; i < warm; ++i) {
        try {
            redisContext* context = connect();
            std::lock_guard<std::mutex> lock(mutex_);
            idle_.push_back(context);
            ++total_;
        } catch (const ConnectionError& e) {
            logger_->error(std::string("Redis pool warm-up failed: ") + e.what());
            break;
        }
    }
    logger_->setup("Redis pool for " + options_.host + ":" + std::to_string(options_.port) +
                   " ready with " + std::to_string(idleCount()) + " idle connections");
}

RedisConnectionPool::~RedisConnectionPool() {
    close();
}

RedisConnectionPool::Lease RedisConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = available_.wait_for(lock, options_.wait_timeout, [this] {
        return closed_ || !idle_.empty() || total_ < options_.max_total;
    });
    if (closed_) {
        throw ConnectionError("Redis connection pool is closed");
    }
    if (!ready) {
        if (statsd_client_) statsd_client_->increment(MetricsDefinitions::REDIS_POOL_EXHAUSTED);
        throw PoolExhaustedError("Redis connection pool exhausted: " + std::to_string(options_.max_total) +
                                 " connections in use after waiting " +
                                 std::to_string(options_.wait_timeout.count()) + "ms");
    }
    if (!idle_.empty()) {
        redisContext* context = idle_.front();
        idle_.pop_front();
        return Lease(this, context);
    }

    // Reserve the slot, then connect without holding the lock
    ++total_;
    lock.unlock();
    try {
        return Lease(this, connect());
    } catch (...) {
        lock.lock();
        --total_;
        lock.unlock();
        available_.notify_one();
        throw;
    }
}

void RedisConnectionPool::close() {
    std::deque<redisContext*> to_free;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        to_free.swap(idle_);
        total_ -= to_free.size();
    }
    available_.notify_all();
    for (redisContext* context : to_free) {
        redisFree(context);
    }
    logger_->debug("Redis connection pool closed");
}

bool RedisConnectionPool::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t RedisConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t RedisConnectionPool::totalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

redisContext* RedisConnectionPool::connect() {
    struct timeval timeout;
    timeout.tv_sec = static_cast<time_t>(options_.connect_timeout.count() / 1000);
    timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout.count() % 1000) * 1000);

    redisContext* context = redisConnectWithTimeout(options_.host.c_str(), options_.port, timeout);
    if (context == nullptr || context->err) {
        std::string error_msg;
        if (context) {
            error_msg = "Redis connection error: " + std::string(context->errstr);
            redisFree(context);
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        if (statsd_client_) statsd_client_->increment(MetricsDefinitions::REDIS_CONNECTION_ERROR);
        throw ConnectionError(error_msg);
    }
    // Same bound for each command round trip
    redisSetTimeout(context, timeout);

    auto handshake = [&](RedisReplyPtr reply, const std::string& step) {
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            std::string detail = reply ? std::string(reply->str, reply->len) : std::string(context->errstr);
            redisFree(context);
            throw ConnectionError("Redis " + step + " failed: " + detail);
        }
    };
    if (!options_.password.empty()) {
        handshake(RedisReplyPtr(static_cast<redisReply*>(
                      redisCommand(context, "AUTH %b", options_.password.data(), options_.password.size()))),
                  "AUTH");
    }
    if (options_.database != 0) {
        handshake(RedisReplyPtr(static_cast<redisReply*>(redisCommand(context, "SELECT %d", options_.database))),
                  "SELECT");
    }
    return context;
}

void RedisConnectionPool::release(redisContext* context, bool broken) {
    bool discard = broken || context->err != 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!discard && !closed_ && idle_.size() < options_.max_idle) {
            idle_.push_back(context);
            context = nullptr;
        } else {
            --total_;
        }
    }
    available_.notify_one();
    if (context) {
        redisFree(context);
    }
}
