#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Forward declarations
struct redisContext;
struct redisReply;

struct RedisReplyDeleter {
    void operator()(redisReply* reply) const;
};
using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

struct RedisPoolOptions {
    std::string host = "localhost";
    int port = 6379;
    std::string password;
    int database = 0;
    std::chrono::milliseconds connect_timeout{2000};
    size_t max_total = 20;
    size_t max_idle = 10;
    size_t min_idle = 2;
    std::chrono::milliseconds wait_timeout{2000};

    static RedisPoolOptions fromConfig(const AppConfig& config);
};

// Bounded pool of hiredis connections. acquire() hands out a lease that
// returns its connection on destruction; a lease marked broken closes it
// instead. When all max_total connections are leased, acquire() waits up to
// wait_timeout and then throws PoolExhaustedError.
class RedisConnectionPool {
public:
    class Lease {
    public:
        Lease(RedisConnectionPool* pool, redisContext* context) : pool_(pool), context_(context) {}
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        redisContext* get() const { return context_; }
        void markBroken() { broken_ = true; }

    private:
        RedisConnectionPool* pool_;
        redisContext* context_;
        bool broken_ = false;
    };

    RedisConnectionPool(RedisPoolOptions options,
                        std::shared_ptr<ILogger> logger,
                        std::shared_ptr<IStatsDClient> statsd_client = nullptr);
    ~RedisConnectionPool();

    RedisConnectionPool(const RedisConnectionPool&) = delete;
    RedisConnectionPool& operator=(const RedisConnectionPool&) = delete;

    Lease acquire();

    // Frees idle connections and refuses new leases. Leased connections are
    // freed as they come back. Idempotent.
    void close();

    bool isClosed() const;
    size_t idleCount() const;
    size_t totalCount() const;
    const RedisPoolOptions& options() const { return options_; }

private:
    redisContext* connect();
    void release(redisContext* context, bool broken);

    const RedisPoolOptions options_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<redisContext*> idle_;
    size_t total_ = 0; // idle + leased + being connected
    bool closed_ = false;
};
