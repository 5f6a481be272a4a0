#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <string>
#include <sstream>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

// StatsD metric names emitted by the cache.
namespace MetricsDefinitions {
    static std::string CACHE_HIT = "distcache.hit";

    static std::string CACHE_MISS = "distcache.miss";

    static std::string CACHE_EVICTION = "distcache.eviction";

    static std::string REDIS_CONNECTION_ERROR = "distcache.redis.connection_error";

    static std::string REDIS_POOL_EXHAUSTED = "distcache.redis.pool_exhausted";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "distcache.config";
    static constexpr auto NAMESPACE_SEPARATOR = ":";
    static constexpr auto TENANT_PREFIX = "tenant";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache behaviour
    int default_ttl_seconds;        // applied when set() omits ttl, 0 = never expire
    int max_size;                   // in-memory only, 0 disables eviction
    bool track_stats;
    int sweep_interval_seconds;

    // Backend selection
    bool use_redis;

    // Redis connection
    std::string redis_host;
    int redis_port;
    std::string redis_password;
    int redis_database;
    int redis_connect_timeout_millis;
    std::string redis_key_prefix;

    // Redis connection pool
    int redis_pool_max_total;
    int redis_pool_max_idle;
    int redis_pool_min_idle;
    int redis_pool_wait_timeout_millis;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        default_ttl_seconds = 0;
        max_size = 10000;
        track_stats = true;
        sweep_interval_seconds = 60;

        use_redis = false;
        redis_host = "localhost";
        redis_port = 6379;
        redis_database = 0;
        redis_connect_timeout_millis = 2000;
        redis_pool_max_total = 20;
        redis_pool_max_idle = 10;
        redis_pool_min_idle = 2;
        redis_pool_wait_timeout_millis = 2000;

        log_level = LogUtils::LogLevel::CERROR; // Default log level
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "default_ttl_seconds: " << default_ttl_seconds << std::endl
            << "max_size: " << max_size << std::endl
            << "track_stats: " << std::boolalpha << track_stats << std::noboolalpha << std::endl
            << "sweep_interval_seconds: " << sweep_interval_seconds << std::endl
            << "// --- Redis Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "redis_password: " << (redis_password.empty() ? "<none>" : "<set>") << std::endl
            << "redis_database: " << redis_database << std::endl
            << "redis_connect_timeout_millis: " << redis_connect_timeout_millis << std::endl
            << "redis_key_prefix: " << redis_key_prefix << std::endl
            << "redis_pool_max_total: " << redis_pool_max_total << std::endl
            << "redis_pool_max_idle: " << redis_pool_max_idle << std::endl
            << "redis_pool_min_idle: " << redis_pool_min_idle << std::endl
            << "redis_pool_wait_timeout_millis: " << redis_pool_wait_timeout_millis << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
