#include "CacheFactory.hpp"

#include <cstdlib>
#include <exception>
#include <string>

#include "InMemoryCache.hpp"
#include "NamespacedCache.hpp"
#include "RedisCache.hpp"
#include "../core/CacheErrors.hpp"
#include "../metrics/DummyStatsDClient.hpp"
#include "../metrics/StatsDClient.hpp"
#include "../utils/Utils.hpp"

std::shared_ptr<CacheInterface> initializeCache(const AppConfig& config,
                                                std::shared_ptr<ILogger> logger,
                                                std::shared_ptr<IStatsDClient> statsd_client) {
    Utils::validateConfig(config);

    if (config.use_redis) {
        // Attempt to create and connect Redis cache instance
        auto redis_cache = RedisCache::fromConfig(config, logger, statsd_client);
        if (redis_cache->isConnected()) {
            logger->setup("Redis cache connected successfully at " + config.redis_host + ":" +
                          std::to_string(config.redis_port) + ".");
            if (!config.redis_key_prefix.empty()) {
                logger->setup("Scoping Redis keys under '" + config.redis_key_prefix + ":'.");
                return redis_cache->with_namespace(config.redis_key_prefix);
            }
            return redis_cache;
        }
        logger->error("Redis unreachable, falling back to InMemoryCache.");
        redis_cache->close();
    }

    logger->setup("Creating InMemoryCache.");
    return InMemoryCache::fromConfig(config, logger, statsd_client);
}

std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (!statsd_server_endpoint.empty()) {
        try {
            logger->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
            return StatsDClient::getInstance(config, logger, statsd_server_endpoint);
        } catch (const std::exception& e) {
            logger->error(std::string("StatsDClient failed to get created: ") + e.what());
        }
    }

    logger->debug("Using DummyStatsDClient instance.");
    return DummyStatsDClient::getInstance();
}
