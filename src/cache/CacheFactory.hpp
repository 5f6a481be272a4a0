#ifndef CACHEFACTORY_HPP
#define CACHEFACTORY_HPP

#include <memory>

#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Picks the backend from configuration: Redis when use_redis is set and the
// server answers PING, the in-process cache otherwise. A redis_key_prefix
// wraps the Redis cache in a namespace view.
std::shared_ptr<CacheInterface> initializeCache(const AppConfig& config,
                                                std::shared_ptr<ILogger> logger,
                                                std::shared_ptr<IStatsDClient> statsd_client);

// Real StatsD client when STATSD_SERVER is set and valid, the no-op one otherwise.
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger);

#endif // CACHEFACTORY_HPP
