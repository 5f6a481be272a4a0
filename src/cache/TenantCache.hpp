#ifndef TENANTCACHE_HPP
#define TENANTCACHE_HPP

#include <memory>
#include <string>

#include "../interfaces/CacheInterface.hpp"

// Tenant isolation on top of any cache: keys live under "tenant:<tenant_id>:".
std::string tenantCacheKey(const std::string& tenant_id, const std::string& key);

std::shared_ptr<CacheInterface> createTenantCache(std::shared_ptr<CacheInterface> cache,
                                                  const std::string& tenant_id);

#endif // TENANTCACHE_HPP
