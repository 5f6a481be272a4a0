#include "TenantCache.hpp"

#include <stdexcept>
#include <utility>

#include "NamespacedCache.hpp"
#include "../config/AppConfig.hpp"
#include "../utils/Utils.hpp"

namespace {
    std::string tenantNamespace(const std::string& tenant_id) {
        if (tenant_id.empty()) {
            throw ValidationError("Tenant id must not be empty");
        }
        return std::string(Constants::TENANT_PREFIX) + Constants::NAMESPACE_SEPARATOR + tenant_id;
    }
}

std::string tenantCacheKey(const std::string& tenant_id, const std::string& key) {
    Utils::validateKey(key);
    return tenantNamespace(tenant_id) + Constants::NAMESPACE_SEPARATOR + key;
}

std::shared_ptr<CacheInterface> createTenantCache(std::shared_ptr<CacheInterface> cache,
                                                  const std::string& tenant_id) {
    if (!cache) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    return std::make_shared<NamespacedCache>(std::move(cache), tenantNamespace(tenant_id));
}
