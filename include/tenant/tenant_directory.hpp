#pragma once

#include "tenant/tenant.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tenantdb {

class SchemaRouter;

/**
 * @brief Read-only view of the tenant table in the shared schema.
 *
 * Every call reads the database; nothing is cached, so a status change is
 * visible to the next batch or unit of work.
 */
class TenantDirectory {
public:
    explicit TenantDirectory(std::shared_ptr<SchemaRouter> router);

    /// Every row, including suspended and soft-deleted tenants, ordered by slug
    [[nodiscard]] std::vector<Tenant> list_all_tenants();

    /// Active and Pending tenants that are not soft-deleted, ordered by slug
    [[nodiscard]] std::vector<TenantRef> list_eligible_tenants();

    /**
     * @brief Look a tenant up by id (UUID form) or slug
     * @return nullopt on a miss; soft-deleted tenants are misses
     */
    [[nodiscard]] std::optional<Tenant> find(const std::string& slug_or_id);

    /// @throws TenantNotFoundError on a miss
    [[nodiscard]] Tenant resolve(const std::string& slug_or_id);

private:
    std::vector<Tenant> query(const std::string& where, const std::vector<std::string>& params);

    std::shared_ptr<SchemaRouter> router_;
};

} // namespace tenantdb
