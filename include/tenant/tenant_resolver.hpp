#pragma once

#include "tenant/tenant_context.hpp"
#include <memory>
#include <string>

namespace tenantdb {

class SchemaRouter;
class TenantDirectory;

/**
 * @brief Entry point of tenant scoping: identifier in, scoped unit of work out.
 */
class TenantResolver {
public:
    TenantResolver(std::shared_ptr<TenantDirectory> directory,
                   std::shared_ptr<SchemaRouter> router);

    /**
     * @brief Resolve slug or id against the directory and bind a new unit of work
     * @throws TenantNotFoundError on a miss (including soft-deleted tenants)
     * @throws ContextMisuseError if the directory row carries an unusable schema name
     */
    [[nodiscard]] UnitOfWork begin_unit_of_work(const std::string& identifier);

private:
    std::shared_ptr<TenantDirectory> directory_;
    std::shared_ptr<SchemaRouter> router_;
};

} // namespace tenantdb
