#pragma once

#include "schema/batch_report.hpp"
#include "schema/schema_patch.hpp"
#include <memory>
#include <string>

namespace tenantdb {

class CancellationCoordinator;
class SchemaRouter;
class SchemaSession;
class TenantDirectory;

struct PatchApplierConfig {
    size_t max_parallel_tenants = 4;
};

/**
 * @brief Applies guarded, idempotent structural fixes to tenant schemas.
 *
 * Each patch runs inside one transaction on the tenant's session. Every step
 * checks the catalog first and acts only when its object is absent, so a
 * re-run on an up-to-date schema changes nothing and reports ALREADY_APPLIED.
 */
class SchemaPatchApplier {
public:
    SchemaPatchApplier(std::shared_ptr<SchemaRouter> router,
                       std::shared_ptr<TenantDirectory> directory,
                       PatchSet catalog,
                       PatchApplierConfig config = {},
                       CancellationCoordinator* cancel = nullptr);

    /**
     * @brief Apply one catalog patch to one tenant (slug or id)
     * @throws TenantNotFoundError when the tenant does not resolve
     * @throws std::invalid_argument when the patch id is not in the catalog
     * @return FAILED with the error for database and routing failures
     */
    [[nodiscard]] PatchResult apply_patch(const std::string& patch_id, const std::string& tenant);

    /// Apply the whole catalog to every eligible tenant
    [[nodiscard]] BatchReport apply_all();

    [[nodiscard]] const PatchSet& catalog() const noexcept { return catalog_; }

private:
    PatchResult apply_to_tenant(const SchemaPatch& patch, const TenantRef& tenant);

    /// @return true when the step changed the schema
    bool apply_step(SchemaSession& session, const PatchStep& step);

    std::shared_ptr<SchemaRouter> router_;
    std::shared_ptr<TenantDirectory> directory_;
    PatchSet catalog_;
    PatchApplierConfig config_;
    CancellationCoordinator* cancel_;
};

} // namespace tenantdb
