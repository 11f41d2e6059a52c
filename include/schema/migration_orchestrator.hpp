#pragma once

#include "schema/batch_report.hpp"
#include "schema/migration.hpp"
#include "tenant/tenant_context.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tenantdb {

class CancellationCoordinator;
class SchemaRouter;
class TenantDirectory;

struct OrchestratorConfig {
    size_t max_parallel_tenants = 4;
};

/**
 * @brief Keeps every tenant schema in step with the migration set.
 *
 * One tenant failing never stops the others; the report says who failed and why.
 * Retry is up to the operator: nothing here re-runs a failed tenant.
 */
class MigrationOrchestrator {
public:
    MigrationOrchestrator(std::shared_ptr<SchemaRouter> router,
                          std::shared_ptr<TenantDirectory> directory,
                          OrchestratorConfig config = {},
                          CancellationCoordinator* cancel = nullptr);

    /// Migrate every eligible tenant
    [[nodiscard]] BatchReport run_all(const MigrationSet& set);

    /**
     * @brief Migrate a single tenant by slug or id
     * @throws TenantNotFoundError when the tenant does not resolve
     */
    [[nodiscard]] BatchReport run_one(const std::string& slug_or_id, const MigrationSet& set);

    /**
     * @brief Apply the shared-schema migration set to the shared schema
     * @return versions newly applied
     * @throws MigrationApplyError, ConnectionError
     */
    std::vector<int64_t> run_shared(const MigrationSet& set);

    /// Applied and pending versions of every non-deleted tenant
    [[nodiscard]] std::vector<TenantMigrationStatus> status(const MigrationSet& set);

    /// Applied and pending versions of the shared schema; creates nothing
    [[nodiscard]] SharedMigrationStatus shared_status(const MigrationSet& set);

    /**
     * @brief Bring one tenant's schema up to date, creating the schema if missing
     * @return versions newly applied
     */
    std::vector<int64_t> migrate_tenant(const UnitOfWork& uow, const MigrationSet& set);

private:
    TenantSuccess migrate_ref(const TenantRef& tenant, const MigrationSet& set);

    std::shared_ptr<SchemaRouter> router_;
    std::shared_ptr<TenantDirectory> directory_;
    OrchestratorConfig config_;
    CancellationCoordinator* cancel_;
};

} // namespace tenantdb
