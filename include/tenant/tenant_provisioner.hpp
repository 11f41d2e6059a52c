#pragma once

#include "core/error.hpp"
#include "schema/migration.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tenantdb {

class MigrationOrchestrator;
class SchemaRouter;
class SchemaSession;

enum class ProvisionState {
    NOT_PROVISIONED,
    SCHEMA_CREATED,
    ROLES_SEEDED,
    OWNER_CREATED,
    SETTINGS_CREATED,
    READY
};

enum class ProvisionStep {
    VALIDATE,
    CREATE_SCHEMA,
    MIGRATE,
    SEED_ROLES,
    CREATE_OWNER,
    CREATE_SETTINGS
};

[[nodiscard]] std::string_view provision_state_name(ProvisionState state);
[[nodiscard]] std::string_view provision_step_name(ProvisionStep step);

/**
 * @brief Provisioning stopped; names the step that failed and the last state reached.
 *
 * Every step is idempotent, so the remedy is to run provisioning again.
 */
class ProvisioningError : public TenantDbError {
public:
    ProvisioningError(ProvisionStep step, ProvisionState reached, const std::string& cause);

    [[nodiscard]] ProvisionStep failed_step() const noexcept { return step_; }
    [[nodiscard]] ProvisionState reached_state() const noexcept { return reached_; }

private:
    ProvisionStep step_;
    ProvisionState reached_;
};

struct ProvisionRequest {
    std::string tenant_id;
    std::string schema_name;
    std::string tenant_slug;
    std::string owner_email;
    std::string owner_password_hash;  // PasswordHasher output; never a plain password
    std::string company_name;
};

struct TenantSettingsDefaults {
    std::string currency = "INR";
    std::string timezone = "Asia/Kolkata";
    std::string date_format = "dd/MM/yyyy";
    std::string time_format = "HH:mm";
};

struct ProvisionResult {
    ProvisionState state = ProvisionState::NOT_PROVISIONED;
    std::vector<int64_t> migrations_applied;
    size_t permissions_added = 0;
    bool roles_created = false;
    bool owner_created = false;
    bool settings_created = false;
};

/**
 * @brief First-time setup of a tenant schema.
 *
 * schema -> migrations -> permissions and default roles -> owner user ->
 * settings. Each step checks what already exists and runs in its own
 * transaction, so a provisioning that died half-way can be re-run from the top
 * and reaches READY without duplicate rows. A re-run on a ready tenant also
 * picks up permissions added to the catalog since, and grants them to Owner.
 */
class TenantProvisioner {
public:
    TenantProvisioner(std::shared_ptr<SchemaRouter> router,
                      std::shared_ptr<MigrationOrchestrator> orchestrator,
                      MigrationSet migrations,
                      TenantSettingsDefaults settings_defaults = {});

    /// @throws ProvisioningError naming the failed step
    ProvisionResult provision(const ProvisionRequest& request);

private:
    size_t seed_roles(SchemaSession& session, ProvisionResult& result);
    void create_owner(SchemaSession& session, const ProvisionRequest& request, ProvisionResult& result);
    void create_settings(SchemaSession& session, const ProvisionRequest& request, ProvisionResult& result);

    std::shared_ptr<SchemaRouter> router_;
    std::shared_ptr<MigrationOrchestrator> orchestrator_;
    MigrationSet migrations_;
    TenantSettingsDefaults settings_defaults_;
};

} // namespace tenantdb
