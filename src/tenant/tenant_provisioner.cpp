#include "tenant/tenant_provisioner.hpp"
#include "tenant/permission_catalog.hpp"
#include "db/schema_router.hpp"
#include "db/schema_session.hpp"
#include "schema/migration_orchestrator.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace tenantdb {

std::string_view provision_state_name(ProvisionState state) {
    switch (state) {
        case ProvisionState::NOT_PROVISIONED:  return "NotProvisioned";
        case ProvisionState::SCHEMA_CREATED:   return "SchemaCreated";
        case ProvisionState::ROLES_SEEDED:     return "RolesSeeded";
        case ProvisionState::OWNER_CREATED:    return "OwnerCreated";
        case ProvisionState::SETTINGS_CREATED: return "SettingsCreated";
        case ProvisionState::READY:            return "Ready";
    }
    return "Unknown";
}

std::string_view provision_step_name(ProvisionStep step) {
    switch (step) {
        case ProvisionStep::VALIDATE:        return "validate";
        case ProvisionStep::CREATE_SCHEMA:   return "create_schema";
        case ProvisionStep::MIGRATE:         return "migrate";
        case ProvisionStep::SEED_ROLES:      return "seed_roles";
        case ProvisionStep::CREATE_OWNER:    return "create_owner";
        case ProvisionStep::CREATE_SETTINGS: return "create_settings";
    }
    return "unknown";
}

ProvisioningError::ProvisioningError(ProvisionStep step, ProvisionState reached, const std::string& cause)
    : TenantDbError(ErrorCategory::PROVISIONING_ERROR,
                    std::format("Provisioning failed at step '{}' (reached {}): {}",
                                provision_step_name(step), provision_state_name(reached), cause)),
      step_(step),
      reached_(reached) {}

TenantProvisioner::TenantProvisioner(std::shared_ptr<SchemaRouter> router,
                                     std::shared_ptr<MigrationOrchestrator> orchestrator,
                                     MigrationSet migrations,
                                     TenantSettingsDefaults settings_defaults)
    : router_(std::move(router)),
      orchestrator_(std::move(orchestrator)),
      migrations_(std::move(migrations)),
      settings_defaults_(std::move(settings_defaults)) {}

// ============================================================================
// Steps
// ============================================================================

size_t TenantProvisioner::seed_roles(SchemaSession& session, ProvisionResult& result) {
    SchemaSession::Transaction tx(session);

    // Sync the permission catalog into the tenant
    std::unordered_map<std::string, std::string> id_by_code;
    for (const auto& row : session.execute_checked("SELECT id, code FROM permissions").rows) {
        if (row.size() >= 2) id_by_code[row[1]] = row[0];
    }

    size_t added = 0;
    for (const auto& p : PermissionCatalog::permissions()) {
        if (id_by_code.contains(std::string(p.code))) {
            continue;
        }
        const std::string id = utils::generate_uuid();
        session.execute_checked(
            "INSERT INTO permissions (id, code, name, module, description) VALUES ($1, $2, $3, $4, $5)",
            {id, std::string(p.code), std::string(p.name), std::string(p.module), std::string(p.description)});
        id_by_code.emplace(std::string(p.code), id);
        ++added;
    }
    result.permissions_added = added;

    auto grant = [&](const std::string& role_id, const std::vector<std::string_view>& codes) {
        std::unordered_set<std::string> held;
        for (const auto& row : session.execute_checked(
                 "SELECT permission_id FROM role_permissions WHERE role_id = $1", {role_id}).rows) {
            if (!row.empty()) held.insert(row[0]);
        }
        for (const auto code : codes) {
            const auto it = id_by_code.find(std::string(code));
            if (it == id_by_code.end() || held.contains(it->second)) {
                continue;
            }
            session.execute_checked(
                "INSERT INTO role_permissions (role_id, permission_id) VALUES ($1, $2)",
                {role_id, it->second});
        }
    };

    const bool has_roles = !session.execute_checked("SELECT 1 FROM roles LIMIT 1").empty();
    if (!has_roles) {
        for (const auto& role : PermissionCatalog::default_roles()) {
            const std::string role_id = utils::generate_uuid();
            session.execute_checked(
                "INSERT INTO roles (id, name, description, is_system) VALUES ($1, $2, $3, $4)",
                {role_id, std::string(role.name), std::string(role.description), role.is_system ? "true" : "false"});
            grant(role_id, PermissionCatalog::permissions_for_role(role.name));
        }
        result.roles_created = true;
    } else {
        // Existing tenant: Owner keeps full access as the catalog grows
        const auto owner = session.execute_checked(
            "SELECT id FROM roles WHERE name = $1", {std::string(PermissionCatalog::kOwnerRole)}).scalar();
        if (owner) {
            grant(*owner, PermissionCatalog::permissions_for_role(PermissionCatalog::kOwnerRole));
        }
    }

    tx.commit();
    return added;
}

void TenantProvisioner::create_owner(SchemaSession& session, const ProvisionRequest& request,
                                     ProvisionResult& result) {
    SchemaSession::Transaction tx(session);

    const auto owner_role = session.execute_checked(
        "SELECT id FROM roles WHERE name = $1", {std::string(PermissionCatalog::kOwnerRole)}).scalar();
    if (!owner_role) {
        throw DatabaseError("Owner role not found");
    }

    const std::string email = utils::to_lower(utils::trim(request.owner_email));
    auto user_id = session.execute_checked("SELECT id FROM users WHERE email = $1", {email}).scalar();
    if (!user_id) {
        user_id = utils::generate_uuid();
        session.execute_checked(
            "INSERT INTO users (id, email, password_hash, first_name, last_name, email_verified) "
            "VALUES ($1, $2, $3, $4, $5, $6)",
            {*user_id, email, request.owner_password_hash, "Account", "Owner", "true"});
        result.owner_created = true;
    }

    const bool assigned = !session.execute_checked(
        "SELECT 1 FROM user_roles WHERE user_id = $1 AND role_id = $2", {*user_id, *owner_role}).empty();
    if (!assigned) {
        session.execute_checked("INSERT INTO user_roles (user_id, role_id) VALUES ($1, $2)",
                                {*user_id, *owner_role});
    }

    tx.commit();
}

void TenantProvisioner::create_settings(SchemaSession& session, const ProvisionRequest& request,
                                        ProvisionResult& result) {
    SchemaSession::Transaction tx(session);

    if (session.execute_checked("SELECT 1 FROM settings LIMIT 1").empty()) {
        session.execute_checked(
            "INSERT INTO settings (id, company_name, currency, timezone, date_format, time_format) "
            "VALUES ($1, $2, $3, $4, $5, $6)",
            {utils::generate_uuid(), request.company_name, settings_defaults_.currency,
             settings_defaults_.timezone, settings_defaults_.date_format, settings_defaults_.time_format});
        result.settings_created = true;
    }

    tx.commit();
}

// ============================================================================
// provision
// ============================================================================

ProvisionResult TenantProvisioner::provision(const ProvisionRequest& request) {
    ProvisionResult result;
    ProvisionStep step = ProvisionStep::VALIDATE;

    utils::log::info(std::format("Provisioning tenant '{}' into schema '{}'",
        request.tenant_slug, request.schema_name));

    try {
        if (utils::trim(request.owner_email).empty()) {
            throw std::invalid_argument("Owner email is required");
        }
        if (request.owner_password_hash.empty()) {
            throw std::invalid_argument("Owner password hash is required");
        }
        UnitOfWork uow = router_->new_unit_of_work();
        uow.set_tenant(request.tenant_id, request.schema_name, request.tenant_slug);
        const TenantContext& ctx = uow.require();

        step = ProvisionStep::CREATE_SCHEMA;
        router_->ensure_schema(ctx);
        result.state = ProvisionState::SCHEMA_CREATED;

        step = ProvisionStep::MIGRATE;
        result.migrations_applied = orchestrator_->migrate_tenant(uow, migrations_);

        auto session = router_->open_session(uow);

        step = ProvisionStep::SEED_ROLES;
        const size_t added = seed_roles(*session, result);
        if (added > 0) {
            utils::log::info(std::format("Synced {} permissions into '{}'", added, ctx.schema_name().str()));
        }
        result.state = ProvisionState::ROLES_SEEDED;

        step = ProvisionStep::CREATE_OWNER;
        create_owner(*session, request, result);
        result.state = ProvisionState::OWNER_CREATED;

        step = ProvisionStep::CREATE_SETTINGS;
        create_settings(*session, request, result);
        result.state = ProvisionState::SETTINGS_CREATED;
    } catch (const ProvisioningError&) {
        throw;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Provisioning of '{}' failed at {}: {}",
            request.tenant_slug, provision_step_name(step), e.what()));
        throw ProvisioningError(step, result.state, e.what());
    }

    result.state = ProvisionState::READY;
    utils::log::info(std::format("Tenant '{}' provisioned (roles {}, owner {}, settings {})",
        request.tenant_slug,
        result.roles_created ? "created" : "kept",
        result.owner_created ? "created" : "kept",
        result.settings_created ? "created" : "kept"));
    return result;
}

} // namespace tenantdb
