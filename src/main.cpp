#include "cli/command_line.hpp"
#include "config/config_loader.hpp"
#include "core/cancellation_coordinator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/schema_router.hpp"
#include "schema/migration_loader.hpp"
#include "schema/migration_orchestrator.hpp"
#include "schema/patch_loader.hpp"
#include "schema/schema_patch_applier.hpp"
#include "security/password_hasher.hpp"
#include "tenant/tenant_directory.hpp"
#include "tenant/tenant_provisioner.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>

using namespace tenantdb;

// Global instance for signal handling
std::shared_ptr<CancellationCoordinator> g_cancel;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void signal_handler(int /*signal*/) {
    if (g_cancel) {
        g_cancel->initiate_cancel();
    }
}

struct Services {
    std::shared_ptr<IConnectionPool> pool;
    std::shared_ptr<SchemaRouter> router;
    std::shared_ptr<TenantDirectory> directory;
    std::shared_ptr<MigrationOrchestrator> orchestrator;
};

Services build_services(const TenantDbConfig& cfg, size_t workers) {
    Services s;

    PoolConfig pool_config;
    pool_config.connection_string = cfg.database.connection_string;
    pool_config.min_connections = cfg.database.min_connections;
    pool_config.max_connections = cfg.database.max_connections;
    pool_config.connection_timeout = cfg.database.connection_timeout;
    pool_config.idle_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.database.idle_timeout);
    pool_config.max_lifetime = cfg.database.max_lifetime;
    pool_config.health_check_query = cfg.database.health_check_query;
    pool_config.statement_timeout_ms = cfg.database.statement_timeout_ms;

    s.pool = std::make_shared<GenericConnectionPool>(
        "tenantdb", pool_config, std::make_shared<PgConnectionFactory>());

    RouterConfig router_config;
    router_config.shared_schema = cfg.routing.shared_schema;
    router_config.tenant_schema_prefix = cfg.routing.tenant_schema_prefix;
    router_config.include_public = cfg.routing.include_public;
    router_config.acquire_timeout = cfg.database.connection_timeout;
    s.router = std::make_shared<SchemaRouter>(s.pool, router_config);

    s.directory = std::make_shared<TenantDirectory>(s.router);

    OrchestratorConfig orch_config;
    orch_config.max_parallel_tenants = workers;
    s.orchestrator = std::make_shared<MigrationOrchestrator>(
        s.router, s.directory, orch_config, g_cancel.get());
    return s;
}

MigrationSet load_migrations_or_throw(const std::string& directory) {
    auto result = MigrationLoader::load_directory(directory);
    if (result.is_error()) {
        throw TenantDbError(result.error_category(), result.error_message());
    }
    utils::log::info(std::format("Loaded {} migrations from {}", result.value().size(), directory));
    return std::move(result.value());
}

PatchSet load_patches_or_throw(const std::string& path) {
    auto result = PatchLoader::load_from_file(path);
    if (result.is_error()) {
        throw TenantDbError(result.error_category(), result.error_message());
    }
    utils::log::info(std::format("Loaded {} patches from {}", result.value().size(), path));
    return std::move(result.value());
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

// ============================================================================
// Commands
// ============================================================================

int run_startup(const TenantDbConfig& cfg, Services& s, size_t workers) {
    nlohmann::json out;
    bool ok = true;

    utils::log::info(std::format("[3/5] Shared migrations from {}", cfg.migrations.shared_directory));
    const auto shared_set = load_migrations_or_throw(cfg.migrations.shared_directory);
    const auto shared_applied = s.orchestrator->run_shared(shared_set);
    out["shared"] = {{"schema", s.router->shared_schema().str()}, {"applied", shared_applied}};

    if (cfg.migrations.run_on_startup) {
        utils::log::info(std::format("[4/5] Tenant migrations from {}", cfg.migrations.tenant_directory));
        const auto tenant_set = load_migrations_or_throw(cfg.migrations.tenant_directory);
        const auto report = s.orchestrator->run_all(tenant_set);
        ok = ok && report.all_succeeded();
        out["migrate"] = report.to_json();
    } else {
        utils::log::info("[4/5] Tenant migrations: disabled (migrations.run_on_startup = false)");
    }

    if (cfg.patches.run_on_startup && !g_cancel->is_cancelled()) {
        utils::log::info(std::format("[5/5] Schema patches from {}", cfg.patches.catalog_file));
        PatchApplierConfig patch_config;
        patch_config.max_parallel_tenants = workers;
        SchemaPatchApplier applier(s.router, s.directory,
            load_patches_or_throw(cfg.patches.catalog_file), patch_config, g_cancel.get());
        const auto report = applier.apply_all();
        ok = ok && report.all_succeeded();
        out["patch"] = report.to_json();
    } else if (!cfg.patches.run_on_startup) {
        utils::log::info("[5/5] Schema patches: disabled (patches.run_on_startup = false)");
    }

    print_json(out);
    return ok ? kExitOk : kExitFailed;
}

int run_patch(const TenantDbConfig& cfg, const cli::CommandLine& cl, Services& s, size_t workers) {
    PatchApplierConfig patch_config;
    patch_config.max_parallel_tenants = workers;
    SchemaPatchApplier applier(s.router, s.directory,
        load_patches_or_throw(cfg.patches.catalog_file), patch_config, g_cancel.get());

    if (!cl.patch_id.empty()) {
        const auto result = applier.apply_patch(cl.patch_id, cl.tenant);
        print_json({
            {"operation", "patch"},
            {"patch", cl.patch_id},
            {"tenant", cl.tenant},
            {"outcome", std::string(patch_outcome_name(result.outcome))},
            {"actions", result.actions},
            {"error", result.error}
        });
        return result.outcome == PatchOutcome::FAILED ? kExitFailed : kExitOk;
    }

    const auto report = applier.apply_all();
    print_json(report.to_json());
    return report.all_succeeded() ? kExitOk : kExitFailed;
}

int run_status(const TenantDbConfig& cfg, Services& s) {
    const auto set = load_migrations_or_throw(cfg.migrations.tenant_directory);
    const auto shared_set = load_migrations_or_throw(cfg.migrations.shared_directory);
    const auto shared = s.orchestrator->shared_status(shared_set);
    const auto statuses = s.orchestrator->status(set);

    bool ok = shared.error.empty();
    auto tenants = nlohmann::json::array();
    for (const auto& st : statuses) {
        if (!st.error.empty()) ok = false;
        tenants.push_back(st.to_json());
    }
    print_json({
        {"operation", "status"},
        {"latest", set.empty() ? 0 : set.versions().back()},
        {"shared", shared.to_json()},
        {"tenants", tenants}
    });
    return ok ? kExitOk : kExitFailed;
}

int run_provision(const TenantDbConfig& cfg, const cli::CommandLine& cl, Services& s) {
    const auto tenant = s.directory->resolve(cl.tenant);

    ProvisionRequest request;
    request.tenant_id = tenant.id;
    request.schema_name = tenant.schema_name;
    request.tenant_slug = tenant.slug;
    request.owner_email = cl.owner_email;
    request.owner_password_hash = PasswordHasher::hash(cl.owner_password);
    request.company_name = cl.company_name;

    TenantProvisioner provisioner(s.router, s.orchestrator,
        load_migrations_or_throw(cfg.migrations.tenant_directory));

    try {
        const auto result = provisioner.provision(request);
        print_json({
            {"operation", "provision"},
            {"tenant", to_json(TenantRef::of(tenant))},
            {"state", std::string(provision_state_name(result.state))},
            {"migrations_applied", result.migrations_applied},
            {"permissions_added", result.permissions_added},
            {"roles_created", result.roles_created},
            {"owner_created", result.owner_created},
            {"settings_created", result.settings_created}
        });
        return kExitOk;
    } catch (const ProvisioningError& e) {
        print_json({
            {"operation", "provision"},
            {"tenant", to_json(TenantRef::of(tenant))},
            {"failed_step", std::string(provision_step_name(e.failed_step()))},
            {"state", std::string(provision_state_name(e.reached_state()))},
            {"error", e.what()}
        });
        utils::log::error(e.what());
        return kExitFailed;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto parsed = cli::parse_command_line(argc, argv);
    if (!parsed.success) {
        std::cerr << parsed.error_message << "\n\n" << cli::usage();
        return kExitUsage;
    }
    const auto& cl = parsed.command_line;
    if (cl.command == cli::Command::HELP) {
        std::cout << cli::usage();
        return kExitOk;
    }

    try {
        utils::log::info(std::format("tenantdb {} starting...", cli::command_name(cl.command)));

        g_cancel = std::make_shared<CancellationCoordinator>();
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utils::log::info(std::format("[1/5] Loading configuration from {}", cl.config_file));
        const auto config_result = ConfigLoader::load_from_file(cl.config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitFailed;
        }
        const auto& cfg = config_result.config;

        const auto level_name = cl.log_level.value_or(cfg.logging.level);
        if (const auto level = utils::log::parse_level(level_name)) {
            utils::log::set_level(*level);
        }

        size_t workers = cl.workers.value_or(cfg.migrations.max_parallel_tenants);
        if (workers > cfg.database.max_connections) {
            utils::log::warn(std::format("--workers {} exceeds database.max_connections {}; using {}",
                workers, cfg.database.max_connections, cfg.database.max_connections));
            workers = cfg.database.max_connections;
        }

        utils::log::info(std::format("[2/5] Connection pool ({}..{} connections), shared schema '{}', {} workers",
            cfg.database.min_connections, cfg.database.max_connections,
            cfg.routing.shared_schema, workers));
        auto services = build_services(cfg, workers);

        int rc = kExitOk;
        switch (cl.command) {
            case cli::Command::STARTUP:
                rc = run_startup(cfg, services, workers);
                break;
            case cli::Command::MIGRATE: {
                const auto report = services.orchestrator->run_all(
                    load_migrations_or_throw(cfg.migrations.tenant_directory));
                print_json(report.to_json());
                rc = report.all_succeeded() ? kExitOk : kExitFailed;
                break;
            }
            case cli::Command::MIGRATE_TENANT: {
                const auto report = services.orchestrator->run_one(
                    cl.tenant, load_migrations_or_throw(cfg.migrations.tenant_directory));
                print_json(report.to_json());
                rc = report.all_succeeded() ? kExitOk : kExitFailed;
                break;
            }
            case cli::Command::PATCH:
                rc = run_patch(cfg, cl, services, workers);
                break;
            case cli::Command::STATUS:
                rc = run_status(cfg, services);
                break;
            case cli::Command::PROVISION:
                rc = run_provision(cfg, cl, services);
                break;
            case cli::Command::HELP:
                break;
        }

        if (g_cancel->is_cancelled()) {
            utils::log::warn("Cancelled by signal; remaining tenants were reported as skipped");
        }
        services.pool->drain();
        utils::log::info(std::format("tenantdb {} finished (exit {})", cli::command_name(cl.command), rc));
        return rc;

    } catch (const TenantDbError& e) {
        utils::log::error(std::format("{}: {}", category_name(e.category()), e.what()));
        return kExitFailed;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailed;
    }
}
