#include "schema/migration_orchestrator.hpp"
#include "schema/migration_runner.hpp"
#include "schema/tenant_batch.hpp"
#include "db/schema_router.hpp"
#include "tenant/tenant_directory.hpp"
#include "core/bounded_parallel.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantdb {

namespace {

// A schema nobody migrated yet has no history table, and that is not an error
DbResultSet find_history_table(SchemaSession& session) {
    return session.execute(
        "SELECT 1 FROM information_schema.tables WHERE table_schema = $1 AND table_name = $2",
        {session.schema().str(), kMigrationHistoryTable});
}

} // anonymous namespace

MigrationOrchestrator::MigrationOrchestrator(std::shared_ptr<SchemaRouter> router,
                                             std::shared_ptr<TenantDirectory> directory,
                                             OrchestratorConfig config,
                                             CancellationCoordinator* cancel)
    : router_(std::move(router)),
      directory_(std::move(directory)),
      config_(config),
      cancel_(cancel) {}

std::vector<int64_t> MigrationOrchestrator::migrate_tenant(const UnitOfWork& uow, const MigrationSet& set) {
    const TenantContext& ctx = uow.require();

    std::unique_ptr<SchemaSession> session;
    try {
        session = router_->open_session(uow);
    } catch (const SchemaNotFoundError&) {
        utils::log::info(std::format("Schema '{}' missing for tenant '{}'; creating it",
            ctx.schema_name().str(), ctx.tenant_slug()));
        router_->ensure_schema(ctx);
        session = router_->open_session(uow);
    }

    // Everything below runs on this one connection
    session->reassert_schema();

    MigrationRunner runner(*session);
    return runner.apply_pending(set);
}

TenantSuccess MigrationOrchestrator::migrate_ref(const TenantRef& tenant, const MigrationSet& set) {
    UnitOfWork uow = router_->new_unit_of_work();
    uow.set_tenant(tenant.id, tenant.schema_name, tenant.slug);

    TenantSuccess success;
    success.tenant = tenant;
    success.applied = migrate_tenant(uow, set);
    return success;
}

BatchReport MigrationOrchestrator::run_all(const MigrationSet& set) {
    const auto tenants = directory_->list_eligible_tenants();
    return run_tenant_batch("migrate", tenants, config_.max_parallel_tenants, cancel_,
        [&](const TenantRef& t) { return migrate_ref(t, set); });
}

BatchReport MigrationOrchestrator::run_one(const std::string& slug_or_id, const MigrationSet& set) {
    const Tenant tenant = directory_->resolve(slug_or_id);
    const std::vector<TenantRef> one{TenantRef::of(tenant)};
    return run_tenant_batch("migrate-tenant", one, 1, cancel_,
        [&](const TenantRef& t) { return migrate_ref(t, set); });
}

std::vector<int64_t> MigrationOrchestrator::run_shared(const MigrationSet& set) {
    router_->ensure_shared_schema();
    auto session = router_->open_shared_session();
    MigrationRunner runner(*session);
    auto applied = runner.apply_pending(set);
    utils::log::info(std::format("Shared schema '{}': {} migrations applied",
        router_->shared_schema().str(), applied.size()));
    return applied;
}

std::vector<TenantMigrationStatus> MigrationOrchestrator::status(const MigrationSet& set) {
    std::vector<Tenant> tenants;
    for (auto& t : directory_->list_all_tenants()) {
        if (!t.deleted) {
            tenants.push_back(std::move(t));
        }
    }

    std::vector<TenantMigrationStatus> result(tenants.size());
    std::vector<size_t> indices(tenants.size());
    for (size_t i = 0; i < indices.size(); ++i) indices[i] = i;

    for_each_bounded(indices, config_.max_parallel_tenants, nullptr, [&](size_t i) {
        const Tenant& t = tenants[i];
        auto& st = result[i];
        st.tenant = TenantRef::of(t);
        st.status = t.status;
        st.pending = set.versions();

        try {
            const auto schema = SchemaIdentifier::parse(t.schema_name);
            if (!schema) {
                st.error = std::format("Invalid schema name '{}'", t.schema_name);
                return;
            }
            st.schema_exists = router_->schema_exists(*schema);
            if (!st.schema_exists) {
                return;
            }

            UnitOfWork uow = router_->new_unit_of_work();
            uow.set_tenant(t.id, t.schema_name, t.slug);
            auto session = router_->open_session(uow);

            const auto has_history = find_history_table(*session);
            if (!has_history.success) {
                st.error = has_history.error_message;
                return;
            }
            if (has_history.empty()) {
                return;
            }

            MigrationRunner runner(*session);
            st.applied = runner.applied_versions();
            st.pending.clear();
            for (const auto* m : runner.pending(set, st.applied)) {
                st.pending.push_back(m->version);
            }
        } catch (const std::exception& e) {
            st.error = e.what();
        }
    });

    return result;
}

SharedMigrationStatus MigrationOrchestrator::shared_status(const MigrationSet& set) {
    SharedMigrationStatus st;
    st.schema = router_->shared_schema().str();
    st.pending = set.versions();

    try {
        st.schema_exists = router_->schema_exists(router_->shared_schema());
        if (!st.schema_exists) {
            return st;
        }

        auto session = router_->open_shared_session();
        const auto has_history = find_history_table(*session);
        if (!has_history.success) {
            st.error = has_history.error_message;
            return st;
        }
        if (has_history.empty()) {
            return st;
        }

        MigrationRunner runner(*session);
        st.applied = runner.applied_versions();
        st.pending.clear();
        for (const auto* m : runner.pending(set, st.applied)) {
            st.pending.push_back(m->version);
        }
    } catch (const std::exception& e) {
        st.error = e.what();
    }
    return st;
}

} // namespace tenantdb
