#include "schema/schema_patch_applier.hpp"
#include "schema/tenant_batch.hpp"
#include "db/schema_router.hpp"
#include "db/schema_session.hpp"
#include "tenant/tenant_directory.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace tenantdb {

namespace {

constexpr const char* kColumnExistsSql =
    "SELECT 1 FROM information_schema.columns "
    "WHERE table_schema = $1 AND table_name = $2 AND column_name = $3";

constexpr const char* kTableExistsSql =
    "SELECT 1 FROM information_schema.tables WHERE table_schema = $1 AND table_name = $2";

constexpr const char* kIndexExistsSql =
    "SELECT 1 FROM pg_catalog.pg_indexes WHERE schemaname = $1 AND indexname = $2";

bool exists(SchemaSession& session, const char* sql, const std::vector<std::string>& params) {
    return !session.execute_checked(sql, params).empty();
}

} // anonymous namespace

SchemaPatchApplier::SchemaPatchApplier(std::shared_ptr<SchemaRouter> router,
                                       std::shared_ptr<TenantDirectory> directory,
                                       PatchSet catalog,
                                       PatchApplierConfig config,
                                       CancellationCoordinator* cancel)
    : router_(std::move(router)),
      directory_(std::move(directory)),
      catalog_(std::move(catalog)),
      config_(config),
      cancel_(cancel) {}

bool SchemaPatchApplier::apply_step(SchemaSession& session, const PatchStep& step) {
    const std::string& schema = session.schema().str();
    const QualifiedName table(session.schema(), step.table);

    switch (step.kind) {
        case PatchStepKind::ADD_COLUMN: {
            // Tenants without the table have nothing to fix
            if (!exists(session, kTableExistsSql, {schema, step.table})) {
                utils::log::debug(std::format("'{}': table {} absent, skipping {}", schema, step.table, step.describe()));
                return false;
            }
            if (exists(session, kColumnExistsSql, {schema, step.table, step.column})) {
                return false;
            }
            session.execute_checked(std::format("ALTER TABLE {} ADD COLUMN {} {}",
                table.quoted(), quote_identifier(step.column), step.definition));
            return true;
        }
        case PatchStepKind::CREATE_TABLE: {
            if (exists(session, kTableExistsSql, {schema, step.table})) {
                return false;
            }
            session.execute_checked(std::format("CREATE TABLE {} ({})", table.quoted(), step.definition));
            return true;
        }
        case PatchStepKind::CREATE_INDEX: {
            if (exists(session, kIndexExistsSql, {schema, step.index})) {
                return false;
            }
            if (!exists(session, kTableExistsSql, {schema, step.table})) {
                utils::log::debug(std::format("'{}': table {} absent, skipping {}", schema, step.table, step.describe()));
                return false;
            }
            std::vector<std::string> cols;
            cols.reserve(step.columns.size());
            for (const auto& c : step.columns) {
                cols.push_back(quote_identifier(c));
            }
            session.execute_checked(std::format("CREATE INDEX {} ON {} ({})",
                quote_identifier(step.index), table.quoted(), utils::join(cols, ", ")));
            return true;
        }
    }
    return false;
}

PatchResult SchemaPatchApplier::apply_to_tenant(const SchemaPatch& patch, const TenantRef& tenant) {
    PatchResult result;
    try {
        UnitOfWork uow = router_->new_unit_of_work();
        uow.set_tenant(tenant.id, tenant.schema_name, tenant.slug);
        auto session = router_->open_session(uow);

        SchemaSession::Transaction tx(*session);
        // Same key as the migration runner: concurrent startups see each other's steps
        session->execute_checked("SELECT pg_advisory_xact_lock(hashtext($1))", {session->schema().str()});
        for (const auto& step : patch.steps) {
            if (apply_step(*session, step)) {
                result.actions.push_back(step.describe());
            }
        }
        tx.commit();

        result.outcome = result.actions.empty() ? PatchOutcome::ALREADY_APPLIED : PatchOutcome::APPLIED;
        if (result.outcome == PatchOutcome::APPLIED) {
            utils::log::info(std::format("Patch '{}' applied to '{}': {}",
                patch.id, tenant.schema_name, utils::join(result.actions, "; ")));
        }
    } catch (const TenantDbError& e) {
        result.outcome = PatchOutcome::FAILED;
        result.actions.clear();
        result.error = e.what();
        utils::log::warn(std::format("Patch '{}' failed for '{}' [{}]: {}",
            patch.id, tenant.schema_name, category_name(e.category()), e.what()));
    } catch (const std::exception& e) {
        result.outcome = PatchOutcome::FAILED;
        result.actions.clear();
        result.error = e.what();
        utils::log::warn(std::format("Patch '{}' failed for '{}': {}", patch.id, tenant.schema_name, e.what()));
    }
    return result;
}

PatchResult SchemaPatchApplier::apply_patch(const std::string& patch_id, const std::string& tenant) {
    const Tenant t = directory_->resolve(tenant);

    const SchemaPatch* patch = catalog_.find(patch_id);
    if (!patch) {
        throw std::invalid_argument(std::format("Unknown patch '{}'", patch_id));
    }
    return apply_to_tenant(*patch, TenantRef::of(t));
}

BatchReport SchemaPatchApplier::apply_all() {
    const auto tenants = directory_->list_eligible_tenants();

    return run_tenant_batch("patch", tenants, config_.max_parallel_tenants, cancel_,
        [&](const TenantRef& tenant) {
            TenantSuccess success;
            success.tenant = tenant;
            std::vector<std::string> failures;
            std::string first_failed;

            for (const auto& patch : catalog_.patches()) {
                const auto r = apply_to_tenant(patch, tenant);
                if (r.outcome == PatchOutcome::FAILED) {
                    if (first_failed.empty()) first_failed = patch.id;
                    failures.push_back(std::format("{}: {}", patch.id, r.error));
                } else {
                    success.notes.push_back(std::format("{}: {}", patch.id, patch_outcome_name(r.outcome)));
                }
            }

            if (!failures.empty()) {
                throw PatchApplyError(first_failed, utils::join(failures, "; "));
            }
            return success;
        });
}

} // namespace tenantdb
