#include "schema/migration_runner.hpp"
#include "db/schema_session.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace tenantdb {

MigrationRunner::MigrationRunner(SchemaSession& session)
    : session_(session) {}

std::string MigrationRunner::history_table() const {
    return QualifiedName(session_.schema(), kMigrationHistoryTable).quoted();
}

void MigrationRunner::ensure_history_table() {
    const auto rs = session_.execute(std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "version BIGINT PRIMARY KEY, "
        "name TEXT NOT NULL, "
        "applied_at TIMESTAMPTZ NOT NULL DEFAULT now())",
        history_table()));
    if (!rs.success) {
        throw MigrationApplyError(session_.schema().str(),
            std::format("Cannot create migration history in '{}': {}", session_.schema().str(), rs.error_message));
    }
}

std::vector<int64_t> MigrationRunner::applied_versions() {
    const auto rs = session_.execute(std::format("SELECT version FROM {}", history_table()));
    if (!rs.success) {
        throw MigrationApplyError(session_.schema().str(),
            std::format("Cannot read migration history in '{}': {}", session_.schema().str(), rs.error_message));
    }

    std::vector<int64_t> versions;
    versions.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        const auto v = row.empty() ? std::nullopt : utils::try_parse_int<int64_t>(row[0]);
        if (!v) {
            throw MigrationApplyError(session_.schema().str(),
                std::format("Unreadable version in migration history of '{}'", session_.schema().str()));
        }
        versions.push_back(*v);
    }
    std::sort(versions.begin(), versions.end());
    return versions;
}

std::vector<const Migration*> MigrationRunner::pending(const MigrationSet& set,
                                                       const std::vector<int64_t>& applied) const {
    const auto& all = set.migrations();
    const std::string& schema = session_.schema().str();

    for (const int64_t v : applied) {
        if (!set.contains(v)) {
            throw MigrationApplyError(schema, std::format(
                "Schema '{}' has applied migration {} which the current migration set does not contain",
                schema, v));
        }
    }
    if (applied.size() > all.size()) {
        throw MigrationApplyError(schema, std::format(
            "Schema '{}' has more applied migrations than the migration set", schema));
    }
    for (size_t i = 0; i < applied.size(); ++i) {
        if (applied[i] != all[i].version) {
            throw MigrationApplyError(schema, std::format(
                "Schema '{}' migration history has a gap: {} is missing but {} is applied",
                schema, all[i].version, applied.back()));
        }
    }

    std::vector<const Migration*> out;
    for (size_t i = applied.size(); i < all.size(); ++i) {
        out.push_back(&all[i]);
    }
    return out;
}

bool MigrationRunner::apply_one(const Migration& migration) {
    const std::string& schema = session_.schema().str();
    SchemaSession::Transaction tx(session_);

    auto lock_rs = session_.execute("SELECT pg_advisory_xact_lock(hashtext($1))", {schema});
    if (!lock_rs.success) {
        throw MigrationApplyError(schema, std::format(
            "Cannot lock '{}' for migration {}: {}", schema, migration.label(), lock_rs.error_message));
    }

    const auto check_rs = session_.execute(
        std::format("SELECT 1 FROM {} WHERE version = $1", history_table()),
        {std::to_string(migration.version)});
    if (!check_rs.success) {
        throw MigrationApplyError(schema, std::format(
            "Cannot re-check migration {} in '{}': {}", migration.label(), schema, check_rs.error_message));
    }
    if (!check_rs.empty()) {
        utils::log::debug(std::format("Migration {} already recorded in '{}'", migration.label(), schema));
        tx.commit();
        return false;
    }

    const auto script_rs = session_.execute(migration.sql);
    if (!script_rs.success) {
        throw MigrationApplyError(schema, std::format(
            "Migration {} failed in '{}': {}", migration.label(), schema, script_rs.error_message));
    }

    const auto insert_rs = session_.execute(
        std::format("INSERT INTO {} (version, name) VALUES ($1, $2)", history_table()),
        {std::to_string(migration.version), migration.name});
    if (!insert_rs.success) {
        throw MigrationApplyError(schema, std::format(
            "Cannot record migration {} in '{}': {}", migration.label(), schema, insert_rs.error_message));
    }

    tx.commit();
    return true;
}

std::vector<int64_t> MigrationRunner::apply_pending(const MigrationSet& set) {
    ensure_history_table();
    const auto todo = pending(set, applied_versions());

    std::vector<int64_t> newly_applied;
    for (const Migration* m : todo) {
        try {
            if (apply_one(*m)) {
                newly_applied.push_back(m->version);
                utils::log::info(std::format("Applied migration {} to '{}'", m->label(), session_.schema().str()));
            }
        } catch (const ContextMisuseError& e) {
            throw MigrationApplyError(session_.schema().str(), std::format(
                "Migration {} rejected for '{}': {}", m->label(), session_.schema().str(), e.what()));
        } catch (const DatabaseError& e) {
            throw MigrationApplyError(session_.schema().str(), std::format(
                "Migration {} failed in '{}': {}", m->label(), session_.schema().str(), e.what()));
        }
    }
    return newly_applied;
}

} // namespace tenantdb
