#pragma once

#include "schema/migration.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tenantdb {

class SchemaSession;

inline constexpr const char* kMigrationHistoryTable = "__schema_migrations";

/**
 * @brief Applies a MigrationSet to the one schema a session is bound to.
 *
 * All work happens on the session's connection. Each migration runs in its own
 * transaction under a per-schema advisory lock, so two runners racing on the
 * same schema apply every version once.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(SchemaSession& session);

    /// CREATE TABLE IF NOT EXISTS for the history table
    void ensure_history_table();

    /// Versions recorded in the history table, ascending
    [[nodiscard]] std::vector<int64_t> applied_versions();

    /**
     * @brief Migrations still to run, in order
     * @throws MigrationApplyError when applied is not a prefix of the set
     *         (a gap, or a version the set does not contain)
     */
    [[nodiscard]] std::vector<const Migration*> pending(const MigrationSet& set,
                                                        const std::vector<int64_t>& applied) const;

    /**
     * @brief ensure_history_table + prefix check + apply each pending migration
     * @return versions newly applied by this call
     * @throws MigrationApplyError on the first failing migration; earlier ones stay applied
     */
    std::vector<int64_t> apply_pending(const MigrationSet& set);

private:
    /// @return false when another runner recorded the version first
    bool apply_one(const Migration& migration);

    [[nodiscard]] std::string history_table() const;

    SchemaSession& session_;
};

} // namespace tenantdb
