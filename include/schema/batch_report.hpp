#pragma once

#include "core/error.hpp"
#include "tenant/tenant.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace tenantdb {

struct TenantSuccess {
    TenantRef tenant;
    std::vector<int64_t> applied;     // migration versions newly applied
    std::vector<std::string> notes;   // e.g. "add_shipment_external_ids: applied"
};

struct TenantFailure {
    TenantRef tenant;
    ErrorCategory category = ErrorCategory::INTERNAL_ERROR;
    std::string error;
};

/**
 * @brief Outcome of one pass over many tenants.
 *
 * Every eligible tenant ends up in exactly one of succeeded, failed or skipped
 * (skipped = never started because the batch was cancelled).
 */
struct BatchReport {
    std::string operation;
    std::vector<TenantSuccess> succeeded;
    std::vector<TenantFailure> failed;
    std::vector<TenantRef> skipped;
    bool cancelled = false;

    [[nodiscard]] size_t total() const { return succeeded.size() + failed.size() + skipped.size(); }
    [[nodiscard]] bool all_succeeded() const { return failed.empty() && !cancelled; }
    [[nodiscard]] size_t newly_applied_count() const;

    /// "migrate: 3 tenants, 2 succeeded, 1 failed, 0 skipped, 4 migrations applied"
    [[nodiscard]] std::string summary() const;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Per-tenant migration state, for the status report.
 */
struct TenantMigrationStatus {
    TenantRef tenant;
    TenantStatus status = TenantStatus::PENDING;
    bool schema_exists = false;
    std::vector<int64_t> applied;
    std::vector<int64_t> pending;
    std::string error;  // empty when the schema could be inspected

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Migration state of the shared schema, for the status report.
 */
struct SharedMigrationStatus {
    std::string schema;
    bool schema_exists = false;
    std::vector<int64_t> applied;
    std::vector<int64_t> pending;
    std::string error;

    [[nodiscard]] nlohmann::json to_json() const;
};

[[nodiscard]] nlohmann::json to_json(const TenantRef& tenant);

} // namespace tenantdb
