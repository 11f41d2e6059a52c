#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tenantdb {

enum class TenantStatus {
    PENDING,
    ACTIVE,
    SUSPENDED,
    DEACTIVATED
};

[[nodiscard]] std::string_view tenant_status_name(TenantStatus status);

/// Case-insensitive: "Active", "active", "ACTIVE"
[[nodiscard]] std::optional<TenantStatus> parse_tenant_status(std::string_view name);

/**
 * @brief Row of the shared tenant directory.
 */
struct Tenant {
    std::string id;
    std::string slug;
    std::string schema_name;
    TenantStatus status = TenantStatus::PENDING;
    bool deleted = false;  // soft-deleted (deleted_at set)

    /// Active and Pending tenants take part in migration and patch batches
    [[nodiscard]] bool is_eligible() const {
        return !deleted && (status == TenantStatus::ACTIVE || status == TenantStatus::PENDING);
    }
};

/**
 * @brief The three values a batch needs to address one tenant.
 */
struct TenantRef {
    std::string id;
    std::string slug;
    std::string schema_name;

    [[nodiscard]] static TenantRef of(const Tenant& t) {
        return TenantRef{t.id, t.slug, t.schema_name};
    }
};

/**
 * @brief Schema name for a slug: prefix + slug, lower-cased, '-' -> '_'.
 *
 * "acme-corp" -> "tenant_acme_corp". The result is not validated here.
 */
[[nodiscard]] std::string derive_schema_name(std::string_view slug,
                                             std::string_view prefix = "tenant_");

} // namespace tenantdb
