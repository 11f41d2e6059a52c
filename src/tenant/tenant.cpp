#include "tenant/tenant.hpp"
#include "core/utils.hpp"

namespace tenantdb {

std::string_view tenant_status_name(TenantStatus status) {
    switch (status) {
        case TenantStatus::PENDING:     return "Pending";
        case TenantStatus::ACTIVE:      return "Active";
        case TenantStatus::SUSPENDED:   return "Suspended";
        case TenantStatus::DEACTIVATED: return "Deactivated";
    }
    return "Unknown";
}

std::optional<TenantStatus> parse_tenant_status(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "pending") return TenantStatus::PENDING;
    if (lower == "active") return TenantStatus::ACTIVE;
    if (lower == "suspended") return TenantStatus::SUSPENDED;
    if (lower == "deactivated") return TenantStatus::DEACTIVATED;
    return std::nullopt;
}

std::string derive_schema_name(std::string_view slug, std::string_view prefix) {
    std::string name(prefix);
    for (const char c : utils::to_lower(slug)) {
        name += (c == '-') ? '_' : c;
    }
    return name;
}

} // namespace tenantdb
