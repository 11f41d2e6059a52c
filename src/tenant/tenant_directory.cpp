#include "tenant/tenant_directory.hpp"
#include "db/schema_router.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace tenantdb {

TenantDirectory::TenantDirectory(std::shared_ptr<SchemaRouter> router)
    : router_(std::move(router)) {}

std::vector<Tenant> TenantDirectory::query(const std::string& where,
                                           const std::vector<std::string>& params) {
    auto session = router_->open_shared_session();

    std::string sql = std::format("SELECT id, slug, schema_name, status, deleted_at FROM {}",
        QualifiedName(router_->shared_schema(), "tenants").quoted());
    if (!where.empty()) {
        sql += " WHERE " + where;
    }

    const auto rs = params.empty() ? session->execute(sql) : session->execute(sql, params);
    if (!rs.success) {
        throw DatabaseError(std::format("Tenant directory query failed: {}", rs.error_message));
    }

    std::vector<Tenant> tenants;
    tenants.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row.size() < 5) {
            continue;
        }
        const auto status = parse_tenant_status(row[3]);
        if (!status) {
            utils::log::warn(std::format("Tenant '{}' has unknown status '{}'; ignoring", row[1], row[3]));
            continue;
        }
        Tenant t;
        t.id = row[0];
        t.slug = row[1];
        t.schema_name = row[2];
        t.status = *status;
        t.deleted = !row[4].empty();
        tenants.push_back(std::move(t));
    }

    std::sort(tenants.begin(), tenants.end(),
              [](const Tenant& a, const Tenant& b) { return a.slug < b.slug; });
    return tenants;
}

std::vector<Tenant> TenantDirectory::list_all_tenants() {
    return query("", {});
}

std::vector<TenantRef> TenantDirectory::list_eligible_tenants() {
    std::vector<TenantRef> eligible;
    for (const auto& t : query("", {})) {
        if (t.is_eligible()) {
            eligible.push_back(TenantRef::of(t));
        }
    }
    return eligible;
}

std::optional<Tenant> TenantDirectory::find(const std::string& slug_or_id) {
    const std::string key = utils::trim(slug_or_id);
    if (key.empty()) {
        return std::nullopt;
    }

    const bool by_id = utils::looks_like_uuid(key);
    auto rows = by_id
        ? query("id = $1", {utils::to_lower(key)})
        : query("slug = $1", {utils::to_lower(key)});

    for (auto& t : rows) {
        if (!t.deleted) {
            return std::move(t);
        }
    }
    return std::nullopt;
}

Tenant TenantDirectory::resolve(const std::string& slug_or_id) {
    auto tenant = find(slug_or_id);
    if (!tenant) {
        throw TenantNotFoundError(slug_or_id);
    }
    return std::move(*tenant);
}

} // namespace tenantdb
