#include "schema/batch_report.hpp"

#include <format>

namespace tenantdb {

nlohmann::json to_json(const TenantRef& tenant) {
    return nlohmann::json{
        {"tenant_id", tenant.id},
        {"slug", tenant.slug},
        {"schema", tenant.schema_name}
    };
}

size_t BatchReport::newly_applied_count() const {
    size_t n = 0;
    for (const auto& s : succeeded) {
        n += s.applied.size();
    }
    return n;
}

std::string BatchReport::summary() const {
    std::string out = std::format("{}: {} tenants, {} succeeded, {} failed, {} skipped",
        operation, total(), succeeded.size(), failed.size(), skipped.size());
    const size_t applied = newly_applied_count();
    if (applied > 0) {
        out += std::format(", {} migrations applied", applied);
    }
    if (cancelled) {
        out += " (cancelled)";
    }
    return out;
}

nlohmann::json BatchReport::to_json() const {
    nlohmann::json j;
    j["operation"] = operation;

    auto ok = nlohmann::json::array();
    for (const auto& s : succeeded) {
        auto entry = tenantdb::to_json(s.tenant);
        entry["applied"] = s.applied;
        if (!s.notes.empty()) {
            entry["notes"] = s.notes;
        }
        ok.push_back(std::move(entry));
    }
    j["succeeded"] = std::move(ok);

    auto bad = nlohmann::json::array();
    for (const auto& f : failed) {
        auto entry = tenantdb::to_json(f.tenant);
        entry["category"] = std::string(category_name(f.category));
        entry["error"] = f.error;
        bad.push_back(std::move(entry));
    }
    j["failed"] = std::move(bad);

    auto skip = nlohmann::json::array();
    for (const auto& t : skipped) {
        skip.push_back(tenantdb::to_json(t));
    }
    j["skipped"] = std::move(skip);

    j["cancelled"] = cancelled;
    return j;
}

nlohmann::json TenantMigrationStatus::to_json() const {
    auto j = tenantdb::to_json(tenant);
    j["status"] = std::string(tenant_status_name(status));
    j["schema_exists"] = schema_exists;
    j["applied"] = applied;
    j["pending"] = pending;
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

nlohmann::json SharedMigrationStatus::to_json() const {
    nlohmann::json j;
    j["schema"] = schema;
    j["schema_exists"] = schema_exists;
    j["applied"] = applied;
    j["pending"] = pending;
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

} // namespace tenantdb
