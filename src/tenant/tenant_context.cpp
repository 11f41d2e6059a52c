#include "tenant/tenant_context.hpp"
#include "core/error.hpp"

#include <format>

namespace tenantdb {

UnitOfWork::UnitOfWork(std::string shared_schema)
    : shared_schema_(std::move(shared_schema)) {}

UnitOfWork::UnitOfWork(UnitOfWork&& other)
    : shared_schema_(other.shared_schema_),
      context_(std::move(other.context_)) {
    other.context_.reset();
}

UnitOfWork& UnitOfWork::operator=(UnitOfWork&& other) {
    if (this != &other) {
        shared_schema_ = other.shared_schema_;
        context_ = std::move(other.context_);
        other.context_.reset();
    }
    return *this;
}

void UnitOfWork::set_tenant(std::string tenant_id, std::string_view schema_name, std::string tenant_slug) {
    if (context_) {
        throw ContextMisuseError(std::format(
            "Tenant context already set to '{}' for this unit of work; refusing to switch to '{}'",
            context_->tenant_slug(), tenant_slug));
    }
    if (tenant_id.empty()) {
        throw ContextMisuseError("Tenant context requires a tenant id");
    }

    auto schema = SchemaIdentifier::parse(schema_name);
    if (!schema) {
        throw ContextMisuseError(std::format("Invalid tenant schema name '{}'", schema_name));
    }
    if (schema->is_system()) {
        throw ContextMisuseError(std::format("Tenant schema may not be system schema '{}'", schema_name));
    }
    if (schema->str() == shared_schema_) {
        throw ContextMisuseError(std::format("Tenant schema may not be the shared schema '{}'", schema_name));
    }

    context_.emplace(std::move(tenant_id), std::move(*schema), std::move(tenant_slug));
}

const TenantContext& UnitOfWork::require() const {
    if (!context_) {
        throw ContextMisuseError("Tenant-scoped access attempted before the tenant context was set");
    }
    return *context_;
}

} // namespace tenantdb
