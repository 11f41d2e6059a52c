#pragma once

#include "db/schema_identifier.hpp"
#include <optional>
#include <string>

namespace tenantdb {

inline constexpr const char* kDefaultSharedSchema = "shared";

/**
 * @brief Immutable tenant scope of one unit of work.
 */
class TenantContext {
public:
    TenantContext(std::string tenant_id, SchemaIdentifier schema_name, std::string tenant_slug)
        : tenant_id_(std::move(tenant_id)),
          schema_name_(std::move(schema_name)),
          tenant_slug_(std::move(tenant_slug)) {}

    [[nodiscard]] const std::string& tenant_id() const noexcept { return tenant_id_; }
    [[nodiscard]] const SchemaIdentifier& schema_name() const noexcept { return schema_name_; }
    [[nodiscard]] const std::string& tenant_slug() const noexcept { return tenant_slug_; }

private:
    std::string tenant_id_;
    SchemaIdentifier schema_name_;
    std::string tenant_slug_;
};

/**
 * @brief One request or job, carrying its tenant context down the call chain.
 *
 * The context is set exactly once. A UnitOfWork is moved, never copied, so
 * two units of work can never share a context.
 */
class UnitOfWork {
public:
    /// @param shared_schema name the context may never be set to
    explicit UnitOfWork(std::string shared_schema = kDefaultSharedSchema);

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;
    /// The moved-from unit of work is left without a tenant (shared schema name is copied)
    UnitOfWork(UnitOfWork&& other);
    UnitOfWork& operator=(UnitOfWork&& other);

    /**
     * @brief Bind this unit of work to a tenant.
     * @throws ContextMisuseError if already set, or the schema name is invalid,
     *         a system schema, or the shared schema
     */
    void set_tenant(std::string tenant_id, std::string_view schema_name, std::string tenant_slug);

    [[nodiscard]] const std::optional<TenantContext>& current() const noexcept { return context_; }

    [[nodiscard]] bool has_tenant() const noexcept { return context_.has_value(); }

    /// @throws ContextMisuseError when no tenant has been set
    [[nodiscard]] const TenantContext& require() const;

private:
    std::string shared_schema_;
    std::optional<TenantContext> context_;
};

} // namespace tenantdb
