#pragma once

#include "db/iconnection_pool.hpp"
#include "db/schema_session.hpp"
#include "tenant/tenant_context.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace tenantdb {

struct RouterConfig {
    std::string shared_schema = kDefaultSharedSchema;
    std::string tenant_schema_prefix = "tenant_";
    bool include_public = true;
    std::chrono::milliseconds acquire_timeout{5000};
};

/**
 * @brief Turns a tenant context into a session confined to that tenant's schema.
 *
 * All tenants share one pool. Nothing about a connection's previous schema is
 * trusted: every checkout sets and confirms the search path again.
 */
class SchemaRouter {
public:
    /// @throws std::invalid_argument if the shared schema name is not a valid identifier
    SchemaRouter(std::shared_ptr<IConnectionPool> pool, RouterConfig config);

    /**
     * @brief Open a session for the unit of work's tenant
     * @throws ContextMisuseError when the unit of work has no tenant
     * @throws ConnectionError when no connection could be acquired
     * @throws SchemaNotFoundError when the tenant schema does not exist
     * @throws RoutingError when the schema could not be confirmed
     */
    [[nodiscard]] std::unique_ptr<SchemaSession> open_session(const UnitOfWork& uow);

    /**
     * @brief Open a session on the shared schema; needs no tenant context
     */
    [[nodiscard]] std::unique_ptr<SchemaSession> open_shared_session();

    /**
     * @brief CREATE SCHEMA IF NOT EXISTS for the context's schema (idempotent)
     */
    void ensure_schema(const TenantContext& context);

    /// CREATE SCHEMA IF NOT EXISTS for the shared schema (first startup)
    void ensure_shared_schema();

    [[nodiscard]] bool schema_exists(const SchemaIdentifier& schema);

    /// A fresh unit of work that knows which schema is reserved for shared data
    [[nodiscard]] UnitOfWork new_unit_of_work() const { return UnitOfWork(config_.shared_schema); }

    [[nodiscard]] const RouterConfig& config() const noexcept { return config_; }
    [[nodiscard]] const SchemaIdentifier& shared_schema() const noexcept { return shared_schema_; }

private:
    std::unique_ptr<PooledConnection> acquire_connection();

    static bool schema_exists_on(IDbConnection& conn, const SchemaIdentifier& schema);

    [[nodiscard]] SchemaSession::Settings session_settings() const;

    std::shared_ptr<IConnectionPool> pool_;
    RouterConfig config_;
    SchemaIdentifier shared_schema_;
};

} // namespace tenantdb
