#include "db/schema_router.hpp"
#include "db/pooled_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantdb {

namespace {

constexpr const char* kSchemaExistsSql =
    "SELECT 1 FROM pg_catalog.pg_namespace WHERE nspname = $1";

} // namespace

SchemaRouter::SchemaRouter(std::shared_ptr<IConnectionPool> pool, RouterConfig config)
    : pool_(std::move(pool)),
      config_(std::move(config)),
      shared_schema_(SchemaIdentifier::from(config_.shared_schema)) {}

std::unique_ptr<PooledConnection> SchemaRouter::acquire_connection() {
    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn || !conn->get()) {
        throw ConnectionError(std::format("No database connection available from pool '{}' within {}ms",
            pool_->name(), config_.acquire_timeout.count()));
    }
    return conn;
}

bool SchemaRouter::schema_exists_on(IDbConnection& conn, const SchemaIdentifier& schema) {
    const auto rs = conn.execute_params(kSchemaExistsSql, {schema.str()});
    if (!rs.success) {
        throw DatabaseError(std::format("Schema lookup for '{}' failed: {}", schema.str(), rs.error_message));
    }
    return !rs.empty();
}

SchemaSession::Settings SchemaRouter::session_settings() const {
    return SchemaSession::Settings{
        config_.shared_schema,
        config_.tenant_schema_prefix,
        config_.include_public
    };
}

std::unique_ptr<SchemaSession> SchemaRouter::open_session(const UnitOfWork& uow) {
    const TenantContext& ctx = uow.require();

    auto conn = acquire_connection();
    if (!schema_exists_on(*conn->get(), ctx.schema_name())) {
        throw SchemaNotFoundError(ctx.schema_name().str());
    }

    auto session = std::make_unique<SchemaSession>(std::move(conn), ctx, session_settings());
    session->reassert_schema();

    utils::log::debug(std::format("Routed session to schema '{}' for tenant '{}'",
        ctx.schema_name().str(), ctx.tenant_slug()));
    return session;
}

std::unique_ptr<SchemaSession> SchemaRouter::open_shared_session() {
    auto conn = acquire_connection();
    auto session = std::make_unique<SchemaSession>(std::move(conn), shared_schema_, session_settings());
    session->reassert_schema();
    return session;
}

void SchemaRouter::ensure_schema(const TenantContext& context) {
    auto conn = acquire_connection();
    const auto rs = conn->get()->execute("CREATE SCHEMA IF NOT EXISTS " + context.schema_name().quoted());
    if (!rs.success) {
        throw DatabaseError(std::format("Failed to create schema '{}': {}",
            context.schema_name().str(), rs.error_message));
    }
    utils::log::info(std::format("Ensured schema '{}' for tenant '{}'",
        context.schema_name().str(), context.tenant_slug()));
}

void SchemaRouter::ensure_shared_schema() {
    auto conn = acquire_connection();
    const auto rs = conn->get()->execute("CREATE SCHEMA IF NOT EXISTS " + shared_schema_.quoted());
    if (!rs.success) {
        throw DatabaseError(std::format("Failed to create shared schema '{}': {}",
            shared_schema_.str(), rs.error_message));
    }
}

bool SchemaRouter::schema_exists(const SchemaIdentifier& schema) {
    auto conn = acquire_connection();
    return schema_exists_on(*conn->get(), schema);
}

} // namespace tenantdb
