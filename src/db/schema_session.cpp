#include "db/schema_session.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantdb {

SchemaSession::SchemaSession(std::unique_ptr<PooledConnection> conn,
                             SchemaIdentifier schema,
                             Settings settings)
    : conn_(std::move(conn)),
      schema_(schema),
      settings_(std::move(settings)),
      guard_(std::move(schema), settings_.shared_schema, settings_.tenant_schema_prefix) {}

SchemaSession::SchemaSession(std::unique_ptr<PooledConnection> conn,
                             TenantContext context,
                             Settings settings)
    : conn_(std::move(conn)),
      schema_(context.schema_name()),
      context_(std::move(context)),
      settings_(std::move(settings)),
      guard_(schema_, settings_.shared_schema, settings_.tenant_schema_prefix) {}

SchemaSession::~SchemaSession() {
    if (!in_transaction_ || !conn_) {
        return;
    }
    const auto rs = conn_->get()->execute("ROLLBACK");
    if (!rs.success) {
        // Transaction state unknown; make sure nobody else inherits it
        utils::log::warn(std::format("Rollback on session close failed for schema '{}': {}",
            schema_.str(), rs.error_message));
        conn_->discard();
    }
}

IDbConnection& SchemaSession::connection() {
    if (!conn_ || !conn_->get()) {
        throw ConnectionError(std::format("Session for schema '{}' has no connection", schema_.str()));
    }
    return *conn_->get();
}

DbResultSet SchemaSession::execute(const std::string& sql) {
    guard_.check(sql);
    return connection().execute(sql);
}

DbResultSet SchemaSession::execute(const std::string& sql, const std::vector<std::string>& params) {
    guard_.check(sql);
    return connection().execute_params(sql, params);
}

DbResultSet SchemaSession::execute_checked(const std::string& sql) {
    auto rs = execute(sql);
    if (!rs.success) {
        throw DatabaseError(rs.error_message);
    }
    return rs;
}

DbResultSet SchemaSession::execute_checked(const std::string& sql, const std::vector<std::string>& params) {
    auto rs = execute(sql, params);
    if (!rs.success) {
        throw DatabaseError(rs.error_message);
    }
    return rs;
}

void SchemaSession::begin() {
    if (in_transaction_) {
        throw ContextMisuseError(std::format("Transaction already open on session for schema '{}'", schema_.str()));
    }
    const auto rs = connection().execute("BEGIN");
    if (!rs.success) {
        throw DatabaseError(rs.error_message);
    }
    in_transaction_ = true;
}

void SchemaSession::commit() {
    if (!in_transaction_) {
        throw ContextMisuseError(std::format("No transaction open on session for schema '{}'", schema_.str()));
    }
    const auto rs = connection().execute("COMMIT");
    in_transaction_ = false;
    if (!rs.success) {
        throw DatabaseError(rs.error_message);
    }
}

void SchemaSession::rollback() {
    if (!in_transaction_) {
        return;
    }
    const auto rs = connection().execute("ROLLBACK");
    in_transaction_ = false;
    if (!rs.success) {
        conn_->discard();
        throw DatabaseError(rs.error_message);
    }
}

void SchemaSession::reassert_schema() {
    if (in_transaction_) {
        throw ContextMisuseError("Schema cannot be re-asserted inside a transaction");
    }

    auto& conn = connection();

    std::string set_sql = "SET search_path TO " + schema_.quoted();
    if (settings_.include_public && schema_.str() != "public") {
        set_sql += ", public";
    }

    const auto set_rs = conn.execute(set_sql);
    if (!set_rs.success) {
        throw RoutingError(std::format("Failed to set search_path for schema '{}': {}",
            schema_.str(), set_rs.error_message));
    }

    const auto check_rs = conn.execute("SELECT current_schema()");
    if (!check_rs.success) {
        throw RoutingError(std::format("Failed to confirm active schema '{}': {}",
            schema_.str(), check_rs.error_message));
    }
    const auto active = check_rs.scalar().value_or("");
    if (active != schema_.str()) {
        throw RoutingError(std::format("Active schema is '{}' after routing to '{}'", active, schema_.str()));
    }
}

// ============================================================================
// Transaction
// ============================================================================

SchemaSession::Transaction::Transaction(SchemaSession& session)
    : session_(session) {
    session_.begin();
}

SchemaSession::Transaction::~Transaction() {
    if (done_) {
        return;
    }
    try {
        session_.rollback();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Rollback failed for schema '{}': {}", session_.schema().str(), e.what()));
    }
}

void SchemaSession::Transaction::commit() {
    done_ = true;
    session_.commit();
}

} // namespace tenantdb
