#pragma once

#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include "db/schema_identifier.hpp"
#include "db/tenant_boundary_guard.hpp"
#include "tenant/tenant_context.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tenantdb {

/**
 * @brief Data-access handle bound to exactly one schema for its lifetime.
 *
 * Owns a pooled connection whose search_path has been set and confirmed for
 * that schema. Every statement is passed through a TenantBoundaryGuard first.
 * Destroying the session rolls back any open transaction and returns the
 * connection to the pool.
 *
 * Not thread-safe; one session belongs to one unit of work.
 */
class SchemaSession {
public:
    struct Settings {
        std::string shared_schema = kDefaultSharedSchema;
        std::string tenant_schema_prefix = "tenant_";
        bool include_public = true;
    };

    /// Shared-schema session (no tenant context)
    SchemaSession(std::unique_ptr<PooledConnection> conn,
                  SchemaIdentifier schema,
                  Settings settings);

    /// Tenant session
    SchemaSession(std::unique_ptr<PooledConnection> conn,
                  TenantContext context,
                  Settings settings);

    ~SchemaSession();

    SchemaSession(const SchemaSession&) = delete;
    SchemaSession& operator=(const SchemaSession&) = delete;

    /**
     * @brief Run SQL text (one or more statements) confined to this schema
     * @throws ContextMisuseError if the text would leave the schema
     */
    [[nodiscard]] DbResultSet execute(const std::string& sql);

    /**
     * @brief Run one statement with bound parameters
     * @throws ContextMisuseError if the text would leave the schema
     */
    [[nodiscard]] DbResultSet execute(const std::string& sql, const std::vector<std::string>& params);

    /// Like execute(), throwing DatabaseError on failure
    DbResultSet execute_checked(const std::string& sql);
    DbResultSet execute_checked(const std::string& sql, const std::vector<std::string>& params);

    /// @throws DatabaseError, or ContextMisuseError when already in a transaction
    void begin();
    void commit();
    void rollback();

    [[nodiscard]] bool in_transaction() const noexcept { return in_transaction_; }

    /**
     * @brief Issue SET search_path for this schema and confirm with current_schema()
     * @throws RoutingError if the active schema does not match afterwards
     * @throws ContextMisuseError inside a transaction
     */
    void reassert_schema();

    [[nodiscard]] const SchemaIdentifier& schema() const noexcept { return schema_; }
    [[nodiscard]] const std::optional<TenantContext>& context() const noexcept { return context_; }
    [[nodiscard]] bool is_shared() const noexcept { return !context_.has_value(); }

    /**
     * @brief RAII transaction: BEGIN on construction, ROLLBACK unless commit() ran
     */
    class Transaction {
    public:
        explicit Transaction(SchemaSession& session);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        SchemaSession& session_;
        bool done_ = false;
    };

private:
    IDbConnection& connection();

    std::unique_ptr<PooledConnection> conn_;
    SchemaIdentifier schema_;
    std::optional<TenantContext> context_;
    Settings settings_;
    TenantBoundaryGuard guard_;
    bool in_transaction_ = false;
};

} // namespace tenantdb
