#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace tenantdb {

/**
 * @brief RAII wrapper for database connection
 *
 * Automatically returns connection to pool on destruction.
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Close the connection so the pool drops it instead of reusing it
     *
     * Used when session state (transaction, search_path) can no longer be
     * trusted, e.g. a failed rollback.
     */
    void discard();

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace tenantdb
