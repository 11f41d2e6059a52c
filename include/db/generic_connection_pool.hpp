#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace tenantdb {

/**
 * @brief Shared connection pool serving every tenant schema
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore
 * - Lazy growth: connections created on demand up to max
 * - Max-lifetime recycling and idle health checks on acquire
 * - Dead connections (closed or discarded) are dropped on return
 * - RAII: PooledConnection auto-returns on destruction
 *
 * The pool never records which schema a connection last served.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    struct ConnTimes {
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    /// Create via factory and apply the per-connection statement timeout
    std::unique_ptr<IDbConnection> create_connection();

    /// Close and forget a connection (caller holds no lock)
    void destroy_connection(std::unique_ptr<IDbConnection> conn);

    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<const IDbConnection*, ConnTimes> times_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<uint64_t> acquire_time_sum_us_{0};
    std::atomic<uint64_t> acquire_time_count_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace tenantdb
