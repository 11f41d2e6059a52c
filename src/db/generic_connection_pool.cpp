#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace tenantdb {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}'",
                i + 1, db_name_));
            continue;
        }
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::debug(std::format("Connection pool '{}' ready: {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    const auto acquire_start = std::chrono::steady_clock::now();

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have started while we waited for the slot
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    ConnTimes times{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            const auto it = times_.find(conn.get());
            if (it != times_.end()) times = it->second;
        }
    }

    const auto now = std::chrono::steady_clock::now();
    bool replace = false;

    if (conn && config_.max_lifetime.count() > 0 && now - times.created_at > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    }

    // Only round-trip a health check for connections idle past idle_timeout
    if (conn && !replace && now - times.last_used > config_.idle_timeout) {
        if (!conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        }
    }

    if (replace) {
        destroy_connection(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Connection pool '{}': failed to open a new connection", db_name_));
            return nullptr;
        }
    }

    const auto elapsed = std::chrono::steady_clock::now() - acquire_start;
    acquire_time_sum_us_.fetch_add(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()),
        std::memory_order_relaxed);
    acquire_time_count_.fetch_add(1, std::memory_order_relaxed);

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.idle_connections = idle_connections_.size();
    }
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.active_connections = stats.total_connections > stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.acquire_time_sum_us = acquire_time_sum_us_.load(std::memory_order_relaxed);
    stats.acquire_time_count = acquire_time_count_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_connections_);
    }
    for (auto& conn : idle) {
        destroy_connection(std::move(conn));
    }

    utils::log::debug(std::format("Connection pool '{}' drained", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        return nullptr;
    }
    if (config_.statement_timeout_ms > 0 && !conn->set_query_timeout(config_.statement_timeout_ms)) {
        utils::log::warn(std::format("Connection pool '{}': could not set statement_timeout", db_name_));
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);

    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    times_[conn.get()] = ConnTimes{now, now};
    return conn;
}

void GenericConnectionPool::destroy_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        times_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        destroy_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        times_[conn.get()].last_used = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace tenantdb
