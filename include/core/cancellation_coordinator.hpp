#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace tenantdb {

/**
 * @brief Cooperative cancellation for tenant batches.
 *
 * Once cancelled, no new tenant iteration may start; iterations already
 * entered run to completion and are drained by the caller.
 */
class CancellationCoordinator {
public:
    struct Config {
        std::chrono::milliseconds drain_timeout{30000};
    };

    CancellationCoordinator();
    explicit CancellationCoordinator(const Config& config);

    /// Called by signal handler or operator to stop launching work
    void initiate_cancel() noexcept;

    /// Called before each tenant iteration. Returns false once cancelled.
    [[nodiscard]] bool try_enter();

    /// Called when a tenant iteration completes.
    void leave();

    /// Blocks until all in-flight iterations complete or timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

private:
    Config config_;
    std::atomic<bool> cancelled_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

} // namespace tenantdb
