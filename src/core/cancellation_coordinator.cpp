#include "core/cancellation_coordinator.hpp"

namespace tenantdb {

CancellationCoordinator::CancellationCoordinator() = default;

CancellationCoordinator::CancellationCoordinator(const Config& config)
    : config_(config) {}

void CancellationCoordinator::initiate_cancel() noexcept {
    // Lock-free: safe to call from a signal handler
    cancelled_.store(true, std::memory_order_release);
}

bool CancellationCoordinator::try_enter() {
    if (cancelled_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    // Re-check after increment so a concurrent cancel sees us or we see it
    if (cancelled_.load(std::memory_order_acquire)) {
        leave();
        return false;
    }
    return true;
}

void CancellationCoordinator::leave() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1) {
        std::lock_guard lock(drain_mutex_);
        drain_cv_.notify_all();
    }
}

bool CancellationCoordinator::wait_for_drain() {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, config_.drain_timeout, [this] {
        return in_flight_.load(std::memory_order_acquire) == 0;
    });
}

} // namespace tenantdb
