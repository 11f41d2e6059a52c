#pragma once

#include "core/cancellation_coordinator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <format>
#include <thread>
#include <vector>

namespace tenantdb {

/**
 * @brief Run fn over items on at most max_workers threads.
 *
 * Each worker claims the next index and calls fn(item). When a cancellation
 * coordinator is given, an item is only launched if try_enter() succeeds; the
 * returned vector marks which items were launched so the caller can report the
 * rest as skipped. fn is expected to handle its own failures; anything that
 * escapes is logged and the worker moves on to the next item.
 *
 * @return launched[i] == true iff fn ran for items[i]
 */
template<typename Item, typename Fn>
std::vector<bool> for_each_bounded(const std::vector<Item>& items,
                                   size_t max_workers,
                                   CancellationCoordinator* cancel,
                                   Fn&& fn) {
    std::vector<bool> launched(items.size(), false);
    if (items.empty()) {
        return launched;
    }

    // vector<bool> is not safe for concurrent writes to distinct elements
    std::vector<char> ran(items.size(), 0);
    std::atomic<size_t> next{0};

    auto worker = [&] {
        for (;;) {
            if (cancel && cancel->is_cancelled()) {
                return;
            }
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= items.size()) {
                return;
            }
            if (cancel && !cancel->try_enter()) {
                return;
            }
            ran[i] = 1;
            try {
                fn(items[i]);
            } catch (const std::exception& e) {
                utils::log::error(std::format("Worker task {} failed: {}", i, e.what()));
            }
            if (cancel) {
                cancel->leave();
            }
        }
    };

    const size_t workers = std::clamp<size_t>(max_workers, 1, items.size());
    if (workers == 1) {
        worker();
    } else {
        std::vector<std::jthread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back(worker);
        }
        // jthread joins on destruction
    }

    for (size_t i = 0; i < items.size(); ++i) {
        launched[i] = ran[i] != 0;
    }
    return launched;
}

} // namespace tenantdb
