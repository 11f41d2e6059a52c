#include <catch2/catch_test_macros.hpp>
#include "core/cancellation_coordinator.hpp"
#include "core/bounded_parallel.hpp"
#include "schema/tenant_batch.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tenantdb;

TEST_CASE("CancellationCoordinator: try_enter succeeds before cancel", "[cancel]") {
    CancellationCoordinator cc;
    CHECK(cc.try_enter());
    CHECK(cc.in_flight_count() == 1);
    cc.leave();
    CHECK(cc.in_flight_count() == 0);
}

TEST_CASE("CancellationCoordinator: try_enter fails after cancel", "[cancel]") {
    CancellationCoordinator cc;
    cc.initiate_cancel();
    CHECK_FALSE(cc.try_enter());
    CHECK(cc.is_cancelled());
    CHECK(cc.in_flight_count() == 0);
}

TEST_CASE("CancellationCoordinator: wait_for_drain blocks until leave", "[cancel]") {
    CancellationCoordinator::Config cfg;
    cfg.drain_timeout = std::chrono::milliseconds(5000);
    CancellationCoordinator cc(cfg);

    REQUIRE(cc.try_enter());

    std::atomic<bool> drained{false};
    std::thread drain_thread([&] {
        cc.initiate_cancel();
        drained = cc.wait_for_drain();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(drained.load());

    cc.leave();
    drain_thread.join();
    CHECK(drained.load());
}

TEST_CASE("CancellationCoordinator: drain times out with work in flight", "[cancel]") {
    CancellationCoordinator::Config cfg;
    cfg.drain_timeout = std::chrono::milliseconds(50);
    CancellationCoordinator cc(cfg);

    REQUIRE(cc.try_enter());
    cc.initiate_cancel();

    const auto start = std::chrono::steady_clock::now();
    const bool ok = cc.wait_for_drain();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(ok);
    CHECK(elapsed >= std::chrono::milliseconds(40));
    CHECK(cc.in_flight_count() == 1);
    cc.leave();
}

TEST_CASE("for_each_bounded: runs every item within the worker limit", "[cancel][parallel]") {
    std::vector<int> items(20);
    for (int i = 0; i < 20; ++i) items[i] = i;

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> sum{0};

    const auto launched = for_each_bounded(items, 4, nullptr, [&](int v) {
        const int now = active.fetch_add(1) + 1;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        sum.fetch_add(v);
        active.fetch_sub(1);
    });

    CHECK(sum.load() == 190);
    CHECK(peak.load() <= 4);
    CHECK(std::all_of(launched.begin(), launched.end(), [](bool b) { return b; }));
}

TEST_CASE("for_each_bounded: cancel mid-run stops new items, finishes started ones", "[cancel][parallel]") {
    CancellationCoordinator cc;
    std::vector<int> items{0, 1, 2, 3, 4};
    std::vector<int> finished;

    const auto launched = for_each_bounded(items, 1, &cc, [&](int v) {
        if (v == 1) {
            cc.initiate_cancel();
        }
        finished.push_back(v);
    });

    CHECK(finished == std::vector<int>{0, 1});
    CHECK(launched == std::vector<bool>{true, true, false, false, false});
    CHECK(cc.in_flight_count() == 0);
}

TEST_CASE("run_tenant_batch: outcomes follow input order", "[cancel][batch]") {
    const std::vector<TenantRef> tenants{
        {"1", "acme", "tenant_acme"},
        {"2", "globex", "tenant_globex"},
        {"3", "initech", "tenant_initech"},
    };
    CancellationCoordinator cc;

    const auto report = run_tenant_batch("migrate", tenants, 1, &cc, [&](const TenantRef& t) {
        if (t.slug == "acme") {
            throw std::runtime_error("boom");
        }
        if (t.slug == "globex") {
            cc.initiate_cancel();
        }
        return TenantSuccess{t, {1}, {}};
    });

    REQUIRE(report.failed.size() == 1);
    CHECK(report.failed[0].tenant.slug == "acme");
    CHECK(report.failed[0].category == ErrorCategory::INTERNAL_ERROR);
    CHECK(report.failed[0].error == "boom");
    REQUIRE(report.succeeded.size() == 1);
    CHECK(report.succeeded[0].tenant.slug == "globex");
    REQUIRE(report.skipped.size() == 1);
    CHECK(report.skipped[0].slug == "initech");
    CHECK(report.cancelled);
    CHECK(report.summary() == "migrate: 3 tenants, 1 succeeded, 1 failed, 1 skipped, 1 migrations applied (cancelled)");
}
