#include <catch2/catch_test_macros.hpp>
#include "mocks/fake_database.hpp"
#include "db/generic_connection_pool.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace tenantdb;
using namespace tenantdb::testing;

namespace {

PoolConfig small_pool(size_t max_connections) {
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = max_connections;
    return config;
}

int connection_id(const PooledConnection& conn) {
    return static_cast<const FakeConnection*>(conn.get())->id();
}

} // namespace

TEST_CASE("Pool: pre-warms min_connections and reuses them", "[pool]") {
    auto db = std::make_shared<FakeDatabase>();
    GenericConnectionPool pool("test-db", small_pool(2), std::make_shared<FakeConnectionFactory>(db));

    CHECK(pool.get_stats().idle_connections == 1);
    CHECK(db->total_connections.load() == 1);

    int first_id = -1;
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        first_id = connection_id(*conn);
        CHECK(pool.get_stats().active_connections == 1);
    }
    auto again = pool.acquire();
    REQUIRE(again != nullptr);
    CHECK(connection_id(*again) == first_id);
    CHECK(db->total_connections.load() == 1);
}

TEST_CASE("Pool: acquire times out when exhausted", "[pool]") {
    auto db = std::make_shared<FakeDatabase>();
    GenericConnectionPool pool("test-db", small_pool(1), std::make_shared<FakeConnectionFactory>(db));

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    const auto start = std::chrono::steady_clock::now();
    auto none = pool.acquire(std::chrono::milliseconds(50));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(none == nullptr);
    CHECK(elapsed >= std::chrono::milliseconds(40));
    CHECK(pool.get_stats().failed_acquires == 1);
}

TEST_CASE("Pool: refused connection yields nullptr and frees the slot", "[pool]") {
    auto db = std::make_shared<FakeDatabase>();
    auto config = small_pool(1);
    config.min_connections = 0;
    GenericConnectionPool pool("test-db", config, std::make_shared<FakeConnectionFactory>(db));

    db->refuse_connections = true;
    CHECK(pool.acquire(std::chrono::milliseconds(50)) == nullptr);

    db->refuse_connections = false;
    auto conn = pool.acquire(std::chrono::milliseconds(50));
    CHECK(conn != nullptr);
}

TEST_CASE("Pool: discarded connection is not returned to the idle set", "[pool]") {
    auto db = std::make_shared<FakeDatabase>();
    GenericConnectionPool pool("test-db", small_pool(2), std::make_shared<FakeConnectionFactory>(db));

    int discarded_id = -1;
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        discarded_id = connection_id(*conn);
        conn->discard();
    }
    CHECK(db->open_connections.load() == 0);

    auto fresh = pool.acquire();
    REQUIRE(fresh != nullptr);
    CHECK(connection_id(*fresh) != discarded_id);
}

TEST_CASE("Pool: short max_lifetime causes connection recycling", "[pool][lifetime]") {
    auto db = std::make_shared<FakeDatabase>();
    auto config = small_pool(2);
    config.max_lifetime = std::chrono::seconds(1);
    GenericConnectionPool pool("test-db", config, std::make_shared<FakeConnectionFactory>(db));

    int first_id = -1;
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        first_id = connection_id(*conn);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(connection_id(*conn) != first_id);
    CHECK(pool.get_stats().connections_recycled == 1);
}

TEST_CASE("Pool: statement timeout applied to new connections", "[pool]") {
    auto db = std::make_shared<FakeDatabase>();
    auto config = small_pool(1);
    config.statement_timeout_ms = 60000;
    GenericConnectionPool pool("test-db", config, std::make_shared<FakeConnectionFactory>(db));

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(static_cast<const FakeConnection*>(conn->get())->session().statement_timeout_ms == 60000);
}

TEST_CASE("Pool: drain closes idle connections and refuses acquires", "[pool]") {
    auto db = std::make_shared<FakeDatabase>();
    GenericConnectionPool pool("test-db", small_pool(2), std::make_shared<FakeConnectionFactory>(db));

    pool.drain();
    CHECK(db->open_connections.load() == 0);
    CHECK(pool.acquire(std::chrono::milliseconds(10)) == nullptr);
}

TEST_CASE("Pool: concurrent acquire never exceeds max_connections", "[pool][concurrency]") {
    auto db = std::make_shared<FakeDatabase>();
    GenericConnectionPool pool("test-db", small_pool(3), std::make_shared<FakeConnectionFactory>(db));

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> served{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            auto conn = pool.acquire(std::chrono::milliseconds(2000));
            if (!conn) return;
            const int now = active.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            active.fetch_sub(1);
            served.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    CHECK(served.load() == 12);
    CHECK(peak.load() <= 3);
    CHECK(db->total_connections.load() <= 3);
}
