#pragma once

#include "mocks/fake_database.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/schema_router.hpp"
#include "schema/migration.hpp"
#include "tenant/tenant_directory.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tenantdb::testing {

inline constexpr const char* kAcmeId = "11111111-1111-4111-8111-111111111111";
inline constexpr const char* kGlobexId = "22222222-2222-4222-8222-222222222222";
inline constexpr const char* kInitechId = "33333333-3333-4333-8333-333333333333";

/**
 * @brief Fake database wired to a real pool, router and tenant directory
 */
struct TenantFixture {
    std::shared_ptr<FakeDatabase> db = std::make_shared<FakeDatabase>();
    std::shared_ptr<IConnectionPool> pool;
    std::shared_ptr<SchemaRouter> router;
    std::shared_ptr<TenantDirectory> directory;

    explicit TenantFixture(size_t max_connections = 4, RouterConfig router_config = {}) {
        db->create_directory(router_config.shared_schema);

        PoolConfig pool_config;
        pool_config.min_connections = 1;
        pool_config.max_connections = max_connections;
        pool = std::make_shared<GenericConnectionPool>(
            "fake", pool_config, std::make_shared<FakeConnectionFactory>(db));

        router_config.acquire_timeout = std::chrono::milliseconds(500);
        router = std::make_shared<SchemaRouter>(pool, router_config);
        directory = std::make_shared<TenantDirectory>(router);
    }

    /// Directory row plus an existing (empty) schema
    void add_tenant(const std::string& id, const std::string& slug, const std::string& status = "Active") {
        const std::string schema = "tenant_" + slug;
        db->add_tenant(id, slug, schema, status);
        db->create_schema(schema);
    }

    [[nodiscard]] UnitOfWork unit_of_work(const std::string& id, const std::string& slug) const {
        UnitOfWork uow = router->new_unit_of_work();
        uow.set_tenant(id, "tenant_" + slug, slug);
        return uow;
    }
};

/// Migration N creates table tN, so tests can tell which versions ran
inline Migration numbered_migration(int64_t version) {
    return Migration{version, "step_" + std::to_string(version),
        "CREATE TABLE t" + std::to_string(version) + " (id UUID PRIMARY KEY, label TEXT)"};
}

inline MigrationSet numbered_set(int64_t up_to) {
    std::vector<Migration> migrations;
    for (int64_t v = 1; v <= up_to; ++v) {
        migrations.push_back(numbered_migration(v));
    }
    return MigrationSet(std::move(migrations));
}

} // namespace tenantdb::testing
