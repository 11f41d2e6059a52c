#include <catch2/catch_test_macros.hpp>
#include "mocks/tenant_fixture.hpp"
#include "core/error.hpp"

using namespace tenantdb;
using namespace tenantdb::testing;

TEST_CASE("TenantDirectory: lists tenants ordered by slug", "[directory]") {
    TenantFixture f;
    f.add_tenant(kGlobexId, "globex");
    f.add_tenant(kAcmeId, "acme");

    const auto all = f.directory->list_all_tenants();
    REQUIRE(all.size() == 2);
    CHECK(all[0].slug == "acme");
    CHECK(all[0].schema_name == "tenant_acme");
    CHECK(all[0].status == TenantStatus::ACTIVE);
    CHECK(all[1].slug == "globex");
}

TEST_CASE("TenantDirectory: eligible excludes suspended, deactivated and deleted tenants", "[directory]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme", "Active");
    f.add_tenant(kGlobexId, "globex", "Pending");
    f.add_tenant(kInitechId, "initech", "Suspended");
    f.db->add_tenant("44444444-4444-4444-8444-444444444444", "hooli", "tenant_hooli", "Deactivated");
    f.db->add_tenant("55555555-5555-4555-8555-555555555555", "umbrella", "tenant_umbrella", "Active", true);

    const auto eligible = f.directory->list_eligible_tenants();
    REQUIRE(eligible.size() == 2);
    CHECK(eligible[0].slug == "acme");
    CHECK(eligible[1].slug == "globex");

    CHECK(f.directory->list_all_tenants().size() == 5);
}

TEST_CASE("TenantDirectory: unknown status rows are skipped", "[directory]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    f.db->add_tenant(kGlobexId, "globex", "tenant_globex", "Archived");

    const auto all = f.directory->list_all_tenants();
    REQUIRE(all.size() == 1);
    CHECK(all[0].slug == "acme");
}

TEST_CASE("TenantDirectory: find by slug or id, case-insensitively", "[directory]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");

    auto by_slug = f.directory->find("  Acme ");
    REQUIRE(by_slug.has_value());
    CHECK(by_slug->id == kAcmeId);

    auto by_id = f.directory->find("11111111-1111-4111-8111-111111111111");
    REQUIRE(by_id.has_value());
    CHECK(by_id->slug == "acme");

    CHECK(f.directory->find("ACME").has_value());

    CHECK_FALSE(f.directory->find("").has_value());
    CHECK_FALSE(f.directory->find("nobody").has_value());
}

TEST_CASE("TenantDirectory: suspended tenants resolve, deleted ones do not", "[directory]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme", "Suspended");
    f.db->add_tenant(kGlobexId, "globex", "tenant_globex", "Active", true);

    CHECK(f.directory->resolve("acme").status == TenantStatus::SUSPENDED);

    try {
        (void)f.directory->resolve("globex");
        FAIL("expected TenantNotFoundError");
    } catch (const TenantNotFoundError& e) {
        CHECK(e.identifier() == "globex");
        CHECK(e.category() == ErrorCategory::TENANT_NOT_FOUND);
    }
}

TEST_CASE("TenantDirectory: query failure surfaces as DatabaseError", "[directory]") {
    TenantFixture f;
    f.db->fail_when("FROM \"shared\".\"tenants\"", "", 1, "relation does not exist");
    CHECK_THROWS_AS(f.directory->list_all_tenants(), DatabaseError);
}
