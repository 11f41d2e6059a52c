#include <catch2/catch_test_macros.hpp>
#include "mocks/tenant_fixture.hpp"
#include "schema/schema_patch_applier.hpp"
#include "core/cancellation_coordinator.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tenantdb;
using namespace tenantdb::testing;

namespace {

PatchSet shipment_catalog() {
    SchemaPatch ids;
    ids.id = "add_shipment_external_ids";
    ids.steps = {
        PatchStep::add_column("shipments", "external_order_id", "VARCHAR(100)"),
        PatchStep::add_column("shipments", "external_shipment_id", "VARCHAR(100)"),
        PatchStep::create_index("ix_shipments_external_order_id", "shipments", {"external_order_id"}),
    };

    SchemaPatch chat;
    chat.id = "create_chat_conversations";
    chat.steps = {
        PatchStep::create_table("chat_conversations", "id UUID PRIMARY KEY, subject TEXT"),
    };
    return PatchSet(std::vector<SchemaPatch>{ids, chat});
}

void create_shipments(TenantFixture& f, const std::string& schema) {
    f.db->run(schema, "CREATE TABLE shipments (id UUID PRIMARY KEY, carrier TEXT)");
    f.db->run(schema, "INSERT INTO shipments (id, carrier) VALUES ('aaaaaaaa-0000-4000-8000-000000000001', 'dhl')");
}

} // namespace

TEST_CASE("SchemaPatchApplier: patch applies once, then reports already applied", "[patch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    create_shipments(f, "tenant_acme");
    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog());

    const auto first = applier.apply_patch("add_shipment_external_ids", "acme");
    CHECK(first.outcome == PatchOutcome::APPLIED);
    CHECK(first.error.empty());
    REQUIRE(first.actions.size() == 3);
    CHECK(first.actions[0] == "add column shipments.external_order_id");
    CHECK(f.db->has_column("tenant_acme", "shipments", "external_order_id"));
    CHECK(f.db->has_column("tenant_acme", "shipments", "external_shipment_id"));
    CHECK(f.db->has_index("tenant_acme", "ix_shipments_external_order_id"));
    CHECK(f.db->row_count("tenant_acme", "shipments") == 1);

    const auto second = applier.apply_patch("add_shipment_external_ids", "acme");
    CHECK(second.outcome == PatchOutcome::ALREADY_APPLIED);
    CHECK(second.actions.empty());
    CHECK(f.db->column_count("tenant_acme", "shipments") == 4);
}

TEST_CASE("SchemaPatchApplier: partially patched schema is completed", "[patch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    create_shipments(f, "tenant_acme");
    f.db->run("tenant_acme", "ALTER TABLE shipments ADD COLUMN external_order_id VARCHAR(100)");

    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog());
    const auto result = applier.apply_patch("add_shipment_external_ids", "acme");

    CHECK(result.outcome == PatchOutcome::APPLIED);
    REQUIRE(result.actions.size() == 2);
    CHECK(result.actions[0] == "add column shipments.external_shipment_id");
}

TEST_CASE("SchemaPatchApplier: steps on an absent table are skipped", "[patch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog());

    const auto result = applier.apply_patch("add_shipment_external_ids", "acme");
    CHECK(result.outcome == PatchOutcome::ALREADY_APPLIED);
    CHECK_FALSE(f.db->has_table("tenant_acme", "shipments"));
}

TEST_CASE("SchemaPatchApplier: a failing step rolls back the whole patch", "[patch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    create_shipments(f, "tenant_acme");
    f.db->fail_when("\"external_shipment_id\"", "tenant_acme", -1, "lock timeout");

    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog());
    const auto result = applier.apply_patch("add_shipment_external_ids", "acme");

    CHECK(result.outcome == PatchOutcome::FAILED);
    CHECK(result.error.find("lock timeout") != std::string::npos);
    CHECK(result.actions.empty());
    CHECK_FALSE(f.db->has_column("tenant_acme", "shipments", "external_order_id"));
}

TEST_CASE("SchemaPatchApplier: each patch runs under the schema advisory lock", "[patch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    create_shipments(f, "tenant_acme");
    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog());
    f.db->clear_log();

    CHECK(applier.apply_patch("add_shipment_external_ids", "acme").outcome == PatchOutcome::APPLIED);
    CHECK(applier.apply_patch("create_chat_conversations", "acme").outcome == PatchOutcome::APPLIED);
    CHECK(f.db->count_statements("pg_advisory_xact_lock") == 2);

    // The lock comes before the existence checks of the same transaction
    const auto log = f.db->statements();
    const auto lock = std::find_if(log.begin(), log.end(),
        [](const FakeStatement& s) { return s.sql.find("pg_advisory_xact_lock") != std::string::npos; });
    const auto check = std::find_if(log.begin(), log.end(),
        [](const FakeStatement& s) { return s.sql.find("information_schema.tables") != std::string::npos; });
    REQUIRE(lock != log.end());
    REQUIRE(check != log.end());
    CHECK(lock < check);
}

TEST_CASE("SchemaPatchApplier: a malformed step fails the patch instead of escaping", "[patch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    create_shipments(f, "tenant_acme");

    SchemaPatch broken;
    broken.id = "nameless_table";
    broken.steps = {PatchStep::add_column("", "note", "TEXT")};
    SchemaPatchApplier applier(f.router, f.directory, PatchSet(std::vector<SchemaPatch>{broken}));

    PatchResult result;
    REQUIRE_NOTHROW(result = applier.apply_patch("nameless_table", "acme"));
    CHECK(result.outcome == PatchOutcome::FAILED);
    CHECK(result.error.find("must not be empty") != std::string::npos);
    CHECK(result.actions.empty());
}

TEST_CASE("SchemaPatchApplier: unknown patch or tenant", "[patch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog());

    CHECK_THROWS_AS(applier.apply_patch("no_such_patch", "acme"), std::invalid_argument);
    CHECK_THROWS_AS(applier.apply_patch("add_shipment_external_ids", "nobody"), TenantNotFoundError);
}

TEST_CASE("SchemaPatchApplier: apply_all covers every eligible tenant", "[patch][batch]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    f.add_tenant(kGlobexId, "globex");
    f.add_tenant(kInitechId, "initech", "Deactivated");
    create_shipments(f, "tenant_acme");
    create_shipments(f, "tenant_globex");
    f.db->fail_when("CREATE TABLE", "tenant_globex", -1, "out of disk");

    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog(), {.max_parallel_tenants = 2});
    const auto report = applier.apply_all();

    CHECK(report.operation == "patch");
    CHECK(report.total() == 2);

    REQUIRE(report.succeeded.size() == 1);
    const auto& acme = report.succeeded[0];
    CHECK(acme.tenant.slug == "acme");
    CHECK(acme.notes == std::vector<std::string>{
        "add_shipment_external_ids: applied", "create_chat_conversations: applied"});
    CHECK(f.db->has_table("tenant_acme", "chat_conversations"));

    REQUIRE(report.failed.size() == 1);
    const auto& globex = report.failed[0];
    CHECK(globex.tenant.slug == "globex");
    CHECK(globex.category == ErrorCategory::PATCH_APPLY_ERROR);
    CHECK(globex.error.find("create_chat_conversations") != std::string::npos);
    // The patch that did not fail still landed
    CHECK(f.db->has_column("tenant_globex", "shipments", "external_order_id"));

    CHECK_FALSE(f.db->has_table("tenant_initech", "chat_conversations"));

    f.db->clear_failures();
    const auto rerun = applier.apply_all();
    CHECK(rerun.all_succeeded());
    for (const auto& s : rerun.succeeded) {
        if (s.tenant.slug == "acme") {
            CHECK(s.notes == std::vector<std::string>{
                "add_shipment_external_ids: already_applied", "create_chat_conversations: already_applied"});
        }
    }
}

TEST_CASE("SchemaPatchApplier: cancelled batch launches nothing", "[patch][cancel]") {
    TenantFixture f;
    f.add_tenant(kAcmeId, "acme");
    CancellationCoordinator cancel;
    cancel.initiate_cancel();

    SchemaPatchApplier applier(f.router, f.directory, shipment_catalog(), {}, &cancel);
    const auto report = applier.apply_all();
    CHECK(report.cancelled);
    CHECK(report.skipped.size() == 1);
    CHECK_FALSE(f.db->has_table("tenant_acme", "chat_conversations"));
}
