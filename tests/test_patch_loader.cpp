#include <catch2/catch_test_macros.hpp>
#include "schema/patch_loader.hpp"

#include <stdexcept>

using namespace tenantdb;

TEST_CASE("PatchLoader: parses patches and their steps in order", "[patch][loader]") {
    const auto result = PatchLoader::load_from_string(R"(
[[patch]]
id = "add_shipment_external_ids"
description = "External ids on shipments"

  [[patch.step]]
  kind = "add_column"
  table = "shipments"
  column = "external_order_id"
  definition = "VARCHAR(100)"

  [[patch.step]]
  kind = "create_index"
  index = "ix_shipments_external_order_id"
  table = "shipments"
  columns = ["external_order_id"]

[[patch]]
id = "create_chat_conversations"

  [[patch.step]]
  kind = "create_table"
  table = "chat_conversations"
  definition = "id UUID PRIMARY KEY"
)");

    REQUIRE(result.is_ok());
    const auto& set = result.value();
    REQUIRE(set.size() == 2);

    const auto* ids = set.find("add_shipment_external_ids");
    REQUIRE(ids != nullptr);
    CHECK(ids->description == "External ids on shipments");
    REQUIRE(ids->steps.size() == 2);
    CHECK(ids->steps[0].kind == PatchStepKind::ADD_COLUMN);
    CHECK(ids->steps[0].column == "external_order_id");
    CHECK(ids->steps[0].definition == "VARCHAR(100)");
    CHECK(ids->steps[1].kind == PatchStepKind::CREATE_INDEX);
    CHECK(ids->steps[1].columns == std::vector<std::string>{"external_order_id"});

    CHECK(set.patches()[1].id == "create_chat_conversations");
    CHECK(set.patches()[1].steps[0].kind == PatchStepKind::CREATE_TABLE);
    CHECK(set.find("missing") == nullptr);
}

TEST_CASE("PatchLoader: empty document is an empty catalog", "[patch][loader]") {
    const auto result = PatchLoader::load_from_string("");
    REQUIRE(result.is_ok());
    CHECK(result.value().empty());
}

TEST_CASE("PatchLoader: invalid catalogs are rejected", "[patch][loader]") {
    SECTION("unknown step kind") {
        const auto r = PatchLoader::load_from_string(R"(
[[patch]]
id = "p"
  [[patch.step]]
  kind = "drop_table"
  table = "orders"
)");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::CONFIG_ERROR);
        CHECK(r.error_message().find("drop_table") != std::string::npos);
    }

    SECTION("missing required field") {
        const auto r = PatchLoader::load_from_string(R"(
[[patch]]
id = "p"
  [[patch.step]]
  kind = "add_column"
  table = "orders"
  definition = "TEXT"
)");
        REQUIRE(r.is_error());
        CHECK(r.error_message().find("patch[0].step[0].column is required") != std::string::npos);
    }

    SECTION("index without columns") {
        const auto r = PatchLoader::load_from_string(R"(
[[patch]]
id = "p"
  [[patch.step]]
  kind = "create_index"
  index = "ix"
  table = "orders"
)");
        REQUIRE(r.is_error());
    }

    SECTION("duplicate patch id") {
        const auto r = PatchLoader::load_from_string(R"(
[[patch]]
id = "p"
  [[patch.step]]
  kind = "create_table"
  table = "a"
  definition = "id INT"

[[patch]]
id = "p"
  [[patch.step]]
  kind = "create_table"
  table = "b"
  definition = "id INT"
)");
        REQUIRE(r.is_error());
    }

    SECTION("malformed toml") {
        const auto r = PatchLoader::load_from_string("[[patch]\nid = ");
        REQUIRE(r.is_error());
        CHECK(r.error_message().starts_with("Failed to parse patch catalog"));
    }
}

TEST_CASE("PatchLoader: missing file is an error", "[patch][loader]") {
    const auto r = PatchLoader::load_from_file("/nonexistent/patches.toml");
    REQUIRE(r.is_error());
    CHECK(r.error_message().find("/nonexistent/patches.toml") != std::string::npos);
}

TEST_CASE("PatchSet: patch without steps is rejected", "[patch]") {
    SchemaPatch empty;
    empty.id = "empty";
    CHECK_THROWS_AS(PatchSet(std::vector<SchemaPatch>{empty}), std::invalid_argument);
}
