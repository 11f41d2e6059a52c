#include <catch2/catch_test_macros.hpp>
#include "db/schema_identifier.hpp"

#include <stdexcept>
#include <string>

using namespace tenantdb;

TEST_CASE("SchemaIdentifier: accepts lower-case identifiers", "[identifier]") {
    CHECK(SchemaIdentifier::is_valid("tenant_acme"));
    CHECK(SchemaIdentifier::is_valid("_private"));
    CHECK(SchemaIdentifier::is_valid("t1"));
    CHECK(SchemaIdentifier::is_valid(std::string(kMaxIdentifierLength, 'a')));
}

TEST_CASE("SchemaIdentifier: rejects everything else", "[identifier]") {
    CHECK_FALSE(SchemaIdentifier::is_valid(""));
    CHECK_FALSE(SchemaIdentifier::is_valid("1tenant"));
    CHECK_FALSE(SchemaIdentifier::is_valid("Tenant"));
    CHECK_FALSE(SchemaIdentifier::is_valid("tenant-acme"));
    CHECK_FALSE(SchemaIdentifier::is_valid("tenant acme"));
    CHECK_FALSE(SchemaIdentifier::is_valid("tenant\"acme"));
    CHECK_FALSE(SchemaIdentifier::is_valid(std::string(kMaxIdentifierLength + 1, 'a')));

    CHECK_FALSE(SchemaIdentifier::parse("x;drop").has_value());
    CHECK_THROWS_AS(SchemaIdentifier::from("Bad"), std::invalid_argument);
}

TEST_CASE("SchemaIdentifier: quoting", "[identifier]") {
    CHECK(SchemaIdentifier::from("tenant_acme").quoted() == "\"tenant_acme\"");
    CHECK(quote_identifier("we\"ird") == "\"we\"\"ird\"");
}

TEST_CASE("SchemaIdentifier: system schemas", "[identifier]") {
    CHECK(is_system_schema("public"));
    CHECK(is_system_schema("pg_catalog"));
    CHECK(is_system_schema("pg_toast"));
    CHECK(is_system_schema("information_schema"));
    CHECK_FALSE(is_system_schema("tenant_acme"));
    CHECK(SchemaIdentifier::from("pg_temp_1").is_system());
}

TEST_CASE("QualifiedName: quotes both parts", "[identifier]") {
    const QualifiedName name(SchemaIdentifier::from("tenant_acme"), "__schema_migrations");
    CHECK(name.quoted() == "\"tenant_acme\".\"__schema_migrations\"");
    CHECK(QualifiedName(SchemaIdentifier::from("s"), "Mixed\"Case").quoted() == "\"s\".\"Mixed\"\"Case\"");
    CHECK_THROWS_AS(QualifiedName(SchemaIdentifier::from("s"), ""), std::invalid_argument);
}

TEST_CASE("SchemaIdentifier: equality", "[identifier]") {
    CHECK(SchemaIdentifier::from("a") == SchemaIdentifier::from("a"));
    CHECK_FALSE(SchemaIdentifier::from("a") == SchemaIdentifier::from("b"));
}
