#include <catch2/catch_test_macros.hpp>
#include "db/sql_lexer.hpp"
#include "db/tenant_boundary_guard.hpp"
#include "core/error.hpp"

#include <stdexcept>

using namespace tenantdb;

// ============================================================================
// Lexer
// ============================================================================

TEST_CASE("SqlLexer: words are lower-cased, quoted identifiers keep case", "[lexer]") {
    const auto tokens = tokenize_sql("SELECT \"MixedCase\" FROM Orders");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[0].is_keyword("select"));
    CHECK(tokens[1].kind == SqlTokenKind::QUOTED_IDENTIFIER);
    CHECK(tokens[1].text == "MixedCase");
    CHECK(tokens[3].text == "orders");
}

TEST_CASE("SqlLexer: literals, parameters and comments", "[lexer]") {
    const auto tokens = tokenize_sql(
        "-- leading comment\n"
        "SELECT 'it''s', E'a\\'b', $$tenant_x.y$$, $1 /* outer /* nested */ still */ FROM t");
    REQUIRE(tokens.size() == 10);
    CHECK(tokens[1].kind == SqlTokenKind::STRING);
    CHECK(tokens[1].text == "it's");
    CHECK(tokens[3].text == "a'b");
    CHECK(tokens[5].kind == SqlTokenKind::STRING);
    CHECK(tokens[5].text == "tenant_x.y");
    CHECK(tokens[7].kind == SqlTokenKind::PARAMETER);
    CHECK(tokens[7].text == "$1");
}

TEST_CASE("SqlLexer: U& identifiers and strings are unescaped", "[lexer]") {
    const auto tokens = tokenize_sql("SELECT U&\"d\\0061t\\+000061\", U&'\\\\x' FROM t");
    REQUIRE(tokens.size() == 6);
    CHECK(tokens[1].kind == SqlTokenKind::QUOTED_IDENTIFIER);
    CHECK(tokens[1].text == "data");
    CHECK(tokens[3].kind == SqlTokenKind::STRING);
    CHECK(tokens[3].text == "\\x");
    CHECK_THROWS_AS(tokenize_sql("SELECT U&\"bad\\00zz\""), std::invalid_argument);
}

TEST_CASE("SqlLexer: two-character operators", "[lexer]") {
    const auto tokens = tokenize_sql("a::int <> b");
    REQUIRE(tokens.size() == 5);
    CHECK(tokens[1].is_symbol("::"));
    CHECK(tokens[3].is_symbol("<>"));
}

TEST_CASE("SqlLexer: unterminated input throws", "[lexer]") {
    CHECK_THROWS_AS(tokenize_sql("SELECT 'open"), std::invalid_argument);
    CHECK_THROWS_AS(tokenize_sql("SELECT \"open"), std::invalid_argument);
    CHECK_THROWS_AS(tokenize_sql("SELECT /* open"), std::invalid_argument);
    CHECK_THROWS_AS(tokenize_sql("SELECT $a$ open"), std::invalid_argument);
}

TEST_CASE("SqlLexer: statements split on top-level semicolons", "[lexer]") {
    const auto stmts = split_statements(tokenize_sql(
        "CREATE TABLE a (x int); INSERT INTO a VALUES (';'); ;"));
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0][0].is_keyword("create"));
    CHECK(stmts[1][0].is_keyword("insert"));
}

// ============================================================================
// Boundary guard
// ============================================================================

namespace {

TenantBoundaryGuard acme_guard() {
    return TenantBoundaryGuard(SchemaIdentifier::from("tenant_acme"), "shared", "tenant_");
}

} // namespace

TEST_CASE("BoundaryGuard: unqualified and own-schema statements pass", "[guard]") {
    const auto guard = acme_guard();
    CHECK_NOTHROW(guard.check("SELECT * FROM orders WHERE id = $1"));
    CHECK_NOTHROW(guard.check("INSERT INTO \"tenant_acme\".\"orders\" (id) VALUES ($1)"));
    CHECK_NOTHROW(guard.check("SELECT o.id FROM orders o JOIN shipments s ON s.order_id = o.id"));
    CHECK_NOTHROW(guard.check("SELECT 1 FROM information_schema.tables WHERE table_schema = $1"));
    CHECK_NOTHROW(guard.check("SELECT count(*) FROM public.orders"));
}

TEST_CASE("BoundaryGuard: other tenants and the shared schema are rejected", "[guard]") {
    const auto guard = acme_guard();
    CHECK_THROWS_AS(guard.check("SELECT * FROM tenant_globex.orders"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("SELECT * FROM \"tenant_globex\".\"orders\""), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("SELECT * FROM shared.tenants"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("SELECT tenant_globex.orders.* FROM tenant_globex.orders"), ContextMisuseError);
}

TEST_CASE("BoundaryGuard: search path changes are rejected", "[guard]") {
    const auto guard = acme_guard();
    CHECK_THROWS_AS(guard.check("SET search_path TO tenant_globex"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("SELECT set_config('search_path', 'x', false)"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("RESET search_path"), ContextMisuseError);
}

TEST_CASE("BoundaryGuard: names inside literals and comments are ignored", "[guard]") {
    const auto guard = acme_guard();
    CHECK_NOTHROW(guard.check("INSERT INTO notes (body) VALUES ('see tenant_globex.orders')"));
    CHECK_NOTHROW(guard.check("SELECT 1 -- shared.tenants"));
    CHECK_NOTHROW(guard.check("SELECT $body$ search_path $body$"));
}

TEST_CASE("BoundaryGuard: unlexable text is rejected", "[guard]") {
    const auto guard = acme_guard();
    CHECK_THROWS_AS(guard.check("SELECT 'unterminated"), ContextMisuseError);
}

TEST_CASE("BoundaryGuard: shared session may use its own schema only", "[guard]") {
    const TenantBoundaryGuard guard(SchemaIdentifier::from("shared"), "shared", "tenant_");
    CHECK_NOTHROW(guard.check("SELECT id FROM \"shared\".\"tenants\""));
    CHECK_NOTHROW(guard.check("CREATE SCHEMA IF NOT EXISTS \"shared\""));
    CHECK_THROWS_AS(guard.check("CREATE SCHEMA IF NOT EXISTS \"tenant_acme\""), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("SELECT * FROM tenant_acme.orders"), ContextMisuseError);
}

TEST_CASE("BoundaryGuard: SET SCHEMA, RESET ALL and DISCARD are rejected", "[guard]") {
    const auto guard = acme_guard();
    CHECK_THROWS_AS(guard.check("SET SCHEMA 'tenant_globex'"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("set local schema 'tenant_globex'"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("RESET ALL"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("RESET SCHEMA"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("SELECT 1; DISCARD ALL"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("DISCARD PLANS"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("DO $$ BEGIN PERFORM 1; END $$"), ContextMisuseError);
}

TEST_CASE("BoundaryGuard: SCHEMA clauses must name the session schema", "[guard]") {
    const auto guard = acme_guard();
    CHECK_THROWS_AS(guard.check("ALTER TABLE orders SET SCHEMA tenant_globex"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("ALTER TABLE orders SET SCHEMA public"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("CREATE SCHEMA IF NOT EXISTS tenant_globex"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("DROP SCHEMA tenant_globex CASCADE"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("GRANT USAGE ON SCHEMA shared TO app"), ContextMisuseError);
    CHECK_NOTHROW(guard.check("ALTER TABLE orders SET SCHEMA tenant_acme"));
    CHECK_NOTHROW(guard.check("SELECT schema FROM audit_entries"));
}

TEST_CASE("BoundaryGuard: Unicode-escaped identifiers are decoded before checking", "[guard]") {
    const auto guard = acme_guard();
    CHECK_THROWS_AS(guard.check("SELECT * FROM U&\"tenant\\005fglobex\".orders"), ContextMisuseError);
    CHECK_THROWS_AS(guard.check("SELECT * FROM u&\"\\+000073hared\".tenants"), ContextMisuseError);
    CHECK_NOTHROW(guard.check("SELECT * FROM U&\"tenant\\005facme\".orders"));
    // A custom escape character is not interpreted, so the text is refused
    CHECK_THROWS_AS(guard.check("SELECT * FROM U&\"tenant!005fglobex\" UESCAPE '!'"), ContextMisuseError);
}
