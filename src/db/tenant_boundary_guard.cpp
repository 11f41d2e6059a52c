#include "db/tenant_boundary_guard.hpp"
#include "db/sql_lexer.hpp"
#include "core/error.hpp"

#include <format>
#include <stdexcept>

namespace tenantdb {

TenantBoundaryGuard::TenantBoundaryGuard(SchemaIdentifier session_schema,
                                         std::string shared_schema,
                                         std::string tenant_schema_prefix)
    : session_schema_(std::move(session_schema)),
      shared_schema_(std::move(shared_schema)),
      tenant_schema_prefix_(std::move(tenant_schema_prefix)) {}

namespace {

bool starts_statement(const std::vector<SqlToken>& tokens, size_t i) {
    return i == 0 || tokens[i - 1].is_symbol(";");
}

// Keywords that may sit between SCHEMA and the schema name
bool is_schema_filler(const SqlToken& tok) {
    return tok.is_keyword("if") || tok.is_keyword("not") || tok.is_keyword("exists");
}

// Keywords after which SCHEMA introduces a schema name rather than a column called "schema"
bool introduces_schema_name(const SqlToken& tok) {
    return tok.is_keyword("create") || tok.is_keyword("drop") || tok.is_keyword("alter")
        || tok.is_keyword("set") || tok.is_keyword("on") || tok.is_keyword("in");
}

} // anonymous namespace

bool TenantBoundaryGuard::is_foreign_schema(const std::string& name) const {
    if (name == session_schema_.str()) {
        return false;
    }
    if (name == shared_schema_) {
        return true;
    }
    return !tenant_schema_prefix_.empty() && name.starts_with(tenant_schema_prefix_);
}

void TenantBoundaryGuard::reject_search_path_change() const {
    throw ContextMisuseError(std::format(
        "Statement rejected on session for schema '{}': changing the search path is not allowed",
        session_schema_.str()));
}

void TenantBoundaryGuard::check(std::string_view sql) const {
    std::vector<SqlToken> tokens;
    try {
        tokens = tokenize_sql(sql);
    } catch (const std::invalid_argument& e) {
        // Unlexable text cannot be proven confined
        throw ContextMisuseError(std::format(
            "Statement rejected on session for schema '{}': {}", session_schema_.str(), e.what()));
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (!tok.is_word()) {
            continue;
        }

        if (tok.text == "search_path" || tok.text == "set_config") {
            reject_search_path_change();
        }

        // An anonymous code block runs text this check cannot see
        if (starts_statement(tokens, i) && tok.is_keyword("do")) {
            throw ContextMisuseError(std::format(
                "Statement rejected on session for schema '{}': DO blocks are not allowed",
                session_schema_.str()));
        }

        // DISCARD ALL / RESET ALL drop the confirmed search path
        if (starts_statement(tokens, i) && tok.is_keyword("discard")) {
            reject_search_path_change();
        }
        if (starts_statement(tokens, i) && tok.is_keyword("reset")
            && i + 1 < tokens.size() && (tokens[i + 1].is_keyword("all") || tokens[i + 1].is_keyword("schema"))) {
            reject_search_path_change();
        }

        if (tok.is_keyword("schema") && i > 0) {
            size_t j = i + 1;
            while (j < tokens.size() && is_schema_filler(tokens[j])) ++j;
            // SET SCHEMA 'name' is the search_path alias
            if (j < tokens.size() && tokens[j].kind == SqlTokenKind::STRING) {
                reject_search_path_change();
            }
            if (introduces_schema_name(tokens[i - 1]) && j < tokens.size() && tokens[j].is_word()
                && tokens[j].text != session_schema_.str()) {
                throw ContextMisuseError(std::format(
                    "Statement rejected on session for schema '{}': references schema '{}'",
                    session_schema_.str(), tokens[j].text));
            }
        }

        const bool qualifies_next = i + 2 < tokens.size()
            && tokens[i + 1].is_symbol(".")
            && (tokens[i + 2].is_word() || tokens[i + 2].is_symbol("*"));
        // Skip the right-hand side of a.b so "s"."tenant_x" column names are not schemas
        const bool is_rhs = i > 0 && tokens[i - 1].is_symbol(".");

        if (qualifies_next && !is_rhs && is_foreign_schema(tok.text)) {
            throw ContextMisuseError(std::format(
                "Statement rejected on session for schema '{}': references schema '{}'",
                session_schema_.str(), tok.text));
        }
    }
}

} // namespace tenantdb
