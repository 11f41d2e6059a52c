#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tenantdb {

enum class SqlTokenKind {
    IDENTIFIER,         // bare word, lower-cased
    QUOTED_IDENTIFIER,  // "Name", unescaped, case kept
    STRING,             // '...', E'...', $tag$...$tag$ (unescaped body)
    NUMBER,
    PARAMETER,          // $1, $2 ...
    SYMBOL              // punctuation and operators
};

struct SqlToken {
    SqlTokenKind kind;
    std::string text;

    [[nodiscard]] bool is_word() const {
        return kind == SqlTokenKind::IDENTIFIER || kind == SqlTokenKind::QUOTED_IDENTIFIER;
    }
    [[nodiscard]] bool is_keyword(std::string_view kw) const {
        return kind == SqlTokenKind::IDENTIFIER && text == kw;
    }
    [[nodiscard]] bool is_symbol(std::string_view sym) const {
        return kind == SqlTokenKind::SYMBOL && text == sym;
    }
};

/**
 * @brief Split PostgreSQL SQL text into tokens.
 *
 * Comments (-- and nested block comments) and whitespace are dropped.
 * Literal bodies are returned as a single STRING token so their contents are
 * never mistaken for identifiers.
 *
 * @throws std::invalid_argument on an unterminated literal, quoted identifier
 *         or block comment
 */
[[nodiscard]] std::vector<SqlToken> tokenize_sql(std::string_view sql);

/**
 * @brief Split token stream into statements on top-level ';'
 */
[[nodiscard]] std::vector<std::vector<SqlToken>> split_statements(std::vector<SqlToken> tokens);

} // namespace tenantdb
