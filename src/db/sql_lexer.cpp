#include "db/sql_lexer.hpp"

#include <cstdint>
#include <format>
#include <stdexcept>

namespace tenantdb {

// ============================================================================
// Character classification (locale-independent)
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER = 0,
    CC_SPACE = 1,
    CC_DIGIT = 2,
    CC_ALPHA = 4,
    CC_UNDERSCORE = 8,
};

struct CharTable {
    uint8_t cls[256];
    char lower[256];

    constexpr CharTable() : cls{}, lower{} {
        for (int i = 0; i < 256; ++i) {
            lower[i] = static_cast<char>(i);
            // Non-ASCII bytes are legal identifier characters in PostgreSQL
            cls[i] = (i >= 0x80) ? CC_ALPHA : CC_OTHER;
        }
        cls[' '] = CC_SPACE; cls['\t'] = CC_SPACE;
        cls['\n'] = CC_SPACE; cls['\r'] = CC_SPACE; cls['\f'] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'A'; i <= 'Z'; ++i) {
            cls[i] = CC_ALPHA;
            lower[i] = static_cast<char>(i + 32);
        }
        cls['_'] = CC_UNDERSCORE;
    }
};

constexpr CharTable CT{};

inline bool ct_space(unsigned char c) { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c) { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) {
    const auto v = CT.cls[c];
    return v == CC_ALPHA || v == CC_UNDERSCORE;
}
inline bool ct_ident_cont(unsigned char c) {
    const auto v = CT.cls[c];
    return v == CC_ALPHA || v == CC_UNDERSCORE || v == CC_DIGIT || c == '$';
}
inline char ct_lower(unsigned char c) { return CT.lower[c]; }

[[noreturn]] void unterminated(std::string_view what, size_t pos) {
    throw std::invalid_argument(std::format("Unterminated {} starting at position {}", what, pos));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Resolve \XXXX, \+XXXXXX and \\ in the body of a U&"..." or U&'...' token
std::string decode_unicode_escapes(std::string_view body, size_t pos) {
    std::string out;
    size_t i = 0;
    while (i < body.size()) {
        if (body[i] != '\\') {
            out += body[i++];
            continue;
        }
        if (i + 1 < body.size() && body[i + 1] == '\\') {
            out += '\\';
            i += 2;
            continue;
        }
        size_t digits = 4;
        size_t start = i + 1;
        if (start < body.size() && body[start] == '+') {
            digits = 6;
            ++start;
        }
        if (start + digits > body.size()) {
            throw std::invalid_argument(std::format("Invalid Unicode escape at position {}", pos));
        }
        uint32_t cp = 0;
        for (size_t k = start; k < start + digits; ++k) {
            const int v = hex_value(body[k]);
            if (v < 0) {
                throw std::invalid_argument(std::format("Invalid Unicode escape at position {}", pos));
            }
            cp = (cp << 4) | static_cast<uint32_t>(v);
        }
        if (cp == 0 || cp > 0x10FFFF) {
            throw std::invalid_argument(std::format("Invalid Unicode escape value at position {}", pos));
        }
        append_utf8(out, cp);
        i = start + digits;
    }
    return out;
}

// Two-character operators kept as one SYMBOL token
bool is_two_char_op(char a, char b) {
    return (a == ':' && b == ':') || (a == '<' && b == '>') || (a == '<' && b == '=')
        || (a == '>' && b == '=') || (a == '!' && b == '=') || (a == '|' && b == '|');
}

} // anonymous namespace

std::vector<SqlToken> tokenize_sql(std::string_view sql) {
    std::vector<SqlToken> tokens;
    const size_t len = sql.size();
    size_t i = 0;

    auto at = [&](size_t k) -> unsigned char {
        return k < len ? static_cast<unsigned char>(sql[k]) : static_cast<unsigned char>('\0');
    };

    while (i < len) {
        const unsigned char c = at(i);

        if (ct_space(c)) {
            ++i;
            continue;
        }

        // -- line comment
        if (c == '-' && at(i + 1) == '-') {
            while (i < len && sql[i] != '\n') ++i;
            continue;
        }

        // /* block comment */ (nests in PostgreSQL)
        if (c == '/' && at(i + 1) == '*') {
            const size_t start = i;
            int depth = 1;
            i += 2;
            while (i < len && depth > 0) {
                if (sql[i] == '/' && at(i + 1) == '*') { ++depth; i += 2; }
                else if (sql[i] == '*' && at(i + 1) == '/') { --depth; i += 2; }
                else ++i;
            }
            if (depth > 0) unterminated("block comment", start);
            continue;
        }

        // U&"identifier" and U&'string' with Unicode escapes
        if ((c == 'u' || c == 'U') && at(i + 1) == '&' && (at(i + 2) == '"' || at(i + 2) == '\'')) {
            const size_t start = i;
            const char quote = static_cast<char>(at(i + 2));
            i += 3;
            std::string raw;
            bool closed = false;
            while (i < len) {
                if (sql[i] == quote) {
                    if (at(i + 1) == static_cast<unsigned char>(quote)) {
                        raw += quote;
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                raw += sql[i++];
            }
            if (!closed) unterminated(quote == '"' ? "quoted identifier" : "string literal", start);

            // A custom escape character changes how the body reads
            size_t k = i;
            while (k < len && ct_space(at(k))) ++k;
            std::string next;
            while (k < len && ct_ident_cont(at(k)) && next.size() < 8) next += ct_lower(at(k++));
            if (next == "uescape") {
                throw std::invalid_argument(std::format("UESCAPE is not supported (position {})", start));
            }

            tokens.push_back({quote == '"' ? SqlTokenKind::QUOTED_IDENTIFIER : SqlTokenKind::STRING,
                              decode_unicode_escapes(raw, start)});
            continue;
        }

        // 'string' and E'string'
        const bool escape_string = (c == 'e' || c == 'E') && at(i + 1) == '\'';
        if (c == '\'' || escape_string) {
            const size_t start = i;
            i += escape_string ? 2 : 1;
            std::string body;
            bool closed = false;
            while (i < len) {
                const char ch = sql[i];
                if (escape_string && ch == '\\' && i + 1 < len) {
                    body += sql[i + 1];
                    i += 2;
                    continue;
                }
                if (ch == '\'') {
                    if (at(i + 1) == '\'') {
                        body += '\'';
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                body += ch;
                ++i;
            }
            if (!closed) unterminated("string literal", start);
            tokens.push_back({SqlTokenKind::STRING, std::move(body)});
            continue;
        }

        // "quoted identifier"
        if (c == '"') {
            const size_t start = i;
            ++i;
            std::string body;
            bool closed = false;
            while (i < len) {
                if (sql[i] == '"') {
                    if (at(i + 1) == '"') {
                        body += '"';
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                body += sql[i++];
            }
            if (!closed) unterminated("quoted identifier", start);
            tokens.push_back({SqlTokenKind::QUOTED_IDENTIFIER, std::move(body)});
            continue;
        }

        if (c == '$') {
            // $1 positional parameter
            if (ct_digit(at(i + 1))) {
                const size_t start = i++;
                while (i < len && ct_digit(at(i))) ++i;
                tokens.push_back({SqlTokenKind::PARAMETER, std::string(sql.substr(start, i - start))});
                continue;
            }
            // $tag$ ... $tag$ dollar quoting
            size_t j = i + 1;
            while (j < len && sql[j] != '$' && ct_ident_cont(at(j))) ++j;
            if (j < len && sql[j] == '$') {
                const std::string_view delim = sql.substr(i, j - i + 1);
                const size_t body_start = j + 1;
                const size_t end = sql.find(delim, body_start);
                if (end == std::string_view::npos) unterminated("dollar-quoted string", i);
                tokens.push_back({SqlTokenKind::STRING, std::string(sql.substr(body_start, end - body_start))});
                i = end + delim.size();
                continue;
            }
        }

        if (ct_digit(c) || (c == '.' && ct_digit(at(i + 1)))) {
            const size_t start = i;
            while (i < len && (ct_digit(at(i)) || sql[i] == '.')) ++i;
            tokens.push_back({SqlTokenKind::NUMBER, std::string(sql.substr(start, i - start))});
            continue;
        }

        if (ct_ident_start(c)) {
            std::string word;
            while (i < len && ct_ident_cont(at(i))) {
                word += ct_lower(at(i));
                ++i;
            }
            tokens.push_back({SqlTokenKind::IDENTIFIER, std::move(word)});
            continue;
        }

        if (is_two_char_op(static_cast<char>(c), static_cast<char>(at(i + 1)))) {
            tokens.push_back({SqlTokenKind::SYMBOL, std::string(sql.substr(i, 2))});
            i += 2;
            continue;
        }

        tokens.push_back({SqlTokenKind::SYMBOL, std::string(1, static_cast<char>(c))});
        ++i;
    }

    return tokens;
}

std::vector<std::vector<SqlToken>> split_statements(std::vector<SqlToken> tokens) {
    std::vector<std::vector<SqlToken>> statements;
    std::vector<SqlToken> current;
    int depth = 0;

    for (auto& tok : tokens) {
        if (tok.is_symbol("(")) ++depth;
        if (tok.is_symbol(")") && depth > 0) --depth;
        if (depth == 0 && tok.is_symbol(";")) {
            if (!current.empty()) {
                statements.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(std::move(tok));
    }
    if (!current.empty()) {
        statements.push_back(std::move(current));
    }
    return statements;
}

} // namespace tenantdb
