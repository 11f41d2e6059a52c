#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tenantdb {

/// PostgreSQL NAMEDATALEN - 1
inline constexpr size_t kMaxIdentifierLength = 63;

/**
 * @brief Quote an identifier for inclusion in SQL text.
 *
 * Wraps in double quotes and doubles any embedded double quote. This is the
 * only place identifiers are turned into SQL.
 */
[[nodiscard]] std::string quote_identifier(std::string_view name);

/**
 * @brief True for names PostgreSQL reserves for itself (pg_*, information_schema, public)
 */
[[nodiscard]] bool is_system_schema(std::string_view name);

/**
 * @brief Validated schema name: [a-z_][a-z0-9_]*, at most 63 bytes.
 *
 * Once constructed the name is known to be safe to quote and route to.
 */
class SchemaIdentifier {
public:
    /// @return nullopt when the name is not a valid lower-case identifier
    [[nodiscard]] static std::optional<SchemaIdentifier> parse(std::string_view name);

    /// @throws std::invalid_argument when the name is not a valid identifier
    [[nodiscard]] static SchemaIdentifier from(std::string_view name);

    [[nodiscard]] static bool is_valid(std::string_view name);

    [[nodiscard]] const std::string& str() const noexcept { return name_; }

    /// "name" form, ready for SQL text
    [[nodiscard]] std::string quoted() const { return quote_identifier(name_); }

    [[nodiscard]] bool is_system() const { return is_system_schema(name_); }

    bool operator==(const SchemaIdentifier& other) const = default;

private:
    explicit SchemaIdentifier(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

/**
 * @brief Schema-qualified object name ("schema"."object")
 *
 * The object part is any non-empty identifier; it is quoted, never validated
 * against the lower-case rule, so mixed-case legacy names survive.
 */
class QualifiedName {
public:
    /// @throws std::invalid_argument on an empty object name
    QualifiedName(SchemaIdentifier schema, std::string object);

    [[nodiscard]] const SchemaIdentifier& schema() const noexcept { return schema_; }
    [[nodiscard]] const std::string& object() const noexcept { return object_; }

    [[nodiscard]] std::string quoted() const;

private:
    SchemaIdentifier schema_;
    std::string object_;
};

} // namespace tenantdb
