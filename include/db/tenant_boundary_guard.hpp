#pragma once

#include "db/schema_identifier.hpp"
#include <string>
#include <string_view>

namespace tenantdb {

/**
 * @brief Static check that a statement stays inside its session's schema.
 *
 * Rejects, before the text reaches the database:
 * - anything that touches the search path (search_path, set_config, SET SCHEMA,
 *   RESET ALL, DISCARD)
 * - a SCHEMA clause naming any schema but the session's own
 * - DO blocks, whose body is opaque here
 * - a qualified reference to another tenant-prefixed schema
 * - a qualified reference to the shared schema from a tenant session
 *
 * Literals, dollar-quoted bodies and comments are skipped, so data that merely
 * mentions a schema name is not flagged.
 */
class TenantBoundaryGuard {
public:
    TenantBoundaryGuard(SchemaIdentifier session_schema,
                        std::string shared_schema,
                        std::string tenant_schema_prefix);

    /// @throws ContextMisuseError when the statement would leave the session schema
    void check(std::string_view sql) const;

    [[nodiscard]] const SchemaIdentifier& session_schema() const noexcept { return session_schema_; }

private:
    [[nodiscard]] bool is_foreign_schema(const std::string& name) const;
    [[noreturn]] void reject_search_path_change() const;

    SchemaIdentifier session_schema_;
    std::string shared_schema_;
    std::string tenant_schema_prefix_;
};

} // namespace tenantdb
