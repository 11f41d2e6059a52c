#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tenantdb {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::seconds idle_timeout{300};
    std::chrono::seconds max_lifetime{3600};
    std::string health_check_query = "SELECT 1";
    uint32_t statement_timeout_ms = 0;  // 0 = server default
};

struct RoutingConfig {
    std::string shared_schema = "shared";
    std::string tenant_schema_prefix = "tenant_";
    bool include_public = true;  // append public to search_path (extension functions)
};

struct MigrationsConfig {
    std::string tenant_directory = "migrations/tenant";
    std::string shared_directory = "migrations/shared";
    size_t max_parallel_tenants = 4;
    bool run_on_startup = true;
};

struct PatchesConfig {
    std::string catalog_file = "config/patches.toml";
    bool run_on_startup = true;
};

struct LoggingConfig {
    std::string level = "info";
};

struct TenantDbConfig {
    DatabaseConfig database;
    RoutingConfig routing;
    MigrationsConfig migrations;
    PatchesConfig patches;
    LoggingConfig logging;
};

} // namespace tenantdb
