#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/schema_identifier.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace tenantdb {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = ConfigLoader::expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// Negative integers would wrap when cast to size_t; clamp them to 0 so validation catches them
size_t as_count(int64_t v) {
    return v < 0 ? 0 : static_cast<size_t>(v);
}

// ---- Section extractors ----------------------------------------------------

DatabaseConfig extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.min_connections = as_count(d["min_connections"].value_or(int64_t{1}));
    cfg.max_connections = as_count(d["max_connections"].value_or(int64_t{10}));
    cfg.connection_timeout = std::chrono::milliseconds(d["connection_timeout_ms"].value_or(int64_t{5000}));
    cfg.idle_timeout = std::chrono::seconds(d["idle_timeout_seconds"].value_or(int64_t{300}));
    cfg.max_lifetime = std::chrono::seconds(d["max_lifetime_seconds"].value_or(int64_t{3600}));
    cfg.health_check_query = d["health_check_query"].value_or("SELECT 1"s);
    cfg.statement_timeout_ms = static_cast<uint32_t>(as_count(d["statement_timeout_ms"].value_or(int64_t{0})));
    return cfg;
}

RoutingConfig extract_routing(const toml::table& root) {
    RoutingConfig cfg;
    const auto* routing = root["routing"].as_table();
    if (!routing) return cfg;
    const auto& r = *routing;

    cfg.shared_schema = r["shared_schema"].value_or(cfg.shared_schema);
    cfg.tenant_schema_prefix = r["tenant_schema_prefix"].value_or(cfg.tenant_schema_prefix);
    cfg.include_public = r["include_public"].value_or(cfg.include_public);
    return cfg;
}

MigrationsConfig extract_migrations(const toml::table& root) {
    MigrationsConfig cfg;
    const auto* migrations = root["migrations"].as_table();
    if (!migrations) return cfg;
    const auto& m = *migrations;

    cfg.tenant_directory = m["tenant_directory"].value_or(cfg.tenant_directory);
    cfg.shared_directory = m["shared_directory"].value_or(cfg.shared_directory);
    cfg.max_parallel_tenants = as_count(m["max_parallel_tenants"].value_or(int64_t{4}));
    cfg.run_on_startup = m["run_on_startup"].value_or(cfg.run_on_startup);
    return cfg;
}

PatchesConfig extract_patches(const toml::table& root) {
    PatchesConfig cfg;
    const auto* patches = root["patches"].as_table();
    if (!patches) return cfg;
    const auto& p = *patches;

    cfg.catalog_file = p["catalog_file"].value_or(cfg.catalog_file);
    cfg.run_on_startup = p["run_on_startup"].value_or(cfg.run_on_startup);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

TenantDbConfig extract_all_sections(const toml::table& tbl) {
    TenantDbConfig config;
    config.database = extract_database(tbl);
    config.routing = extract_routing(tbl);
    config.migrations = extract_migrations(tbl);
    config.patches = extract_patches(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(TenantDbConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TenantDbConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (db.connection_string.empty()) {
        errors.push_back("database.connection_string must not be empty");
    }
    if (db.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format(
            "database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.connection_timeout.count() <= 0) {
        errors.push_back("database.connection_timeout_ms must be > 0");
    }

    const auto& routing = config.routing;
    if (!SchemaIdentifier::is_valid(routing.shared_schema)) {
        errors.push_back(std::format(
            "routing.shared_schema '{}' must be a lower-case identifier of at most {} bytes",
            routing.shared_schema, kMaxIdentifierLength));
    } else if (is_system_schema(routing.shared_schema)) {
        errors.push_back(std::format("routing.shared_schema '{}' must not be a system schema",
            routing.shared_schema));
    }
    if (routing.tenant_schema_prefix.empty()) {
        errors.push_back("routing.tenant_schema_prefix must not be empty");
    } else if (!SchemaIdentifier::is_valid(routing.tenant_schema_prefix)) {
        errors.push_back(std::format("routing.tenant_schema_prefix '{}' must be a lower-case identifier",
            routing.tenant_schema_prefix));
    } else if (routing.shared_schema.starts_with(routing.tenant_schema_prefix)) {
        errors.push_back("routing.shared_schema must not start with routing.tenant_schema_prefix");
    }

    if (config.migrations.max_parallel_tenants == 0) {
        errors.push_back("migrations.max_parallel_tenants must be >= 1");
    } else if (db.max_connections > 0 && config.migrations.max_parallel_tenants > db.max_connections) {
        // Each worker holds one connection for a whole tenant
        errors.push_back(std::format(
            "migrations.max_parallel_tenants ({}) > database.max_connections ({})",
            config.migrations.max_parallel_tenants, db.max_connections));
    }
    if (config.migrations.tenant_directory.empty()) {
        errors.push_back("migrations.tenant_directory must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' must be one of debug, info, warn, error",
            config.logging.level));
    }

    return errors;
}

} // namespace tenantdb
