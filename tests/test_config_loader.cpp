#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

using namespace tenantdb;

namespace {

bool has_error_for(const std::vector<std::string>& errors, const std::string& key) {
    return std::any_of(errors.begin(), errors.end(),
        [&](const std::string& e) { return e.find(key) != std::string::npos; });
}

TenantDbConfig valid_config() {
    TenantDbConfig cfg;
    cfg.database.connection_string = "host=localhost dbname=app";
    return cfg;
}

} // namespace

TEST_CASE("Config: minimal file takes defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost dbname=app"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.database.max_connections == 10);
    CHECK(cfg.database.min_connections == 1);
    CHECK(cfg.routing.shared_schema == "shared");
    CHECK(cfg.routing.tenant_schema_prefix == "tenant_");
    CHECK(cfg.routing.include_public);
    CHECK(cfg.migrations.tenant_directory == "migrations/tenant");
    CHECK(cfg.migrations.max_parallel_tenants == 4);
    CHECK(cfg.migrations.run_on_startup);
    CHECK(cfg.patches.catalog_file == "config/patches.toml");
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("Config: every section is read", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=db dbname=app"
min_connections = 2
max_connections = 6
connection_timeout_ms = 1500
idle_timeout_seconds = 60
max_lifetime_seconds = 600
statement_timeout_ms = 30000

[routing]
shared_schema = "platform"
tenant_schema_prefix = "t_"
include_public = false

[migrations]
tenant_directory = "/srv/migrations/tenant"
shared_directory = "/srv/migrations/shared"
max_parallel_tenants = 5
run_on_startup = false

[patches]
catalog_file = "/srv/patches.toml"
run_on_startup = false

[logging]
level = "debug"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.database.min_connections == 2);
    CHECK(cfg.database.max_connections == 6);
    CHECK(cfg.database.connection_timeout == std::chrono::milliseconds(1500));
    CHECK(cfg.database.idle_timeout == std::chrono::seconds(60));
    CHECK(cfg.database.max_lifetime == std::chrono::seconds(600));
    CHECK(cfg.database.statement_timeout_ms == 30000);
    CHECK(cfg.routing.shared_schema == "platform");
    CHECK(cfg.routing.tenant_schema_prefix == "t_");
    CHECK_FALSE(cfg.routing.include_public);
    CHECK(cfg.migrations.shared_directory == "/srv/migrations/shared");
    CHECK(cfg.migrations.max_parallel_tenants == 5);
    CHECK_FALSE(cfg.migrations.run_on_startup);
    CHECK_FALSE(cfg.patches.run_on_startup);
    CHECK(cfg.logging.level == "debug");
}

TEST_CASE("Config: env vars expand in string values", "[config][env]") {
    ::setenv("TENANTDB_TEST_DB_URL", "host=pg password=s3cret", 1);
    ::unsetenv("TENANTDB_TEST_UNSET_XYZ");

    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "${TENANTDB_TEST_DB_URL} dbname=app${TENANTDB_TEST_UNSET_XYZ}"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=pg password=s3cret dbname=app");

    ::unsetenv("TENANTDB_TEST_DB_URL");
}

TEST_CASE("Config: unclosed substitution is an error", "[config][env]") {
    CHECK_THROWS_AS(ConfigLoader::expand_env_vars("host=${DB_HOST"), std::runtime_error);

    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=${DB_HOST"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("Config: malformed TOML is reported", "[config]") {
    auto result = ConfigLoader::load_from_string("[database\nconnection_string = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

TEST_CASE("Config: missing file is reported", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/tenantdb.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

TEST_CASE("Config: validation names the offending key", "[config][validation]") {
    CHECK(ConfigLoader::validate_config(valid_config()).empty());

    SECTION("empty connection string") {
        auto cfg = valid_config();
        cfg.database.connection_string.clear();
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "database.connection_string"));
    }
    SECTION("pool bounds") {
        auto cfg = valid_config();
        cfg.database.min_connections = 5;
        cfg.database.max_connections = 2;
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "database.min_connections (5) > max_connections (2)"));
        cfg.database.max_connections = 0;
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "database.max_connections"));
    }
    SECTION("shared schema") {
        auto cfg = valid_config();
        cfg.routing.shared_schema = "pg_catalog";
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "system schema"));
        cfg.routing.shared_schema = "Shared-Data";
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "routing.shared_schema"));
        cfg.routing.shared_schema = "tenant_shared";
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "must not start with routing.tenant_schema_prefix"));
    }
    SECTION("tenant prefix") {
        auto cfg = valid_config();
        cfg.routing.tenant_schema_prefix = "";
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "routing.tenant_schema_prefix"));
    }
    SECTION("parallelism and directories") {
        auto cfg = valid_config();
        cfg.migrations.max_parallel_tenants = 0;
        cfg.migrations.tenant_directory.clear();
        const auto errors = ConfigLoader::validate_config(cfg);
        CHECK(errors.size() == 2);
        CHECK(has_error_for(errors, "migrations.max_parallel_tenants"));
        CHECK(has_error_for(errors, "migrations.tenant_directory"));
    }
    SECTION("more workers than pooled connections") {
        auto cfg = valid_config();
        cfg.database.max_connections = 4;
        cfg.migrations.max_parallel_tenants = 4;
        CHECK(ConfigLoader::validate_config(cfg).empty());
        cfg.migrations.max_parallel_tenants = 5;
        CHECK(has_error_for(ConfigLoader::validate_config(cfg),
            "migrations.max_parallel_tenants (5) > database.max_connections (4)"));
    }
    SECTION("log level") {
        auto cfg = valid_config();
        cfg.logging.level = "verbose";
        CHECK(has_error_for(ConfigLoader::validate_config(cfg), "logging.level 'verbose'"));
    }
}

TEST_CASE("Config: negative counts fail validation instead of wrapping", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=db"
max_connections = -1
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("database.max_connections must be > 0") != std::string::npos);
}
