#pragma once

#include "config/config_types.hpp"
#include <string>
#include <vector>

namespace tenantdb {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        TenantDbConfig config;

        static LoadResult ok(TenantDbConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file; ${VAR} in string values is expanded
     * @param config_path Path to tenantdb.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// @return one message per problem, each naming the offending key
    [[nodiscard]] static std::vector<std::string> validate_config(const TenantDbConfig& config);

    /// ${VAR} substitution; unset variables expand to empty
    /// @throws std::runtime_error on an unclosed ${
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);
};

} // namespace tenantdb
