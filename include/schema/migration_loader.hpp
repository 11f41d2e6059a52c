#pragma once

#include "core/error.hpp"
#include "schema/migration.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tenantdb {

/**
 * @brief Builds a MigrationSet from a directory of NNNN_name.sql files.
 *
 * Files without the .sql extension are ignored. A .sql file whose name does
 * not start with a numeric version followed by '_' is an error, as is a
 * duplicate version.
 */
class MigrationLoader {
public:
    [[nodiscard]] static Result<MigrationSet> load_directory(const std::string& directory);

    /// "0003_add_orders.sql" -> {3, "add_orders"}
    [[nodiscard]] static std::optional<std::pair<int64_t, std::string>> parse_filename(std::string_view filename);
};

} // namespace tenantdb
