#include "schema/migration_loader.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tenantdb {

std::optional<std::pair<int64_t, std::string>> MigrationLoader::parse_filename(std::string_view filename) {
    constexpr std::string_view kExt = ".sql";
    if (!filename.ends_with(kExt)) {
        return std::nullopt;
    }
    const std::string_view stem = filename.substr(0, filename.size() - kExt.size());

    const auto underscore = stem.find('_');
    if (underscore == std::string_view::npos || underscore == 0 || underscore + 1 >= stem.size()) {
        return std::nullopt;
    }

    const auto version = utils::try_parse_int<int64_t>(stem.substr(0, underscore));
    if (!version || *version <= 0) {
        return std::nullopt;
    }
    return std::make_pair(*version, std::string(stem.substr(underscore + 1)));
}

Result<MigrationSet> MigrationLoader::load_directory(const std::string& directory) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Result<MigrationSet>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Migration directory not found: {}", directory));
    }

    std::vector<Migration> migrations;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const std::string filename = entry.path().filename().string();
        if (entry.path().extension() != ".sql") {
            continue;
        }

        const auto parsed = parse_filename(filename);
        if (!parsed) {
            return Result<MigrationSet>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Migration file '{}' does not match NNNN_name.sql", filename));
        }

        std::ifstream in(entry.path());
        if (!in) {
            return Result<MigrationSet>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Cannot read migration file '{}'", entry.path().string()));
        }
        std::ostringstream body;
        body << in.rdbuf();

        migrations.push_back(Migration{parsed->first, parsed->second, body.str()});
    }
    if (ec) {
        return Result<MigrationSet>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Cannot list migration directory '{}': {}", directory, ec.message()));
    }

    try {
        MigrationSet set(std::move(migrations));
        utils::log::debug(std::format("Loaded {} migrations from {}", set.size(), directory));
        return Result<MigrationSet>::ok(std::move(set));
    } catch (const std::invalid_argument& e) {
        return Result<MigrationSet>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Invalid migration set in {}: {}", directory, e.what()));
    }
}

} // namespace tenantdb
