#include "schema/patch_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace tenantdb {

namespace {

std::string require_string(const toml::table& tbl, std::string_view key, const std::string& where) {
    const std::string value = tbl[key].value_or(""s);
    if (value.empty()) {
        throw std::runtime_error(std::format("{}.{} is required", where, key));
    }
    return value;
}

PatchStep extract_step(const toml::table& s, const std::string& where) {
    const std::string kind_name = require_string(s, "kind", where);
    const auto kind = parse_patch_step_kind(kind_name);
    if (!kind) {
        throw std::runtime_error(std::format(
            "{}.kind '{}' is not one of add_column, create_table, create_index", where, kind_name));
    }

    switch (*kind) {
        case PatchStepKind::ADD_COLUMN:
            return PatchStep::add_column(require_string(s, "table", where),
                                         require_string(s, "column", where),
                                         require_string(s, "definition", where));
        case PatchStepKind::CREATE_TABLE:
            return PatchStep::create_table(require_string(s, "table", where),
                                           require_string(s, "definition", where));
        case PatchStepKind::CREATE_INDEX: {
            std::vector<std::string> columns;
            if (const auto* arr = s["columns"].as_array()) {
                for (const auto& elem : *arr) {
                    if (auto v = elem.value<std::string>()) {
                        columns.push_back(*v);
                    }
                }
            }
            if (columns.empty()) {
                throw std::runtime_error(std::format("{}.columns must list at least one column", where));
            }
            return PatchStep::create_index(require_string(s, "index", where),
                                           require_string(s, "table", where),
                                           std::move(columns));
        }
    }
    throw std::runtime_error(std::format("{}: unhandled step kind", where));
}

PatchSet extract_patches(const toml::table& root) {
    std::vector<SchemaPatch> patches;
    const auto* arr = root["patch"].as_array();
    if (!arr) {
        return PatchSet{};
    }

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* p = (*arr)[i].as_table();
        const std::string where = std::format("patch[{}]", i);
        if (!p) {
            throw std::runtime_error(std::format("{} must be a table", where));
        }

        SchemaPatch patch;
        patch.id = require_string(*p, "id", where);
        patch.description = (*p)["description"].value_or(""s);

        if (const auto* steps = (*p)["step"].as_array()) {
            for (size_t j = 0; j < steps->size(); ++j) {
                const auto* s = (*steps)[j].as_table();
                const std::string step_where = std::format("{}.step[{}]", where, j);
                if (!s) {
                    throw std::runtime_error(std::format("{} must be a table", step_where));
                }
                patch.steps.push_back(extract_step(*s, step_where));
            }
        }
        patches.push_back(std::move(patch));
    }

    return PatchSet(std::move(patches));
}

} // anonymous namespace

Result<PatchSet> PatchLoader::load_from_file(const std::string& path) {
    try {
        const auto tbl = toml::parse_file(path);
        auto set = extract_patches(tbl);
        utils::log::debug(std::format("Loaded {} schema patches from {}", set.size(), path));
        return Result<PatchSet>::ok(std::move(set));
    } catch (const std::exception& e) {
        return Result<PatchSet>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to load patch catalog {}: {}", path, e.what()));
    }
}

Result<PatchSet> PatchLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return Result<PatchSet>::ok(extract_patches(tbl));
    } catch (const std::exception& e) {
        return Result<PatchSet>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to parse patch catalog: {}", e.what()));
    }
}

} // namespace tenantdb
