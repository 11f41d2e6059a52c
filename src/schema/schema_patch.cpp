#include "schema/schema_patch.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <unordered_set>

namespace tenantdb {

std::string_view patch_step_kind_name(PatchStepKind kind) {
    switch (kind) {
        case PatchStepKind::ADD_COLUMN:   return "add_column";
        case PatchStepKind::CREATE_TABLE: return "create_table";
        case PatchStepKind::CREATE_INDEX: return "create_index";
    }
    return "unknown";
}

std::optional<PatchStepKind> parse_patch_step_kind(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "add_column") return PatchStepKind::ADD_COLUMN;
    if (lower == "create_table") return PatchStepKind::CREATE_TABLE;
    if (lower == "create_index") return PatchStepKind::CREATE_INDEX;
    return std::nullopt;
}

std::string_view patch_outcome_name(PatchOutcome outcome) {
    switch (outcome) {
        case PatchOutcome::APPLIED:         return "applied";
        case PatchOutcome::ALREADY_APPLIED: return "already_applied";
        case PatchOutcome::FAILED:          return "failed";
    }
    return "unknown";
}

PatchStep PatchStep::add_column(std::string table, std::string column, std::string definition) {
    PatchStep step;
    step.kind = PatchStepKind::ADD_COLUMN;
    step.table = std::move(table);
    step.column = std::move(column);
    step.definition = std::move(definition);
    return step;
}

PatchStep PatchStep::create_table(std::string table, std::string definition) {
    PatchStep step;
    step.kind = PatchStepKind::CREATE_TABLE;
    step.table = std::move(table);
    step.definition = std::move(definition);
    return step;
}

PatchStep PatchStep::create_index(std::string index, std::string table, std::vector<std::string> columns) {
    PatchStep step;
    step.kind = PatchStepKind::CREATE_INDEX;
    step.index = std::move(index);
    step.table = std::move(table);
    step.columns = std::move(columns);
    return step;
}

std::string PatchStep::describe() const {
    switch (kind) {
        case PatchStepKind::ADD_COLUMN:
            return std::format("add column {}.{}", table, column);
        case PatchStepKind::CREATE_TABLE:
            return std::format("create table {}", table);
        case PatchStepKind::CREATE_INDEX:
            return std::format("create index {} on {}({})", index, table, utils::join(columns, ", "));
    }
    return "unknown step";
}

PatchSet::PatchSet(std::vector<SchemaPatch> patches)
    : patches_(std::move(patches)) {
    std::unordered_set<std::string> seen;
    for (const auto& p : patches_) {
        if (p.id.empty()) {
            throw std::invalid_argument("Patch id must not be empty");
        }
        if (!seen.insert(p.id).second) {
            throw std::invalid_argument(std::format("Duplicate patch id '{}'", p.id));
        }
        if (p.steps.empty()) {
            throw std::invalid_argument(std::format("Patch '{}' has no steps", p.id));
        }
    }
}

const SchemaPatch* PatchSet::find(std::string_view id) const {
    for (const auto& p : patches_) {
        if (p.id == id) {
            return &p;
        }
    }
    return nullptr;
}

} // namespace tenantdb
