#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tenantdb {

enum class PatchStepKind {
    ADD_COLUMN,
    CREATE_TABLE,
    CREATE_INDEX
};

[[nodiscard]] std::string_view patch_step_kind_name(PatchStepKind kind);
[[nodiscard]] std::optional<PatchStepKind> parse_patch_step_kind(std::string_view name);

/**
 * @brief One guarded structural change: performed only if the object is absent.
 *
 * Names are identifiers and are always quoted when turned into DDL.
 * definition is a SQL fragment (column type, or a table body) taken as-is.
 */
struct PatchStep {
    PatchStepKind kind = PatchStepKind::ADD_COLUMN;
    std::string table;
    std::string column;
    std::string definition;
    std::string index;
    std::vector<std::string> columns;

    [[nodiscard]] static PatchStep add_column(std::string table, std::string column, std::string definition);
    [[nodiscard]] static PatchStep create_table(std::string table, std::string definition);
    [[nodiscard]] static PatchStep create_index(std::string index, std::string table, std::vector<std::string> columns);

    [[nodiscard]] std::string describe() const;
};

struct SchemaPatch {
    std::string id;
    std::string description;
    std::vector<PatchStep> steps;
};

/**
 * @brief Catalog of named patches, in declaration order.
 */
class PatchSet {
public:
    PatchSet() = default;

    /// @throws std::invalid_argument on a duplicate or empty id, or a patch with no steps
    explicit PatchSet(std::vector<SchemaPatch> patches);

    [[nodiscard]] const std::vector<SchemaPatch>& patches() const noexcept { return patches_; }
    [[nodiscard]] const SchemaPatch* find(std::string_view id) const;
    [[nodiscard]] size_t size() const noexcept { return patches_.size(); }
    [[nodiscard]] bool empty() const noexcept { return patches_.empty(); }

private:
    std::vector<SchemaPatch> patches_;
};

enum class PatchOutcome {
    APPLIED,
    ALREADY_APPLIED,
    FAILED
};

[[nodiscard]] std::string_view patch_outcome_name(PatchOutcome outcome);

struct PatchResult {
    PatchOutcome outcome = PatchOutcome::FAILED;
    std::string error;                 // set when FAILED
    std::vector<std::string> actions;  // steps that changed the schema
};

} // namespace tenantdb
