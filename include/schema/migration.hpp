#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tenantdb {

/**
 * @brief One versioned SQL script.
 */
struct Migration {
    int64_t version = 0;
    std::string name;
    std::string sql;

    /// "0003_orders" style label used in logs and errors
    [[nodiscard]] std::string label() const;
};

/**
 * @brief Migrations in their fixed total order (ascending version).
 */
class MigrationSet {
public:
    MigrationSet() = default;

    /// @throws std::invalid_argument on a duplicate or non-positive version
    explicit MigrationSet(std::vector<Migration> migrations);

    [[nodiscard]] const std::vector<Migration>& migrations() const noexcept { return migrations_; }
    [[nodiscard]] size_t size() const noexcept { return migrations_.size(); }
    [[nodiscard]] bool empty() const noexcept { return migrations_.empty(); }

    [[nodiscard]] bool contains(int64_t version) const;
    [[nodiscard]] const Migration* find(int64_t version) const;
    [[nodiscard]] std::vector<int64_t> versions() const;

    auto begin() const { return migrations_.begin(); }
    auto end() const { return migrations_.end(); }

private:
    std::vector<Migration> migrations_;
};

} // namespace tenantdb
