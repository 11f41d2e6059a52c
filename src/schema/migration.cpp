#include "schema/migration.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace tenantdb {

std::string Migration::label() const {
    return std::format("{:04d}_{}", version, name);
}

MigrationSet::MigrationSet(std::vector<Migration> migrations)
    : migrations_(std::move(migrations)) {
    std::sort(migrations_.begin(), migrations_.end(),
              [](const Migration& a, const Migration& b) { return a.version < b.version; });

    for (size_t i = 0; i < migrations_.size(); ++i) {
        if (migrations_[i].version <= 0) {
            throw std::invalid_argument(std::format(
                "Migration '{}' has non-positive version {}", migrations_[i].name, migrations_[i].version));
        }
        if (i > 0 && migrations_[i].version == migrations_[i - 1].version) {
            throw std::invalid_argument(std::format(
                "Duplicate migration version {} ('{}' and '{}')",
                migrations_[i].version, migrations_[i - 1].name, migrations_[i].name));
        }
    }
}

const Migration* MigrationSet::find(int64_t version) const {
    const auto it = std::lower_bound(migrations_.begin(), migrations_.end(), version,
        [](const Migration& m, int64_t v) { return m.version < v; });
    if (it == migrations_.end() || it->version != version) {
        return nullptr;
    }
    return &*it;
}

bool MigrationSet::contains(int64_t version) const {
    return find(version) != nullptr;
}

std::vector<int64_t> MigrationSet::versions() const {
    std::vector<int64_t> out;
    out.reserve(migrations_.size());
    for (const auto& m : migrations_) {
        out.push_back(m.version);
    }
    return out;
}

} // namespace tenantdb
