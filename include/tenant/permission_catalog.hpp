#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tenantdb {

struct PermissionDef {
    std::string_view code;
    std::string_view name;
    std::string_view module;
    std::string_view description;
};

struct RoleDef {
    std::string_view name;
    std::string_view description;
    bool is_system = false;
};

/**
 * @brief Fixed permission catalog and default role table seeded into every tenant.
 */
class PermissionCatalog {
public:
    [[nodiscard]] static const std::vector<PermissionDef>& permissions();

    /// Owner, Admin, Manager, Staff
    [[nodiscard]] static const std::vector<RoleDef>& default_roles();

    /// Permission codes granted to a default role; empty for an unknown role
    [[nodiscard]] static std::vector<std::string_view> permissions_for_role(std::string_view role);

    static constexpr std::string_view kOwnerRole = "Owner";
};

} // namespace tenantdb
