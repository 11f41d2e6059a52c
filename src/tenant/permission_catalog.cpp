#include "tenant/permission_catalog.hpp"

#include <algorithm>
#include <array>

namespace tenantdb {

const std::vector<PermissionDef>& PermissionCatalog::permissions() {
    static const std::vector<PermissionDef> kPermissions = {
        // Orders
        {"orders.view", "View Orders", "orders", "View order list and details"},
        {"orders.create", "Create Orders", "orders", "Create new orders"},
        {"orders.edit", "Edit Orders", "orders", "Edit order details"},
        {"orders.cancel", "Cancel Orders", "orders", "Cancel orders"},
        {"orders.export", "Export Orders", "orders", "Export order data"},
        {"orders.bulk", "Bulk Order Operations", "orders", "Perform bulk updates on orders"},

        // Shipments
        {"shipments.view", "View Shipments", "shipments", "View shipment list and details"},
        {"shipments.create", "Create Shipments", "shipments", "Create new shipments"},
        {"shipments.cancel", "Cancel Shipments", "shipments", "Cancel shipments"},
        {"shipments.track", "Track Shipments", "shipments", "View tracking information"},
        {"shipments.bulk", "Bulk Shipment Operations", "shipments", "Perform bulk shipment creation"},
        {"shipments.export", "Export Shipments", "shipments", "Export shipment data"},

        // NDR
        {"ndr.view", "View NDR", "ndr", "View NDR inbox and records"},
        {"ndr.action", "NDR Actions", "ndr", "Perform NDR actions (call, message)"},
        {"ndr.assign", "Assign NDR", "ndr", "Assign NDR to employees"},
        {"ndr.reattempt", "Schedule Reattempt", "ndr", "Schedule delivery reattempts"},
        {"ndr.export", "Export NDR", "ndr", "Export NDR data"},
        {"ndr.bulk", "Bulk NDR Operations", "ndr", "Perform bulk NDR assign/status updates"},

        // Inventory
        {"inventory.view", "View Inventory", "inventory", "View products and stock levels"},
        {"inventory.create", "Create Products", "inventory", "Create new products"},
        {"inventory.edit", "Edit Products", "inventory", "Edit product details"},
        {"inventory.adjust", "Adjust Stock", "inventory", "Adjust stock levels"},
        {"inventory.export", "Export Inventory", "inventory", "Export inventory data"},

        // Channels
        {"channels.view", "View Channels", "channels", "View connected sales channels"},
        {"channels.connect", "Connect Channels", "channels", "Connect new sales channels"},
        {"channels.disconnect", "Disconnect Channels", "channels", "Disconnect channels"},
        {"channels.settings", "Channel Settings", "channels", "Manage channel settings"},
        {"channels.sync", "Sync Channels", "channels", "Trigger manual order and inventory sync"},

        // Team
        {"team.view", "View Team", "team", "View team members"},
        {"team.invite", "Invite Users", "team", "Invite new team members"},
        {"team.edit", "Edit Users", "team", "Edit user details"},
        {"team.delete", "Delete Users", "team", "Remove team members"},
        {"team.roles", "Manage Roles", "team", "Create and manage roles"},

        // Finance
        {"finance.view", "View Finance", "finance", "View financial reports"},
        {"finance.create", "Create Expenses", "finance", "Record expenses"},
        {"finance.export", "Export Finance", "finance", "Export financial data"},

        // Settings
        {"settings.view", "View Settings", "settings", "View tenant settings"},
        {"settings.edit", "Edit Settings", "settings", "Modify tenant settings"},

        // Analytics
        {"analytics.view", "View Analytics", "analytics", "View analytics dashboard"},
        {"analytics.export", "Export Analytics", "analytics", "Export analytics reports"},

        // Webhooks
        {"webhooks.view", "View Webhooks", "webhooks", "View webhook subscriptions and logs"},
        {"webhooks.manage", "Manage Webhooks", "webhooks", "Create, edit, and delete webhook subscriptions"},

        // Audit
        {"audit.view", "View Audit Logs", "audit", "View audit log entries"},
        {"audit.export", "Export Audit Logs", "audit", "Export audit log data"},

        // Security
        {"security.view", "View Security", "security", "View security settings"},
        {"security.configure", "Configure Security", "security", "Modify security settings"},
        {"security.audit_logs", "View Audit Logs", "security", "Access audit logs"},
        {"security.export_approve", "Approve Exports", "security", "Approve large exports"},
        {"security.sessions", "Manage Sessions", "security", "View and manage user sessions"},
        {"security.force_logout", "Force Logout", "security", "Force logout users"},

        // Data access
        {"data.view_masked", "View Masked Data", "data_access", "View masked sensitive data"},
        {"data.view_full", "View Full Data", "data_access", "View unmasked data"},
        {"data.copy", "Copy Data", "data_access", "Copy data from UI"},
        {"data.print", "Print Data", "data_access", "Print pages"},

        // Export
        {"export.orders_csv", "Export Orders CSV", "export", "Export orders as CSV"},
        {"export.orders_excel", "Export Orders Excel", "export", "Export orders as Excel"},
        {"export.customers", "Export Customers", "export", "Export customer data"},
        {"export.financial", "Export Financial", "export", "Export financial data"},
        {"export.ndr", "Export NDR", "export", "Export NDR records"},
        {"export.inventory", "Export Inventory", "export", "Export inventory data"},
        {"export.analytics", "Export Analytics", "export", "Export analytics reports"},
        {"export.bulk_api", "Bulk API Export", "export", "Access bulk export API"},
    };
    return kPermissions;
}

const std::vector<RoleDef>& PermissionCatalog::default_roles() {
    static const std::vector<RoleDef> kRoles = {
        {"Owner", "Full access to all features", true},
        {"Admin", "Administrative access", false},
        {"Manager", "Operations management", false},
        {"Staff", "Basic operational access", false},
    };
    return kRoles;
}

std::vector<std::string_view> PermissionCatalog::permissions_for_role(std::string_view role) {
    std::vector<std::string_view> codes;

    if (role == "Owner") {
        for (const auto& p : permissions()) codes.push_back(p.code);
        return codes;
    }

    if (role == "Admin") {
        static constexpr std::array<std::string_view, 2> kAdminExclude = {
            "security.force_logout", "security.export_approve"
        };
        for (const auto& p : permissions()) {
            if (std::find(kAdminExclude.begin(), kAdminExclude.end(), p.code) == kAdminExclude.end()) {
                codes.push_back(p.code);
            }
        }
        return codes;
    }

    if (role == "Manager") {
        return {
            "orders.view", "orders.create", "orders.edit", "orders.cancel", "orders.export",
            "shipments.view", "shipments.create", "shipments.cancel", "shipments.track", "shipments.export",
            "ndr.view", "ndr.action", "ndr.reattempt",
            "inventory.view", "inventory.adjust",
            "team.view",
            "analytics.view",
            "data.view_masked",
        };
    }

    if (role == "Staff") {
        return {
            "orders.view", "orders.create",
            "shipments.view", "shipments.track",
            "ndr.view", "ndr.action",
            "inventory.view",
            "data.view_masked",
        };
    }

    return codes;
}

} // namespace tenantdb
