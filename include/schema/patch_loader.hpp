#pragma once

#include "core/error.hpp"
#include "schema/schema_patch.hpp"
#include <string>

namespace tenantdb {

/**
 * @brief Reads the patch catalog: [[patch]] tables with [[patch.step]] entries.
 *
 * Example:
 *   [[patch]]
 *   id = "shipment_external_ids"
 *   description = "External order/shipment ids on shipments"
 *     [[patch.step]]
 *     kind = "add_column"
 *     table = "shipments"
 *     column = "external_order_id"
 *     definition = "VARCHAR(100)"
 */
class PatchLoader {
public:
    [[nodiscard]] static Result<PatchSet> load_from_file(const std::string& path);
    [[nodiscard]] static Result<PatchSet> load_from_string(const std::string& toml_content);
};

} // namespace tenantdb
