#pragma once

#include "core/bounded_parallel.hpp"
#include "core/cancellation_coordinator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "schema/batch_report.hpp"
#include <algorithm>
#include <format>
#include <string>
#include <variant>
#include <vector>

namespace tenantdb {

/**
 * @brief Run fn for every tenant with bounded parallelism and fold the
 *        outcomes into a BatchReport.
 *
 * fn(const TenantRef&) returns a TenantSuccess or throws. Exceptions are
 * recorded against that tenant only; siblings keep running. Tenants not
 * launched because of cancellation are reported as skipped. Report order
 * follows the input order, not completion order.
 */
template<typename Fn>
BatchReport run_tenant_batch(std::string operation,
                             const std::vector<TenantRef>& tenants,
                             size_t max_workers,
                             CancellationCoordinator* cancel,
                             Fn&& fn) {
    using Outcome = std::variant<std::monostate, TenantSuccess, TenantFailure>;
    std::vector<Outcome> outcomes(tenants.size());

    const utils::Timer timer;
    utils::log::info(std::format("{}: starting over {} tenants ({} workers)",
        operation, tenants.size(), std::max<size_t>(1, max_workers)));

    // Each worker writes only its own slot
    std::vector<size_t> indices(tenants.size());
    for (size_t i = 0; i < indices.size(); ++i) indices[i] = i;

    const auto launched = for_each_bounded(indices, max_workers, cancel, [&](size_t i) {
        const TenantRef& tenant = tenants[i];
        try {
            outcomes[i] = fn(tenant);
        } catch (const TenantDbError& e) {
            outcomes[i] = TenantFailure{tenant, e.category(), e.what()};
        } catch (const std::exception& e) {
            outcomes[i] = TenantFailure{tenant, ErrorCategory::INTERNAL_ERROR, e.what()};
        }
        if (const auto* f = std::get_if<TenantFailure>(&outcomes[i])) {
            utils::log::warn(std::format("{}: tenant '{}' ({}) failed [{}]: {}",
                operation, tenant.slug, tenant.schema_name, category_name(f->category), f->error));
        }
    });

    BatchReport report;
    report.operation = std::move(operation);
    for (size_t i = 0; i < tenants.size(); ++i) {
        if (!launched[i]) {
            report.skipped.push_back(tenants[i]);
            continue;
        }
        if (auto* s = std::get_if<TenantSuccess>(&outcomes[i])) {
            report.succeeded.push_back(std::move(*s));
        } else if (auto* f = std::get_if<TenantFailure>(&outcomes[i])) {
            report.failed.push_back(std::move(*f));
        } else {
            report.failed.push_back(TenantFailure{tenants[i], ErrorCategory::INTERNAL_ERROR,
                                                  "Tenant task produced no outcome"});
        }
    }
    report.cancelled = cancel != nullptr && cancel->is_cancelled() && !report.skipped.empty();

    const auto line = std::format("{} in {} ms", report.summary(), timer.elapsed_ms().count());
    if (report.failed.empty() && !report.cancelled) {
        utils::log::info(line);
    } else {
        utils::log::warn(line);
    }
    return report;
}

} // namespace tenantdb
