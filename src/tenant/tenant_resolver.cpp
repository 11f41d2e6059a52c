#include "tenant/tenant_resolver.hpp"
#include "tenant/tenant_directory.hpp"
#include "db/schema_router.hpp"

namespace tenantdb {

TenantResolver::TenantResolver(std::shared_ptr<TenantDirectory> directory,
                               std::shared_ptr<SchemaRouter> router)
    : directory_(std::move(directory)), router_(std::move(router)) {}

UnitOfWork TenantResolver::begin_unit_of_work(const std::string& identifier) {
    Tenant tenant = directory_->resolve(identifier);

    UnitOfWork uow = router_->new_unit_of_work();
    uow.set_tenant(std::move(tenant.id), tenant.schema_name, std::move(tenant.slug));
    return uow;
}

} // namespace tenantdb
