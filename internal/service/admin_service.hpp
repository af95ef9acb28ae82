#pragma once

#include "internal/policy/operation_policy.hpp"
#include "internal/service/service_context.hpp"
#include "ledger/v1/admin_service.pb.h"

namespace ledger::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  ledger::v1::GetLockStatsResponse GetLockStats(const policy::Caller& caller, const ledger::v1::GetLockStatsRequest& req);

  ledger::v1::GetTopContendedResourcesResponse GetTopContendedResources(const policy::Caller&                           caller,
                                                                        const ledger::v1::GetTopContendedResourcesRequest& req);

  ledger::v1::RunExpiryResponse RunExpiry(const policy::Caller& caller, const ledger::v1::RunExpiryRequest& req);

  // Testing hooks. util::InvalidState unless enabled in config.
  ledger::v1::ForceExpireResponse ForceExpireCooldown(const policy::Caller& caller, const ledger::v1::ForceExpireRequest& req);
  ledger::v1::ForceExpireResponse ForceExpireWindow(const policy::Caller& caller, const ledger::v1::ForceExpireRequest& req);
  ledger::v1::ForceExpireResponse ForceExpireRemoval(const policy::Caller& caller, const ledger::v1::ForceExpireRequest& req);

 private:
  ServiceContext ctx_;

  void RequireTestingHooks() const;
};

} // namespace ledger::service
