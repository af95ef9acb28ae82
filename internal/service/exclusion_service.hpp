#pragma once

#include "internal/policy/operation_policy.hpp"
#include "internal/service/service_context.hpp"
#include "ledger/v1/exclusion_service.pb.h"

namespace ledger::service {

class ExclusionService {
 public:
  explicit ExclusionService(ServiceContext ctx);

  ledger::v1::CreateSelfExclusionResponse CreateSelfExclusion(const policy::Caller& caller, const ledger::v1::CreateSelfExclusionRequest& req);

  ledger::v1::CancelSelfExclusionResponse CancelSelfExclusion(const policy::Caller& caller, const ledger::v1::CancelSelfExclusionRequest& req);

  ledger::v1::ListSelfExclusionsResponse ListSelfExclusions(const policy::Caller& caller, const ledger::v1::ListSelfExclusionsRequest& req);

  ledger::v1::GetActiveSelfExclusionsResponse GetActiveSelfExclusions(const policy::Caller&                          caller,
                                                                      const ledger::v1::GetActiveSelfExclusionsRequest& req);

  ledger::v1::GetGamblingLimitsResponse GetGamblingLimits(const policy::Caller& caller, const ledger::v1::GetGamblingLimitsRequest& req);

  ledger::v1::ExtendSelfExclusionResponse ExtendSelfExclusion(const policy::Caller& caller, const ledger::v1::ExtendSelfExclusionRequest& req);

  ledger::v1::HasActiveSelfExclusionResponse HasActiveSelfExclusion(const policy::Caller&                         caller,
                                                                    const ledger::v1::HasActiveSelfExclusionRequest& req);

  // Throws util::SelfExclusionActive when the action is denied.
  ledger::v1::CheckAccessResponse CheckAccess(const policy::Caller& caller, const ledger::v1::CheckAccessRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ledger::service
