#include "operation_policy.hpp"

#include "internal/util/errors.hpp"

namespace ledger::policy {

namespace {

OperationPolicy Route(std::string route, std::vector<std::string> roles = {}, bool rate_limited = true, uint32_t max_requests = 0,
                      int64_t window_ms = 0) {
  return OperationPolicy{std::move(route), std::move(roles), rate_limited, max_requests, window_ms};
}

} // namespace

const std::vector<OperationPolicy>& OperationPolicies() {
  const std::string admin(kAdminRole);

  static const std::vector<OperationPolicy> policies = {
      Route("BalanceService.UpdateBalance"),
      Route("BalanceService.UpdateBalanceBatch"),
      Route("BalanceService.GetBalances"),
      Route("BalanceService.GetOperation"),
      Route("BalanceService.GetStatistics"),
      Route("BalanceService.GetAssetLimits", {}, false),

      // Exclusion changes are rare; keep them tight.
      Route("ExclusionService.CreateSelfExclusion", {}, true, 10, 60000),
      Route("ExclusionService.CancelSelfExclusion", {}, true, 10, 60000),
      Route("ExclusionService.ExtendSelfExclusion", {}, true, 10, 60000),
      Route("ExclusionService.ListSelfExclusions"),
      Route("ExclusionService.GetActiveSelfExclusions"),
      Route("ExclusionService.GetGamblingLimits"),
      Route("ExclusionService.HasActiveSelfExclusion", {}, false),
      Route("ExclusionService.CheckAccess", {}, false),

      Route("AdminService.GetLockStats", {admin}, false),
      Route("AdminService.GetTopContendedResources", {admin}, false),
      Route("AdminService.RunExpiry", {admin}, false),
      Route("AdminService.ForceExpireCooldown", {admin}, false),
      Route("AdminService.ForceExpireWindow", {admin}, false),
      Route("AdminService.ForceExpireRemoval", {admin}, false),
  };
  return policies;
}

const OperationPolicy& PolicyFor(std::string_view route) {
  for (const auto& policy : OperationPolicies()) {
    if (policy.route == route) return policy;
  }
  throw util::InvalidState("no policy for route " + std::string(route));
}

} // namespace ledger::policy
