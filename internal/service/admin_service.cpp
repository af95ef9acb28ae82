#include "admin_service.hpp"

#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/scheduler/expiry_scheduler.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::service {

using namespace ledger::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void AdminService::RequireTestingHooks() const {
  if (!ctx_.testing_hooks_enabled) {
    throw util::InvalidState("testing hooks are disabled; set admin.testing_hooks_enabled");
  }
}

GetLockStatsResponse AdminService::GetLockStats(const policy::Caller& caller, const GetLockStatsRequest& req) {
  return ObserveRpc(ctx_, "AdminService.GetLockStats", caller, [&] {
    std::optional<std::string> resource;
    if (!req.resource().empty()) resource = req.resource();

    GetLockStatsResponse resp;
    *resp.mutable_stats() = ToProto(ctx_.locks->Metrics().Stats(resource));
    return resp;
  });
}

GetTopContendedResourcesResponse AdminService::GetTopContendedResources(const policy::Caller& caller, const GetTopContendedResourcesRequest& req) {
  return ObserveRpc(ctx_, "AdminService.GetTopContendedResources", caller, [&] {
    const std::size_t limit = req.limit() == 0 ? 10 : req.limit();

    GetTopContendedResourcesResponse resp;
    for (const auto& stats : ctx_.locks->Metrics().TopContended(limit)) {
      *resp.add_resources() = ToProto(stats);
    }
    return resp;
  });
}

RunExpiryResponse AdminService::RunExpiry(const policy::Caller& caller, const RunExpiryRequest&) {
  return ObserveRpc(ctx_, "AdminService.RunExpiry", caller, [&] {
    const auto report = ctx_.scheduler->RunOnce();

    RunExpiryResponse resp;
    resp.set_cooldowns_windowed(report.cooldowns_windowed);
    resp.set_windows_removed(report.windows_removed);
    resp.set_temporaries_expired(report.temporaries_expired);
    resp.set_limits_removed(report.limits_removed);
    resp.set_skipped(report.skipped);
    return resp;
  });
}

ForceExpireResponse AdminService::ForceExpireCooldown(const policy::Caller& caller, const ForceExpireRequest& req) {
  return ObserveRpc(ctx_, "AdminService.ForceExpireCooldown", caller, [&] {
    RequireTestingHooks();

    ForceExpireResponse resp;
    *resp.mutable_exclusion() = ToProto(ctx_.exclusions->ForceExpireCooldown(req.exclusion_id()), util::NowMs());
    return resp;
  });
}

ForceExpireResponse AdminService::ForceExpireWindow(const policy::Caller& caller, const ForceExpireRequest& req) {
  return ObserveRpc(ctx_, "AdminService.ForceExpireWindow", caller, [&] {
    RequireTestingHooks();

    ForceExpireResponse resp;
    *resp.mutable_exclusion() = ToProto(ctx_.exclusions->ForceExpireWindow(req.exclusion_id()), util::NowMs());
    return resp;
  });
}

ForceExpireResponse AdminService::ForceExpireRemoval(const policy::Caller& caller, const ForceExpireRequest& req) {
  return ObserveRpc(ctx_, "AdminService.ForceExpireRemoval", caller, [&] {
    RequireTestingHooks();

    ForceExpireResponse resp;
    *resp.mutable_exclusion() = ToProto(ctx_.exclusions->ForceExpireRemoval(req.exclusion_id()), util::NowMs());
    return resp;
  });
}

} // namespace ledger::service
