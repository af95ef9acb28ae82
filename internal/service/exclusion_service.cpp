#include "exclusion_service.hpp"

#include "internal/exclusion/access_guard.hpp"
#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/time.hpp"

namespace ledger::service {

using namespace ledger::v1;

namespace {

std::optional<PlatformType> Segment(PlatformType platform) {
  if (platform == PLATFORM_TYPE_UNSPECIFIED) return std::nullopt;
  return platform;
}

} // namespace

ExclusionService::ExclusionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateSelfExclusionResponse ExclusionService::CreateSelfExclusion(const policy::Caller& caller, const CreateSelfExclusionRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.CreateSelfExclusion", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    exclusion::CreateRequest request;
    request.user_id  = req.user_id();
    request.type     = req.type();
    request.platform = req.platform();
    if (req.period() != LIMIT_PERIOD_UNSPECIFIED) request.period = req.period();
    if (!req.limit_amount().empty()) request.limit_amount = util::ParseAmount(req.limit_amount());
    if (req.has_end_ms()) request.end_ms = req.end_ms();

    CreateSelfExclusionResponse resp;
    *resp.mutable_exclusion() = ToProto(ctx_.exclusions->Create(request), util::NowMs());
    return resp;
  });
}

CancelSelfExclusionResponse ExclusionService::CancelSelfExclusion(const policy::Caller& caller, const CancelSelfExclusionRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.CancelSelfExclusion", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    const auto result = ctx_.exclusions->Cancel(req.user_id(), req.id());

    CancelSelfExclusionResponse resp;
    *resp.mutable_exclusion() = ToProto(result.exclusion, util::NowMs());
    resp.set_deleted(result.deleted);
    return resp;
  });
}

ListSelfExclusionsResponse ExclusionService::ListSelfExclusions(const policy::Caller& caller, const ListSelfExclusionsRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.ListSelfExclusions", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    const auto                 now = util::NowMs();
    ListSelfExclusionsResponse resp;
    for (const auto& record : ctx_.exclusions->List(req.user_id())) {
      *resp.add_exclusions() = ToProto(record, now);
    }
    return resp;
  });
}

GetActiveSelfExclusionsResponse ExclusionService::GetActiveSelfExclusions(const policy::Caller& caller, const GetActiveSelfExclusionsRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.GetActiveSelfExclusions", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    const auto                      now = util::NowMs();
    GetActiveSelfExclusionsResponse resp;
    for (const auto& record : ctx_.exclusions->GetActive(req.user_id(), Segment(req.platform()))) {
      *resp.add_exclusions() = ToProto(record, now);
    }
    return resp;
  });
}

GetGamblingLimitsResponse ExclusionService::GetGamblingLimits(const policy::Caller& caller, const GetGamblingLimitsRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.GetGamblingLimits", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    const auto limits = ctx_.exclusions->GetGamblingLimits(req.user_id());

    GetGamblingLimitsResponse resp;
    for (const auto& limit : limits.deposit) *resp.add_deposit_limits() = ToProto(limit);
    for (const auto& limit : limits.loss) *resp.add_loss_limits() = ToProto(limit);
    for (const auto& limit : limits.wager) *resp.add_wager_limits() = ToProto(limit);
    return resp;
  });
}

ExtendSelfExclusionResponse ExclusionService::ExtendSelfExclusion(const policy::Caller& caller, const ExtendSelfExclusionRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.ExtendSelfExclusion", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    std::optional<int32_t> duration_days;
    if (req.has_duration_days()) duration_days = req.duration_days();

    ExtendSelfExclusionResponse resp;
    *resp.mutable_exclusion() =
        ToProto(ctx_.exclusions->Extend(req.user_id(), req.cooldown_id(), req.platform(), duration_days), util::NowMs());
    return resp;
  });
}

HasActiveSelfExclusionResponse ExclusionService::HasActiveSelfExclusion(const policy::Caller& caller, const HasActiveSelfExclusionRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.HasActiveSelfExclusion", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    HasActiveSelfExclusionResponse resp;
    if (const auto active = ctx_.exclusions->HasActive(req.user_id(), Segment(req.platform()))) {
      resp.set_excluded(true);
      *resp.mutable_exclusion() = ToProto(*active);
    }
    return resp;
  });
}

CheckAccessResponse ExclusionService::CheckAccess(const policy::Caller& caller, const CheckAccessRequest& req) {
  return ObserveRpc(ctx_, "ExclusionService.CheckAccess", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    ctx_.guard->CheckAccess(req.user_id(), req.platform(), req.action());

    CheckAccessResponse resp;
    resp.set_allowed(true);
    return resp;
  });
}

} // namespace ledger::service
