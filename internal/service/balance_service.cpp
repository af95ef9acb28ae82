#include "balance_service.hpp"

#include "internal/balance/balance_ledger.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/amount.hpp"

namespace ledger::service {

using namespace ledger::v1;

namespace {

ledger::v1::PlatformType PlatformOrDefault(ledger::v1::PlatformType platform) {
  return platform == PLATFORM_TYPE_UNSPECIFIED ? PLATFORM_TYPE_PLATFORM : platform;
}

void Fill(UpdateBalanceResponse& resp, const balance::UpdateResult& result) {
  resp.set_success(result.success);
  resp.set_status(result.status);
  resp.set_balance(util::FormatAmount(result.balance));
  resp.set_replayed(result.replayed);
  resp.set_operation_id(result.operation_id);
}

} // namespace

BalanceService::BalanceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

UpdateBalanceResponse BalanceService::UpdateBalance(const policy::Caller& caller, const UpdateBalanceRequest& req) {
  return ObserveRpc(ctx_, "BalanceService.UpdateBalance", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    balance::UpdateRequest request;
    request.operation_id = req.operation_id();
    request.user_id      = req.user_id();
    request.kind         = req.kind();
    request.amount       = util::ParseAmount(req.amount());
    request.asset        = req.asset();
    request.description  = req.description();
    request.platform     = PlatformOrDefault(req.platform());

    UpdateBalanceResponse resp;
    Fill(resp, ctx_.ledger->UpdateBalance(request));
    return resp;
  });
}

UpdateBalanceBatchResponse BalanceService::UpdateBalanceBatch(const policy::Caller& caller, const UpdateBalanceBatchRequest& req) {
  return ObserveRpc(ctx_, "BalanceService.UpdateBalanceBatch", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    std::vector<balance::UpdateRequest> ops;
    ops.reserve(req.operations_size());
    for (const auto& op : req.operations()) {
      balance::UpdateRequest request;
      request.operation_id = op.operation_id();
      request.kind         = op.kind();
      request.amount       = util::ParseAmount(op.amount());
      request.description  = op.description();
      request.platform     = PlatformOrDefault(op.platform());
      ops.push_back(std::move(request));
    }

    const auto results = ctx_.ledger->UpdateBalanceBatch(req.user_id(), req.asset(), std::move(ops));

    UpdateBalanceBatchResponse resp;
    for (const auto& result : results) {
      Fill(*resp.add_results(), result);
    }
    if (!results.empty()) {
      resp.set_balance(util::FormatAmount(results.back().balance));
    }
    return resp;
  });
}

GetBalancesResponse BalanceService::GetBalances(const policy::Caller& caller, const GetBalancesRequest& req) {
  return ObserveRpc(ctx_, "BalanceService.GetBalances", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    GetBalancesResponse resp;
    for (const auto& wallet : ctx_.ledger->GetBalances(req.user_id())) {
      *resp.add_wallets() = ToProto(wallet);
    }
    return resp;
  });
}

GetOperationResponse BalanceService::GetOperation(const policy::Caller& caller, const GetOperationRequest& req) {
  return ObserveRpc(ctx_, "BalanceService.GetOperation", caller, [&] {
    const auto op = ctx_.ledger->GetOperation(req.operation_id());
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, op.user_id);

    GetOperationResponse resp;
    *resp.mutable_operation() = ToProto(op);
    return resp;
  });
}

GetStatisticsResponse BalanceService::GetStatistics(const policy::Caller& caller, const GetStatisticsRequest& req) {
  return ObserveRpc(ctx_, "BalanceService.GetStatistics", caller, [&] {
    policy::PolicyEnforcer::RequireSelfOrAdmin(caller, req.user_id());

    GetStatisticsResponse resp;
    *resp.mutable_statistics() = ToProto(ctx_.ledger->GetStatistics(req.user_id()));
    return resp;
  });
}

GetAssetLimitsResponse BalanceService::GetAssetLimits(const policy::Caller& caller, const GetAssetLimitsRequest&) {
  return ObserveRpc(ctx_, "BalanceService.GetAssetLimits", caller, [&] {
    GetAssetLimitsResponse resp;
    for (const auto& limit : ctx_.ledger->GetAssetLimits()) {
      *resp.add_limits() = ToProto(limit);
    }
    return resp;
  });
}

} // namespace ledger::service
