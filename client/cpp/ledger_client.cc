#include "client/cpp/ledger_client.h"

#include <string>
#include <utility>

namespace ledger::client {

using namespace ledger::v1;

LedgerClient::LedgerClient(std::shared_ptr<::grpc::Channel> channel, Identity identity)
    : identity_(std::move(identity)),
      balance_stub_(BalanceService::NewStub(channel)),
      exclusion_stub_(ExclusionService::NewStub(channel)),
      admin_stub_(AdminService::NewStub(channel)) {
}

void LedgerClient::Prepare(::grpc::ClientContext& ctx) const {
  if (!identity_.user_id.empty()) {
    ctx.AddMetadata("x-user-id", identity_.user_id);
  }
  if (!identity_.roles.empty()) {
    std::string roles;
    for (const auto& role : identity_.roles) {
      if (!roles.empty()) roles.push_back(',');
      roles += role;
    }
    ctx.AddMetadata("x-roles", roles);
  }
  if (timeout_) {
    ctx.set_deadline(std::chrono::system_clock::now() + *timeout_);
  }
}

::grpc::Status LedgerClient::UpdateBalance(const UpdateBalanceRequest& request, UpdateBalanceResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return balance_stub_->UpdateBalance(&ctx, request, response);
}

::grpc::Status LedgerClient::UpdateBalanceBatch(const UpdateBalanceBatchRequest& request, UpdateBalanceBatchResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return balance_stub_->UpdateBalanceBatch(&ctx, request, response);
}

::grpc::Status LedgerClient::GetBalances(const GetBalancesRequest& request, GetBalancesResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return balance_stub_->GetBalances(&ctx, request, response);
}

::grpc::Status LedgerClient::GetOperation(const GetOperationRequest& request, GetOperationResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return balance_stub_->GetOperation(&ctx, request, response);
}

::grpc::Status LedgerClient::GetStatistics(const GetStatisticsRequest& request, GetStatisticsResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return balance_stub_->GetStatistics(&ctx, request, response);
}

::grpc::Status LedgerClient::GetAssetLimits(const GetAssetLimitsRequest& request, GetAssetLimitsResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return balance_stub_->GetAssetLimits(&ctx, request, response);
}

::grpc::Status LedgerClient::CreateSelfExclusion(const CreateSelfExclusionRequest& request, CreateSelfExclusionResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->CreateSelfExclusion(&ctx, request, response);
}

::grpc::Status LedgerClient::CancelSelfExclusion(const CancelSelfExclusionRequest& request, CancelSelfExclusionResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->CancelSelfExclusion(&ctx, request, response);
}

::grpc::Status LedgerClient::ListSelfExclusions(const ListSelfExclusionsRequest& request, ListSelfExclusionsResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->ListSelfExclusions(&ctx, request, response);
}

::grpc::Status LedgerClient::GetActiveSelfExclusions(const GetActiveSelfExclusionsRequest& request, GetActiveSelfExclusionsResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->GetActiveSelfExclusions(&ctx, request, response);
}

::grpc::Status LedgerClient::GetGamblingLimits(const GetGamblingLimitsRequest& request, GetGamblingLimitsResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->GetGamblingLimits(&ctx, request, response);
}

::grpc::Status LedgerClient::ExtendSelfExclusion(const ExtendSelfExclusionRequest& request, ExtendSelfExclusionResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->ExtendSelfExclusion(&ctx, request, response);
}

::grpc::Status LedgerClient::HasActiveSelfExclusion(const HasActiveSelfExclusionRequest& request, HasActiveSelfExclusionResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->HasActiveSelfExclusion(&ctx, request, response);
}

::grpc::Status LedgerClient::CheckAccess(const CheckAccessRequest& request, CheckAccessResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return exclusion_stub_->CheckAccess(&ctx, request, response);
}

::grpc::Status LedgerClient::GetLockStats(const GetLockStatsRequest& request, GetLockStatsResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return admin_stub_->GetLockStats(&ctx, request, response);
}

::grpc::Status LedgerClient::GetTopContendedResources(const GetTopContendedResourcesRequest& request, GetTopContendedResourcesResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return admin_stub_->GetTopContendedResources(&ctx, request, response);
}

::grpc::Status LedgerClient::RunExpiry(const RunExpiryRequest& request, RunExpiryResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return admin_stub_->RunExpiry(&ctx, request, response);
}

::grpc::Status LedgerClient::ForceExpireCooldown(const ForceExpireRequest& request, ForceExpireResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return admin_stub_->ForceExpireCooldown(&ctx, request, response);
}

::grpc::Status LedgerClient::ForceExpireWindow(const ForceExpireRequest& request, ForceExpireResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return admin_stub_->ForceExpireWindow(&ctx, request, response);
}

::grpc::Status LedgerClient::ForceExpireRemoval(const ForceExpireRequest& request, ForceExpireResponse* response) const {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  return admin_stub_->ForceExpireRemoval(&ctx, request, response);
}

} // namespace ledger::client
