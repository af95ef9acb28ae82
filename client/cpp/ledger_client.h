#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ledger/v1/admin_service.grpc.pb.h"
#include "ledger/v1/balance_service.grpc.pb.h"
#include "ledger/v1/exclusion_service.grpc.pb.h"

namespace ledger::client {

// Sent as x-user-id / x-roles metadata on every call.
struct Identity {
  std::string              user_id;
  std::vector<std::string> roles;
};

class LedgerClient {
 public:
  LedgerClient(std::shared_ptr<::grpc::Channel> channel, Identity identity);

  // Per-call deadline; unset means none.
  void SetTimeout(std::optional<std::chrono::milliseconds> timeout) {
    timeout_ = timeout;
  }

  // BalanceService
  ::grpc::Status UpdateBalance(const ledger::v1::UpdateBalanceRequest& request, ledger::v1::UpdateBalanceResponse* response) const;
  ::grpc::Status UpdateBalanceBatch(const ledger::v1::UpdateBalanceBatchRequest& request, ledger::v1::UpdateBalanceBatchResponse* response) const;
  ::grpc::Status GetBalances(const ledger::v1::GetBalancesRequest& request, ledger::v1::GetBalancesResponse* response) const;
  ::grpc::Status GetOperation(const ledger::v1::GetOperationRequest& request, ledger::v1::GetOperationResponse* response) const;
  ::grpc::Status GetStatistics(const ledger::v1::GetStatisticsRequest& request, ledger::v1::GetStatisticsResponse* response) const;
  ::grpc::Status GetAssetLimits(const ledger::v1::GetAssetLimitsRequest& request, ledger::v1::GetAssetLimitsResponse* response) const;

  // ExclusionService
  ::grpc::Status CreateSelfExclusion(const ledger::v1::CreateSelfExclusionRequest& request, ledger::v1::CreateSelfExclusionResponse* response) const;
  ::grpc::Status CancelSelfExclusion(const ledger::v1::CancelSelfExclusionRequest& request, ledger::v1::CancelSelfExclusionResponse* response) const;
  ::grpc::Status ListSelfExclusions(const ledger::v1::ListSelfExclusionsRequest& request, ledger::v1::ListSelfExclusionsResponse* response) const;
  ::grpc::Status GetActiveSelfExclusions(const ledger::v1::GetActiveSelfExclusionsRequest& request, ledger::v1::GetActiveSelfExclusionsResponse* response) const;
  ::grpc::Status GetGamblingLimits(const ledger::v1::GetGamblingLimitsRequest& request, ledger::v1::GetGamblingLimitsResponse* response) const;
  ::grpc::Status ExtendSelfExclusion(const ledger::v1::ExtendSelfExclusionRequest& request, ledger::v1::ExtendSelfExclusionResponse* response) const;
  ::grpc::Status HasActiveSelfExclusion(const ledger::v1::HasActiveSelfExclusionRequest& request, ledger::v1::HasActiveSelfExclusionResponse* response) const;
  ::grpc::Status CheckAccess(const ledger::v1::CheckAccessRequest& request, ledger::v1::CheckAccessResponse* response) const;

  // AdminService
  ::grpc::Status GetLockStats(const ledger::v1::GetLockStatsRequest& request, ledger::v1::GetLockStatsResponse* response) const;
  ::grpc::Status GetTopContendedResources(const ledger::v1::GetTopContendedResourcesRequest& request, ledger::v1::GetTopContendedResourcesResponse* response) const;
  ::grpc::Status RunExpiry(const ledger::v1::RunExpiryRequest& request, ledger::v1::RunExpiryResponse* response) const;
  ::grpc::Status ForceExpireCooldown(const ledger::v1::ForceExpireRequest& request, ledger::v1::ForceExpireResponse* response) const;
  ::grpc::Status ForceExpireWindow(const ledger::v1::ForceExpireRequest& request, ledger::v1::ForceExpireResponse* response) const;
  ::grpc::Status ForceExpireRemoval(const ledger::v1::ForceExpireRequest& request, ledger::v1::ForceExpireResponse* response) const;

 private:
  void Prepare(::grpc::ClientContext& ctx) const;

  Identity                                 identity_;
  std::optional<std::chrono::milliseconds> timeout_;

  std::unique_ptr<ledger::v1::BalanceService::Stub>   balance_stub_;
  std::unique_ptr<ledger::v1::ExclusionService::Stub> exclusion_stub_;
  std::unique_ptr<ledger::v1::AdminService::Stub>     admin_stub_;
};

} // namespace ledger::client
