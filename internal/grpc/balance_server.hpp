#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/balance_service.hpp"
#include "ledger/v1/balance_service.grpc.pb.h"

namespace ledger::grpc {

class BalanceServer final : public ledger::v1::BalanceService::Service {
 public:
  explicit BalanceServer(std::shared_ptr<ledger::service::BalanceService> svc);

  ::grpc::Status UpdateBalance(::grpc::ServerContext* ctx, const ledger::v1::UpdateBalanceRequest* req, ledger::v1::UpdateBalanceResponse* resp) override;

  ::grpc::Status UpdateBalanceBatch(::grpc::ServerContext* ctx, const ledger::v1::UpdateBalanceBatchRequest* req, ledger::v1::UpdateBalanceBatchResponse* resp) override;

  ::grpc::Status GetBalances(::grpc::ServerContext* ctx, const ledger::v1::GetBalancesRequest* req, ledger::v1::GetBalancesResponse* resp) override;

  ::grpc::Status GetOperation(::grpc::ServerContext* ctx, const ledger::v1::GetOperationRequest* req, ledger::v1::GetOperationResponse* resp) override;

  ::grpc::Status GetStatistics(::grpc::ServerContext* ctx, const ledger::v1::GetStatisticsRequest* req, ledger::v1::GetStatisticsResponse* resp) override;

  ::grpc::Status GetAssetLimits(::grpc::ServerContext* ctx, const ledger::v1::GetAssetLimitsRequest* req, ledger::v1::GetAssetLimitsResponse* resp) override;

 private:
  std::shared_ptr<ledger::service::BalanceService> service_;
};

} // namespace ledger::grpc
