#include "balance_server.hpp"

#include "caller_metadata.hpp"
#include "grpc_error.hpp"

namespace ledger::grpc {

using namespace ledger::v1;

BalanceServer::BalanceServer(std::shared_ptr<ledger::service::BalanceService> svc) : service_(std::move(svc)) {
}

::grpc::Status BalanceServer::UpdateBalance(::grpc::ServerContext* ctx, const UpdateBalanceRequest* req, UpdateBalanceResponse* resp) {
  return Invoke([&] { *resp = service_->UpdateBalance(CallerFrom(*ctx), *req); });
}

::grpc::Status BalanceServer::UpdateBalanceBatch(::grpc::ServerContext* ctx, const UpdateBalanceBatchRequest* req, UpdateBalanceBatchResponse* resp) {
  return Invoke([&] { *resp = service_->UpdateBalanceBatch(CallerFrom(*ctx), *req); });
}

::grpc::Status BalanceServer::GetBalances(::grpc::ServerContext* ctx, const GetBalancesRequest* req, GetBalancesResponse* resp) {
  return Invoke([&] { *resp = service_->GetBalances(CallerFrom(*ctx), *req); });
}

::grpc::Status BalanceServer::GetOperation(::grpc::ServerContext* ctx, const GetOperationRequest* req, GetOperationResponse* resp) {
  return Invoke([&] { *resp = service_->GetOperation(CallerFrom(*ctx), *req); });
}

::grpc::Status BalanceServer::GetStatistics(::grpc::ServerContext* ctx, const GetStatisticsRequest* req, GetStatisticsResponse* resp) {
  return Invoke([&] { *resp = service_->GetStatistics(CallerFrom(*ctx), *req); });
}

::grpc::Status BalanceServer::GetAssetLimits(::grpc::ServerContext* ctx, const GetAssetLimitsRequest* req, GetAssetLimitsResponse* resp) {
  return Invoke([&] { *resp = service_->GetAssetLimits(CallerFrom(*ctx), *req); });
}

} // namespace ledger::grpc
