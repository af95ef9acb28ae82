#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "ledger/v1/admin_service.grpc.pb.h"

namespace ledger::grpc {

class AdminServer final : public ledger::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<ledger::service::AdminService> svc);

  ::grpc::Status GetLockStats(::grpc::ServerContext* ctx, const ledger::v1::GetLockStatsRequest* req, ledger::v1::GetLockStatsResponse* resp) override;

  ::grpc::Status GetTopContendedResources(::grpc::ServerContext* ctx, const ledger::v1::GetTopContendedResourcesRequest* req, ledger::v1::GetTopContendedResourcesResponse* resp) override;

  ::grpc::Status RunExpiry(::grpc::ServerContext* ctx, const ledger::v1::RunExpiryRequest* req, ledger::v1::RunExpiryResponse* resp) override;

  ::grpc::Status ForceExpireCooldown(::grpc::ServerContext* ctx, const ledger::v1::ForceExpireRequest* req, ledger::v1::ForceExpireResponse* resp) override;

  ::grpc::Status ForceExpireWindow(::grpc::ServerContext* ctx, const ledger::v1::ForceExpireRequest* req, ledger::v1::ForceExpireResponse* resp) override;

  ::grpc::Status ForceExpireRemoval(::grpc::ServerContext* ctx, const ledger::v1::ForceExpireRequest* req, ledger::v1::ForceExpireResponse* resp) override;

 private:
  std::shared_ptr<ledger::service::AdminService> service_;
};

} // namespace ledger::grpc
