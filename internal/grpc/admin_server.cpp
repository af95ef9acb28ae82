#include "admin_server.hpp"

#include "caller_metadata.hpp"
#include "grpc_error.hpp"

namespace ledger::grpc {

using namespace ledger::v1;

AdminServer::AdminServer(std::shared_ptr<ledger::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetLockStats(::grpc::ServerContext* ctx, const GetLockStatsRequest* req, GetLockStatsResponse* resp) {
  return Invoke([&] { *resp = service_->GetLockStats(CallerFrom(*ctx), *req); });
}

::grpc::Status AdminServer::GetTopContendedResources(::grpc::ServerContext* ctx, const GetTopContendedResourcesRequest* req, GetTopContendedResourcesResponse* resp) {
  return Invoke([&] { *resp = service_->GetTopContendedResources(CallerFrom(*ctx), *req); });
}

::grpc::Status AdminServer::RunExpiry(::grpc::ServerContext* ctx, const RunExpiryRequest* req, RunExpiryResponse* resp) {
  return Invoke([&] { *resp = service_->RunExpiry(CallerFrom(*ctx), *req); });
}

::grpc::Status AdminServer::ForceExpireCooldown(::grpc::ServerContext* ctx, const ForceExpireRequest* req, ForceExpireResponse* resp) {
  return Invoke([&] { *resp = service_->ForceExpireCooldown(CallerFrom(*ctx), *req); });
}

::grpc::Status AdminServer::ForceExpireWindow(::grpc::ServerContext* ctx, const ForceExpireRequest* req, ForceExpireResponse* resp) {
  return Invoke([&] { *resp = service_->ForceExpireWindow(CallerFrom(*ctx), *req); });
}

::grpc::Status AdminServer::ForceExpireRemoval(::grpc::ServerContext* ctx, const ForceExpireRequest* req, ForceExpireResponse* resp) {
  return Invoke([&] { *resp = service_->ForceExpireRemoval(CallerFrom(*ctx), *req); });
}

} // namespace ledger::grpc
