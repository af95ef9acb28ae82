#include "exclusion_server.hpp"

#include "caller_metadata.hpp"
#include "grpc_error.hpp"

namespace ledger::grpc {

using namespace ledger::v1;

ExclusionServer::ExclusionServer(std::shared_ptr<ledger::service::ExclusionService> svc) : service_(std::move(svc)) {
}

::grpc::Status ExclusionServer::CreateSelfExclusion(::grpc::ServerContext* ctx, const CreateSelfExclusionRequest* req, CreateSelfExclusionResponse* resp) {
  return Invoke([&] { *resp = service_->CreateSelfExclusion(CallerFrom(*ctx), *req); });
}

::grpc::Status ExclusionServer::CancelSelfExclusion(::grpc::ServerContext* ctx, const CancelSelfExclusionRequest* req, CancelSelfExclusionResponse* resp) {
  return Invoke([&] { *resp = service_->CancelSelfExclusion(CallerFrom(*ctx), *req); });
}

::grpc::Status ExclusionServer::ListSelfExclusions(::grpc::ServerContext* ctx, const ListSelfExclusionsRequest* req, ListSelfExclusionsResponse* resp) {
  return Invoke([&] { *resp = service_->ListSelfExclusions(CallerFrom(*ctx), *req); });
}

::grpc::Status ExclusionServer::GetActiveSelfExclusions(::grpc::ServerContext* ctx, const GetActiveSelfExclusionsRequest* req, GetActiveSelfExclusionsResponse* resp) {
  return Invoke([&] { *resp = service_->GetActiveSelfExclusions(CallerFrom(*ctx), *req); });
}

::grpc::Status ExclusionServer::GetGamblingLimits(::grpc::ServerContext* ctx, const GetGamblingLimitsRequest* req, GetGamblingLimitsResponse* resp) {
  return Invoke([&] { *resp = service_->GetGamblingLimits(CallerFrom(*ctx), *req); });
}

::grpc::Status ExclusionServer::ExtendSelfExclusion(::grpc::ServerContext* ctx, const ExtendSelfExclusionRequest* req, ExtendSelfExclusionResponse* resp) {
  return Invoke([&] { *resp = service_->ExtendSelfExclusion(CallerFrom(*ctx), *req); });
}

::grpc::Status ExclusionServer::HasActiveSelfExclusion(::grpc::ServerContext* ctx, const HasActiveSelfExclusionRequest* req, HasActiveSelfExclusionResponse* resp) {
  return Invoke([&] { *resp = service_->HasActiveSelfExclusion(CallerFrom(*ctx), *req); });
}

::grpc::Status ExclusionServer::CheckAccess(::grpc::ServerContext* ctx, const CheckAccessRequest* req, CheckAccessResponse* resp) {
  return Invoke([&] { *resp = service_->CheckAccess(CallerFrom(*ctx), *req); });
}

} // namespace ledger::grpc
