#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/exclusion_service.hpp"
#include "ledger/v1/exclusion_service.grpc.pb.h"

namespace ledger::grpc {

class ExclusionServer final : public ledger::v1::ExclusionService::Service {
 public:
  explicit ExclusionServer(std::shared_ptr<ledger::service::ExclusionService> svc);

  ::grpc::Status CreateSelfExclusion(::grpc::ServerContext* ctx, const ledger::v1::CreateSelfExclusionRequest* req, ledger::v1::CreateSelfExclusionResponse* resp) override;

  ::grpc::Status CancelSelfExclusion(::grpc::ServerContext* ctx, const ledger::v1::CancelSelfExclusionRequest* req, ledger::v1::CancelSelfExclusionResponse* resp) override;

  ::grpc::Status ListSelfExclusions(::grpc::ServerContext* ctx, const ledger::v1::ListSelfExclusionsRequest* req, ledger::v1::ListSelfExclusionsResponse* resp) override;

  ::grpc::Status GetActiveSelfExclusions(::grpc::ServerContext* ctx, const ledger::v1::GetActiveSelfExclusionsRequest* req, ledger::v1::GetActiveSelfExclusionsResponse* resp) override;

  ::grpc::Status GetGamblingLimits(::grpc::ServerContext* ctx, const ledger::v1::GetGamblingLimitsRequest* req, ledger::v1::GetGamblingLimitsResponse* resp) override;

  ::grpc::Status ExtendSelfExclusion(::grpc::ServerContext* ctx, const ledger::v1::ExtendSelfExclusionRequest* req, ledger::v1::ExtendSelfExclusionResponse* resp) override;

  ::grpc::Status HasActiveSelfExclusion(::grpc::ServerContext* ctx, const ledger::v1::HasActiveSelfExclusionRequest* req, ledger::v1::HasActiveSelfExclusionResponse* resp) override;

  ::grpc::Status CheckAccess(::grpc::ServerContext* ctx, const ledger::v1::CheckAccessRequest* req, ledger::v1::CheckAccessResponse* resp) override;

 private:
  std::shared_ptr<ledger::service::ExclusionService> service_;
};

} // namespace ledger::grpc
