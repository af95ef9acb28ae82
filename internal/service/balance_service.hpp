#pragma once

#include "internal/policy/operation_policy.hpp"
#include "internal/service/service_context.hpp"
#include "ledger/v1/balance_service.pb.h"

namespace ledger::service {

class BalanceService {
 public:
  explicit BalanceService(ServiceContext ctx);

  ledger::v1::UpdateBalanceResponse UpdateBalance(const policy::Caller& caller, const ledger::v1::UpdateBalanceRequest& req);

  ledger::v1::UpdateBalanceBatchResponse UpdateBalanceBatch(const policy::Caller& caller, const ledger::v1::UpdateBalanceBatchRequest& req);

  ledger::v1::GetBalancesResponse GetBalances(const policy::Caller& caller, const ledger::v1::GetBalancesRequest& req);

  ledger::v1::GetOperationResponse GetOperation(const policy::Caller& caller, const ledger::v1::GetOperationRequest& req);

  ledger::v1::GetStatisticsResponse GetStatistics(const policy::Caller& caller, const ledger::v1::GetStatisticsRequest& req);

  ledger::v1::GetAssetLimitsResponse GetAssetLimits(const policy::Caller& caller, const ledger::v1::GetAssetLimitsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ledger::service
