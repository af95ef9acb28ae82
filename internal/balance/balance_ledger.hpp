#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/balance/asset_limits.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/limits/limit_evaluator.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/pricing/usd_rates.hpp"

namespace ledger::balance {

struct UpdateRequest {
  std::string operation_id; // idempotency key
  std::string user_id;

  ledger::v1::OperationKind kind = ledger::v1::OPERATION_KIND_UNSPECIFIED;

  int64_t     amount = 0; // unsigned magnitude, 1e-8 units
  std::string asset;
  std::string description;

  ledger::v1::PlatformType platform = ledger::v1::PLATFORM_TYPE_PLATFORM;
};

struct UpdateResult {
  bool                        success = false;
  ledger::v1::OperationStatus status  = ledger::v1::OPERATION_STATUS_CONFIRMED;
  int64_t                     balance = 0;
  bool                        replayed = false;
  std::string                 operation_id;
};

/*
  Idempotent balance ledger.

  For one (user, asset):
    - every mutation happens under lock balance:{user}:{asset}
    - balance, operation row and statistics commit in one transaction
    - an operation_id is applied at most once; retries replay the
      stored row

  Limit checks and daily gambling stats use the USD value of the
  amount from the rate provider.
*/
class BalanceLedger {
 public:
  static constexpr std::size_t kMaxBatchSize = 50;

  BalanceLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                std::shared_ptr<exclusion::ExclusionManager> exclusions, std::shared_ptr<limits::LimitEvaluator> evaluator,
                std::shared_ptr<pricing::RateProvider> rates);

  UpdateResult UpdateBalance(const UpdateRequest& request);

  // All operations must target user_id/asset. Applied in order under
  // one lock and one transaction; nothing is applied if any fails.
  std::vector<UpdateResult> UpdateBalanceBatch(const std::string& user_id, const std::string& asset, std::vector<UpdateRequest> operations);

  std::vector<db::model::BalanceRecord> GetBalances(const std::string& user_id);

  db::model::BalanceOperationRecord GetOperation(const std::string& operation_id);

  db::model::BalanceStatisticsRecord GetStatistics(const std::string& user_id);

  const std::vector<AssetLimit>& GetAssetLimits() const;

 private:
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<lock::LockCoordinator>       locks_;
  std::shared_ptr<exclusion::ExclusionManager> exclusions_;
  std::shared_ptr<limits::LimitEvaluator>      evaluator_;
  std::shared_ptr<pricing::RateProvider>       rates_;

  static void Validate(const UpdateRequest& request);

  // Stored result for request.operation_id, Conflict if it was used
  // for a different operation.
  std::optional<UpdateResult> FindApplied(db::Transaction& tx, const UpdateRequest& request);
  std::optional<UpdateResult> FindApplied(const UpdateRequest& request);

  UpdateResult Apply(db::Transaction& tx, const UpdateRequest& request, int64_t now_ms);

  void CheckRestrictions(db::Transaction& tx, const UpdateRequest& request, int64_t now_ms);
  void RecordStatistics(db::Transaction& tx, const UpdateRequest& request, int64_t now_ms);
};

} // namespace ledger::balance
