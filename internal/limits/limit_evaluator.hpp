#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/limits/period_window.hpp"

namespace ledger::limits {

// USD amounts, 1e-8 units.
struct LimitUsage {
  int64_t used_usd      = 0;
  int64_t limit_usd     = 0;
  int64_t remaining_usd = 0;

  PeriodWindow window;
};

/*
  Periodic Limit Evaluator.

  Reads the daily gambling stats rows of a period window and compares
  them with deposit / loss / wager limits. Limits and stats are USD in
  1e-8 units; callers value the pending amount with pricing::ToUsd.

  All calls run inside the caller's transaction so the ledger sees its
  own pending writes and never opens a nested transaction.
*/
class LimitEvaluator {
 public:
  explicit LimitEvaluator(std::shared_ptr<db::Repository> repository);

  // Amount already used against a limit record in its current window.
  LimitUsage Evaluate(db::Transaction& tx, const db::model::SelfExclusionRecord& limit, int64_t now_ms);

  // Headroom in USD 1e-8 units, floored at 0.
  int64_t Remaining(db::Transaction& tx, const std::string& user_id, ledger::v1::ExclusionType limit_type, ledger::v1::LimitPeriod period,
                    ledger::v1::PlatformType segment, int64_t limit_usd, int64_t now_ms);

  // Throw util::LimitExceeded on the first violated limit. Limits of
  // another type, inactive ones and those scoped to a different
  // segment are ignored. Rejects when used + pending exceeds the limit,
  // so once usage meets the limit any further amount is refused.
  void CheckLoss(db::Transaction& tx, const std::string& user_id, int64_t bet_usd, const std::string& asset, ledger::v1::PlatformType segment,
                 const std::vector<db::model::SelfExclusionRecord>& limits, int64_t now_ms);

  void CheckWager(db::Transaction& tx, const std::string& user_id, int64_t bet_usd, ledger::v1::PlatformType segment,
                  const std::vector<db::model::SelfExclusionRecord>& limits, int64_t now_ms);

  void CheckDeposit(db::Transaction& tx, const std::string& user_id, int64_t deposit_usd, ledger::v1::PlatformType segment,
                    const std::vector<db::model::SelfExclusionRecord>& limits, int64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;

  int64_t UsedUsd(db::Transaction& tx, const std::string& user_id, ledger::v1::ExclusionType limit_type, ledger::v1::PlatformType segment,
                  const PeriodWindow& window);

  LimitUsage Measure(db::Transaction& tx, const std::string& user_id, const db::model::SelfExclusionRecord& limit, int64_t now_ms);

  static bool Applies(const db::model::SelfExclusionRecord& limit, ledger::v1::ExclusionType type, ledger::v1::PlatformType segment);
};

} // namespace ledger::limits
