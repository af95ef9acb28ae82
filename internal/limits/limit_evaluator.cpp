#include "limit_evaluator.hpp"

#include <algorithm>

#include "internal/db/model/enum_codec.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"

namespace ledger::limits {

using ledger::v1::ExclusionType;
using ledger::v1::PlatformType;

LimitEvaluator::LimitEvaluator(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

int64_t LimitEvaluator::UsedUsd(db::Transaction& tx, const std::string& user_id, ExclusionType limit_type, PlatformType segment,
                                const PeriodWindow& window) {
  int64_t used = 0;
  for (const auto& row : repository_->ListDailyStats(tx, user_id, window.first_day, window.last_day)) {
    if (segment != ledger::v1::PLATFORM_TYPE_PLATFORM && row.platform != segment) continue;

    switch (limit_type) {
      case ledger::v1::EXCLUSION_TYPE_WAGER_LIMIT:
        used += row.wager_usd;
        break;
      case ledger::v1::EXCLUSION_TYPE_LOSS_LIMIT:
        used += std::max<int64_t>(0, row.wager_usd - row.win_usd);
        break;
      case ledger::v1::EXCLUSION_TYPE_DEPOSIT_LIMIT:
        used += row.deposit_usd;
        break;
      default:
        throw util::ValidationError("not a limit type: " + db::model::ExclusionTypeCode(limit_type));
    }
  }
  return used;
}

bool LimitEvaluator::Applies(const db::model::SelfExclusionRecord& limit, ExclusionType type, PlatformType segment) {
  if (limit.type != type || !limit.is_active || !limit.period || !limit.limit_amount) return false;
  return limit.platform == segment || limit.platform == ledger::v1::PLATFORM_TYPE_PLATFORM;
}

LimitUsage LimitEvaluator::Evaluate(db::Transaction& tx, const db::model::SelfExclusionRecord& limit, int64_t now_ms) {
  return Measure(tx, limit.user_id, limit, now_ms);
}

LimitUsage LimitEvaluator::Measure(db::Transaction& tx, const std::string& user_id, const db::model::SelfExclusionRecord& limit, int64_t now_ms) {
  if (!limit.period || !limit.limit_amount) {
    throw util::ValidationError("limit " + limit.id + " has no period or amount");
  }

  LimitUsage usage;
  usage.window        = CurrentWindow(*limit.period, now_ms);
  usage.used_usd      = UsedUsd(tx, user_id, limit.type, limit.platform, usage.window);
  usage.limit_usd     = *limit.limit_amount;
  usage.remaining_usd = std::max<int64_t>(0, usage.limit_usd - usage.used_usd);
  return usage;
}

int64_t LimitEvaluator::Remaining(db::Transaction& tx, const std::string& user_id, ExclusionType limit_type, ledger::v1::LimitPeriod period,
                                  PlatformType segment, int64_t limit_usd, int64_t now_ms) {
  const auto window = CurrentWindow(period, now_ms);
  return std::max<int64_t>(0, limit_usd - UsedUsd(tx, user_id, limit_type, segment, window));
}

void LimitEvaluator::CheckLoss(db::Transaction& tx, const std::string& user_id, int64_t bet_usd, const std::string& asset,
                               PlatformType segment, const std::vector<db::model::SelfExclusionRecord>& limits, int64_t now_ms) {
  for (const auto& limit : limits) {
    if (!Applies(limit, ledger::v1::EXCLUSION_TYPE_LOSS_LIMIT, segment)) continue;

    const auto usage = Measure(tx, user_id, limit, now_ms);
    if (usage.used_usd + bet_usd > usage.limit_usd) {
      throw util::LimitExceeded(util::LimitKind::kLoss, "Loss limit of " + util::FormatAmount(*limit.limit_amount) + " " + asset + " for " +
                                                            PeriodName(*limit.period) + " period has been reached on " +
                                                            db::model::PlatformCode(limit.platform));
    }
  }
}

void LimitEvaluator::CheckWager(db::Transaction& tx, const std::string& user_id, int64_t bet_usd, PlatformType segment,
                                const std::vector<db::model::SelfExclusionRecord>& limits, int64_t now_ms) {
  for (const auto& limit : limits) {
    if (!Applies(limit, ledger::v1::EXCLUSION_TYPE_WAGER_LIMIT, segment)) continue;

    const auto usage = Measure(tx, user_id, limit, now_ms);
    if (usage.used_usd + bet_usd > usage.limit_usd) {
      throw util::LimitExceeded(util::LimitKind::kWager, "Wager limit exceeded. Your " + PeriodName(*limit.period) + " wager limit is $" +
                                                             util::FormatCents(util::RoundToCents(usage.limit_usd)) + ". You have $" +
                                                             util::FormatCents(util::RoundToCents(usage.remaining_usd)) + " remaining.");
    }
  }
}

void LimitEvaluator::CheckDeposit(db::Transaction& tx, const std::string& user_id, int64_t deposit_usd, PlatformType segment,
                                  const std::vector<db::model::SelfExclusionRecord>& limits, int64_t now_ms) {
  for (const auto& limit : limits) {
    if (!Applies(limit, ledger::v1::EXCLUSION_TYPE_DEPOSIT_LIMIT, segment)) continue;

    const auto usage = Measure(tx, user_id, limit, now_ms);
    if (usage.used_usd + deposit_usd > usage.limit_usd) {
      throw util::LimitExceeded(util::LimitKind::kDeposit, "Deposit limit of " + util::FormatAmount(*limit.limit_amount) + " for " +
                                                               PeriodName(*limit.period) + " period has been reached");
    }
  }
}

} // namespace ledger::limits
