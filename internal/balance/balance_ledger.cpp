#include "balance_ledger.hpp"

#include "internal/balance/operation_kind.hpp"
#include "internal/db/api/unit_of_work.hpp"
#include "internal/db/model/enum_codec.hpp"
#include "internal/exclusion/access_guard.hpp"
#include "internal/lock/lock_keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::balance {

using observability::BoolField;
using observability::StringField;

namespace {

// Raised inside a transaction when operation_id was inserted concurrently.
struct DuplicateOperation : std::runtime_error {
  DuplicateOperation() : std::runtime_error("duplicate operation_id") {
  }
};

bool IsDuplicate(const db::Result& result) {
  return result.code == db::ErrorCode::AlreadyExists || result.code == db::ErrorCode::ConstraintViolation;
}

UpdateResult FromRecord(const db::model::BalanceOperationRecord& op, bool replayed) {
  return UpdateResult{true, op.status, op.balance_after, replayed, op.operation_id};
}

void LogApplied(const UpdateRequest& request, const UpdateResult& result) {
  LEDGER_LOG_INFO(result.replayed ? "idempotent replay" : "balance operation applied",
                  {StringField("operation_id", request.operation_id), StringField("user_id", request.user_id), StringField("asset", request.asset),
                   StringField("kind", db::model::OperationKindCode(request.kind)), StringField("amount", util::FormatAmount(request.amount)),
                   StringField("balance", util::FormatAmount(result.balance)), BoolField("replayed", result.replayed)});
  observability::Metrics::Instance().RecordLedgerOperation(db::model::OperationKindCode(request.kind), result.replayed ? "replayed" : "applied");
}

template <typename Fn>
auto WithBusyMessage(Fn&& fn) {
  try {
    return fn();
  } catch (const util::LockTimeout&) {
    throw util::LockTimeout("The system is currently busy. Please try again in a moment.");
  }
}

} // namespace

BalanceLedger::BalanceLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                             std::shared_ptr<exclusion::ExclusionManager> exclusions, std::shared_ptr<limits::LimitEvaluator> evaluator,
                             std::shared_ptr<pricing::RateProvider> rates)
    : repository_(std::move(repository)),
      locks_(std::move(locks)),
      exclusions_(std::move(exclusions)),
      evaluator_(std::move(evaluator)),
      rates_(std::move(rates)) {
}

void BalanceLedger::Validate(const UpdateRequest& request) {
  if (request.operation_id.empty()) throw util::ValidationError("operation_id is required");
  if (request.user_id.empty()) throw util::ValidationError("user_id is required");
  if (request.asset.empty()) throw util::ValidationError("asset is required");

  TraitsOf(request.kind);

  const auto* limit = FindAssetLimit(request.asset);
  if (limit == nullptr) {
    throw util::ValidationError("unsupported asset " + request.asset);
  }
  ValidateAmount(*limit, request.kind, request.amount);
}

std::optional<UpdateResult> BalanceLedger::FindApplied(db::Transaction& tx, const UpdateRequest& request) {
  auto stored = repository_->GetOperation(tx, request.operation_id);
  if (!stored) return std::nullopt;

  if (stored->user_id != request.user_id || stored->asset != request.asset || stored->kind != request.kind || stored->amount != request.amount) {
    throw util::Conflict("operation_id " + request.operation_id + " was already used for a different operation");
  }
  return FromRecord(*stored, true);
}

std::optional<UpdateResult> BalanceLedger::FindApplied(const UpdateRequest& request) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return FindApplied(tx, request); });
}

UpdateResult BalanceLedger::UpdateBalance(const UpdateRequest& request) {
  Validate(request);

  try {
    if (auto replay = FindApplied(request)) {
      LogApplied(request, *replay);
      return *replay;
    }

    auto result = WithBusyMessage([&] {
      return locks_->WithLock(lock::BalanceResource(request.user_id, request.asset), [&] {
        return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
          if (auto replay = FindApplied(tx, request)) return *replay;
          return Apply(tx, request, util::NowMs());
        });
      });
    });

    LogApplied(request, result);
    return result;
  } catch (const DuplicateOperation&) {
    // Lost an insert race on operation_id to another worker.
    if (auto replay = FindApplied(request)) {
      LogApplied(request, *replay);
      return *replay;
    }
    throw util::Conflict("operation_id " + request.operation_id + " is being applied concurrently");
  } catch (const std::exception&) {
    observability::Metrics::Instance().RecordLedgerOperation(db::model::OperationKindCode(request.kind), "rejected");
    throw;
  }
}

std::vector<UpdateResult> BalanceLedger::UpdateBalanceBatch(const std::string& user_id, const std::string& asset,
                                                            std::vector<UpdateRequest> operations) {
  if (operations.empty() || operations.size() > kMaxBatchSize) {
    throw util::ValidationError("a batch must contain between 1 and " + std::to_string(kMaxBatchSize) + " operations");
  }
  for (auto& op : operations) {
    op.user_id = user_id;
    op.asset   = asset;
    Validate(op);
  }

  std::vector<UpdateResult> results;
  try {
    results = WithBusyMessage([&] {
      return locks_->WithLock(lock::BalanceResource(user_id, asset), [&] {
        return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
          const auto                now = util::NowMs();
          std::vector<UpdateResult> applied;
          applied.reserve(operations.size());
          for (const auto& op : operations) {
            auto replay = FindApplied(tx, op);
            applied.push_back(replay ? *replay : Apply(tx, op, now));
          }
          return applied;
        });
      });
    });
  } catch (const DuplicateOperation&) {
    throw util::Conflict("an operation_id in the batch is being applied concurrently");
  }

  for (std::size_t i = 0; i < operations.size(); ++i) {
    LogApplied(operations[i], results[i]);
  }
  return results;
}

void BalanceLedger::CheckRestrictions(db::Transaction& tx, const UpdateRequest& request, int64_t now_ms) {
  const auto& traits = TraitsOf(request.kind);

  const bool demo_bet = request.kind == ledger::v1::OPERATION_KIND_BET && request.amount == 0;
  if (demo_bet) return;

  if (traits.risks_money || request.kind == ledger::v1::OPERATION_KIND_DEPOSIT) {
    if (auto active = exclusions_->HasActive(tx, request.user_id, request.platform, now_ms)) {
      exclusion::ThrowDenied(*active);
    }

    const auto limits = exclusions_->ActiveLimits(tx, request.user_id);
    if (!limits.empty()) {
      const int64_t usd = pricing::ToUsd(*rates_, request.amount, request.asset);
      if (request.kind == ledger::v1::OPERATION_KIND_BET) {
        evaluator_->CheckLoss(tx, request.user_id, usd, request.asset, request.platform, limits, now_ms);
        evaluator_->CheckWager(tx, request.user_id, usd, request.platform, limits, now_ms);
      } else if (request.kind == ledger::v1::OPERATION_KIND_DEPOSIT) {
        evaluator_->CheckDeposit(tx, request.user_id, usd, request.platform, limits, now_ms);
      }
    }
  }

  if (request.kind == ledger::v1::OPERATION_KIND_WITHDRAW) {
    const auto* limit = FindAssetLimit(request.asset);
    const auto  today = limits::CurrentWindow(ledger::v1::LIMIT_PERIOD_DAILY, now_ms);
    const auto  withdrawn =
        repository_->SumOperationAmounts(tx, request.user_id, request.asset, ledger::v1::OPERATION_KIND_WITHDRAW, today.start_ms, today.end_ms);

    if (withdrawn + request.amount > limit->daily_withdraw_limit) {
      throw util::LimitExceeded(util::LimitKind::kDailyWithdraw, "Daily withdrawal limit of " + util::FormatAmount(limit->daily_withdraw_limit) +
                                                                     " " + request.asset + " exceeded");
    }
  }
}

UpdateResult BalanceLedger::Apply(db::Transaction& tx, const UpdateRequest& request, int64_t now_ms) {
  const auto& traits = TraitsOf(request.kind);

  CheckRestrictions(tx, request, now_ms);

  auto          current  = repository_->GetBalance(tx, request.user_id, request.asset);
  const int64_t previous = current ? current->balance : 0;
  const int64_t delta    = traits.sign == Sign::kCredit ? request.amount : -request.amount;

  if (util::AddOverflows(previous, delta)) {
    throw util::ValidationError("balance would overflow");
  }
  const int64_t next = previous + delta;

  if (traits.sign == Sign::kDebit && next < 0 && !traits.can_go_negative) {
    throw util::InsufficientBalance("Insufficient balance");
  }
  if (traits.sign == Sign::kCredit && next > util::kMaxBalanceUnits) {
    throw util::ValidationError("Balance would exceed the maximum allowed balance");
  }

  db::model::BalanceRecord wallet;
  if (current) {
    wallet = *current;
  } else {
    wallet.user_id    = request.user_id;
    wallet.asset      = request.asset;
    wallet.is_primary = repository_->ListBalances(tx, request.user_id).empty();
  }
  wallet.balance       = next;
  wallet.updated_at_ms = now_ms;
  db::ThrowIfDbError(repository_->UpsertBalance(tx, wallet), "upsert balance");

  db::model::BalanceOperationRecord op;
  op.operation_id     = request.operation_id;
  op.user_id          = request.user_id;
  op.asset            = request.asset;
  op.kind             = request.kind;
  op.amount           = request.amount;
  op.signed_amount    = delta;
  op.previous_balance = previous;
  op.balance_after    = next;
  op.status           = ledger::v1::OPERATION_STATUS_CONFIRMED;
  op.description      = request.description;
  op.platform         = request.platform;
  op.created_at_ms    = now_ms;

  const auto inserted = repository_->InsertOperation(tx, op);
  if (!inserted && IsDuplicate(inserted)) {
    throw DuplicateOperation();
  }
  db::ThrowIfDbError(inserted, "insert operation");

  if (request.amount > 0) {
    RecordStatistics(tx, request, now_ms);
  }

  return UpdateResult{true, ledger::v1::OPERATION_STATUS_CONFIRMED, next, false, request.operation_id};
}

void BalanceLedger::RecordStatistics(db::Transaction& tx, const UpdateRequest& request, int64_t now_ms) {
  const auto& traits = TraitsOf(request.kind);

  if (traits.stats_bucket != StatsBucket::kNone) {
    const int64_t cents = pricing::ToCents(*rates_, request.amount, request.asset);

    auto stats = repository_->GetStatistics(tx, request.user_id).value_or(db::model::BalanceStatisticsRecord{request.user_id});
    switch (traits.stats_bucket) {
      case StatsBucket::kDeposits:
        stats.deposits_cents += cents;
        break;
      case StatsBucket::kWithdrawals:
        stats.withdrawals_cents += cents;
        break;
      case StatsBucket::kBets:
        stats.bets_cents += cents;
        ++stats.bet_count;
        break;
      case StatsBucket::kWins:
        stats.wins_cents += cents;
        ++stats.win_count;
        break;
      case StatsBucket::kRefunds:
        stats.refunds_cents += cents;
        break;
      case StatsBucket::kNone:
        break;
    }
    db::ThrowIfDbError(repository_->UpsertStatistics(tx, stats), "upsert statistics");
  }

  if (traits.daily_bucket != DailyBucket::kNone) {
    const int64_t usd = pricing::ToUsd(*rates_, request.amount, request.asset);

    db::model::DailyGamblingStatsRecord delta;
    delta.user_id  = request.user_id;
    delta.day      = util::FormatDay(now_ms);
    delta.platform = request.platform;
    switch (traits.daily_bucket) {
      case DailyBucket::kWager:
        delta.wager_usd = usd;
        break;
      case DailyBucket::kWin:
        delta.win_usd = usd;
        break;
      case DailyBucket::kDeposit:
        delta.deposit_usd = usd;
        break;
      case DailyBucket::kNone:
        break;
    }
    db::ThrowIfDbError(repository_->AddDailyStats(tx, delta), "add daily stats");
  }
}

std::vector<db::model::BalanceRecord> BalanceLedger::GetBalances(const std::string& user_id) {
  if (user_id.empty()) throw util::ValidationError("user_id is required");
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->ListBalances(tx, user_id); });
}

db::model::BalanceOperationRecord BalanceLedger::GetOperation(const std::string& operation_id) {
  auto op = db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetOperation(tx, operation_id); });
  if (!op) {
    throw util::NotFound("Operation not found");
  }
  return *op;
}

db::model::BalanceStatisticsRecord BalanceLedger::GetStatistics(const std::string& user_id) {
  if (user_id.empty()) throw util::ValidationError("user_id is required");
  auto stats = db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetStatistics(tx, user_id); });
  return stats.value_or(db::model::BalanceStatisticsRecord{user_id});
}

const std::vector<AssetLimit>& BalanceLedger::GetAssetLimits() const {
  return AssetLimits();
}

} // namespace ledger::balance
