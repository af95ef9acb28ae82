#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace ledger::db::memory {

namespace {

using ledger::v1::EXCLUSION_TYPE_COOLDOWN;
using ledger::v1::EXCLUSION_TYPE_DEPOSIT_LIMIT;
using ledger::v1::EXCLUSION_TYPE_LOSS_LIMIT;
using ledger::v1::EXCLUSION_TYPE_TEMPORARY;
using ledger::v1::EXCLUSION_TYPE_WAGER_LIMIT;

bool IsLimitType(ledger::v1::ExclusionType type) {
  return type == EXCLUSION_TYPE_DEPOSIT_LIMIT || type == EXCLUSION_TYPE_LOSS_LIMIT || type == EXCLUSION_TYPE_WAGER_LIMIT;
}

// Mirrors the partial unique index on (user_id) WHERE type='WAGER_LIMIT' AND is_active.
template <typename Map>
bool ViolatesActiveWagerLimit(const Map& exclusions, const model::SelfExclusionRecord& r) {
  if (r.type != EXCLUSION_TYPE_WAGER_LIMIT || !r.is_active) return false;
  for (const auto& [id, other] : exclusions) {
    if (id != r.id && other.user_id == r.user_id && other.type == EXCLUSION_TYPE_WAGER_LIMIT && other.is_active) {
      return true;
    }
  }
  return false;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> MemoryRepository::GetBalance(Transaction& t, const std::string& user_id, const std::string& asset) {
  const auto& s  = TX(t).View();
  auto        it = s.balances.find({user_id, asset});
  if (it == s.balances.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BalanceRecord> MemoryRepository::ListBalances(Transaction& t, const std::string& user_id) {
  const auto&                       s = TX(t).View();
  std::vector<model::BalanceRecord> out;
  for (auto it = s.balances.lower_bound({user_id, std::string()}); it != s.balances.end() && it->first.first == user_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
  TX(t).Mutable().balances[{r.user_id, r.asset}] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Result MemoryRepository::InsertOperation(Transaction& t, const model::BalanceOperationRecord& r) {
  if (TX(t).View().operations.contains(r.operation_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "operation_id already applied");
  }
  TX(t).Mutable().operations[r.operation_id] = r;
  return Result::Ok();
}

std::optional<model::BalanceOperationRecord> MemoryRepository::GetOperation(Transaction& t, const std::string& operation_id) {
  const auto& s  = TX(t).View();
  auto        it = s.operations.find(operation_id);
  if (it == s.operations.end()) return std::nullopt;
  return it->second;
}

int64_t MemoryRepository::SumOperationAmounts(Transaction& t, const std::string& user_id, const std::string& asset,
                                              ledger::v1::OperationKind kind, int64_t from_ms, int64_t to_ms) {
  int64_t sum = 0;
  for (const auto& [_, op] : TX(t).View().operations) {
    if (op.user_id == user_id && op.asset == asset && op.kind == kind && op.status == ledger::v1::OPERATION_STATUS_CONFIRMED &&
        op.created_at_ms >= from_ms && op.created_at_ms <= to_ms) {
      sum += op.amount;
    }
  }
  return sum;
}

// ------------------------------------------------------------------
// Statistics
// ------------------------------------------------------------------

std::optional<model::BalanceStatisticsRecord> MemoryRepository::GetStatistics(Transaction& t, const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.statistics.find(user_id);
  if (it == s.statistics.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertStatistics(Transaction& t, const model::BalanceStatisticsRecord& r) {
  TX(t).Mutable().statistics[r.user_id] = r;
  return Result::Ok();
}

Result MemoryRepository::AddDailyStats(Transaction& t, const model::DailyGamblingStatsRecord& delta) {
  auto& row = TX(t).Mutable().daily_stats[{delta.user_id, delta.day, static_cast<int>(delta.platform)}];
  row.user_id  = delta.user_id;
  row.day      = delta.day;
  row.platform = delta.platform;
  row.wager_usd += delta.wager_usd;
  row.win_usd += delta.win_usd;
  row.deposit_usd += delta.deposit_usd;
  row.loss_usd = std::max<int64_t>(0, row.wager_usd - row.win_usd);
  return Result::Ok();
}

std::vector<model::DailyGamblingStatsRecord> MemoryRepository::ListDailyStats(Transaction& t, const std::string& user_id,
                                                                             const std::string& from_day, const std::string& to_day) {
  std::vector<model::DailyGamblingStatsRecord> out;
  for (const auto& [key, row] : TX(t).View().daily_stats) {
    if (row.user_id == user_id && row.day >= from_day && row.day <= to_day) {
      out.push_back(row);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Self-exclusions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSelfExclusion(Transaction& t, const model::SelfExclusionRecord& r) {
  const auto& view = TX(t).View();
  if (view.exclusions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "self-exclusion id exists");
  if (ViolatesActiveWagerLimit(view.exclusions, r)) {
    return Result::Err(ErrorCode::ConstraintViolation, "one active wager limit per user");
  }
  TX(t).Mutable().exclusions[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateSelfExclusion(Transaction& t, const model::SelfExclusionRecord& r) {
  const auto& view = TX(t).View();
  if (!view.exclusions.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  if (ViolatesActiveWagerLimit(view.exclusions, r)) {
    return Result::Err(ErrorCode::ConstraintViolation, "one active wager limit per user");
  }
  TX(t).Mutable().exclusions[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSelfExclusion(Transaction& t, const std::string& id) {
  if (!TX(t).View().exclusions.contains(id)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().exclusions.erase(id);
  return Result::Ok();
}

std::optional<model::SelfExclusionRecord> MemoryRepository::GetSelfExclusion(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.exclusions.find(id);
  if (it == s.exclusions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SelfExclusionRecord> MemoryRepository::ListSelfExclusions(Transaction& t, const std::string& user_id) {
  std::vector<model::SelfExclusionRecord> out;
  for (const auto& [_, r] : TX(t).View().exclusions) {
    if (r.user_id == user_id) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Expiry
// ------------------------------------------------------------------

Result MemoryRepository::StartPostCooldownWindows(Transaction& t, int64_t now_ms, int64_t window_end_ms, uint64_t& affected) {
  affected = 0;
  for (auto& [_, r] : TX(t).Mutable().exclusions) {
    if (r.type == EXCLUSION_TYPE_COOLDOWN && r.is_active && r.end_ms && *r.end_ms < now_ms && !r.post_cooldown_window_end_ms) {
      r.post_cooldown_window_end_ms = window_end_ms;
      r.updated_at_ms               = now_ms;
      ++affected;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredCooldownWindows(Transaction& t, int64_t now_ms, uint64_t& affected) {
  affected  = 0;
  auto& map = TX(t).Mutable().exclusions;
  for (auto it = map.begin(); it != map.end();) {
    const auto& r = it->second;
    if (r.type == EXCLUSION_TYPE_COOLDOWN && r.post_cooldown_window_end_ms && *r.post_cooldown_window_end_ms < now_ms) {
      it = map.erase(it);
      ++affected;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::DeactivateExpiredTemporary(Transaction& t, int64_t now_ms, uint64_t& affected) {
  affected = 0;
  for (auto& [_, r] : TX(t).Mutable().exclusions) {
    if (r.type == EXCLUSION_TYPE_TEMPORARY && r.is_active && r.end_ms && *r.end_ms < now_ms) {
      r.is_active     = false;
      r.updated_at_ms = now_ms;
      ++affected;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteRemovedLimits(Transaction& t, int64_t cutoff_ms, uint64_t& affected) {
  affected  = 0;
  auto& map = TX(t).Mutable().exclusions;
  for (auto it = map.begin(); it != map.end();) {
    const auto& r = it->second;
    if (IsLimitType(r.type) && r.removal_requested_at_ms && *r.removal_requested_at_ms <= cutoff_ms) {
      it = map.erase(it);
      ++affected;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Lock entries and counters
// ------------------------------------------------------------------

Result MemoryRepository::TryAcquireLock(Transaction& t, const model::LockEntryRecord& r, int64_t now_ms) {
  const auto& locks = TX(t).View().locks;
  auto        it    = locks.find(r.key);
  if (it != locks.end() && it->second.expires_at_ms > now_ms) {
    return Result::Err(ErrorCode::Conflict, "lock held");
  }
  TX(t).Mutable().locks[r.key] = r;
  return Result::Ok();
}

Result MemoryRepository::ReleaseLock(Transaction& t, const std::string& key, const std::string& token) {
  const auto& locks = TX(t).View().locks;
  auto        it    = locks.find(key);
  if (it == locks.end() || it->second.token != token) {
    return Result::Err(ErrorCode::NotFound, "lock not held by token");
  }
  TX(t).Mutable().locks.erase(key);
  return Result::Ok();
}

Result MemoryRepository::ExtendLock(Transaction& t, const std::string& key, const std::string& token, int64_t expires_at_ms,
                                    int64_t now_ms) {
  const auto& locks = TX(t).View().locks;
  auto        it    = locks.find(key);
  if (it == locks.end() || it->second.token != token || it->second.expires_at_ms <= now_ms) {
    return Result::Err(ErrorCode::NotFound, "lock not held by token");
  }
  TX(t).Mutable().locks[key].expires_at_ms = expires_at_ms;
  return Result::Ok();
}

std::optional<model::LockEntryRecord> MemoryRepository::GetLock(Transaction& t, const std::string& key, int64_t now_ms) {
  const auto& locks = TX(t).View().locks;
  auto        it    = locks.find(key);
  if (it == locks.end() || it->second.expires_at_ms <= now_ms) return std::nullopt;
  return it->second;
}

Result MemoryRepository::IncrementCounter(Transaction& t, const std::string& key, int64_t expires_at_ms, int64_t now_ms,
                                          uint64_t& count) {
  auto& counter = TX(t).Mutable().counters[key];
  if (counter.count == 0 || counter.expires_at_ms <= now_ms) {
    counter.count         = 1;
    counter.expires_at_ms = expires_at_ms;
  } else {
    ++counter.count;
  }
  count = counter.count;
  return Result::Ok();
}

} // namespace ledger::db::memory
