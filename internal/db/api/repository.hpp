#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/balance_operation_record.hpp"
#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/balance_statistics_record.hpp"
#include "internal/db/model/daily_gambling_stats_record.hpp"
#include "internal/db/model/lock_entry_record.hpp"
#include "internal/db/model/self_exclusion_record.hpp"

namespace ledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - operation_id is unique (duplicate insert fails)
  - At most one active WAGER_LIMIT per user (duplicate fails)
  - Conditional statements (scheduler, lock entries) are atomic

  The DB is the source of truth for:
    balances and applied operations
    self-exclusions and limits
    shared lock entries and rate counters
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Balances
  // ---------------------------------------------------------------------

  virtual std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string& user_id, const std::string& asset) = 0;

  virtual std::vector<model::BalanceRecord> ListBalances(Transaction&, const std::string& user_id) = 0;

  virtual Result UpsertBalance(Transaction&, const model::BalanceRecord&) = 0;

  // ---------------------------------------------------------------------
  // Operations (append only)
  // ---------------------------------------------------------------------

  // AlreadyExists / ConstraintViolation when operation_id is taken.
  virtual Result InsertOperation(Transaction&, const model::BalanceOperationRecord&) = 0;

  virtual std::optional<model::BalanceOperationRecord> GetOperation(Transaction&, const std::string& operation_id) = 0;

  // Sum of amount for confirmed operations with created_at_ms in [from_ms, to_ms].
  virtual int64_t SumOperationAmounts(Transaction&, const std::string& user_id, const std::string& asset, ledger::v1::OperationKind kind,
                                      int64_t from_ms, int64_t to_ms) = 0;

  // ---------------------------------------------------------------------
  // Statistics
  // ---------------------------------------------------------------------

  virtual std::optional<model::BalanceStatisticsRecord> GetStatistics(Transaction&, const std::string& user_id) = 0;

  virtual Result UpsertStatistics(Transaction&, const model::BalanceStatisticsRecord&) = 0;

  // Adds wager/win/deposit of delta to the (user, day, platform) row,
  // creating it when missing, and recomputes loss_usd.
  virtual Result AddDailyStats(Transaction&, const model::DailyGamblingStatsRecord& delta) = 0;

  // Rows with from_day <= day <= to_day, all platforms.
  virtual std::vector<model::DailyGamblingStatsRecord> ListDailyStats(Transaction&, const std::string& user_id, const std::string& from_day,
                                                                     const std::string& to_day) = 0;

  // ---------------------------------------------------------------------
  // Self-exclusions and limits
  // ---------------------------------------------------------------------

  virtual Result InsertSelfExclusion(Transaction&, const model::SelfExclusionRecord&) = 0;

  virtual Result UpdateSelfExclusion(Transaction&, const model::SelfExclusionRecord&) = 0;

  virtual Result DeleteSelfExclusion(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::SelfExclusionRecord> GetSelfExclusion(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::SelfExclusionRecord> ListSelfExclusions(Transaction&, const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // Expiry (each is one conditional statement, safe to race)
  // ---------------------------------------------------------------------

  // Active cooldowns with end_ms < now and no window: window_end_ms := window_end.
  virtual Result StartPostCooldownWindows(Transaction&, int64_t now_ms, int64_t window_end_ms, uint64_t& affected) = 0;

  // Cooldowns whose window ended before now.
  virtual Result DeleteExpiredCooldownWindows(Transaction&, int64_t now_ms, uint64_t& affected) = 0;

  // Active temporaries with end_ms < now: is_active := false.
  virtual Result DeactivateExpiredTemporary(Transaction&, int64_t now_ms, uint64_t& affected) = 0;

  // Limits with removal_requested_at_ms <= cutoff.
  virtual Result DeleteRemovedLimits(Transaction&, int64_t cutoff_ms, uint64_t& affected) = 0;

  // ---------------------------------------------------------------------
  // Shared lock entries and counters
  // ---------------------------------------------------------------------

  // Conflict when an unexpired entry for key exists.
  virtual Result TryAcquireLock(Transaction&, const model::LockEntryRecord&, int64_t now_ms) = 0;

  // NotFound when the stored token differs or the key is absent.
  virtual Result ReleaseLock(Transaction&, const std::string& key, const std::string& token) = 0;

  // NotFound unless an unexpired entry with token exists.
  virtual Result ExtendLock(Transaction&, const std::string& key, const std::string& token, int64_t expires_at_ms, int64_t now_ms) = 0;

  // Unexpired entry only.
  virtual std::optional<model::LockEntryRecord> GetLock(Transaction&, const std::string& key, int64_t now_ms) = 0;

  // Increments key's counter, restarting it at 1 with expires_at_ms when
  // absent or expired. count receives the new value.
  virtual Result IncrementCounter(Transaction&, const std::string& key, int64_t expires_at_ms, int64_t now_ms, uint64_t& count) = 0;
};

} // namespace ledger::db
