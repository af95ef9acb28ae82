#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string& user_id, const std::string& asset) override;
  std::vector<model::BalanceRecord> ListBalances(Transaction&, const std::string& user_id) override;
  Result UpsertBalance(Transaction&, const model::BalanceRecord&) override;

  Result InsertOperation(Transaction&, const model::BalanceOperationRecord&) override;
  std::optional<model::BalanceOperationRecord> GetOperation(Transaction&, const std::string& operation_id) override;
  int64_t SumOperationAmounts(Transaction&, const std::string& user_id, const std::string& asset, ledger::v1::OperationKind kind,
                              int64_t from_ms, int64_t to_ms) override;

  std::optional<model::BalanceStatisticsRecord> GetStatistics(Transaction&, const std::string& user_id) override;
  Result UpsertStatistics(Transaction&, const model::BalanceStatisticsRecord&) override;
  Result AddDailyStats(Transaction&, const model::DailyGamblingStatsRecord&) override;
  std::vector<model::DailyGamblingStatsRecord> ListDailyStats(Transaction&, const std::string& user_id, const std::string& from_day,
                                                             const std::string& to_day) override;

  Result InsertSelfExclusion(Transaction&, const model::SelfExclusionRecord&) override;
  Result UpdateSelfExclusion(Transaction&, const model::SelfExclusionRecord&) override;
  Result DeleteSelfExclusion(Transaction&, const std::string& id) override;
  std::optional<model::SelfExclusionRecord> GetSelfExclusion(Transaction&, const std::string& id) override;
  std::vector<model::SelfExclusionRecord> ListSelfExclusions(Transaction&, const std::string& user_id) override;

  Result StartPostCooldownWindows(Transaction&, int64_t now_ms, int64_t window_end_ms, uint64_t& affected) override;
  Result DeleteExpiredCooldownWindows(Transaction&, int64_t now_ms, uint64_t& affected) override;
  Result DeactivateExpiredTemporary(Transaction&, int64_t now_ms, uint64_t& affected) override;
  Result DeleteRemovedLimits(Transaction&, int64_t cutoff_ms, uint64_t& affected) override;

  Result TryAcquireLock(Transaction&, const model::LockEntryRecord&, int64_t now_ms) override;
  Result ReleaseLock(Transaction&, const std::string& key, const std::string& token) override;
  Result ExtendLock(Transaction&, const std::string& key, const std::string& token, int64_t expires_at_ms, int64_t now_ms) override;
  std::optional<model::LockEntryRecord> GetLock(Transaction&, const std::string& key, int64_t now_ms) override;
  Result IncrementCounter(Transaction&, const std::string& key, int64_t expires_at_ms, int64_t now_ms, uint64_t& count) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Runs a write statement to completion; affected receives sqlite3_changes.
  static Result Execute(sqlite3* db, sqlite3_stmt* st, uint64_t* affected = nullptr);
};

}
