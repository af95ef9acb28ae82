#include "pg_repository.hpp"

#include "internal/db/model/enum_codec.hpp"

namespace ledger::db::postgres {

namespace {

std::optional<int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<int64_t>();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::BalanceRecord ReadBalance(const pqxx::row& row) {
  model::BalanceRecord r;
  r.user_id       = row[0].c_str();
  r.asset         = row[1].c_str();
  r.balance       = row[2].as<int64_t>();
  r.is_primary    = row[3].as<bool>();
  r.updated_at_ms = row[4].as<int64_t>();
  return r;
}

model::BalanceOperationRecord ReadOperation(const pqxx::row& row) {
  model::BalanceOperationRecord r;
  r.operation_id     = row[0].c_str();
  r.user_id          = row[1].c_str();
  r.asset            = row[2].c_str();
  r.kind             = model::ParseOperationKind(row[3].c_str());
  r.amount           = row[4].as<int64_t>();
  r.signed_amount    = row[5].as<int64_t>();
  r.previous_balance = row[6].as<int64_t>();
  r.balance_after    = row[7].as<int64_t>();
  r.status           = model::ParseOperationStatus(row[8].c_str());
  r.description      = Text(row[9]);
  r.platform         = model::ParsePlatform(row[10].c_str());
  r.created_at_ms    = row[11].as<int64_t>();
  return r;
}

model::SelfExclusionRecord ReadExclusion(const pqxx::row& row) {
  model::SelfExclusionRecord r;
  r.id       = row[0].c_str();
  r.user_id  = row[1].c_str();
  r.type     = model::ParseExclusionType(row[2].c_str());
  r.platform = model::ParsePlatform(row[3].c_str());
  if (!row[4].is_null()) r.period = model::ParseLimitPeriod(row[4].c_str());
  r.limit_amount                = OptI64(row[5]);
  r.start_ms                    = row[6].as<int64_t>();
  r.end_ms                      = OptI64(row[7]);
  r.is_active                   = row[8].as<bool>();
  r.removal_requested_at_ms     = OptI64(row[9]);
  r.post_cooldown_window_end_ms = OptI64(row[10]);
  r.created_at_ms               = row[11].as<int64_t>();
  r.updated_at_ms               = row[12].as<int64_t>();
  return r;
}

std::optional<std::string> PeriodCode(const model::SelfExclusionRecord& r) {
  if (!r.period) return std::nullopt;
  return model::LimitPeriodCode(*r.period);
}

constexpr const char* kExclusionColumns =
    "id,user_id,type,platform,period,limit_amount,start_ms,end_ms,is_active,"
    "removal_requested_at_ms,post_cooldown_window_end_ms,created_at_ms,updated_at_ms";

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::WriteConflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> PgRepository::GetBalance(Transaction& t, const std::string& user_id, const std::string& asset) {
  auto res = TX(t).Work().exec_prepared("get_balance", user_id, asset);
  if (res.empty()) return std::nullopt;
  return ReadBalance(res[0]);
}

std::vector<model::BalanceRecord> PgRepository::ListBalances(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT user_id,asset,balance,is_primary,updated_at_ms FROM balances WHERE user_id=$1 ORDER BY asset;", user_id);

  std::vector<model::BalanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadBalance(row));
  return out;
}

Result PgRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_balance", r.user_id, r.asset, r.balance, r.is_primary, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Result PgRepository::InsertOperation(Transaction& t, const model::BalanceOperationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_operation", r.operation_id, r.user_id, r.asset, model::OperationKindCode(r.kind), r.amount,
                               r.signed_amount, r.previous_balance, r.balance_after, model::OperationStatusCode(r.status),
                               r.description, model::PlatformCode(r.platform), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BalanceOperationRecord> PgRepository::GetOperation(Transaction& t, const std::string& operation_id) {
  auto res = TX(t).Work().exec_prepared("get_operation", operation_id);
  if (res.empty()) return std::nullopt;
  return ReadOperation(res[0]);
}

int64_t PgRepository::SumOperationAmounts(Transaction& t, const std::string& user_id, const std::string& asset,
                                          ledger::v1::OperationKind kind, int64_t from_ms, int64_t to_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT COALESCE(SUM(amount),0)::BIGINT FROM balance_operations WHERE user_id=$1 AND asset=$2 AND kind=$3 "
      "AND status='CONFIRMED' AND created_at_ms BETWEEN $4 AND $5;",
      user_id, asset, model::OperationKindCode(kind), from_ms, to_ms);
  if (res.empty()) return 0;
  return res[0][0].as<int64_t>();
}

// ------------------------------------------------------------------
// Statistics
// ------------------------------------------------------------------

std::optional<model::BalanceStatisticsRecord> PgRepository::GetStatistics(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT user_id,deposits_cents,withdrawals_cents,bets_cents,wins_cents,refunds_cents,bet_count,win_count "
      "FROM balance_statistics WHERE user_id=$1;",
      user_id);
  if (res.empty()) return std::nullopt;

  const auto&                    row = res[0];
  model::BalanceStatisticsRecord r;
  r.user_id           = row[0].c_str();
  r.deposits_cents    = row[1].as<int64_t>();
  r.withdrawals_cents = row[2].as<int64_t>();
  r.bets_cents        = row[3].as<int64_t>();
  r.wins_cents        = row[4].as<int64_t>();
  r.refunds_cents     = row[5].as<int64_t>();
  r.bet_count         = row[6].as<int64_t>();
  r.win_count         = row[7].as<int64_t>();
  return r;
}

Result PgRepository::UpsertStatistics(Transaction& t, const model::BalanceStatisticsRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO balance_statistics(user_id,deposits_cents,withdrawals_cents,bets_cents,wins_cents,refunds_cents,"
        "bet_count,win_count) VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
        "ON CONFLICT(user_id) DO UPDATE SET deposits_cents=EXCLUDED.deposits_cents,"
        "withdrawals_cents=EXCLUDED.withdrawals_cents,bets_cents=EXCLUDED.bets_cents,wins_cents=EXCLUDED.wins_cents,"
        "refunds_cents=EXCLUDED.refunds_cents,bet_count=EXCLUDED.bet_count,win_count=EXCLUDED.win_count;",
        r.user_id, r.deposits_cents, r.withdrawals_cents, r.bets_cents, r.wins_cents, r.refunds_cents, r.bet_count, r.win_count);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AddDailyStats(Transaction& t, const model::DailyGamblingStatsRecord& d) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO daily_gambling_stats AS s(user_id,day,platform,wager_usd,win_usd,loss_usd,deposit_usd) "
        "VALUES($1,$2,$3,$4::BIGINT,$5::BIGINT,GREATEST(0,$4::BIGINT-$5::BIGINT),$6::BIGINT) "
        "ON CONFLICT(user_id,day,platform) DO UPDATE SET "
        "wager_usd=s.wager_usd+EXCLUDED.wager_usd,"
        "win_usd=s.win_usd+EXCLUDED.win_usd,"
        "deposit_usd=s.deposit_usd+EXCLUDED.deposit_usd,"
        "loss_usd=GREATEST(0,(s.wager_usd+EXCLUDED.wager_usd)-(s.win_usd+EXCLUDED.win_usd));",
        d.user_id, d.day, model::PlatformCode(d.platform), d.wager_usd, d.win_usd, d.deposit_usd);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DailyGamblingStatsRecord> PgRepository::ListDailyStats(Transaction& t, const std::string& user_id,
                                                                         const std::string& from_day, const std::string& to_day) {
  auto res = TX(t).Work().exec_params(
      "SELECT user_id,day,platform,wager_usd,win_usd,loss_usd,deposit_usd FROM daily_gambling_stats "
      "WHERE user_id=$1 AND day>=$2 AND day<=$3 ORDER BY day,platform;",
      user_id, from_day, to_day);

  std::vector<model::DailyGamblingStatsRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::DailyGamblingStatsRecord r;
    r.user_id       = row[0].c_str();
    r.day           = row[1].c_str();
    r.platform      = model::ParsePlatform(row[2].c_str());
    r.wager_usd   = row[3].as<int64_t>();
    r.win_usd     = row[4].as<int64_t>();
    r.loss_usd    = row[5].as<int64_t>();
    r.deposit_usd = row[6].as<int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Self-exclusions
// ------------------------------------------------------------------

Result PgRepository::InsertSelfExclusion(Transaction& t, const model::SelfExclusionRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO self_exclusions(") + kExclusionColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13);",
                             r.id, r.user_id, model::ExclusionTypeCode(r.type), model::PlatformCode(r.platform), PeriodCode(r),
                             r.limit_amount, r.start_ms, r.end_ms, r.is_active, r.removal_requested_at_ms,
                             r.post_cooldown_window_end_ms, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateSelfExclusion(Transaction& t, const model::SelfExclusionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE self_exclusions SET type=$2,platform=$3,period=$4,limit_amount=$5,start_ms=$6,end_ms=$7,is_active=$8,"
        "removal_requested_at_ms=$9,post_cooldown_window_end_ms=$10,updated_at_ms=$11 WHERE id=$1;",
        r.id, model::ExclusionTypeCode(r.type), model::PlatformCode(r.platform), PeriodCode(r), r.limit_amount, r.start_ms, r.end_ms,
        r.is_active, r.removal_requested_at_ms, r.post_cooldown_window_end_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSelfExclusion(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM self_exclusions WHERE id=$1;", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SelfExclusionRecord> PgRepository::GetSelfExclusion(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kExclusionColumns + " FROM self_exclusions WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadExclusion(res[0]);
}

std::vector<model::SelfExclusionRecord> PgRepository::ListSelfExclusions(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kExclusionColumns + " FROM self_exclusions WHERE user_id=$1 ORDER BY created_at_ms DESC, id DESC;",
      user_id);

  std::vector<model::SelfExclusionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadExclusion(row));
  return out;
}

// ------------------------------------------------------------------
// Expiry
// ------------------------------------------------------------------

Result PgRepository::StartPostCooldownWindows(Transaction& t, int64_t now_ms, int64_t window_end_ms, uint64_t& affected) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE self_exclusions SET post_cooldown_window_end_ms=$1, updated_at_ms=$2 "
        "WHERE type='COOLDOWN' AND is_active AND end_ms IS NOT NULL AND end_ms < $2 "
        "AND post_cooldown_window_end_ms IS NULL;",
        window_end_ms, now_ms);
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredCooldownWindows(Transaction& t, int64_t now_ms, uint64_t& affected) {
  try {
    auto res = TX(t).Work().exec_params(
        "DELETE FROM self_exclusions WHERE type='COOLDOWN' AND post_cooldown_window_end_ms IS NOT NULL "
        "AND post_cooldown_window_end_ms < $1;",
        now_ms);
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeactivateExpiredTemporary(Transaction& t, int64_t now_ms, uint64_t& affected) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE self_exclusions SET is_active=FALSE, updated_at_ms=$1 "
        "WHERE type='TEMPORARY' AND is_active AND end_ms IS NOT NULL AND end_ms < $1;",
        now_ms);
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRemovedLimits(Transaction& t, int64_t cutoff_ms, uint64_t& affected) {
  try {
    auto res = TX(t).Work().exec_params(
        "DELETE FROM self_exclusions WHERE type IN ('DEPOSIT_LIMIT','LOSS_LIMIT','WAGER_LIMIT') "
        "AND removal_requested_at_ms IS NOT NULL AND removal_requested_at_ms <= $1;",
        cutoff_ms);
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Lock entries and counters
// ------------------------------------------------------------------

Result PgRepository::TryAcquireLock(Transaction& t, const model::LockEntryRecord& r, int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("try_acquire_lock", r.key, r.token, r.expires_at_ms, now_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "lock held");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReleaseLock(Transaction& t, const std::string& key, const std::string& token) {
  try {
    auto res = TX(t).Work().exec_prepared("release_lock", key, token);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "lock not held by token");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ExtendLock(Transaction& t, const std::string& key, const std::string& token, int64_t expires_at_ms,
                                int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("extend_lock", key, token, expires_at_ms, now_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "lock not held by token");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LockEntryRecord> PgRepository::GetLock(Transaction& t, const std::string& key, int64_t now_ms) {
  auto res = TX(t).Work().exec_params("SELECT key,token,expires_at_ms FROM lock_entries WHERE key=$1 AND expires_at_ms > $2;", key,
                                      now_ms);
  if (res.empty()) return std::nullopt;

  model::LockEntryRecord r;
  r.key           = res[0][0].c_str();
  r.token         = res[0][1].c_str();
  r.expires_at_ms = res[0][2].as<int64_t>();
  return r;
}

Result PgRepository::IncrementCounter(Transaction& t, const std::string& key, int64_t expires_at_ms, int64_t now_ms,
                                      uint64_t& count) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO rate_counters AS c(key,count,expires_at_ms) VALUES($1,1,$2) "
        "ON CONFLICT(key) DO UPDATE SET "
        "count=CASE WHEN c.expires_at_ms <= $3 THEN 1 ELSE c.count + 1 END,"
        "expires_at_ms=CASE WHEN c.expires_at_ms <= $3 THEN EXCLUDED.expires_at_ms ELSE c.expires_at_ms END "
        "RETURNING count;",
        key, expires_at_ms, now_ms);
    count = res.empty() ? 0 : res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
