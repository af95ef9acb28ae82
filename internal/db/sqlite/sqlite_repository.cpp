#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/model/enum_codec.hpp"

namespace ledger::db::sqlite {

using ledger::db::ErrorCode;
using ledger::db::Result;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Null on failure; writers report it through Result.
Stmt Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        st = nullptr;
    }
    return Stmt(st, &sqlite3_finalize);
}

// Readers have no Result channel, so a bad statement throws.
Stmt MustPrepare(sqlite3* db, const char* sql) {
    auto st = Prepare(db, sql);
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
    sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v) {
        BindI64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col) != 0;
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

model::BalanceRecord ReadBalance(sqlite3_stmt* st) {
    model::BalanceRecord r;
    r.user_id       = ColText(st, 0);
    r.asset         = ColText(st, 1);
    r.balance       = ColI64(st, 2);
    r.is_primary    = ColBool(st, 3);
    r.updated_at_ms = ColI64(st, 4);
    return r;
}

model::BalanceOperationRecord ReadOperation(sqlite3_stmt* st) {
    model::BalanceOperationRecord r;
    r.operation_id     = ColText(st, 0);
    r.user_id          = ColText(st, 1);
    r.asset            = ColText(st, 2);
    r.kind             = model::ParseOperationKind(ColText(st, 3));
    r.amount           = ColI64(st, 4);
    r.signed_amount    = ColI64(st, 5);
    r.previous_balance = ColI64(st, 6);
    r.balance_after    = ColI64(st, 7);
    r.status           = model::ParseOperationStatus(ColText(st, 8));
    r.description      = ColText(st, 9);
    r.platform         = model::ParsePlatform(ColText(st, 10));
    r.created_at_ms    = ColI64(st, 11);
    return r;
}

model::SelfExclusionRecord ReadExclusion(sqlite3_stmt* st) {
    model::SelfExclusionRecord r;
    r.id       = ColText(st, 0);
    r.user_id  = ColText(st, 1);
    r.type     = model::ParseExclusionType(ColText(st, 2));
    r.platform = model::ParsePlatform(ColText(st, 3));
    if (sqlite3_column_type(st, 4) != SQLITE_NULL) r.period = model::ParseLimitPeriod(ColText(st, 4));
    r.limit_amount                = ColOptI64(st, 5);
    r.start_ms                    = ColI64(st, 6);
    r.end_ms                      = ColOptI64(st, 7);
    r.is_active                   = ColBool(st, 8);
    r.removal_requested_at_ms     = ColOptI64(st, 9);
    r.post_cooldown_window_end_ms = ColOptI64(st, 10);
    r.created_at_ms               = ColI64(st, 11);
    r.updated_at_ms               = ColI64(st, 12);
    return r;
}

model::DailyGamblingStatsRecord ReadDaily(sqlite3_stmt* st) {
    model::DailyGamblingStatsRecord r;
    r.user_id       = ColText(st, 0);
    r.day           = ColText(st, 1);
    r.platform      = model::ParsePlatform(ColText(st, 2));
    r.wager_usd   = ColI64(st, 3);
    r.win_usd     = ColI64(st, 4);
    r.loss_usd    = ColI64(st, 5);
    r.deposit_usd = ColI64(st, 6);
    return r;
}

constexpr const char* kExclusionColumns =
    "id,user_id,type,platform,period,limit_amount,start_ms,end_ms,is_active,"
    "removal_requested_at_ms,post_cooldown_window_end_ms,created_at_ms,updated_at_ms";

constexpr const char* kOperationColumns =
    "operation_id,user_id,asset,kind,amount,signed_amount,previous_balance,balance_after,"
    "status,description,platform,created_at_ms";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::WriteConflict, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Execute(sqlite3* db, sqlite3_stmt* st, uint64_t* affected) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (affected) *affected = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord>
SqliteRepository::GetBalance(Transaction& t, const std::string& user_id, const std::string& asset) {
    auto* db = TX(t).Handle();
    auto st = MustPrepare(db,
        "SELECT user_id,asset,balance,is_primary,updated_at_ms FROM balances WHERE user_id=? AND asset=?;");

    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, asset);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadBalance(st.get());
}

std::vector<model::BalanceRecord> SqliteRepository::ListBalances(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();
    auto st = MustPrepare(db,
        "SELECT user_id,asset,balance,is_primary,updated_at_ms FROM balances WHERE user_id=? ORDER BY asset;");
    BindText(st.get(), 1, user_id);

    std::vector<model::BalanceRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadBalance(st.get()));
    return out;
}

Result SqliteRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO balances(user_id,asset,balance,is_primary,updated_at_ms) VALUES(?,?,?,?,?) "
        "ON CONFLICT(user_id,asset) DO UPDATE SET balance=excluded.balance,"
        "is_primary=excluded.is_primary,updated_at_ms=excluded.updated_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.user_id);
    BindText(st.get(), 2, r.asset);
    BindI64(st.get(), 3, r.balance);
    BindBool(st.get(), 4, r.is_primary);
    BindI64(st.get(), 5, r.updated_at_ms);

    return Execute(db, st.get());
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Result SqliteRepository::InsertOperation(Transaction& t, const model::BalanceOperationRecord& r) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("INSERT INTO balance_operations(") + kOperationColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";
    auto st = Prepare(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.operation_id);
    BindText(st.get(), 2, r.user_id);
    BindText(st.get(), 3, r.asset);
    BindText(st.get(), 4, model::OperationKindCode(r.kind));
    BindI64(st.get(), 5, r.amount);
    BindI64(st.get(), 6, r.signed_amount);
    BindI64(st.get(), 7, r.previous_balance);
    BindI64(st.get(), 8, r.balance_after);
    BindText(st.get(), 9, model::OperationStatusCode(r.status));
    BindText(st.get(), 10, r.description);
    BindText(st.get(), 11, model::PlatformCode(r.platform));
    BindI64(st.get(), 12, r.created_at_ms);

    return Execute(db, st.get());
}

std::optional<model::BalanceOperationRecord>
SqliteRepository::GetOperation(Transaction& t, const std::string& operation_id) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kOperationColumns + " FROM balance_operations WHERE operation_id=?;";
    auto st = MustPrepare(db, sql.c_str());
    BindText(st.get(), 1, operation_id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadOperation(st.get());
}

int64_t SqliteRepository::SumOperationAmounts(Transaction& t, const std::string& user_id, const std::string& asset,
                                              ledger::v1::OperationKind kind, int64_t from_ms, int64_t to_ms) {
    auto* db = TX(t).Handle();
    auto st = MustPrepare(db,
        "SELECT COALESCE(SUM(amount),0) FROM balance_operations WHERE user_id=? AND asset=? AND kind=? "
        "AND status='CONFIRMED' AND created_at_ms BETWEEN ? AND ?;");
    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, asset);
    BindText(st.get(), 3, model::OperationKindCode(kind));
    BindI64(st.get(), 4, from_ms);
    BindI64(st.get(), 5, to_ms);

    if (!StepRow(db, st.get())) return 0;
    return ColI64(st.get(), 0);
}

// ------------------------------------------------------------------
// Statistics
// ------------------------------------------------------------------

std::optional<model::BalanceStatisticsRecord>
SqliteRepository::GetStatistics(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();
    auto st = MustPrepare(db,
        "SELECT user_id,deposits_cents,withdrawals_cents,bets_cents,wins_cents,refunds_cents,bet_count,win_count "
        "FROM balance_statistics WHERE user_id=?;");
    BindText(st.get(), 1, user_id);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::BalanceStatisticsRecord r;
    r.user_id           = ColText(st.get(), 0);
    r.deposits_cents    = ColI64(st.get(), 1);
    r.withdrawals_cents = ColI64(st.get(), 2);
    r.bets_cents        = ColI64(st.get(), 3);
    r.wins_cents        = ColI64(st.get(), 4);
    r.refunds_cents     = ColI64(st.get(), 5);
    r.bet_count         = ColI64(st.get(), 6);
    r.win_count         = ColI64(st.get(), 7);
    return r;
}

Result SqliteRepository::UpsertStatistics(Transaction& t, const model::BalanceStatisticsRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO balance_statistics(user_id,deposits_cents,withdrawals_cents,bets_cents,wins_cents,refunds_cents,"
        "bet_count,win_count) VALUES(?,?,?,?,?,?,?,?) "
        "ON CONFLICT(user_id) DO UPDATE SET deposits_cents=excluded.deposits_cents,"
        "withdrawals_cents=excluded.withdrawals_cents,bets_cents=excluded.bets_cents,wins_cents=excluded.wins_cents,"
        "refunds_cents=excluded.refunds_cents,bet_count=excluded.bet_count,win_count=excluded.win_count;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.user_id);
    BindI64(st.get(), 2, r.deposits_cents);
    BindI64(st.get(), 3, r.withdrawals_cents);
    BindI64(st.get(), 4, r.bets_cents);
    BindI64(st.get(), 5, r.wins_cents);
    BindI64(st.get(), 6, r.refunds_cents);
    BindI64(st.get(), 7, r.bet_count);
    BindI64(st.get(), 8, r.win_count);

    return Execute(db, st.get());
}

Result SqliteRepository::AddDailyStats(Transaction& t, const model::DailyGamblingStatsRecord& d) {
    auto* db = TX(t).Handle();
    // all SET expressions see the pre-update row
    auto st = Prepare(db,
        "INSERT INTO daily_gambling_stats(user_id,day,platform,wager_usd,win_usd,loss_usd,deposit_usd) "
        "VALUES(?1,?2,?3,?4,?5,MAX(0,?4-?5),?6) "
        "ON CONFLICT(user_id,day,platform) DO UPDATE SET "
        "wager_usd=wager_usd+excluded.wager_usd,"
        "win_usd=win_usd+excluded.win_usd,"
        "deposit_usd=deposit_usd+excluded.deposit_usd,"
        "loss_usd=MAX(0,(wager_usd+excluded.wager_usd)-(win_usd+excluded.win_usd));");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, d.user_id);
    BindText(st.get(), 2, d.day);
    BindText(st.get(), 3, model::PlatformCode(d.platform));
    BindI64(st.get(), 4, d.wager_usd);
    BindI64(st.get(), 5, d.win_usd);
    BindI64(st.get(), 6, d.deposit_usd);

    return Execute(db, st.get());
}

std::vector<model::DailyGamblingStatsRecord>
SqliteRepository::ListDailyStats(Transaction& t, const std::string& user_id, const std::string& from_day, const std::string& to_day) {
    auto* db = TX(t).Handle();
    auto st = MustPrepare(db,
        "SELECT user_id,day,platform,wager_usd,win_usd,loss_usd,deposit_usd FROM daily_gambling_stats "
        "WHERE user_id=? AND day>=? AND day<=? ORDER BY day,platform;");
    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, from_day);
    BindText(st.get(), 3, to_day);

    std::vector<model::DailyGamblingStatsRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadDaily(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Self-exclusions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSelfExclusion(Transaction& t, const model::SelfExclusionRecord& r) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("INSERT INTO self_exclusions(") + kExclusionColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";
    auto st = Prepare(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.user_id);
    BindText(st.get(), 3, model::ExclusionTypeCode(r.type));
    BindText(st.get(), 4, model::PlatformCode(r.platform));
    if (r.period) {
        BindText(st.get(), 5, model::LimitPeriodCode(*r.period));
    } else {
        sqlite3_bind_null(st.get(), 5);
    }
    BindOptI64(st.get(), 6, r.limit_amount);
    BindI64(st.get(), 7, r.start_ms);
    BindOptI64(st.get(), 8, r.end_ms);
    BindBool(st.get(), 9, r.is_active);
    BindOptI64(st.get(), 10, r.removal_requested_at_ms);
    BindOptI64(st.get(), 11, r.post_cooldown_window_end_ms);
    BindI64(st.get(), 12, r.created_at_ms);
    BindI64(st.get(), 13, r.updated_at_ms);

    return Execute(db, st.get());
}

Result SqliteRepository::UpdateSelfExclusion(Transaction& t, const model::SelfExclusionRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "UPDATE self_exclusions SET type=?,platform=?,period=?,limit_amount=?,start_ms=?,end_ms=?,is_active=?,"
        "removal_requested_at_ms=?,post_cooldown_window_end_ms=?,updated_at_ms=? WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, model::ExclusionTypeCode(r.type));
    BindText(st.get(), 2, model::PlatformCode(r.platform));
    if (r.period) {
        BindText(st.get(), 3, model::LimitPeriodCode(*r.period));
    } else {
        sqlite3_bind_null(st.get(), 3);
    }
    BindOptI64(st.get(), 4, r.limit_amount);
    BindI64(st.get(), 5, r.start_ms);
    BindOptI64(st.get(), 6, r.end_ms);
    BindBool(st.get(), 7, r.is_active);
    BindOptI64(st.get(), 8, r.removal_requested_at_ms);
    BindOptI64(st.get(), 9, r.post_cooldown_window_end_ms);
    BindI64(st.get(), 10, r.updated_at_ms);
    BindText(st.get(), 11, r.id);

    uint64_t changed = 0;
    auto     res     = Execute(db, st.get(), &changed);
    if (!res) return res;
    if (changed == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::DeleteSelfExclusion(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, "DELETE FROM self_exclusions WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);

    uint64_t changed = 0;
    auto     res     = Execute(db, st.get(), &changed);
    if (!res) return res;
    if (changed == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::optional<model::SelfExclusionRecord> SqliteRepository::GetSelfExclusion(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kExclusionColumns + " FROM self_exclusions WHERE id=?;";
    auto st = MustPrepare(db, sql.c_str());
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadExclusion(st.get());
}

std::vector<model::SelfExclusionRecord> SqliteRepository::ListSelfExclusions(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kExclusionColumns +
                            " FROM self_exclusions WHERE user_id=? ORDER BY created_at_ms DESC, id DESC;";
    auto st = MustPrepare(db, sql.c_str());
    BindText(st.get(), 1, user_id);

    std::vector<model::SelfExclusionRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadExclusion(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Expiry
// ------------------------------------------------------------------

Result SqliteRepository::StartPostCooldownWindows(Transaction& t, int64_t now_ms, int64_t window_end_ms, uint64_t& affected) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "UPDATE self_exclusions SET post_cooldown_window_end_ms=?1, updated_at_ms=?2 "
        "WHERE type='COOLDOWN' AND is_active=1 AND end_ms IS NOT NULL AND end_ms < ?2 "
        "AND post_cooldown_window_end_ms IS NULL;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, window_end_ms);
    BindI64(st.get(), 2, now_ms);
    return Execute(db, st.get(), &affected);
}

Result SqliteRepository::DeleteExpiredCooldownWindows(Transaction& t, int64_t now_ms, uint64_t& affected) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "DELETE FROM self_exclusions WHERE type='COOLDOWN' AND post_cooldown_window_end_ms IS NOT NULL "
        "AND post_cooldown_window_end_ms < ?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, now_ms);
    return Execute(db, st.get(), &affected);
}

Result SqliteRepository::DeactivateExpiredTemporary(Transaction& t, int64_t now_ms, uint64_t& affected) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "UPDATE self_exclusions SET is_active=0, updated_at_ms=?1 "
        "WHERE type='TEMPORARY' AND is_active=1 AND end_ms IS NOT NULL AND end_ms < ?1;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, now_ms);
    return Execute(db, st.get(), &affected);
}

Result SqliteRepository::DeleteRemovedLimits(Transaction& t, int64_t cutoff_ms, uint64_t& affected) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "DELETE FROM self_exclusions WHERE type IN ('DEPOSIT_LIMIT','LOSS_LIMIT','WAGER_LIMIT') "
        "AND removal_requested_at_ms IS NOT NULL AND removal_requested_at_ms <= ?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, cutoff_ms);
    return Execute(db, st.get(), &affected);
}

// ------------------------------------------------------------------
// Lock entries and counters
// ------------------------------------------------------------------

Result SqliteRepository::TryAcquireLock(Transaction& t, const model::LockEntryRecord& r, int64_t now_ms) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO lock_entries(key,token,expires_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(key) DO UPDATE SET token=excluded.token, expires_at_ms=excluded.expires_at_ms "
        "WHERE lock_entries.expires_at_ms <= ?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.key);
    BindText(st.get(), 2, r.token);
    BindI64(st.get(), 3, r.expires_at_ms);
    BindI64(st.get(), 4, now_ms);

    uint64_t changed = 0;
    auto     res     = Execute(db, st.get(), &changed);
    if (!res) return res;
    if (changed == 0) return Result::Err(ErrorCode::Conflict, "lock held");
    return Result::Ok();
}

Result SqliteRepository::ReleaseLock(Transaction& t, const std::string& key, const std::string& token) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, "DELETE FROM lock_entries WHERE key=? AND token=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, key);
    BindText(st.get(), 2, token);

    uint64_t changed = 0;
    auto     res     = Execute(db, st.get(), &changed);
    if (!res) return res;
    if (changed == 0) return Result::Err(ErrorCode::NotFound, "lock not held by token");
    return Result::Ok();
}

Result SqliteRepository::ExtendLock(Transaction& t, const std::string& key, const std::string& token, int64_t expires_at_ms,
                                    int64_t now_ms) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, "UPDATE lock_entries SET expires_at_ms=? WHERE key=? AND token=? AND expires_at_ms > ?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, expires_at_ms);
    BindText(st.get(), 2, key);
    BindText(st.get(), 3, token);
    BindI64(st.get(), 4, now_ms);

    uint64_t changed = 0;
    auto     res     = Execute(db, st.get(), &changed);
    if (!res) return res;
    if (changed == 0) return Result::Err(ErrorCode::NotFound, "lock not held by token");
    return Result::Ok();
}

std::optional<model::LockEntryRecord> SqliteRepository::GetLock(Transaction& t, const std::string& key, int64_t now_ms) {
    auto* db = TX(t).Handle();
    auto st = MustPrepare(db, "SELECT key,token,expires_at_ms FROM lock_entries WHERE key=? AND expires_at_ms > ?;");
    BindText(st.get(), 1, key);
    BindI64(st.get(), 2, now_ms);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::LockEntryRecord r;
    r.key           = ColText(st.get(), 0);
    r.token         = ColText(st.get(), 1);
    r.expires_at_ms = ColI64(st.get(), 2);
    return r;
}

Result SqliteRepository::IncrementCounter(Transaction& t, const std::string& key, int64_t expires_at_ms, int64_t now_ms,
                                          uint64_t& count) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO rate_counters(key,count,expires_at_ms) VALUES(?1,1,?2) "
        "ON CONFLICT(key) DO UPDATE SET "
        "count=CASE WHEN rate_counters.expires_at_ms <= ?3 THEN 1 ELSE rate_counters.count + 1 END,"
        "expires_at_ms=CASE WHEN rate_counters.expires_at_ms <= ?3 THEN excluded.expires_at_ms "
        "ELSE rate_counters.expires_at_ms END;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, key);
    BindI64(st.get(), 2, expires_at_ms);
    BindI64(st.get(), 3, now_ms);

    auto res = Execute(db, st.get());
    if (!res) return res;

    auto read = Prepare(db, "SELECT count FROM rate_counters WHERE key=?;");
    if (!read) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(read.get(), 1, key);

    int rc = sqlite3_step(read.get());
    if (rc != SQLITE_ROW) return Translate(db, rc == SQLITE_DONE ? SQLITE_INTERNAL : rc);
    count = static_cast<uint64_t>(ColI64(read.get(), 0));
    return Result::Ok();
}

}
