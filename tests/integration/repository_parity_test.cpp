#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/unit_of_work.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

#if LEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if LEDGER_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using namespace ledger::v1;
using ledger::db::ErrorCode;
using ledger::db::Repository;
using ledger::db::Transaction;
using ledger::db::model::BalanceOperationRecord;
using ledger::db::model::BalanceRecord;
using ledger::db::model::DailyGamblingStatsRecord;
using ledger::db::model::LockEntryRecord;
using ledger::db::model::SelfExclusionRecord;

constexpr int64_t kNow = 1710331200000;

struct BackendFactory {
  std::string                                        name;
  std::function<std::shared_ptr<Repository>()>       make_repository;
  std::function<bool()>                              supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                              cleanup;
  bool                                               supports_parallel_transactions = true;
};

template <typename Fn>
auto InTx(Repository& repo, Fn&& fn) {
  return ledger::db::RunInTransaction(repo, std::forward<Fn>(fn));
}

SelfExclusionRecord Exclusion(const std::string& user, ExclusionType type, int64_t created_at_ms) {
  SelfExclusionRecord r;
  r.id            = ledger::util::GenerateUUIDString();
  r.user_id       = user;
  r.type          = type;
  r.platform      = PLATFORM_TYPE_PLATFORM;
  r.start_ms      = created_at_ms;
  r.created_at_ms = created_at_ms;
  r.updated_at_ms = created_at_ms;
  return r;
}

void VerifyBalancesAndOperations(Repository& repo, const std::string& user) {
  InTx(repo, [&](Transaction& tx) {
    assert(!repo.GetBalance(tx, user, "USDT"));

    BalanceRecord wallet{user, "USDT", 500, true, kNow};
    assert(repo.UpsertBalance(tx, wallet));
    wallet.balance = 750;
    assert(repo.UpsertBalance(tx, wallet));
    assert(repo.UpsertBalance(tx, BalanceRecord{user, "BTC", 3, false, kNow}));

    // Reads inside the transaction see its writes.
    assert(repo.GetBalance(tx, user, "USDT")->balance == 750);
  });

  InTx(repo, [&](Transaction& tx) {
    const auto wallets = repo.ListBalances(tx, user);
    assert(wallets.size() == 2);
    const auto usdt = repo.GetBalance(tx, user, "USDT");
    assert(usdt && usdt->balance == 750 && usdt->is_primary);
  });

  BalanceOperationRecord op;
  op.operation_id     = user + "-op-1";
  op.user_id          = user;
  op.asset            = "USDT";
  op.kind             = OPERATION_KIND_WITHDRAW;
  op.amount           = 100;
  op.signed_amount    = -100;
  op.previous_balance = 850;
  op.balance_after    = 750;
  op.description      = "cash out";
  op.platform         = PLATFORM_TYPE_CASINO;
  op.created_at_ms    = kNow;

  InTx(repo, [&](Transaction& tx) { assert(repo.InsertOperation(tx, op)); });

  {
    // A failed statement may poison the transaction, so it is rolled back.
    auto       tx  = repo.Begin();
    const auto dup = repo.InsertOperation(*tx, op);
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists || dup.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  InTx(repo, [&](Transaction& tx) {
    const auto stored = repo.GetOperation(tx, op.operation_id);
    assert(stored);
    assert(stored->kind == OPERATION_KIND_WITHDRAW);
    assert(stored->signed_amount == -100);
    assert(stored->previous_balance == 850);
    assert(stored->description == "cash out");
    assert(stored->platform == PLATFORM_TYPE_CASINO);
    assert(!repo.GetOperation(tx, user + "-missing"));

    auto later          = op;
    later.operation_id  = user + "-op-2";
    later.created_at_ms = kNow + ledger::util::kDayMs;
    assert(repo.InsertOperation(tx, later));

    assert(repo.SumOperationAmounts(tx, user, "USDT", OPERATION_KIND_WITHDRAW, kNow, kNow + 1000) == 100);
    assert(repo.SumOperationAmounts(tx, user, "USDT", OPERATION_KIND_WITHDRAW, kNow, kNow + ledger::util::kDayMs) == 200);
    assert(repo.SumOperationAmounts(tx, user, "USDT", OPERATION_KIND_DEPOSIT, kNow, kNow + ledger::util::kDayMs) == 0);
    assert(repo.SumOperationAmounts(tx, user, "BTC", OPERATION_KIND_WITHDRAW, kNow, kNow + ledger::util::kDayMs) == 0);
  });
}

void VerifyStatistics(Repository& repo, const std::string& user) {
  InTx(repo, [&](Transaction& tx) {
    assert(!repo.GetStatistics(tx, user));

    ledger::db::model::BalanceStatisticsRecord stats{user};
    stats.deposits_cents = 1000;
    stats.bets_cents     = 250;
    stats.bet_count      = 2;
    assert(repo.UpsertStatistics(tx, stats));
    stats.wins_cents = 75;
    stats.win_count  = 1;
    assert(repo.UpsertStatistics(tx, stats));
  });

  InTx(repo, [&](Transaction& tx) {
    const auto stats = repo.GetStatistics(tx, user);
    assert(stats && stats->deposits_cents == 1000 && stats->bet_count == 2 && stats->wins_cents == 75);
  });

  auto delta = [&](const std::string& day, PlatformType platform, int64_t wager, int64_t win, int64_t deposit) {
    DailyGamblingStatsRecord r;
    r.user_id       = user;
    r.day           = day;
    r.platform      = platform;
    r.wager_usd   = wager;
    r.win_usd     = win;
    r.deposit_usd = deposit;
    return r;
  };

  InTx(repo, [&](Transaction& tx) {
    assert(repo.AddDailyStats(tx, delta("2024-03-12", PLATFORM_TYPE_CASINO, 500, 0, 0)));
    assert(repo.AddDailyStats(tx, delta("2024-03-13", PLATFORM_TYPE_CASINO, 300, 0, 0)));
    assert(repo.AddDailyStats(tx, delta("2024-03-13", PLATFORM_TYPE_CASINO, 0, 450, 0)));
    assert(repo.AddDailyStats(tx, delta("2024-03-13", PLATFORM_TYPE_SPORTS, 100, 20, 700)));
    assert(repo.AddDailyStats(tx, delta("2024-03-14", PLATFORM_TYPE_SPORTS, 1, 0, 0)));
  });

  InTx(repo, [&](Transaction& tx) {
    const auto rows = repo.ListDailyStats(tx, user, "2024-03-13", "2024-03-13");
    assert(rows.size() == 2);
    for (const auto& row : rows) {
      if (row.platform == PLATFORM_TYPE_CASINO) {
        assert(row.wager_usd == 300 && row.win_usd == 450);
        assert(row.loss_usd == 0);
      } else {
        assert(row.wager_usd == 100 && row.deposit_usd == 700);
        assert(row.loss_usd == 80);
      }
    }
    assert(repo.ListDailyStats(tx, user, "2024-03-12", "2024-03-14").size() == 4);
    assert(repo.ListDailyStats(tx, user + "-other", "2024-03-12", "2024-03-14").empty());
  });
}

void VerifySelfExclusions(Repository& repo, const std::string& user) {
  auto older   = Exclusion(user, EXCLUSION_TYPE_COOLDOWN, kNow - 1000);
  older.end_ms = kNow + ledger::util::kDayMs;

  auto newer         = Exclusion(user, EXCLUSION_TYPE_WAGER_LIMIT, kNow);
  newer.period       = LIMIT_PERIOD_WEEKLY;
  newer.limit_amount = 12345;

  InTx(repo, [&](Transaction& tx) {
    assert(repo.InsertSelfExclusion(tx, older));
    assert(repo.InsertSelfExclusion(tx, newer));
  });

  // One active wager limit per user.
  {
    auto tx             = repo.Begin();
    auto second         = Exclusion(user, EXCLUSION_TYPE_WAGER_LIMIT, kNow + 1);
    second.period       = LIMIT_PERIOD_DAILY;
    second.limit_amount = 1;
    const auto result   = repo.InsertSelfExclusion(*tx, second);
    assert(!result);
    assert(result.code == ErrorCode::ConstraintViolation || result.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  InTx(repo, [&](Transaction& tx) {
    const auto rows = repo.ListSelfExclusions(tx, user);
    assert(rows.size() == 2);
    assert(rows[0].id == newer.id);
    assert(rows[0].period == LIMIT_PERIOD_WEEKLY);
    assert(rows[0].limit_amount == 12345);
    assert(!rows[0].end_ms);
    assert(rows[1].id == older.id);
    assert(rows[1].end_ms == kNow + ledger::util::kDayMs);
    assert(!rows[1].period);
  });

  InTx(repo, [&](Transaction& tx) {
    auto updated                    = newer;
    updated.removal_requested_at_ms = kNow + 5;
    updated.limit_amount            = 999;
    assert(repo.UpdateSelfExclusion(tx, updated));

    const auto stored = repo.GetSelfExclusion(tx, newer.id);
    assert(stored && stored->removal_requested_at_ms == kNow + 5 && stored->limit_amount == 999);

    assert(repo.DeleteSelfExclusion(tx, older.id));
    assert(!repo.GetSelfExclusion(tx, older.id));
  });
}

void VerifyExpiryStatements(Repository& repo, const std::string& user) {
  auto cooldown   = Exclusion(user, EXCLUSION_TYPE_COOLDOWN, kNow - 2 * ledger::util::kDayMs);
  cooldown.end_ms = kNow - ledger::util::kHourMs;

  auto temporary   = Exclusion(user, EXCLUSION_TYPE_TEMPORARY, kNow - 2 * ledger::util::kDayMs);
  temporary.end_ms = kNow - 1;

  auto limit                    = Exclusion(user, EXCLUSION_TYPE_DEPOSIT_LIMIT, kNow - 3 * ledger::util::kDayMs);
  limit.period                  = LIMIT_PERIOD_DAILY;
  limit.limit_amount            = 100;
  limit.removal_requested_at_ms = kNow - 2 * ledger::util::kDayMs;

  InTx(repo, [&](Transaction& tx) {
    assert(repo.InsertSelfExclusion(tx, cooldown));
    assert(repo.InsertSelfExclusion(tx, temporary));
    assert(repo.InsertSelfExclusion(tx, limit));
  });

  const int64_t window_end = kNow + ledger::util::kDayMs;
  InTx(repo, [&](Transaction& tx) {
    uint64_t n = 0;
    assert(repo.StartPostCooldownWindows(tx, kNow, window_end, n) && n == 1);
    assert(repo.StartPostCooldownWindows(tx, kNow, window_end, n) && n == 0);
    assert(repo.DeactivateExpiredTemporary(tx, kNow, n) && n == 1);
    assert(repo.DeleteRemovedLimits(tx, kNow - ledger::util::kDayMs, n) && n == 1);
    assert(repo.DeleteExpiredCooldownWindows(tx, kNow, n) && n == 0);
  });

  InTx(repo, [&](Transaction& tx) {
    assert(repo.GetSelfExclusion(tx, cooldown.id)->post_cooldown_window_end_ms == window_end);
    assert(!repo.GetSelfExclusion(tx, temporary.id)->is_active);
    assert(!repo.GetSelfExclusion(tx, limit.id));

    uint64_t n = 0;
    assert(repo.DeleteExpiredCooldownWindows(tx, window_end + 1, n) && n == 1);
    assert(!repo.GetSelfExclusion(tx, cooldown.id));
  });
}

void VerifyLockEntries(Repository& repo, const std::string& prefix) {
  const auto key = prefix + ":balance:u:USDT";

  InTx(repo, [&](Transaction& tx) {
    assert(repo.TryAcquireLock(tx, LockEntryRecord{key, "t1", kNow + 1000}, kNow));

    const auto held = repo.TryAcquireLock(tx, LockEntryRecord{key, "t2", kNow + 1000}, kNow);
    assert(!held && held.code == ErrorCode::Conflict);

    assert(repo.GetLock(tx, key, kNow)->token == "t1");
    assert(repo.ExtendLock(tx, key, "t1", kNow + 5000, kNow + 10));
    assert(repo.ExtendLock(tx, key, "t2", kNow + 5000, kNow + 10).code == ErrorCode::NotFound);
    assert(repo.ReleaseLock(tx, key, "t2").code == ErrorCode::NotFound);

    // Expired entries may be taken over.
    assert(!repo.GetLock(tx, key, kNow + 6000));
    assert(repo.TryAcquireLock(tx, LockEntryRecord{key, "t3", kNow + 9000}, kNow + 6000));
    assert(repo.ExtendLock(tx, key, "t1", kNow + 9999, kNow + 6000).code == ErrorCode::NotFound);
    assert(repo.ReleaseLock(tx, key, "t3"));
    assert(!repo.GetLock(tx, key, kNow + 6000));
  });

  const auto counter = prefix + ":rate:route:u";
  InTx(repo, [&](Transaction& tx) {
    uint64_t count = 0;
    assert(repo.IncrementCounter(tx, counter, kNow + 1000, kNow, count) && count == 1);
    assert(repo.IncrementCounter(tx, counter, kNow + 1000, kNow + 1, count) && count == 2);
    assert(repo.IncrementCounter(tx, counter, kNow + 3000, kNow + 1000, count) && count == 1);
  });
}

void VerifyRollbackBehavior(Repository& repo, const std::string& user) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertBalance(*tx, BalanceRecord{user, "ETH", 1, true, kNow}));
    tx->Rollback();
  }
  {
    // Destructor without commit rolls back too.
    auto tx = repo.Begin();
    assert(repo.UpsertBalance(*tx, BalanceRecord{user, "SOL", 1, true, kNow}));
  }

  InTx(repo, [&](Transaction& tx) { assert(repo.ListBalances(tx, user).empty()); });
}

void VerifyConcurrentCommits(Repository& repo, const std::string& user, bool supports_parallel_transactions) {
  InTx(repo, [&](Transaction& tx) { assert(repo.UpsertBalance(tx, BalanceRecord{user, "USDT", 10, true, kNow})); });

  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto w1 = repo.GetBalance(*tx1, user, "USDT");
  auto w2 = repo.GetBalance(*tx2, user, "USDT");
  assert(w1 && w2);

  w1->balance = 11;
  assert(repo.UpsertBalance(*tx1, *w1));
  tx1->Commit();

  // The second writer either waits and overwrites or loses with a conflict.
  w2->balance = 12;
  bool lost = false;
  try {
    const auto result = repo.UpsertBalance(*tx2, *w2);
    if (result) {
      tx2->Commit();
    } else {
      lost = true;
    }
  } catch (const ledger::db::TransactionConflict&) {
    lost = true;
  }

  InTx(repo, [&](Transaction& tx) {
    const auto final_balance = repo.GetBalance(tx, user, "USDT")->balance;
    assert(final_balance == (lost ? 11 : 12));
  });
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& user) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  InTx(*repo, [&](Transaction& tx) {
    assert(repo->UpsertBalance(tx, BalanceRecord{user, "USDT", 4242, true, kNow}));
    auto limit         = Exclusion(user, EXCLUSION_TYPE_LOSS_LIMIT, kNow);
    limit.period       = LIMIT_PERIOD_MONTHLY;
    limit.limit_amount = 77;
    assert(repo->InsertSelfExclusion(tx, limit));
  });

  backend.restart(repo);

  InTx(*repo, [&](Transaction& tx) {
    assert(repo->GetBalance(tx, user, "USDT")->balance == 4242);
    const auto rows = repo->ListSelfExclusions(tx, user);
    assert(rows.size() == 1 && rows[0].limit_amount == 77 && rows[0].period == LIMIT_PERIOD_MONTHLY);
  });
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<ledger::db::memory::MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if LEDGER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = (std::filesystem::temp_directory_path() / "ledger_repository_parity.sqlite").string();
  std::filesystem::remove(db_path);

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<ledger::db::sqlite::SqliteDB>(db_path);
    for (const auto& statement : ledger::db::sql::SqliteSchema()) {
      db->Exec(statement);
    }
    return std::make_shared<ledger::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if LEDGER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("LEDGER_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("LEDGER_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      for (const auto& statement : ledger::db::sql::PostgresSchema()) {
        tx.exec(statement);
      }
      tx.exec("TRUNCATE balances, balance_operations, balance_statistics, daily_gambling_stats, self_exclusions, lock_entries, rate_counters;");
      tx.commit();
    }
    return std::make_shared<ledger::db::postgres::PgRepository>(std::make_shared<ledger::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

template <typename Error>
bool Raises(const ledger::db::Result& result) {
  try {
    ledger::db::ThrowIfDbError(result, "write");
  } catch (const Error&) {
    return true;
  }
  return false;
}

void VerifyErrorCodeTranslation(Repository& repo, const std::string& user) {
  assert(Raises<ledger::util::NotFound>(ledger::db::Result::Err(ErrorCode::NotFound)));
  assert(Raises<ledger::util::Conflict>(ledger::db::Result::Err(ErrorCode::ConstraintViolation, "operation id taken")));
  assert(Raises<ledger::db::TransactionConflict>(ledger::db::Result::Err(ErrorCode::WriteConflict, "database is locked")));
  assert(Raises<std::runtime_error>(ledger::db::Result::Err(ErrorCode::IOError)));

  // A write that loses to another writer replays the whole unit.
  int attempts = 0;
  InTx(repo, [&](Transaction& tx) {
    ++attempts;
    BalanceRecord r;
    r.user_id       = user;
    r.asset         = "USDT";
    r.balance       = 5;
    r.updated_at_ms = kNow;
    ledger::db::ThrowIfDbError(repo.UpsertBalance(tx, r), "upsert balance");
    if (attempts == 1) {
      ledger::db::ThrowIfDbError(ledger::db::Result::Err(ErrorCode::WriteConflict, "database is locked"), "add daily stats");
    }
  });
  assert(attempts == 2);

  auto tx = repo.Begin();
  const auto balance = repo.GetBalance(*tx, user, "USDT");
  assert(balance && balance->balance == 5);
  tx->Commit();
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyBalancesAndOperations(*repo, backend.name + "-ledger");
  VerifyStatistics(*repo, backend.name + "-stats");
  VerifySelfExclusions(*repo, backend.name + "-exclusions");
  VerifyExpiryStatements(*repo, backend.name + "-expiry");
  VerifyLockEntries(*repo, backend.name);
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyErrorCodeTranslation(*repo, backend.name + "-retry");
  VerifyConcurrentCommits(*repo, backend.name + "-concurrency", backend.supports_parallel_transactions);

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LEDGER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if LEDGER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "ledger_integration_repository_parity: pass\n";
  return 0;
}
