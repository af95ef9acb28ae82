#include "internal/balance/balance_ledger.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/limits/limit_evaluator.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/pricing/usd_rates.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ledger::v1;
using ledger::balance::BalanceLedger;
using ledger::balance::UpdateRequest;
using ledger::util::ParseAmount;

struct Fixture {
  std::shared_ptr<ledger::db::memory::MemoryRepository> repository = std::make_shared<ledger::db::memory::MemoryRepository>();
  std::shared_ptr<ledger::lock::LockCoordinator>        locks;
  std::shared_ptr<ledger::limits::LimitEvaluator>       evaluator;
  std::shared_ptr<ledger::exclusion::ExclusionManager>  exclusions;
  std::shared_ptr<BalanceLedger>                        ledger;

  Fixture() {
    ledger::lock::LockOptions options;
    options.ttl_ms          = 5000;
    options.retry_count     = 1000;
    options.retry_delay_ms  = 1;
    options.retry_jitter_ms = 2;

    locks      = std::make_shared<ledger::lock::LockCoordinator>(std::make_shared<ledger::lock::MemoryLockStore>(), options);
    evaluator  = std::make_shared<ledger::limits::LimitEvaluator>(repository);
    exclusions = std::make_shared<ledger::exclusion::ExclusionManager>(repository, locks, evaluator);
    ledger     = std::make_shared<BalanceLedger>(repository, locks, exclusions, evaluator,
                                              std::make_shared<ledger::pricing::StaticRateProvider>(ledger::pricing::DefaultUsdRates()));
  }

  ledger::balance::UpdateResult Apply(const std::string& op_id, const std::string& user, OperationKind kind, const std::string& amount,
                                      PlatformType platform = PLATFORM_TYPE_PLATFORM, const std::string& asset = "USDT") {
    UpdateRequest req;
    req.operation_id = op_id;
    req.user_id      = user;
    req.kind         = kind;
    req.amount       = ParseAmount(amount);
    req.asset        = asset;
    req.platform     = platform;
    return ledger->UpdateBalance(req);
  }

  void Limit(const std::string& user, ExclusionType type, LimitPeriod period, const std::string& amount,
             PlatformType platform = PLATFORM_TYPE_PLATFORM) {
    ledger::exclusion::CreateRequest req;
    req.user_id      = user;
    req.type         = type;
    req.platform     = platform;
    req.period       = period;
    req.limit_amount = ParseAmount(amount);
    (void)exclusions->Create(req);
  }

  int64_t Balance(const std::string& user, const std::string& asset = "USDT") {
    for (const auto& wallet : ledger->GetBalances(user)) {
      if (wallet.asset == asset) return wallet.balance;
    }
    return 0;
  }

  ledger::db::model::DailyGamblingStatsRecord DailyTotals(const std::string& user) {
    auto tx = repository->Begin();
    ledger::db::model::DailyGamblingStatsRecord total;
    for (const auto& row : repository->ListDailyStats(*tx, user, "0000-01-01", "9999-12-31")) {
      total.wager_usd += row.wager_usd;
      total.win_usd += row.win_usd;
      total.loss_usd += row.loss_usd;
      total.deposit_usd += row.deposit_usd;
    }
    tx->Commit();
    return total;
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRepeatedOperationIdReplays() {
  Fixture f;

  const auto first = f.Apply("op-1", "u1", OPERATION_KIND_DEPOSIT, "100");
  assert(first.success);
  assert(!first.replayed);
  assert(first.balance == ParseAmount("100"));

  const auto second = f.Apply("op-1", "u1", OPERATION_KIND_DEPOSIT, "100");
  assert(second.replayed);
  assert(second.balance == first.balance);
  assert(second.operation_id == "op-1");
  assert(f.Balance("u1") == ParseAmount("100"));

  // Reusing the id for a different operation is a conflict, not a replay.
  assert(Throws<ledger::util::Conflict>([&] { (void)f.Apply("op-1", "u1", OPERATION_KIND_DEPOSIT, "5"); }));
  assert(f.Balance("u1") == ParseAmount("100"));
}

void TestConcurrentWritersDoNotLoseUpdates() {
  Fixture f;
  (void)f.Apply("seed", "u2", OPERATION_KIND_DEPOSIT, "10");

  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;

  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        try {
          (void)f.Apply("mx-" + std::to_string(t) + "-" + std::to_string(i), "u2", OPERATION_KIND_DEPOSIT, "1");
        } catch (const std::exception&) {
          failures.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(failures == 0);
  assert(f.Balance("u2") == ParseAmount("10") + kThreads * kPerThread * ParseAmount("1"));
}

void TestInsufficientBalanceLeavesNoTrace() {
  Fixture f;
  (void)f.Apply("d", "u3", OPERATION_KIND_DEPOSIT, "5");

  assert(Throws<ledger::util::InsufficientBalance>([&] { (void)f.Apply("b", "u3", OPERATION_KIND_BET, "6"); }));
  assert(f.Balance("u3") == ParseAmount("5"));
  assert(Throws<ledger::util::NotFound>([&] { (void)f.ledger->GetOperation("b"); }));

  // Corrections may go negative.
  const auto corrected = f.Apply("c", "u3", OPERATION_KIND_CORRECTION_DEBIT, "7");
  assert(corrected.balance == -ParseAmount("2"));
}

void TestLossLimitCountsWinsAgainstWagers() {
  Fixture f;
  (void)f.Apply("d", "u4", OPERATION_KIND_DEPOSIT, "1000");
  f.Limit("u4", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_DAILY, "80");

  (void)f.Apply("b1", "u4", OPERATION_KIND_BET, "30");

  bool rejected = false;
  try {
    (void)f.Apply("b2", "u4", OPERATION_KIND_BET, "60");
  } catch (const ledger::util::LimitExceeded& e) {
    rejected = e.kind() == ledger::util::LimitKind::kLoss;
    assert(std::string(e.what()) == "Loss limit of 80 USDT for daily period has been reached on PLATFORM");
  }
  assert(rejected);

  (void)f.Apply("w1", "u4", OPERATION_KIND_WIN, "40");
  const auto ok = f.Apply("b3", "u4", OPERATION_KIND_BET, "30");
  assert(ok.success);
  assert(f.Balance("u4") == ParseAmount("1000") - ParseAmount("30") + ParseAmount("40") - ParseAmount("30"));
}

void TestLimitsAreScopedToTheirPlatform() {
  Fixture f;
  (void)f.Apply("d", "u5", OPERATION_KIND_DEPOSIT, "1000");
  f.Limit("u5", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_DAILY, "10", PLATFORM_TYPE_SPORTS);

  (void)f.Apply("casino-1", "u5", OPERATION_KIND_BET, "50", PLATFORM_TYPE_CASINO);
  assert(Throws<ledger::util::LimitExceeded>([&] { (void)f.Apply("sports-1", "u5", OPERATION_KIND_BET, "50", PLATFORM_TYPE_SPORTS); }));
  // Casino losses do not count towards the sports limit.
  (void)f.Apply("sports-2", "u5", OPERATION_KIND_BET, "10", PLATFORM_TYPE_SPORTS);

  Fixture g;
  (void)g.Apply("d", "u6", OPERATION_KIND_DEPOSIT, "1000");
  g.Limit("u6", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_DAILY, "10", PLATFORM_TYPE_CASINO);
  (void)g.Apply("sports-1", "u6", OPERATION_KIND_BET, "50", PLATFORM_TYPE_SPORTS);
  assert(Throws<ledger::util::LimitExceeded>([&] { (void)g.Apply("casino-1", "u6", OPERATION_KIND_BET, "50", PLATFORM_TYPE_CASINO); }));
}

void TestPlatformExclusionBlocksEverySegment() {
  Fixture f;
  (void)f.Apply("d", "u7", OPERATION_KIND_DEPOSIT, "100");

  ledger::exclusion::CreateRequest cooldown;
  cooldown.user_id  = "u7";
  cooldown.type     = EXCLUSION_TYPE_COOLDOWN;
  cooldown.platform = PLATFORM_TYPE_PLATFORM;
  (void)f.exclusions->Create(cooldown);

  for (auto platform : {PLATFORM_TYPE_SPORTS, PLATFORM_TYPE_CASINO, PLATFORM_TYPE_PLATFORM}) {
    bool denied = false;
    try {
      (void)f.Apply("bet-" + std::to_string(platform), "u7", OPERATION_KIND_BET, "1", platform);
    } catch (const ledger::util::SelfExclusionActive& e) {
      denied = e.kind() == ledger::util::ExclusionKind::kCooldown;
    }
    assert(denied);
  }
  assert(Throws<ledger::util::SelfExclusionActive>([&] { (void)f.Apply("dep", "u7", OPERATION_KIND_DEPOSIT, "5"); }));

  // Withdrawals and demo bets stay open.
  (void)f.Apply("wd", "u7", OPERATION_KIND_WITHDRAW, "10");
  const auto demo = f.Apply("demo", "u7", OPERATION_KIND_BET, "0", PLATFORM_TYPE_CASINO);
  assert(demo.success);
  assert(f.Balance("u7") == ParseAmount("90"));
  assert(f.ledger->GetStatistics("u7").bet_count == 0);
}

void TestWagerAndDepositLimitMessages() {
  Fixture f;
  (void)f.Apply("d", "u8", OPERATION_KIND_DEPOSIT, "500");
  f.Limit("u8", EXCLUSION_TYPE_WAGER_LIMIT, LIMIT_PERIOD_WEEKLY, "100");

  (void)f.Apply("b1", "u8", OPERATION_KIND_BET, "80");
  std::string message;
  try {
    (void)f.Apply("b2", "u8", OPERATION_KIND_BET, "30");
  } catch (const ledger::util::LimitExceeded& e) {
    assert(e.kind() == ledger::util::LimitKind::kWager);
    message = e.what();
  }
  assert(message == "Wager limit exceeded. Your weekly wager limit is $100.00. You have $20.00 remaining.");

  f.Limit("u8", EXCLUSION_TYPE_DEPOSIT_LIMIT, LIMIT_PERIOD_DAILY, "600");
  (void)f.Apply("d2", "u8", OPERATION_KIND_DEPOSIT, "90");
  bool deposit_rejected = false;
  try {
    (void)f.Apply("d3", "u8", OPERATION_KIND_DEPOSIT, "20");
  } catch (const ledger::util::LimitExceeded& e) {
    deposit_rejected = e.kind() == ledger::util::LimitKind::kDeposit;
  }
  assert(deposit_rejected);
}

void TestDailyWithdrawLimit() {
  Fixture f;
  (void)f.Apply("d", "u9", OPERATION_KIND_DEPOSIT, "100", PLATFORM_TYPE_PLATFORM, "BTC");

  for (int i = 0; i < 5; ++i) {
    (void)f.Apply("w" + std::to_string(i), "u9", OPERATION_KIND_WITHDRAW, "10", PLATFORM_TYPE_PLATFORM, "BTC");
  }

  bool rejected = false;
  try {
    (void)f.Apply("w5", "u9", OPERATION_KIND_WITHDRAW, "10", PLATFORM_TYPE_PLATFORM, "BTC");
  } catch (const ledger::util::LimitExceeded& e) {
    rejected = e.kind() == ledger::util::LimitKind::kDailyWithdraw;
  }
  assert(rejected);
  assert(f.Balance("u9", "BTC") == ParseAmount("50"));
}

void TestBatchIsAllOrNothing() {
  Fixture f;

  auto op = [](const std::string& id, OperationKind kind, const std::string& amount) {
    UpdateRequest req;
    req.operation_id = id;
    req.kind         = kind;
    req.amount       = ParseAmount(amount);
    return req;
  };

  const auto results = f.ledger->UpdateBalanceBatch("u10", "USDT", {op("a", OPERATION_KIND_DEPOSIT, "10"), op("b", OPERATION_KIND_BET, "5"),
                                                                   op("c", OPERATION_KIND_WIN, "2")});
  assert(results.size() == 3);
  assert(results.back().balance == ParseAmount("7"));

  assert(Throws<ledger::util::InsufficientBalance>([&] {
    (void)f.ledger->UpdateBalanceBatch("u10", "USDT", {op("d", OPERATION_KIND_DEPOSIT, "1"), op("e", OPERATION_KIND_BET, "100")});
  }));
  assert(f.Balance("u10") == ParseAmount("7"));
  assert(Throws<ledger::util::NotFound>([&] { (void)f.ledger->GetOperation("d"); }));

  std::vector<UpdateRequest> too_many;
  for (std::size_t i = 0; i <= BalanceLedger::kMaxBatchSize; ++i) too_many.push_back(op("x" + std::to_string(i), OPERATION_KIND_DEPOSIT, "1"));
  assert(Throws<ledger::util::ValidationError>([&] { (void)f.ledger->UpdateBalanceBatch("u10", "USDT", too_many); }));
}

void TestStatisticsAndWallets() {
  Fixture f;
  (void)f.Apply("d1", "u11", OPERATION_KIND_DEPOSIT, "20");
  (void)f.Apply("b1", "u11", OPERATION_KIND_BET, "2.5");
  (void)f.Apply("w1", "u11", OPERATION_KIND_WIN, "1.25");
  (void)f.Apply("e1", "u11", OPERATION_KIND_DEPOSIT, "1", PLATFORM_TYPE_PLATFORM, "ETH");

  const auto stats = f.ledger->GetStatistics("u11");
  // 20 USDT plus 1 ETH valued at 3000 USD.
  assert(stats.deposits_cents == 2000 + 300000);
  assert(stats.bets_cents == 250);
  assert(stats.wins_cents == 125);
  assert(stats.bet_count == 1);
  assert(stats.win_count == 1);

  const auto wallets = f.ledger->GetBalances("u11");
  assert(wallets.size() == 2);
  for (const auto& wallet : wallets) {
    assert(wallet.is_primary == (wallet.asset == "USDT"));
  }

  const auto op = f.ledger->GetOperation("b1");
  assert(op.signed_amount == -ParseAmount("2.5"));
  assert(op.previous_balance == ParseAmount("20"));
  assert(op.balance_after == ParseAmount("17.5"));

  assert(f.ledger->GetStatistics("nobody").bet_count == 0);
}

void TestSubCentBetsAccumulateTowardsLossLimit() {
  Fixture f;
  (void)f.Apply("d", "u13", OPERATION_KIND_DEPOSIT, "100", PLATFORM_TYPE_CASINO);
  f.Limit("u13", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_DAILY, "1", PLATFORM_TYPE_CASINO);

  // 101 bets of 0.0099 lose 0.9999, one more would pass the limit.
  for (int i = 0; i < 101; ++i) {
    (void)f.Apply("tiny-" + std::to_string(i), "u13", OPERATION_KIND_BET, "0.0099", PLATFORM_TYPE_CASINO);
  }
  assert(f.DailyTotals("u13").loss_usd == ParseAmount("0.9999"));

  bool rejected = false;
  try {
    (void)f.Apply("tiny-101", "u13", OPERATION_KIND_BET, "0.0099", PLATFORM_TYPE_CASINO);
  } catch (const ledger::util::LimitExceeded& e) {
    rejected = e.kind() == ledger::util::LimitKind::kLoss;
  }
  assert(rejected);
  assert(f.Balance("u13") == ParseAmount("100") - 101 * ParseAmount("0.0099"));

  // A whole-cent amount is still refused once the limit is nearly used.
  assert(Throws<ledger::util::LimitExceeded>([&] { (void)f.Apply("cent", "u13", OPERATION_KIND_BET, "0.01", PLATFORM_TYPE_CASINO); }));
}

void TestLimitsCompareUsdValueOfTheAsset() {
  Fixture f;
  (void)f.Apply("d", "u14", OPERATION_KIND_DEPOSIT, "1", PLATFORM_TYPE_CASINO, "BTC");
  f.Limit("u14", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_DAILY, "10", PLATFORM_TYPE_CASINO);

  // 0.9 BTC is 40500 USD against a 10 USD limit.
  assert(Throws<ledger::util::LimitExceeded>([&] { (void)f.Apply("big", "u14", OPERATION_KIND_BET, "0.9", PLATFORM_TYPE_CASINO, "BTC"); }));
  assert(f.Balance("u14", "BTC") == ParseAmount("1"));

  // 0.0002 BTC is 9 USD and fits.
  (void)f.Apply("small", "u14", OPERATION_KIND_BET, "0.0002", PLATFORM_TYPE_CASINO, "BTC");
  const auto totals = f.DailyTotals("u14");
  assert(totals.wager_usd == ParseAmount("9"));
  assert(totals.loss_usd == ParseAmount("9"));
  assert(totals.deposit_usd == ParseAmount("45000"));

  assert(Throws<ledger::util::LimitExceeded>([&] { (void)f.Apply("more", "u14", OPERATION_KIND_BET, "0.0001", PLATFORM_TYPE_CASINO, "BTC"); }));
  assert(f.ledger->GetStatistics("u14").bets_cents == 900);
}

void TestRequestValidation() {
  Fixture f;
  assert(Throws<ledger::util::ValidationError>([&] { (void)f.Apply("", "u12", OPERATION_KIND_DEPOSIT, "1"); }));
  assert(Throws<ledger::util::ValidationError>([&] { (void)f.Apply("x", "u12", OPERATION_KIND_DEPOSIT, "1", PLATFORM_TYPE_PLATFORM, "NOPE"); }));
  assert(Throws<ledger::util::ValidationError>([&] { (void)f.Apply("y", "u12", OPERATION_KIND_UNSPECIFIED, "1"); }));
  assert(Throws<ledger::util::ValidationError>([&] { (void)f.Apply("z", "u12", OPERATION_KIND_DEPOSIT, "2000000"); }));
}

} // namespace

int main() {
  TestRepeatedOperationIdReplays();
  TestConcurrentWritersDoNotLoseUpdates();
  TestInsufficientBalanceLeavesNoTrace();
  TestLossLimitCountsWinsAgainstWagers();
  TestLimitsAreScopedToTheirPlatform();
  TestPlatformExclusionBlocksEverySegment();
  TestWagerAndDepositLimitMessages();
  TestDailyWithdrawLimit();
  TestBatchIsAllOrNothing();
  TestStatisticsAndWallets();
  TestSubCentBetsAccumulateTowardsLossLimit();
  TestLimitsCompareUsdValueOfTheAsset();
  TestRequestValidation();

  std::cout << "ledger_unit_balance_ledger: pass\n";
  return 0;
}
