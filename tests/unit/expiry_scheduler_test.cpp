#include "internal/scheduler/expiry_scheduler.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/unit_of_work.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/lock/lock_keys.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace ledger::v1;
using ledger::db::model::SelfExclusionRecord;
using ledger::scheduler::ExpiryReport;
using ledger::scheduler::ExpiryScheduler;

constexpr int64_t kNow = 1710331200000;

SelfExclusionRecord Row(const std::string& user, ExclusionType type) {
  SelfExclusionRecord r;
  r.id            = ledger::util::GenerateUUIDString();
  r.user_id       = user;
  r.type          = type;
  r.platform      = PLATFORM_TYPE_PLATFORM;
  r.start_ms      = kNow - 10 * ledger::util::kDayMs;
  r.is_active     = true;
  r.created_at_ms = r.start_ms;
  r.updated_at_ms = r.start_ms;
  return r;
}

struct Fixture {
  std::shared_ptr<ledger::db::memory::MemoryRepository> repository = std::make_shared<ledger::db::memory::MemoryRepository>();
  std::shared_ptr<ledger::lock::LockCoordinator>        locks =
      std::make_shared<ledger::lock::LockCoordinator>(std::make_shared<ledger::lock::MemoryLockStore>());

  void Insert(const SelfExclusionRecord& r) {
    ledger::db::RunInTransaction(*repository, [&](ledger::db::Transaction& tx) {
      ledger::db::ThrowIfDbError(repository->InsertSelfExclusion(tx, r), "insert");
    });
  }

  std::optional<SelfExclusionRecord> Get(const std::string& id) {
    return ledger::db::RunInTransaction(*repository, [&](ledger::db::Transaction& tx) { return repository->GetSelfExclusion(tx, id); });
  }

  // One row for each transition, all due at kNow.
  void SeedDueRows(const std::string& user) {
    auto cooldown   = Row(user, EXCLUSION_TYPE_COOLDOWN);
    cooldown.end_ms = kNow - ledger::util::kHourMs;
    Insert(cooldown);

    auto windowed                        = Row(user, EXCLUSION_TYPE_COOLDOWN);
    windowed.end_ms                      = kNow - 2 * ledger::util::kDayMs;
    windowed.post_cooldown_window_end_ms = kNow - ledger::util::kHourMs;
    Insert(windowed);

    auto temporary   = Row(user, EXCLUSION_TYPE_TEMPORARY);
    temporary.end_ms = kNow - 1;
    Insert(temporary);

    auto limit                    = Row(user, EXCLUSION_TYPE_DEPOSIT_LIMIT);
    limit.period                  = LIMIT_PERIOD_DAILY;
    limit.limit_amount            = 100;
    limit.removal_requested_at_ms = kNow - ledger::exclusion::kLimitRemovalGracePeriod - 1;
    Insert(limit);
  }
};

void TestEachTransitionRunsOnce() {
  Fixture f;
  f.SeedDueRows("u1");

  auto pending_cooldown   = Row("u1", EXCLUSION_TYPE_COOLDOWN);
  pending_cooldown.end_ms = kNow + ledger::util::kHourMs;
  f.Insert(pending_cooldown);

  auto recent_removal                    = Row("u1", EXCLUSION_TYPE_WAGER_LIMIT);
  recent_removal.period                  = LIMIT_PERIOD_WEEKLY;
  recent_removal.limit_amount            = 100;
  recent_removal.removal_requested_at_ms = kNow - ledger::util::kHourMs;
  f.Insert(recent_removal);

  ExpiryScheduler scheduler(f.repository, f.locks, false);

  const auto first = scheduler.RunOnce(kNow);
  assert(!first.skipped);
  assert(first.cooldowns_windowed == 1);
  assert(first.windows_removed == 1);
  assert(first.temporaries_expired == 1);
  assert(first.limits_removed == 1);

  const auto second = scheduler.RunOnce(kNow);
  assert(second.Total() == 0);

  const auto still_cooling = f.Get(pending_cooldown.id);
  assert(still_cooling && !still_cooling->post_cooldown_window_end_ms);
  assert(f.Get(recent_removal.id));

  // The window opened by the first run closes a day later.
  const auto later = scheduler.RunOnce(kNow + ledger::exclusion::kPostCooldownWindowMs + ledger::util::kHourMs);
  assert(later.windows_removed == 1);
  assert(later.cooldowns_windowed == 1);
  assert(later.limits_removed == 1);
}

void TestLeaderLockSkipsWhenHeld() {
  Fixture f;
  f.SeedDueRows("u2");

  ExpiryScheduler scheduler(f.repository, f.locks, true);

  auto held = f.locks->TryLock(ledger::lock::SchedulerResource());
  assert(held);

  const auto skipped = scheduler.RunOnce(kNow);
  assert(skipped.skipped);
  assert(skipped.Total() == 0);

  f.locks->Release(*held);

  const auto ran = scheduler.RunOnce(kNow);
  assert(!ran.skipped);
  assert(ran.Total() == 4);
  assert(!f.locks->IsLocked(ledger::lock::SchedulerResource()));
}

void TestRacingWorkersApplyEachTransitionOnce() {
  Fixture f;
  for (int u = 0; u < 5; ++u) f.SeedDueRows("race-" + std::to_string(u));

  ExpiryScheduler a(f.repository, f.locks, true);
  ExpiryScheduler b(f.repository, f.locks, true);

  ExpiryReport total;
  std::mutex   mu;
  auto         worker = [&](ExpiryScheduler& scheduler) {
    for (int i = 0; i < 20; ++i) {
      const auto report = scheduler.RunOnce(kNow);
      std::lock_guard<std::mutex> lock(mu);
      total.cooldowns_windowed += report.cooldowns_windowed;
      total.windows_removed += report.windows_removed;
      total.temporaries_expired += report.temporaries_expired;
      total.limits_removed += report.limits_removed;
    }
  };

  std::thread ta(worker, std::ref(a));
  std::thread tb(worker, std::ref(b));
  ta.join();
  tb.join();

  assert(total.cooldowns_windowed == 5);
  assert(total.windows_removed == 5);
  assert(total.temporaries_expired == 5);
  assert(total.limits_removed == 5);
}

} // namespace

int main() {
  TestEachTransitionRunsOnce();
  TestLeaderLockSkipsWhenHeld();
  TestRacingWorkersApplyEachTransitionOnce();

  std::cout << "ledger_unit_expiry_scheduler: pass\n";
  return 0;
}
