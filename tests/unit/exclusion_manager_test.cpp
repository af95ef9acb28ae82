#include "internal/exclusion/exclusion_manager.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/scheduler/expiry_scheduler.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace ledger::v1;
using ledger::exclusion::CreateRequest;
using ledger::exclusion::ExclusionManager;
using ledger::util::ParseAmount;

struct Fixture {
  std::shared_ptr<ledger::db::memory::MemoryRepository> repository = std::make_shared<ledger::db::memory::MemoryRepository>();
  std::shared_ptr<ledger::lock::LockCoordinator>        locks;
  std::shared_ptr<ExclusionManager>                     exclusions;
  std::shared_ptr<ledger::scheduler::ExpiryScheduler>   scheduler;

  Fixture() {
    ledger::lock::LockOptions options;
    options.retry_count     = 1000;
    options.retry_delay_ms  = 1;
    options.retry_jitter_ms = 2;

    locks      = std::make_shared<ledger::lock::LockCoordinator>(std::make_shared<ledger::lock::MemoryLockStore>(), options);
    exclusions = std::make_shared<ExclusionManager>(repository, locks, std::make_shared<ledger::limits::LimitEvaluator>(repository));
    scheduler  = std::make_shared<ledger::scheduler::ExpiryScheduler>(repository, locks, false);
  }

  ledger::db::model::SelfExclusionRecord Cooldown(const std::string& user, PlatformType platform = PLATFORM_TYPE_PLATFORM) {
    CreateRequest req;
    req.user_id  = user;
    req.type     = EXCLUSION_TYPE_COOLDOWN;
    req.platform = platform;
    return exclusions->Create(req);
  }

  ledger::db::model::SelfExclusionRecord Limit(const std::string& user, ExclusionType type, LimitPeriod period, std::optional<int64_t> amount) {
    CreateRequest req;
    req.user_id      = user;
    req.type         = type;
    req.period       = period;
    req.limit_amount = amount;
    return exclusions->Create(req);
  }
};

template <typename Error, typename Fn>
std::string ErrorOf(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.what();
  }
  return "<no error>";
}

void TestCooldownLifecycle() {
  Fixture f;
  const auto cooldown = f.Cooldown("u1");
  assert(cooldown.end_ms && *cooldown.end_ms - cooldown.start_ms == ledger::exclusion::kCooldownDurationMs);

  auto active = f.exclusions->HasActive("u1", PLATFORM_TYPE_CASINO);
  assert(active && active->type == EXCLUSION_TYPE_COOLDOWN && !active->in_post_cooldown_window);

  // Not yet in the window.
  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Extend("u1", cooldown.id, PLATFORM_TYPE_PLATFORM, 7); })
             .find("not in the post-cooldown window") != std::string::npos);

  (void)f.exclusions->ForceExpireCooldown(cooldown.id);
  assert(f.scheduler->RunOnce().cooldowns_windowed == 1);
  assert(f.scheduler->RunOnce().cooldowns_windowed == 0);

  active = f.exclusions->HasActive("u1", PLATFORM_TYPE_SPORTS);
  assert(active && active->in_post_cooldown_window);

  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Extend("u1", cooldown.id, PLATFORM_TYPE_PLATFORM, 3); }) ==
         "Duration must be one of 1, 7, 30 or 180 days");
  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Extend("u1", cooldown.id, PLATFORM_TYPE_CASINO, 7); }) ==
         "Platform type mismatch. This cooldown is for PLATFORM, but you requested CASINO");
  assert(ErrorOf<ledger::util::NotFound>([&] { (void)f.exclusions->Extend("someone-else", cooldown.id, PLATFORM_TYPE_PLATFORM, 7); }) ==
         "Cooldown not found");

  const auto temporary = f.exclusions->Extend("u1", cooldown.id, PLATFORM_TYPE_PLATFORM, 7);
  assert(temporary.type == EXCLUSION_TYPE_TEMPORARY);
  assert(*temporary.end_ms - temporary.start_ms == 7 * ledger::util::kDayMs);

  const auto rows = f.exclusions->List("u1");
  assert(rows.size() == 1);
  assert(rows.front().id == temporary.id);

  // Temporary exclusions lapse once their end date passes.
  const auto report = f.scheduler->RunOnce(*temporary.end_ms + 1);
  assert(report.temporaries_expired == 1);
  assert(!f.exclusions->HasActive("u1", std::nullopt));
}

void TestExpiredWindowIsRemoved() {
  Fixture f;
  const auto cooldown = f.Cooldown("u2", PLATFORM_TYPE_SPORTS);
  (void)f.exclusions->ForceExpireCooldown(cooldown.id);
  (void)f.scheduler->RunOnce();
  (void)f.exclusions->ForceExpireWindow(cooldown.id);

  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Extend("u2", cooldown.id, PLATFORM_TYPE_SPORTS, std::nullopt); }) ==
         "The post-cooldown window has expired. You can no longer extend this cooldown.");

  assert(f.scheduler->RunOnce().windows_removed == 1);
  assert(f.exclusions->List("u2").empty());
}

void TestPermanentNeedsRecentCooldown() {
  Fixture f;

  CreateRequest permanent;
  permanent.user_id  = "u3";
  permanent.type     = EXCLUSION_TYPE_PERMANENT;
  permanent.platform = PLATFORM_TYPE_CASINO;
  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Create(permanent); }) ==
         "You must first take a 24-hour cooldown before setting up self-exclusion");

  // A cooldown on another segment does not count.
  (void)f.Cooldown("u3", PLATFORM_TYPE_SPORTS);
  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Create(permanent); }) != "<no error>");

  (void)f.Cooldown("u3", PLATFORM_TYPE_CASINO);
  const auto created = f.exclusions->Create(permanent);
  assert(created.type == EXCLUSION_TYPE_PERMANENT && !created.end_ms);

  assert(ErrorOf<ledger::util::Conflict>([&] { (void)f.exclusions->Cancel("u3", created.id); }) ==
         "Permanent exclusions cannot be canceled before their end date");

  const auto active = f.exclusions->HasActive("u3", PLATFORM_TYPE_CASINO);
  assert(active && active->type == EXCLUSION_TYPE_PERMANENT);
  assert(f.exclusions->HasActive("u3", PLATFORM_TYPE_SPORTS)->type == EXCLUSION_TYPE_COOLDOWN);

  CreateRequest temporary = permanent;
  temporary.type          = EXCLUSION_TYPE_TEMPORARY;
  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Create(temporary); }) ==
         "End date is required for temporary exclusion");
  temporary.end_ms = ledger::util::NowMs() - 1;
  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Create(temporary); }) == "End date must be in the future");
}

void TestCancelRules() {
  Fixture f;
  const auto cooldown = f.Cooldown("u4");

  assert(ErrorOf<ledger::util::ValidationError>([&] { (void)f.exclusions->Cancel("u4", "not-a-uuid"); }) == "Invalid exclusion ID format");
  assert(ErrorOf<ledger::util::NotFound>([&] { (void)f.exclusions->Cancel("u5", cooldown.id); }) == "Self-exclusion not found");

  const auto canceled = f.exclusions->Cancel("u4", cooldown.id);
  assert(canceled.deleted);
  assert(f.exclusions->List("u4").empty());

  const auto limit = f.Limit("u4", EXCLUSION_TYPE_DEPOSIT_LIMIT, LIMIT_PERIOD_MONTHLY, ParseAmount("500"));
  const auto pending = f.exclusions->Cancel("u4", limit.id);
  assert(!pending.deleted);
  assert(pending.exclusion.removal_requested_at_ms);

  // Still enforced during the grace period.
  assert(f.exclusions->GetGamblingLimits("u4").deposit.size() == 1);
  assert(f.scheduler->RunOnce().limits_removed == 0);

  (void)f.exclusions->ForceExpireRemoval(limit.id);
  assert(f.scheduler->RunOnce().limits_removed == 1);
  assert(f.exclusions->GetGamblingLimits("u4").deposit.empty());
}

void TestLimitUpdatesAndRemoval() {
  Fixture f;
  const auto first = f.Limit("u6", EXCLUSION_TYPE_DEPOSIT_LIMIT, LIMIT_PERIOD_DAILY, ParseAmount("100"));
  const auto again = f.Limit("u6", EXCLUSION_TYPE_DEPOSIT_LIMIT, LIMIT_PERIOD_DAILY, ParseAmount("250"));
  assert(again.id == first.id);
  assert(*again.limit_amount == ParseAmount("250"));

  // Deposit limits may be stacked across periods.
  (void)f.Limit("u6", EXCLUSION_TYPE_DEPOSIT_LIMIT, LIMIT_PERIOD_WEEKLY, ParseAmount("1000"));
  assert(f.exclusions->GetGamblingLimits("u6").deposit.size() == 2);

  const auto removal = f.Limit("u6", EXCLUSION_TYPE_DEPOSIT_LIMIT, LIMIT_PERIOD_DAILY, 0);
  assert(removal.removal_requested_at_ms);

  // Setting it again cancels the pending removal.
  const auto restored = f.Limit("u6", EXCLUSION_TYPE_DEPOSIT_LIMIT, LIMIT_PERIOD_DAILY, ParseAmount("80"));
  assert(!restored.removal_requested_at_ms);

  assert(ErrorOf<ledger::util::NotFound>([&] { (void)f.Limit("u6", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_DAILY, std::nullopt); }) ==
         "No active loss_limit found for daily period");
  assert(ErrorOf<ledger::util::ValidationError>([&] {
           CreateRequest req;
           req.user_id = "u6";
           req.type    = EXCLUSION_TYPE_WAGER_LIMIT;
           (void)f.exclusions->Create(req);
         }) == "Period is required for wager_limit");

  (void)f.Limit("u6", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_DAILY, ParseAmount("50"));
  assert(ErrorOf<ledger::util::Conflict>([&] { (void)f.Limit("u6", EXCLUSION_TYPE_LOSS_LIMIT, LIMIT_PERIOD_WEEKLY, ParseAmount("50")); }) ==
         "You can only have one active loss limit at a time");
}

void TestConcurrentWagerLimitsKeepOne() {
  Fixture f;

  const LimitPeriod periods[] = {LIMIT_PERIOD_DAILY, LIMIT_PERIOD_WEEKLY, LIMIT_PERIOD_MONTHLY, LIMIT_PERIOD_DAILY, LIMIT_PERIOD_WEEKLY};

  std::atomic<int>         created{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> threads;
  for (auto period : periods) {
    threads.emplace_back([&, period] {
      try {
        (void)f.Limit("u7", EXCLUSION_TYPE_WAGER_LIMIT, period, ParseAmount("100"));
        created.fetch_add(1);
      } catch (const ledger::util::Conflict&) {
        conflicts.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  // A same period request may update the winner instead of conflicting.
  assert(created >= 1);
  assert(created + conflicts == 5);
  assert(f.exclusions->GetGamblingLimits("u7").wager.size() == 1);
  assert(f.exclusions->List("u7").size() == 1);
}

void TestGetActiveFiltersBySegment() {
  Fixture f;
  (void)f.Cooldown("u8", PLATFORM_TYPE_SPORTS);
  (void)f.Limit("u8", EXCLUSION_TYPE_WAGER_LIMIT, LIMIT_PERIOD_DAILY, ParseAmount("10"));

  assert(f.exclusions->GetActive("u8", PLATFORM_TYPE_SPORTS).size() == 2);
  assert(f.exclusions->GetActive("u8", PLATFORM_TYPE_CASINO).size() == 1);
  assert(f.exclusions->GetActive("u8", std::nullopt).size() == 2);
  assert(!f.exclusions->HasActive("u8", PLATFORM_TYPE_CASINO));
}

} // namespace

int main() {
  TestCooldownLifecycle();
  TestExpiredWindowIsRemoved();
  TestPermanentNeedsRecentCooldown();
  TestCancelRules();
  TestLimitUpdatesAndRemoval();
  TestConcurrentWagerLimitsKeepOne();
  TestGetActiveFiltersBySegment();

  std::cout << "ledger_unit_exclusion_manager: pass\n";
  return 0;
}
