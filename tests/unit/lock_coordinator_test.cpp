#include "internal/lock/lock_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/lock/repository_lock_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::lock::LockCoordinator;
using ledger::lock::LockOptions;
using ledger::lock::LockStore;

using StoreFactory = std::function<std::shared_ptr<LockStore>()>;

LockOptions NoRetry(int64_t ttl_ms) {
  LockOptions options;
  options.ttl_ms          = ttl_ms;
  options.retry_count     = 0;
  options.retry_delay_ms  = 0;
  options.retry_jitter_ms = 0;
  return options;
}

void SleepMs(int64_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void TestSecondAcquireTimesOut(const StoreFactory& make_store) {
  LockCoordinator locks(make_store(), NoRetry(5000));

  const auto held = locks.Acquire("balance:u1:BTC");
  assert(locks.IsLocked("balance:u1:BTC"));

  bool timed_out = false;
  try {
    (void)locks.Acquire("balance:u1:BTC");
  } catch (const ledger::util::LockTimeout&) {
    timed_out = true;
  }
  assert(timed_out);

  // Other resources are independent.
  const auto other = locks.Acquire("balance:u1:ETH");
  locks.Release(other);

  locks.Release(held);
  assert(!locks.IsLocked("balance:u1:BTC"));

  const auto stats = locks.Metrics().Stats(std::string("balance:u1:BTC"));
  assert(stats.successful_acquisitions == 1);
  assert(stats.failed_acquisitions == 1);
}

void TestExpiredHolderCannotReleaseNewOwner(const StoreFactory& make_store) {
  LockCoordinator locks(make_store(), NoRetry(5000));

  const auto stale = locks.Acquire("balance:u2:BTC", NoRetry(50));
  SleepMs(120);
  assert(!locks.IsLocked("balance:u2:BTC"));

  const auto fresh = locks.Acquire("balance:u2:BTC");

  // The stale token must not delete the new owner's entry.
  locks.Release(stale);
  assert(locks.IsLocked("balance:u2:BTC"));

  bool extension_failed = false;
  try {
    (void)locks.Extend(stale);
  } catch (const ledger::util::LockExtensionFailed&) {
    extension_failed = true;
  }
  assert(extension_failed);

  locks.Release(fresh);
  assert(!locks.IsLocked("balance:u2:BTC"));
}

void TestTryLock(const StoreFactory& make_store) {
  LockCoordinator locks(make_store(), NoRetry(5000));

  auto first = locks.TryLock("self-exclusion:u3");
  assert(first.has_value());
  assert(!locks.TryLock("self-exclusion:u3").has_value());

  locks.Release(*first);
  auto again = locks.TryLock("self-exclusion:u3", 1000);
  assert(again.has_value());
  assert(again->ttl_ms == 1000);
  locks.Release(*again);
}

void TestExtendPushesExpiry(const StoreFactory& make_store) {
  LockCoordinator locks(make_store(), NoRetry(5000));

  const auto held = locks.Acquire("balance:u4:BTC", NoRetry(150));
  SleepMs(80);
  const auto extended = locks.Extend(held, 400);
  assert(extended.token == held.token);
  assert(extended.expires_at_ms > held.expires_at_ms);

  // Past the original ttl but inside the extension.
  SleepMs(150);
  assert(locks.IsLocked("balance:u4:BTC"));

  locks.Release(extended);
}

void TestWithLockAutoExtendsLongCriticalSection(const StoreFactory& make_store) {
  LockCoordinator locks(make_store(), NoRetry(100));

  std::atomic<bool> still_held{false};
  const int         result = locks.WithLock("balance:u5:BTC", [&] {
    SleepMs(350);
    // Well past the 100 ms ttl; the watchdog must have kept it alive.
    still_held = locks.IsLocked("balance:u5:BTC") && !locks.TryLock("balance:u5:BTC").has_value();
    return 42;
  });

  assert(result == 42);
  assert(still_held);
  assert(!locks.IsLocked("balance:u5:BTC"));
  assert(locks.Metrics().Stats(std::string("balance:u5:BTC")).extensions >= 2);
}

void TestWithLockReleasesOnException(const StoreFactory& make_store) {
  LockCoordinator locks(make_store(), NoRetry(5000));

  bool threw = false;
  try {
    locks.WithLock("balance:u6:BTC", [] { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!locks.IsLocked("balance:u6:BTC"));
}

void TestWithLockSerializesWriters(const StoreFactory& make_store) {
  LockOptions options;
  options.ttl_ms          = 5000;
  options.retry_count     = 500;
  options.retry_delay_ms  = 1;
  options.retry_jitter_ms = 2;
  LockCoordinator locks(make_store(), options);

  int              counter = 0;
  std::atomic<int> inside{0};
  std::atomic<int> overlap{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 10; ++i) {
        locks.WithLock("balance:u7:BTC", [&] {
          if (inside.fetch_add(1) != 0) overlap.fetch_add(1);
          const int read = counter;
          std::this_thread::yield();
          counter = read + 1;
          inside.fetch_sub(1);
        });
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(overlap == 0);
  assert(counter == 40);
}

void TestNonPositiveTtlRejected(const StoreFactory& make_store) {
  LockCoordinator locks(make_store(), NoRetry(5000));

  bool threw = false;
  try {
    (void)locks.Acquire("balance:u8:BTC", NoRetry(0));
  } catch (const ledger::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void RunAll(const StoreFactory& make_store) {
  TestSecondAcquireTimesOut(make_store);
  TestExpiredHolderCannotReleaseNewOwner(make_store);
  TestTryLock(make_store);
  TestExtendPushesExpiry(make_store);
  TestWithLockAutoExtendsLongCriticalSection(make_store);
  TestWithLockReleasesOnException(make_store);
  TestWithLockSerializesWriters(make_store);
  TestNonPositiveTtlRejected(make_store);
}

} // namespace

int main() {
  RunAll([] { return std::make_shared<ledger::lock::MemoryLockStore>(); });
  RunAll([] { return std::make_shared<ledger::lock::RepositoryLockStore>(std::make_shared<ledger::db::memory::MemoryRepository>()); });

  std::cout << "ledger_unit_lock_coordinator: pass\n";
  return 0;
}
