#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>

#include "internal/lock/lock.hpp"
#include "internal/lock/lock_metrics.hpp"
#include "internal/lock/lock_store.hpp"

namespace ledger::lock {

/*
  Distributed mutual exclusion over a shared LockStore.

  Guarantees:
    - at most one unexpired holder per resource across all workers
    - release/extend never touch an entry re-acquired by someone else
      (fencing token compare)
    - Acquire blocks at most retry_count * (retry_delay + retry_jitter)

  Thread-safe.
*/
class LockCoordinator {
 public:
  static constexpr double kWatchdogFraction    = 0.6;
  static constexpr int    kWatchdogMaxFailures = 3;

  LockCoordinator(std::shared_ptr<LockStore> store, LockOptions defaults = {}, std::shared_ptr<LockMetrics> metrics = nullptr);

  // Throws util::LockTimeout when every attempt found the resource held.
  Lock Acquire(const std::string& resource);
  Lock Acquire(const std::string& resource, const LockOptions& options);

  // Single attempt. Empty when held by someone else.
  std::optional<Lock> TryLock(const std::string& resource, std::optional<int64_t> ttl_ms = std::nullopt);

  // No-op (logged) when the lock already expired or was taken over.
  void Release(const Lock& lock);

  // Throws util::LockExtensionFailed when the token no longer holds the resource.
  Lock Extend(const Lock& lock, std::optional<int64_t> ttl_ms = std::nullopt);

  bool IsLocked(const std::string& resource);

  /*
    Acquire, run fn, release on every exit path.

    A watchdog extends the lock every 0.6 * ttl while fn runs, so fn may
    outlive the initial ttl. fn itself is never interrupted.
  */
  template <typename Fn>
  auto WithLock(const std::string& resource, Fn&& fn) {
    return WithLock(resource, std::forward<Fn>(fn), defaults_);
  }

  template <typename Fn>
  auto WithLock(const std::string& resource, Fn&& fn, const LockOptions& options) {
    ReleaseGuard guard(*this, Acquire(resource, options));
    Watchdog     watchdog(*this, guard.lock);
    return fn();
  }

  const LockOptions& Defaults() const {
    return defaults_;
  }

  LockMetrics& Metrics() {
    return *metrics_;
  }

  std::shared_ptr<LockMetrics> SharedMetrics() const {
    return metrics_;
  }

 private:
  struct ReleaseGuard {
    ReleaseGuard(LockCoordinator& owner, Lock held);
    ~ReleaseGuard();

    ReleaseGuard(const ReleaseGuard&)            = delete;
    ReleaseGuard& operator=(const ReleaseGuard&) = delete;

    LockCoordinator& owner;
    Lock             lock;
  };

  class Watchdog {
   public:
    Watchdog(LockCoordinator& owner, const Lock& lock);
    ~Watchdog();

    Watchdog(const Watchdog&)            = delete;
    Watchdog& operator=(const Watchdog&) = delete;

   private:
    void Run();

    LockCoordinator& owner_;
    Lock             lock_;

    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    stop_ = false;
    std::thread             thread_;
  };

  std::shared_ptr<LockStore>   store_;
  LockOptions                  defaults_;
  std::shared_ptr<LockMetrics> metrics_;

  int64_t JitteredDelayMs(const LockOptions& options);
};

} // namespace ledger::lock
