#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/lock/lock_coordinator.hpp"

namespace ledger::scheduler {

struct ExpiryReport {
  uint64_t cooldowns_windowed  = 0;
  uint64_t windows_removed     = 0;
  uint64_t temporaries_expired = 0;
  uint64_t limits_removed      = 0;

  // Another worker held the scheduler lock.
  bool skipped = false;

  uint64_t Total() const {
    return cooldowns_windowed + windows_removed + temporaries_expired + limits_removed;
  }
};

/*
  Time driven self-exclusion transitions.

    1. cooldown past end_ms         -> post-cooldown window (now + 24h)
    2. post-cooldown window closed  -> row deleted
    3. temporary past end_ms        -> is_active = false
    4. limit removal requested 24h+ -> row deleted

  Every step is one conditional statement, so concurrent runs on
  several workers are safe. With leader_lock only the worker holding
  scheduler:expiry runs.
*/
class ExpiryScheduler {
 public:
  ExpiryScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks, bool leader_lock);

  ExpiryReport RunOnce();
  ExpiryReport RunOnce(int64_t now_ms);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<lock::LockCoordinator> locks_;
  bool                                   leader_lock_;

  void Run(int64_t now_ms, ExpiryReport& report);
};

} // namespace ledger::scheduler
