#include "expiry_scheduler.hpp"

#include "internal/db/api/unit_of_work.hpp"
#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/lock/lock_keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace ledger::scheduler {

using observability::IntField;

namespace {

template <typename Step>
uint64_t RunStep(db::Repository& repository, const char* name, Step&& step) {
  const auto affected = db::RunInTransaction(repository, [&](db::Transaction& tx) {
    uint64_t n = 0;
    db::ThrowIfDbError(step(tx, n), name);
    return n;
  });

  if (affected > 0) {
    observability::Metrics::Instance().RecordSchedulerTransitions(name, affected);
  }
  return affected;
}

} // namespace

ExpiryScheduler::ExpiryScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks, bool leader_lock)
    : repository_(std::move(repository)), locks_(std::move(locks)), leader_lock_(leader_lock) {
}

ExpiryReport ExpiryScheduler::RunOnce() {
  return RunOnce(util::NowMs());
}

ExpiryReport ExpiryScheduler::RunOnce(int64_t now_ms) {
  observability::SpanScope span("ledger.scheduler.expiry");

  ExpiryReport report;
  if (!leader_lock_) {
    Run(now_ms, report);
  } else {
    auto leader = locks_->TryLock(lock::SchedulerResource());
    if (!leader) {
      report.skipped = true;
      span.AddEvent("skipped");
      return report;
    }

    try {
      Run(now_ms, report);
    } catch (...) {
      locks_->Release(*leader);
      throw;
    }
    locks_->Release(*leader);
  }

  if (report.Total() > 0) {
    LEDGER_LOG_INFO("expiry run", {IntField("cooldowns_windowed", static_cast<int64_t>(report.cooldowns_windowed)),
                                   IntField("windows_removed", static_cast<int64_t>(report.windows_removed)),
                                   IntField("temporaries_expired", static_cast<int64_t>(report.temporaries_expired)),
                                   IntField("limits_removed", static_cast<int64_t>(report.limits_removed))});
  }
  return report;
}

void ExpiryScheduler::Run(int64_t now_ms, ExpiryReport& report) {
  auto& repo = *repository_;

  report.cooldowns_windowed = RunStep(repo, "cooldown_windowed", [&](db::Transaction& tx, uint64_t& n) {
    return repo.StartPostCooldownWindows(tx, now_ms, now_ms + exclusion::kPostCooldownWindowMs, n);
  });

  report.windows_removed =
      RunStep(repo, "window_removed", [&](db::Transaction& tx, uint64_t& n) { return repo.DeleteExpiredCooldownWindows(tx, now_ms, n); });

  report.temporaries_expired =
      RunStep(repo, "temporary_expired", [&](db::Transaction& tx, uint64_t& n) { return repo.DeactivateExpiredTemporary(tx, now_ms, n); });

  report.limits_removed = RunStep(repo, "limit_removed", [&](db::Transaction& tx, uint64_t& n) {
    return repo.DeleteRemovedLimits(tx, now_ms - exclusion::kLimitRemovalGracePeriod, n);
  });
}

} // namespace ledger::scheduler
