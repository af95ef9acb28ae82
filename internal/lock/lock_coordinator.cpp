#include "lock_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <random>

#include "internal/lock/lock_keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ledger::lock {

using observability::IntField;
using observability::StringField;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

LockCoordinator::LockCoordinator(std::shared_ptr<LockStore> store, LockOptions defaults, std::shared_ptr<LockMetrics> metrics)
    : store_(std::move(store)), defaults_(defaults), metrics_(metrics ? std::move(metrics) : std::make_shared<LockMetrics>()) {
}

int64_t LockCoordinator::JitteredDelayMs(const LockOptions& options) {
  thread_local std::mt19937_64 rng{std::random_device{}()};

  if (options.retry_jitter_ms <= 0) return options.retry_delay_ms;
  std::uniform_int_distribution<int64_t> jitter(0, options.retry_jitter_ms);
  return options.retry_delay_ms + jitter(rng);
}

Lock LockCoordinator::Acquire(const std::string& resource) {
  return Acquire(resource, defaults_);
}

Lock LockCoordinator::Acquire(const std::string& resource, const LockOptions& options) {
  if (options.ttl_ms <= 0) {
    throw util::ValidationError("lock ttl must be positive");
  }

  const auto key     = StoreKey(resource);
  const auto token   = util::GenerateUUIDString();
  const auto started = std::chrono::steady_clock::now();

  for (uint32_t attempt = 0;; ++attempt) {
    if (store_->SetIfAbsent(key, token, std::chrono::milliseconds(options.ttl_ms))) {
      metrics_->RecordAcquisition(resource, ElapsedMs(started), true);

      const auto now = util::NowMs();
      return Lock{resource, token, options.ttl_ms, now, now + options.ttl_ms};
    }

    if (attempt >= options.retry_count) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(JitteredDelayMs(options)));
  }

  metrics_->RecordAcquisition(resource, ElapsedMs(started), false);
  throw util::LockTimeout("failed to acquire lock on " + resource + " after " + std::to_string(options.retry_count + 1) + " attempts");
}

std::optional<Lock> LockCoordinator::TryLock(const std::string& resource, std::optional<int64_t> ttl_ms) {
  LockOptions options = defaults_;
  options.retry_count = 0;
  if (ttl_ms) options.ttl_ms = *ttl_ms;

  try {
    return Acquire(resource, options);
  } catch (const util::LockTimeout&) {
    return std::nullopt;
  }
}

void LockCoordinator::Release(const Lock& lock) {
  const double hold_ms = static_cast<double>(util::NowMs() - lock.acquired_at_ms);

  if (!store_->CompareAndDelete(StoreKey(lock.resource), lock.token)) {
    LEDGER_LOG_WARN("lock expired or taken over before release",
                    {StringField("resource", lock.resource), IntField("hold_ms", static_cast<int64_t>(hold_ms))});
  }

  metrics_->RecordRelease(lock.resource, lock.token, hold_ms);
}

Lock LockCoordinator::Extend(const Lock& lock, std::optional<int64_t> ttl_ms) {
  const int64_t ttl = ttl_ms.value_or(lock.ttl_ms > 0 ? lock.ttl_ms : defaults_.ttl_ms);

  const bool ok = store_->CompareAndExtend(StoreKey(lock.resource), lock.token, std::chrono::milliseconds(ttl));
  metrics_->RecordExtension(lock.resource, lock.token, ok);
  if (!ok) {
    throw util::LockExtensionFailed("lock on " + lock.resource + " is no longer held");
  }

  Lock extended          = lock;
  extended.ttl_ms        = ttl;
  extended.expires_at_ms = util::NowMs() + ttl;
  return extended;
}

bool LockCoordinator::IsLocked(const std::string& resource) {
  return store_->Exists(StoreKey(resource));
}

// ---------------------------------------------------------------------------
// WithLock helpers
// ---------------------------------------------------------------------------

LockCoordinator::ReleaseGuard::ReleaseGuard(LockCoordinator& owner, Lock held) : owner(owner), lock(std::move(held)) {
}

LockCoordinator::ReleaseGuard::~ReleaseGuard() {
  try {
    owner.Release(lock);
  } catch (const std::exception& e) {
    // The entry expires on its own; never throw from a destructor.
    LEDGER_LOG_ERROR("lock release failed", {StringField("resource", lock.resource), StringField("error", e.what())});
  }
}

LockCoordinator::Watchdog::Watchdog(LockCoordinator& owner, const Lock& lock) : owner_(owner), lock_(lock) {
  thread_ = std::thread(&Watchdog::Run, this);
}

LockCoordinator::Watchdog::~Watchdog() {
  {
    std::lock_guard guard(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LockCoordinator::Watchdog::Run() {
  const auto interval = std::chrono::milliseconds(std::max<int64_t>(1, static_cast<int64_t>(lock_.ttl_ms * kWatchdogFraction)));
  int        failures = 0;

  std::unique_lock guard(mutex_);
  while (!cv_.wait_for(guard, interval, [this] { return stop_; })) {
    guard.unlock();
    try {
      lock_    = owner_.Extend(lock_);
      failures = 0;
    } catch (const std::exception& e) {
      ++failures;
      LEDGER_LOG_WARN("lock auto-extension failed",
                      {StringField("resource", lock_.resource), IntField("failures", failures), StringField("error", e.what())});
    }
    guard.lock();

    if (failures >= kWatchdogMaxFailures) {
      LEDGER_LOG_ERROR("lock auto-extension stopped", {StringField("resource", lock_.resource), IntField("failures", failures)});
      return;
    }
  }
}

} // namespace ledger::lock
