#include "lock_metrics.hpp"

#include <algorithm>
#include <set>

#include "internal/lock/lock_keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ledger::lock {

using observability::IntField;
using observability::StringField;

void LockMetrics::Push(Event event) {
  events_.push_back(std::move(event));
  while (events_.size() > kMaxRecords) {
    events_.pop_front();
  }
}

void LockMetrics::RecordAcquisition(const std::string& resource, double acquisition_ms, bool success) {
  {
    std::lock_guard lock(mutex_);
    Push(Event{EventType::kAcquire, resource, success, acquisition_ms});
  }

  observability::Metrics::Instance().ObserveLockAcquisitionMs(ResourceKind(resource), acquisition_ms, success);

  if (acquisition_ms > kSlowAcquisitionMs) {
    LEDGER_LOG_WARN("slow lock acquisition", {StringField("resource", resource), IntField("acquisition_ms", static_cast<int64_t>(acquisition_ms)),
                                              observability::BoolField("success", success)});
  }
}

void LockMetrics::RecordRelease(const std::string& resource, const std::string& token, double hold_ms) {
  {
    std::lock_guard lock(mutex_);
    Push(Event{EventType::kRelease, resource, true, hold_ms});
    extensions_by_token_.erase(token);
  }

  if (hold_ms > kLongHoldMs) {
    LEDGER_LOG_WARN("long lock hold", {StringField("resource", resource), IntField("hold_ms", static_cast<int64_t>(hold_ms))});
  }
}

void LockMetrics::RecordExtension(const std::string& resource, const std::string& token, bool success) {
  uint64_t count = 0;
  {
    std::lock_guard lock(mutex_);
    Push(Event{EventType::kExtend, resource, success, 0});
    if (success) {
      count = ++extensions_by_token_[token];
    }
  }

  observability::Metrics::Instance().RecordLockExtension(ResourceKind(resource), success);

  if (count > 0 && count % kExtensionWarnPeriod == 0) {
    LEDGER_LOG_WARN("lock extended repeatedly", {StringField("resource", resource), IntField("extensions", static_cast<int64_t>(count))});
  }
}

LockStats LockMetrics::Aggregate(const std::deque<Event>& events, const std::optional<std::string>& resource) {
  LockStats stats;
  if (resource) stats.resource = *resource;

  double   acquisition_total = 0;
  double   hold_total        = 0;
  uint64_t releases          = 0;

  for (const auto& event : events) {
    if (resource && event.resource != *resource) continue;

    switch (event.type) {
      case EventType::kAcquire:
        ++stats.total_acquisitions;
        acquisition_total += event.value_ms;
        if (event.success) {
          ++stats.successful_acquisitions;
        } else {
          ++stats.failed_acquisitions;
        }
        break;
      case EventType::kRelease:
        ++releases;
        hold_total += event.value_ms;
        break;
      case EventType::kExtend:
        if (event.success) ++stats.extensions;
        break;
    }
  }

  if (stats.total_acquisitions > 0) stats.avg_acquisition_ms = acquisition_total / static_cast<double>(stats.total_acquisitions);
  if (releases > 0) stats.avg_hold_ms = hold_total / static_cast<double>(releases);
  return stats;
}

LockStats LockMetrics::Stats(const std::optional<std::string>& resource) const {
  std::lock_guard lock(mutex_);
  return Aggregate(events_, resource);
}

std::vector<LockStats> LockMetrics::TopContended(std::size_t limit) const {
  std::lock_guard lock(mutex_);

  std::set<std::string> resources;
  for (const auto& event : events_) {
    resources.insert(event.resource);
  }

  std::vector<LockStats> ranked;
  ranked.reserve(resources.size());
  for (const auto& resource : resources) {
    ranked.push_back(Aggregate(events_, resource));
  }

  std::sort(ranked.begin(), ranked.end(), [](const LockStats& a, const LockStats& b) {
    if (a.failed_acquisitions != b.failed_acquisitions) return a.failed_acquisitions > b.failed_acquisitions;
    return a.avg_acquisition_ms > b.avg_acquisition_ms;
  });

  if (ranked.size() > limit) ranked.resize(limit);
  return ranked;
}

std::size_t LockMetrics::RecordCount() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

void LockMetrics::Reset() {
  std::lock_guard lock(mutex_);
  events_.clear();
  extensions_by_token_.clear();
}

} // namespace ledger::lock
