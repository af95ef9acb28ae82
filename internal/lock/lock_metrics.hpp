#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger::lock {

struct LockStats {
  std::string resource; // empty for the aggregate over all resources

  uint64_t total_acquisitions      = 0;
  uint64_t successful_acquisitions = 0;
  uint64_t failed_acquisitions     = 0;
  uint64_t extensions              = 0;

  double avg_acquisition_ms = 0;
  double avg_hold_ms        = 0;
};

/*
  In-process lock telemetry for one worker.

  Keeps the last kMaxRecords events and derives statistics from them.
  Counters are forwarded to observability::Metrics as well.
*/
class LockMetrics {
 public:
  static constexpr std::size_t kMaxRecords          = 10000;
  static constexpr double      kSlowAcquisitionMs   = 1000;
  static constexpr double      kLongHoldMs          = 5000;
  static constexpr uint64_t    kExtensionWarnPeriod = 10;

  void RecordAcquisition(const std::string& resource, double acquisition_ms, bool success);
  void RecordRelease(const std::string& resource, const std::string& token, double hold_ms);
  void RecordExtension(const std::string& resource, const std::string& token, bool success);

  LockStats              Stats(const std::optional<std::string>& resource = std::nullopt) const;
  std::vector<LockStats> TopContended(std::size_t limit = 10) const;

  std::size_t RecordCount() const;
  void        Reset();

 private:
  enum class EventType { kAcquire, kRelease, kExtend };

  struct Event {
    EventType   type;
    std::string resource;
    bool        success = false;
    double      value_ms = 0;
  };

  mutable std::mutex mutex_;

  std::deque<Event>                         events_;
  std::unordered_map<std::string, uint64_t> extensions_by_token_;

  void Push(Event event);

  static LockStats Aggregate(const std::deque<Event>& events, const std::optional<std::string>& resource);
};

} // namespace ledger::lock
