#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ledger::runtime::config {
class RuntimeConfig;
}

namespace ledger::observability {

// Both return false and install nothing when the matching
// observability.*_enabled flag is off.
bool InitializeTracing(const ledger::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ledger::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // resource_kind is the lock key prefix ("balance", "self-exclusion", ...).
  void ObserveLockAcquisitionMs(std::string_view resource_kind, double latency_ms, bool success);
  void RecordLockExtension(std::string_view resource_kind, bool success);

  // outcome: applied | replayed | rejected
  void RecordLedgerOperation(std::string_view kind, std::string_view outcome);
  void RecordSchedulerTransitions(std::string_view step, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const ledger::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ledger::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveLockAcquisitionMs(std::string_view, double, bool) {
}

inline void Metrics::RecordLockExtension(std::string_view, bool) {
}

inline void Metrics::RecordLedgerOperation(std::string_view, std::string_view) {
}

inline void Metrics::RecordSchedulerTransitions(std::string_view, std::uint64_t) {
}
#endif

} // namespace ledger::observability
