#include "internal/lock/lock_metrics.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using ledger::lock::LockMetrics;

void TestAggregatesPerResource() {
  LockMetrics metrics;
  metrics.RecordAcquisition("balance:u1:BTC", 10, true);
  metrics.RecordAcquisition("balance:u1:BTC", 30, false);
  metrics.RecordRelease("balance:u1:BTC", "t1", 40);
  metrics.RecordExtension("balance:u1:BTC", "t1", true);
  metrics.RecordExtension("balance:u1:BTC", "t1", false);
  metrics.RecordAcquisition("self-exclusion:u1", 5, true);

  const auto balance = metrics.Stats(std::string("balance:u1:BTC"));
  assert(balance.resource == "balance:u1:BTC");
  assert(balance.total_acquisitions == 2);
  assert(balance.successful_acquisitions == 1);
  assert(balance.failed_acquisitions == 1);
  assert(balance.extensions == 1);
  assert(balance.avg_acquisition_ms == 20);
  assert(balance.avg_hold_ms == 40);

  const auto all = metrics.Stats();
  assert(all.resource.empty());
  assert(all.total_acquisitions == 3);
}

void TestTopContendedOrdersByFailures() {
  LockMetrics metrics;
  metrics.RecordAcquisition("a", 1, false);
  metrics.RecordAcquisition("b", 1, false);
  metrics.RecordAcquisition("b", 1, false);
  metrics.RecordAcquisition("c", 50, true);
  metrics.RecordAcquisition("d", 90, true);

  const auto top = metrics.TopContended(3);
  assert(top.size() == 3);
  assert(top[0].resource == "b");
  assert(top[1].resource == "a");
  // Ties on failures fall back to slower acquisition first.
  assert(top[2].resource == "d");
}

void TestRingBufferIsBounded() {
  LockMetrics metrics;
  for (std::size_t i = 0; i < LockMetrics::kMaxRecords + 25; ++i) {
    metrics.RecordAcquisition("r", 1, true);
  }
  assert(metrics.RecordCount() == LockMetrics::kMaxRecords);

  metrics.Reset();
  assert(metrics.RecordCount() == 0);
  assert(metrics.Stats().total_acquisitions == 0);
}

} // namespace

int main() {
  TestAggregatesPerResource();
  TestTopContendedOrdersByFailures();
  TestRingBufferIsBounded();

  std::cout << "ledger_unit_lock_metrics: pass\n";
  return 0;
}
