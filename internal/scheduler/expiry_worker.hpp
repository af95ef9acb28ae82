#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "expiry_scheduler.hpp"

namespace ledger::scheduler {

/*
  Background thread running ExpiryScheduler::RunOnce every interval.

  Failures are logged and the next tick runs normally.
*/
class ExpiryWorker {
 public:
  ExpiryWorker(std::shared_ptr<ExpiryScheduler> scheduler, std::chrono::milliseconds interval);
  ~ExpiryWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<ExpiryScheduler> scheduler_;
  std::chrono::milliseconds        interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace ledger::scheduler
