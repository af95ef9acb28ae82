#include "expiry_worker.hpp"

#include "internal/observability/logging.hpp"

namespace ledger::scheduler {

ExpiryWorker::ExpiryWorker(std::shared_ptr<ExpiryScheduler> scheduler, std::chrono::milliseconds interval)
    : scheduler_(std::move(scheduler)), interval_(interval) {
}

ExpiryWorker::~ExpiryWorker() {
  Stop();
}

void ExpiryWorker::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;

  running_ = true;
  thread_  = std::thread(&ExpiryWorker::Run, this);
}

void ExpiryWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ExpiryWorker::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    try {
      scheduler_->RunOnce();
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("expiry run failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace ledger::scheduler
