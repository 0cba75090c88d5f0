#include "sync_worker.hpp"

#include "internal/core/sync_coordinator.hpp"
#include "internal/observability/logging.hpp"

namespace vaultsync::runtime {

using observability::StringField;

SyncWorker::SyncWorker(std::shared_ptr<core::SyncCoordinator> coordinator, SyncSchedule schedule)
    : coordinator_(std::move(coordinator)), schedule_(schedule) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SyncWorker::Wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    woken_ = true;
  }
  cv_.notify_all();
}

void SyncWorker::Run() {
  auto next_sync = std::chrono::steady_clock::now() + schedule_.initial_delay;

  while (running_) {
    try {
      coordinator_->Pump();
      if (!schedule_.paused && std::chrono::steady_clock::now() >= next_sync) {
        coordinator_->TriggerSync();
        next_sync = std::chrono::steady_clock::now() + schedule_.interval;
      }
    } catch (const std::exception& e) {
      VAULTSYNC_LOG_ERROR("sync worker iteration failed", {StringField("error", e.what())});
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, schedule_.poll_interval, [&] { return !running_ || woken_; });
    woken_ = false;
  }
}

} // namespace vaultsync::runtime
