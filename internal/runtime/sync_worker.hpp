#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace vaultsync::core {
class SyncCoordinator;
}

namespace vaultsync::runtime {

struct SyncSchedule {
  std::chrono::milliseconds initial_delay{0};
  std::chrono::milliseconds interval{60'000};
  std::chrono::milliseconds poll_interval{200};
  // Scheduled sessions suspended; the inbox is still pumped.
  bool paused = false;
};

/*
  Background worker for the daemon.

  Pumps the coordinator every poll interval and fires scheduled syncs after
  the initial delay at a fixed interval. Wake() runs a pump immediately.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<core::SyncCoordinator> coordinator, SyncSchedule schedule);
  ~SyncWorker();

  SyncWorker(const SyncWorker&)            = delete;
  SyncWorker& operator=(const SyncWorker&) = delete;

  void Start();
  void Stop();
  void Wake();

 private:
  void Run();

  std::shared_ptr<core::SyncCoordinator> coordinator_;
  SyncSchedule                           schedule_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    woken_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace vaultsync::runtime
