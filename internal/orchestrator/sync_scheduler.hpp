#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/sync/index_sync.hpp"

namespace docbuild::orchestrator {

/*
  Runs IndexSync on a timer, or right away when Trigger() is called.
  Triggers that arrive while a run is in progress coalesce into one
  follow-up run.
*/
class SyncScheduler {
 public:
  SyncScheduler(std::shared_ptr<sync::IndexSync> sync, std::chrono::milliseconds poll_interval);
  ~SyncScheduler();

  void Start();
  void Stop();

  void Trigger();

  uint64_t CompletedRuns() const {
    return completed_runs_.load();
  }

 private:
  void Run();

  std::shared_ptr<sync::IndexSync> sync_;
  std::chrono::milliseconds        poll_interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    triggered_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> completed_runs_{0};
};

} // namespace docbuild::orchestrator
