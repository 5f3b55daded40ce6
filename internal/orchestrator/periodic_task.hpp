#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace docbuild::orchestrator {

/*
  Runs a maintenance function every interval on its own thread. The first
  run happens one interval after Start(). A throwing run is logged and the
  next tick retries.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
  ~PeriodicTask();

  void Start();
  void Stop();

  uint64_t CompletedRuns() const {
    return completed_runs_.load();
  }

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;

  std::mutex              mutex_;
  std::condition_variable cv_;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> completed_runs_{0};
};

} // namespace docbuild::orchestrator
