#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/queue/build_queue.hpp"
#include "internal/sandbox/doc_builder.hpp"

namespace docbuild::orchestrator {

struct BuildWorkerOptions {
  std::string               name = "worker-0";
  std::chrono::milliseconds idle_poll_interval{1000};
  std::chrono::milliseconds locked_poll_interval{60000};
};

/*
  One build thread: dequeue, build, record the result, repeat.

  Exceptions never escape the loop. A build that throws is reported to the
  queue as an infrastructure error so the entry is retried without
  consuming an attempt.
*/
class BuildWorker {
 public:
  BuildWorker(std::shared_ptr<queue::BuildQueue> queue, std::shared_ptr<sandbox::DocBuilder> builder, BuildWorkerOptions options);
  ~BuildWorker();

  void Start();
  void Stop();

  // Interrupts an idle or locked sleep.
  void Wake();

  // Processes at most one entry. Returns false when nothing was dequeued.
  bool RunOnce();

  uint64_t CompletedBuilds() const {
    return completed_builds_.load();
  }

 private:
  void Run();
  void Sleep(std::chrono::milliseconds interval);

  std::shared_ptr<queue::BuildQueue>   queue_;
  std::shared_ptr<sandbox::DocBuilder> builder_;
  BuildWorkerOptions                   options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    woken_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> completed_builds_{0};
};

} // namespace docbuild::orchestrator
