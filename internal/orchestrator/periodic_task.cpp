#include "periodic_task.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace docbuild::orchestrator {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("periodic task " + name_ + " needs a positive interval");
  }
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&PeriodicTask::Run, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void PeriodicTask::Run() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return !running_; })) {
        return;
      }
    }

    try {
      fn_();
    } catch (const std::exception& e) {
      DOCBUILD_LOG_WARN("periodic task failed", {observability::StringField("task", name_), observability::StringField("error", e.what())});
    }
    ++completed_runs_;
  }
}

} // namespace docbuild::orchestrator
