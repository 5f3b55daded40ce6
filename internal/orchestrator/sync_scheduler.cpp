#include "sync_scheduler.hpp"

#include "internal/observability/logging.hpp"

namespace docbuild::orchestrator {

SyncScheduler::SyncScheduler(std::shared_ptr<sync::IndexSync> sync, std::chrono::milliseconds poll_interval)
    : sync_(std::move(sync)), poll_interval_(poll_interval) {
}

SyncScheduler::~SyncScheduler() {
  Stop();
}

void SyncScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SyncScheduler::Run, this);
}

void SyncScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SyncScheduler::Trigger() {
  {
    std::lock_guard lock(mutex_);
    triggered_ = true;
  }
  cv_.notify_all();
}

void SyncScheduler::Run() {
  while (running_) {
    try {
      sync_->Run();
    } catch (const std::exception& e) {
      // IndexSync already logged the details; the next tick retries
      DOCBUILD_LOG_WARN("scheduled sync failed", {observability::StringField("error", e.what())});
    }
    ++completed_runs_;

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, poll_interval_, [&] { return triggered_ || !running_; });
    triggered_ = false;
  }
}

} // namespace docbuild::orchestrator
