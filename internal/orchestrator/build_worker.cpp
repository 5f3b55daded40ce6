#include "build_worker.hpp"

#include "internal/observability/logging.hpp"

namespace docbuild::orchestrator {

BuildWorker::BuildWorker(std::shared_ptr<queue::BuildQueue> queue, std::shared_ptr<sandbox::DocBuilder> builder, BuildWorkerOptions options)
    : queue_(std::move(queue)), builder_(std::move(builder)), options_(std::move(options)) {
}

BuildWorker::~BuildWorker() {
  Stop();
}

void BuildWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&BuildWorker::Run, this);
}

void BuildWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void BuildWorker::Wake() {
  {
    std::lock_guard lock(mutex_);
    woken_ = true;
  }
  cv_.notify_all();
}

void BuildWorker::Sleep(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, interval, [&] { return woken_ || !running_; });
  woken_ = false;
}

bool BuildWorker::RunOnce() {
  auto entry = queue_->DequeueNext(options_.name);
  if (!entry) {
    return false;
  }

  auto outcome = queue::AttemptOutcome::kInfrastructureError;
  try {
    outcome = builder_->Build(*entry).attempt;
  } catch (const std::exception& e) {
    DOCBUILD_LOG_ERROR("build failed before completion", {observability::StringField("worker", options_.name),
                                                          observability::StringField("name", entry->normalized_name),
                                                          observability::StringField("version", entry->version),
                                                          observability::StringField("error", e.what())});
  }

  queue_->RecordAttemptResult(*entry, outcome);
  ++completed_builds_;
  return true;
}

void BuildWorker::Run() {
  DOCBUILD_LOG_INFO("build worker started", {observability::StringField("worker", options_.name)});

  while (running_) {
    try {
      if (queue_->IsLocked()) {
        Sleep(options_.locked_poll_interval);
        continue;
      }
      if (!RunOnce()) {
        Sleep(options_.idle_poll_interval);
      }
    } catch (const std::exception& e) {
      DOCBUILD_LOG_ERROR("build worker iteration failed",
                         {observability::StringField("worker", options_.name), observability::StringField("error", e.what())});
      Sleep(options_.idle_poll_interval);
    }
  }

  DOCBUILD_LOG_INFO("build worker stopped", {observability::StringField("worker", options_.name)});
}

} // namespace docbuild::orchestrator
