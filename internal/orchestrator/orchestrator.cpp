#include "orchestrator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/queue/admission.hpp"
#include "internal/status/status_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"

namespace docbuild::orchestrator {

Orchestrator::Orchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<sync::IndexSync> sync,
                           std::shared_ptr<queue::BuildQueue> queue, std::shared_ptr<sandbox::DocBuilder> builder,
                           OrchestratorOptions options)
    : repository_(std::move(repository)),
      sync_(std::move(sync)),
      queue_(std::move(queue)),
      builder_(std::move(builder)),
      options_(std::move(options)) {
  if (options_.workers > 0 && !builder_) {
    throw std::invalid_argument("build workers need a DocBuilder");
  }
}

Orchestrator::~Orchestrator() {
  Stop();
}

void Orchestrator::Start() {
  if (running_) {
    return;
  }

  const auto failed = FailAbandonedBuilds();
  if (failed > 0) {
    DOCBUILD_LOG_WARN("failed abandoned builds at startup", {observability::IntField("builds", static_cast<int64_t>(failed))});
  }

  if (options_.sync_enabled) {
    scheduler_ = std::make_unique<SyncScheduler>(sync_, options_.sync_poll_interval);
    scheduler_->Start();
  }

  for (uint32_t i = 0; i < options_.workers; ++i) {
    BuildWorkerOptions worker_options;
    worker_options.name                 = options_.worker_name + "-" + std::to_string(i);
    worker_options.idle_poll_interval   = options_.idle_poll_interval;
    worker_options.locked_poll_interval = options_.locked_poll_interval;

    auto worker = std::make_unique<BuildWorker>(queue_, builder_, worker_options);
    worker->Start();
    workers_.push_back(std::move(worker));
  }

  if (options_.abandoned_sweep_interval.count() > 0) {
    maintenance_.push_back(std::make_unique<PeriodicTask>("abandoned build sweep", options_.abandoned_sweep_interval, [this] {
      if (auto failed = FailAbandonedBuilds(); failed > 0) {
        DOCBUILD_LOG_WARN("failed abandoned builds", {observability::IntField("builds", static_cast<int64_t>(failed))});
      }
    }));
  }
  if (options_.max_queued_rebuilds > 0) {
    maintenance_.push_back(std::make_unique<PeriodicTask>("rebuild queueing", options_.rebuild_interval, [this] {
      if (QueueRebuilds() > 0) {
        Wake();
      }
    }));
  }
  for (auto& task : maintenance_) {
    task->Start();
  }

  running_ = true;
  DOCBUILD_LOG_INFO("orchestrator started", {observability::IntField("workers", options_.workers),
                                             observability::BoolField("sync", options_.sync_enabled)});
}

void Orchestrator::Stop() {
  if (!running_) {
    return;
  }
  if (scheduler_) {
    scheduler_->Stop();
    scheduler_.reset();
  }
  for (auto& task : maintenance_) {
    task->Stop();
  }
  maintenance_.clear();
  for (auto& worker : workers_) {
    worker->Stop();
  }
  workers_.clear();
  running_ = false;
  DOCBUILD_LOG_INFO("orchestrator stopped");
}

void Orchestrator::TriggerSync() {
  if (scheduler_) {
    scheduler_->Trigger();
  }
}

void Orchestrator::Wake() {
  for (auto& worker : workers_) {
    worker->Wake();
  }
}

uint64_t Orchestrator::FailAbandonedBuilds() {
  status::StatusAggregator aggregator(repository_);
  return aggregator.FailAbandonedBuilds(util::NowMillis(), options_.abandoned_build_age,
                                        [this](db::Transaction& tx, const std::string& normalized_name) {
                                          return queue_->WindowFor(tx, normalized_name, options_.abandoned_build_age);
                                        });
}

uint64_t Orchestrator::QueueRebuilds() {
  if (options_.max_queued_rebuilds == 0) {
    return 0;
  }
  return queue_->QueueRebuilds(options_.max_queued_rebuilds);
}

queue::EnqueueResult Orchestrator::ManualEnqueue(const std::string& name, const std::string& version, std::optional<int32_t> priority,
                                                 const std::string& registry) {
  std::vector<db::model::PriorityRuleRecord> rules;
  std::vector<std::string>                   blocked;
  {
    auto tx = repository_->Begin();
    rules   = repository_->ListPriorityRules(*tx);
    blocked = repository_->ListBlacklist(*tx);
    tx->Commit();
  }
  if (queue::BlacklistFilter(blocked).IsBlocked(name)) {
    throw util::FailedPrecondition("package is blacklisted: " + util::NormalizeName(name));
  }
  if (!priority) {
    priority = queue::PriorityResolver(std::move(rules)).ResolveByRules(name);
  }

  queue::EnqueueRequest request;
  request.name     = name;
  request.version  = version;
  request.priority = *priority;
  request.registry = registry.empty() ? options_.registry_name : registry;

  auto result = queue_->Requeue(request);
  Wake();
  return result;
}

} // namespace docbuild::orchestrator
