#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/orchestrator/build_worker.hpp"
#include "internal/orchestrator/periodic_task.hpp"
#include "internal/orchestrator/sync_scheduler.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/sandbox/doc_builder.hpp"
#include "internal/sync/index_sync.hpp"

namespace docbuild::orchestrator {

struct OrchestratorOptions {
  uint32_t                  workers     = 1;
  std::string               worker_name = "docbuild";
  std::chrono::milliseconds idle_poll_interval{1000};
  std::chrono::milliseconds locked_poll_interval{60000};

  bool                      sync_enabled = true;
  std::chrono::milliseconds sync_poll_interval{60000};

  // builds in_progress for longer than this are failed; sandbox timeout
  // overrides above the default widen it per package
  std::chrono::seconds      abandoned_build_age{15 * 60 + 300};
  std::chrono::milliseconds abandoned_sweep_interval{5 * 60 * 1000}; // 0 = startup only

  uint32_t                  max_queued_rebuilds = 0; // 0 = no rebuilds
  std::chrono::milliseconds rebuild_interval{60 * 60 * 1000};

  std::string registry_name;
};

/*
  Orchestrator

  Owns the sync scheduler, the build workers and the maintenance tasks
  (abandoned build sweep, rebuild queueing). There is no leader election:
  several orchestrators may share one database.
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<sync::IndexSync> sync, std::shared_ptr<queue::BuildQueue> queue,
               std::shared_ptr<sandbox::DocBuilder> builder, OrchestratorOptions options);
  ~Orchestrator();

  void Start();
  void Stop();

  void TriggerSync();

  /*
    Enqueues outside synchronization, resetting any previous attempts.
    Without an explicit priority the priority rules decide. Throws
    util::FailedPrecondition for blacklisted packages.
  */
  queue::EnqueueResult ManualEnqueue(const std::string& name, const std::string& version, std::optional<int32_t> priority,
                                     const std::string& registry = {});

  void Wake();

  // Fails builds in_progress past their package's window. Returns how many.
  uint64_t FailAbandonedBuilds();

  uint64_t QueueRebuilds();

  bool Running() const {
    return running_;
  }

 private:
  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<sync::IndexSync>     sync_;
  std::shared_ptr<queue::BuildQueue>   queue_;
  std::shared_ptr<sandbox::DocBuilder> builder_;
  OrchestratorOptions                  options_;

  std::unique_ptr<SyncScheduler>             scheduler_;
  std::vector<std::unique_ptr<BuildWorker>>  workers_;
  std::vector<std::unique_ptr<PeriodicTask>> maintenance_;
  bool                                      running_ = false;
};

} // namespace docbuild::orchestrator
