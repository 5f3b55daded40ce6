#include "internal/orchestrator/orchestrator.hpp"

#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/catalog/release_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/admission.hpp"
#include "internal/registry/journal_index.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using namespace std::chrono_literals;
using docbuild::db::memory::MemoryRepository;
using docbuild::orchestrator::BuildWorker;
using docbuild::orchestrator::BuildWorkerOptions;
using docbuild::orchestrator::Orchestrator;
using docbuild::orchestrator::OrchestratorOptions;
using docbuild::orchestrator::SyncScheduler;
using docbuild::sandbox::TargetBuildRequest;
using docbuild::sandbox::TargetBuildResult;

class FakeEnvironment final : public docbuild::sandbox::BuildEnvironment {
 public:
  TargetBuildResult BuildTarget(const TargetBuildRequest& request) override {
    ++calls;
    if (throw_setup) {
      throw docbuild::util::SandboxError("no sandbox");
    }

    TargetBuildResult result;
    result.doc_dir   = request.output_dir / "doc";
    result.exit_code = fail ? 101 : 0;
    if (!fail) {
      fs::create_directories(result.doc_dir);
      std::ofstream(result.doc_dir / "index.html") << "<html></html>";
    }
    return result;
  }

  std::atomic<int>  calls{0};
  std::atomic<bool> fail{false};
  std::atomic<bool> throw_setup{false};
};

bool WaitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 10s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

std::string PublishLine(uint64_t seq, const std::string& name, const std::string& version) {
  return R"({"seq": )" + std::to_string(seq) + R"(, "kind": "PUBLISH", "name": ")" + name + R"(", "vers": ")" + version +
         R"(", "has_lib": true})" + "\n";
}

struct Fixture {
  const std::string tag  = std::to_string(getpid()) + "_" + std::to_string(counter++);
  fs::path          work = fs::temp_directory_path() / ("docbuild_orchestrator_" + tag);
  fs::path          journal = fs::temp_directory_path() / ("docbuild_orchestrator_" + tag + ".jsonl");

  std::shared_ptr<MemoryRepository>               repo = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeEnvironment>                env  = std::make_shared<FakeEnvironment>();
  std::shared_ptr<docbuild::queue::BuildQueue>    queue;
  std::shared_ptr<docbuild::sync::IndexSync>      sync;
  std::shared_ptr<docbuild::sandbox::DocBuilder>  builder;

  Fixture() {
    std::ofstream(journal, std::ios::trunc) << PublishLine(1, "serde", "1.0.0");

    docbuild::queue::QueueOptions queue_options;
    queue_options.delay_between_attempts = 0s;
    queue = std::make_shared<docbuild::queue::BuildQueue>(repo, queue_options);

    docbuild::sync::SyncOptions sync_options;
    sync_options.registry_name = "crates.io";
    sync = std::make_shared<docbuild::sync::IndexSync>(repo, std::make_shared<docbuild::registry::JournalIndex>(journal.string()), queue,
                                                       sync_options);

    docbuild::sandbox::DocBuilderOptions options;
    options.work_dir       = work;
    options.default_target = "x86_64-unknown-linux-gnu";
    builder                = std::make_shared<docbuild::sandbox::DocBuilder>(repo, env, options);
  }

  ~Fixture() {
    std::error_code ec;
    fs::remove_all(work, ec);
    fs::remove(journal, ec);
  }

  void Append(const std::string& line) {
    std::ofstream(journal, std::ios::app) << line;
  }

  std::optional<docbuild::v1::BuildStatus> Status(const std::string& name, const std::string& version) {
    auto tx      = repo->Begin();
    auto package = repo->GetPackage(*tx, name);
    if (!package) {
      return std::nullopt;
    }
    auto release = repo->GetRelease(*tx, package->id, version);
    if (!release) {
      return std::nullopt;
    }
    auto status = repo->GetReleaseStatus(*tx, release->id);
    tx->Commit();
    if (!status) {
      return std::nullopt;
    }
    return status->status;
  }

  static inline int counter = 0;
};

void TestWorkerRunOnceRecordsOutcome() {
  Fixture f;
  BuildWorker worker(f.queue, f.builder, BuildWorkerOptions{.name = "worker-a"});

  assert(!worker.RunOnce());

  f.sync->Run();
  assert(worker.RunOnce());
  assert(worker.CompletedBuilds() == 1);
  assert(f.Status("serde", "1.0.0") == docbuild::v1::BUILD_STATUS_SUCCESS);
  assert(f.queue->List().empty());
}

void TestWorkerFailureConsumesAttempt() {
  Fixture f;
  f.env->fail = true;
  BuildWorker worker(f.queue, f.builder, BuildWorkerOptions{.name = "worker-a"});

  f.sync->Run();
  assert(worker.RunOnce());
  auto entries = f.queue->List();
  assert(entries.size() == 1);
  assert(entries[0].attempt == 1);
  assert(f.Status("serde", "1.0.0") == docbuild::v1::BUILD_STATUS_FAILURE);
}

void TestWorkerInfrastructureErrorKeepsAttempt() {
  Fixture f;
  f.env->throw_setup = true;
  BuildWorker worker(f.queue, f.builder, BuildWorkerOptions{.name = "worker-a"});

  f.sync->Run();
  assert(worker.RunOnce());
  auto entries = f.queue->List();
  assert(entries.size() == 1);
  assert(entries[0].attempt == 0);
  assert(entries[0].claimed_by.empty());
}

void TestWorkerSkipsWhileLocked() {
  Fixture f;
  BuildWorkerOptions options;
  options.name                 = "worker-a";
  options.idle_poll_interval   = 10ms;
  options.locked_poll_interval = 10ms;
  BuildWorker worker(f.queue, f.builder, options);

  f.sync->Run();
  f.queue->Lock();
  worker.Start();
  std::this_thread::sleep_for(100ms);
  assert(f.env->calls == 0);

  f.queue->Unlock();
  worker.Wake();
  assert(WaitFor([&] { return worker.CompletedBuilds() == 1; }));
  worker.Stop();
  assert(f.Status("serde", "1.0.0") == docbuild::v1::BUILD_STATUS_SUCCESS);
}

void TestSchedulerRunsOnStartAndOnTrigger() {
  Fixture f;
  SyncScheduler scheduler(f.sync, std::chrono::hours(1));
  scheduler.Start();

  assert(WaitFor([&] { return scheduler.CompletedRuns() >= 1; }));
  assert(f.queue->List().size() == 1);

  f.Append(PublishLine(2, "tokio", "1.0.0"));
  scheduler.Trigger();
  assert(WaitFor([&] { return scheduler.CompletedRuns() >= 2; }));
  scheduler.Stop();

  assert(f.queue->List().size() == 2);
  assert(f.sync->Checkpoint().reference == "2");
}

void TestSchedulerSurvivesUnreadableIndex() {
  Fixture f;
  fs::remove(f.journal);

  SyncScheduler scheduler(f.sync, 10ms);
  scheduler.Start();
  assert(WaitFor([&] { return scheduler.CompletedRuns() >= 3; }));
  scheduler.Stop();
  assert(f.sync->Checkpoint().reference.empty());
}

void TestOrchestratorBuildsPublishedRelease() {
  Fixture f;

  OrchestratorOptions options;
  options.workers            = 1;
  options.worker_name        = "test";
  options.idle_poll_interval = 20ms;
  options.sync_poll_interval = std::chrono::hours(1);
  options.registry_name      = "crates.io";

  Orchestrator orchestrator(f.repo, f.sync, f.queue, f.builder, options);
  orchestrator.Start();
  assert(orchestrator.Running());

  assert(WaitFor([&] { return f.Status("serde", "1.0.0") == docbuild::v1::BUILD_STATUS_SUCCESS; }));

  f.Append(PublishLine(2, "serde", "1.1.0"));
  orchestrator.TriggerSync();
  assert(WaitFor([&] { return f.Status("serde", "1.1.0") == docbuild::v1::BUILD_STATUS_SUCCESS; }));

  orchestrator.Stop();
  assert(!orchestrator.Running());

  auto tx      = f.repo->Begin();
  auto package = f.repo->GetPackage(*tx, "serde");
  auto latest  = f.repo->GetRelease(*tx, package->id, "1.1.0");
  assert(package->latest_release_id == latest->id);
  for (const auto& build : f.repo->ListBuilds(*tx, latest->id)) {
    assert(build.worker == "test-0");
  }
  tx->Commit();
}

void TestManualEnqueue() {
  Fixture f;
  {
    auto                                tx = f.repo->Begin();
    docbuild::db::model::PriorityRuleRecord rule{.pattern = "serde%", .priority = 15};
    docbuild::db::ThrowIfError(f.repo->UpsertPriorityRule(*tx, rule), "priority rule");
    tx->Commit();
  }

  OrchestratorOptions options;
  options.workers       = 0;
  options.sync_enabled  = false;
  options.registry_name = "crates.io";
  Orchestrator orchestrator(f.repo, f.sync, f.queue, nullptr, options);

  auto by_rule = orchestrator.ManualEnqueue("serde_json", "1.0.0", std::nullopt);
  assert(by_rule.created);
  assert(by_rule.entry.priority == 15);
  assert(by_rule.entry.registry == "crates.io");

  // a failed entry is revived with the explicit priority
  auto entry = f.queue->DequeueNext("w");
  f.queue->RecordAttemptResult(*entry, docbuild::queue::AttemptOutcome::kFailure);
  auto explicit_priority = orchestrator.ManualEnqueue("serde_json", "1.0.0", -5, "mirror");
  assert(!explicit_priority.created);
  assert(explicit_priority.entry.priority == -5);
  assert(explicit_priority.entry.registry == "mirror");
  assert(explicit_priority.entry.attempt == 0);

  // without workers there is nothing to wake and no sync to trigger
  orchestrator.Wake();
  orchestrator.TriggerSync();
}

void TestManualEnqueueRejectsBlacklisted() {
  Fixture f;
  {
    auto tx = f.repo->Begin();
    docbuild::db::ThrowIfError(f.repo->InsertBlacklistEntry(*tx, "spam-crate"), "blacklist");
    tx->Commit();
  }

  OrchestratorOptions options;
  options.workers      = 0;
  options.sync_enabled = false;
  Orchestrator orchestrator(f.repo, f.sync, f.queue, nullptr, options);

  bool threw = false;
  try {
    orchestrator.ManualEnqueue("Spam_Crate", "1.0.0", 0);
  } catch (const docbuild::util::FailedPrecondition&) {
    threw = true;
  }
  assert(threw);
  assert(f.queue->List().empty());
}

void TestPeriodicSweepFailsAbandonedBuilds() {
  Fixture f;

  OrchestratorOptions options;
  options.workers                  = 0;
  options.sync_enabled             = false;
  options.abandoned_build_age      = 1s;
  options.abandoned_sweep_interval = 20ms;
  Orchestrator orchestrator(f.repo, f.sync, f.queue, nullptr, options);
  orchestrator.Start();

  // appears after the startup sweep
  {
    auto tx = f.repo->Begin();
    docbuild::catalog::ReleaseCatalog catalog(f.repo);
    auto entry = catalog.EnsureRelease(*tx, "serde", "1.0.0");
    docbuild::db::model::BuildRecord build{.release_id = entry.release.id, .started_at_ms = 1, .worker = "gone"};
    docbuild::db::ThrowIfError(f.repo->InsertBuild(*tx, build), "insert build");
    tx->Commit();
  }

  assert(WaitFor([&] { return f.Status("serde", "1.0.0") == docbuild::v1::BUILD_STATUS_FAILURE; }));
  orchestrator.Stop();
}

void TestPeriodicRebuildsAreQueued() {
  Fixture f;
  {
    auto tx = f.repo->Begin();
    docbuild::catalog::ReleaseCatalog catalog(f.repo);
    auto entry = catalog.EnsureRelease(*tx, "serde", "1.0.0");
    entry.release.has_docs = true;
    docbuild::db::ThrowIfError(f.repo->UpdateReleaseOutputs(*tx, entry.release), "outputs");
    catalog.RefreshLatest(*tx, entry.package.id);
    tx->Commit();
  }

  OrchestratorOptions options;
  options.workers             = 0;
  options.sync_enabled        = false;
  options.max_queued_rebuilds = 5;
  options.rebuild_interval    = 20ms;
  Orchestrator orchestrator(f.repo, f.sync, f.queue, nullptr, options);
  orchestrator.Start();

  assert(WaitFor([&] { return f.queue->List().size() == 1; }));
  orchestrator.Stop();

  auto entries = f.queue->List();
  assert(entries.size() == 1);
  assert(entries[0].normalized_name == "serde");
  assert(entries[0].priority == docbuild::queue::kRebuildPriority);
}

void TestPeriodicTaskSurvivesFailures() {
  std::atomic<int>                     calls{0};
  docbuild::orchestrator::PeriodicTask task("flaky", 10ms, [&] {
    if (++calls % 2 == 1) {
      throw std::runtime_error("transient");
    }
  });
  task.Start();
  assert(WaitFor([&] { return task.CompletedRuns() >= 4; }));
  task.Stop();
  assert(calls >= 4);
}

void TestWorkersRequireBuilder() {
  OrchestratorOptions options;
  options.workers = 2;
  bool threw      = false;
  try {
    Orchestrator orchestrator(std::make_shared<MemoryRepository>(), nullptr, nullptr, nullptr, options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWorkerRunOnceRecordsOutcome();
  TestWorkerFailureConsumesAttempt();
  TestWorkerInfrastructureErrorKeepsAttempt();
  TestWorkerSkipsWhileLocked();
  TestSchedulerRunsOnStartAndOnTrigger();
  TestSchedulerSurvivesUnreadableIndex();
  TestOrchestratorBuildsPublishedRelease();
  TestManualEnqueue();
  TestManualEnqueueRejectsBlacklisted();
  TestPeriodicSweepFailsAbandonedBuilds();
  TestPeriodicRebuildsAreQueued();
  TestPeriodicTaskSurvivesFailures();
  TestWorkersRequireBuilder();

  std::cout << "docbuild_unit_orchestrator: pass\n";
  return 0;
}
