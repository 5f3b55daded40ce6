#include "internal/service/admin_service.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/orchestrator/orchestrator.hpp"
#include "internal/queue/admission.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/registry/journal_index.hpp"
#include "internal/registry/notification_verifier.hpp"
#include "internal/sync/index_sync.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using docbuild::service::AdminService;
using docbuild::service::ServiceContext;
using namespace docbuild::v1;

constexpr const char* kSecret = "hook-secret";

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

struct Fixture {
  fs::path journal = fs::temp_directory_path() / ("docbuild_admin_service_" + std::to_string(getpid()) + ".jsonl");

  std::shared_ptr<docbuild::db::memory::MemoryRepository> repo = std::make_shared<docbuild::db::memory::MemoryRepository>();
  std::shared_ptr<docbuild::queue::BuildQueue>            queue;
  std::shared_ptr<docbuild::sync::IndexSync>              sync;
  std::shared_ptr<docbuild::orchestrator::Orchestrator>   orchestrator;
  std::unique_ptr<AdminService>                           admin;

  Fixture() {
    std::ofstream(journal, std::ios::trunc) << R"({"seq": 1, "kind": "PUBLISH", "name": "serde", "vers": "1.0.0", "has_lib": true})"
                                            << "\n"
                                            << R"({"seq": 2, "kind": "PUBLISH", "name": "tokio", "vers": "1.0.0", "has_lib": true})"
                                            << "\n";

    queue = std::make_shared<docbuild::queue::BuildQueue>(repo, docbuild::queue::QueueOptions{});
    auto index = std::make_shared<docbuild::registry::JournalIndex>(journal.string());
    sync       = std::make_shared<docbuild::sync::IndexSync>(repo, index, queue, docbuild::sync::SyncOptions{});

    docbuild::orchestrator::OrchestratorOptions options;
    options.workers       = 0;
    options.sync_enabled  = false;
    options.registry_name = "crates.io";
    orchestrator          = std::make_shared<docbuild::orchestrator::Orchestrator>(repo, sync, queue, nullptr, options);

    ServiceContext ctx;
    ctx.repository   = repo;
    ctx.queue        = queue;
    ctx.sync         = sync;
    ctx.orchestrator = orchestrator;
    ctx.verifier     = std::make_shared<docbuild::registry::NotificationVerifier>(kSecret);
    admin            = std::make_unique<AdminService>(ctx);
  }

  ~Fixture() {
    std::error_code ec;
    fs::remove(journal, ec);
  }
};

void TestIncompleteContextIsRejected() {
  assert(Throws<std::invalid_argument>([] { AdminService admin(ServiceContext{}); }));
}

void TestEnqueueRelease() {
  Fixture f;

  SetPriorityRuleRequest rule;
  rule.set_pattern("aws-%");
  rule.set_priority(40);
  f.admin->SetPriorityRule(rule);

  EnqueueReleaseRequest req;
  req.set_name("aws-sdk-s3");
  req.set_version("1.0.0");
  auto resp = f.admin->EnqueueRelease(req);
  assert(resp.created());
  assert(resp.entry().priority() == 40);
  assert(resp.entry().registry() == "crates.io");

  req.set_priority(-3);
  resp = f.admin->EnqueueRelease(req);
  assert(!resp.created());
  assert(resp.entry().priority() == -3);

  EnqueueReleaseRequest bad;
  bad.set_name("serde");
  assert(Throws<docbuild::util::InvalidArgument>([&] { f.admin->EnqueueRelease(bad); }));
}

void TestLockUnlockAndResetAttempts() {
  Fixture f;

  assert(f.admin->LockQueue(LockQueueRequest{}).locked());
  assert(f.queue->IsLocked());
  assert(!f.admin->UnlockQueue(UnlockQueueRequest{}).locked());
  assert(!f.queue->IsLocked());

  ResetQueueAttemptsRequest missing;
  missing.set_name("ghost");
  missing.set_version("1.0.0");
  assert(Throws<docbuild::util::NotFound>([&] { f.admin->ResetQueueAttempts(missing); }));

  f.queue->Enqueue(docbuild::queue::EnqueueRequest{.name = "ghost", .version = "1.0.0"});
  auto entry = f.queue->DequeueNext("w1");
  f.queue->RecordAttemptResult(*entry, docbuild::queue::AttemptOutcome::kFailure);

  auto reset = f.admin->ResetQueueAttempts(missing);
  assert(reset.entry().attempt() == 0);
}

void TestBlacklist() {
  Fixture f;

  AddBlacklistRequest add;
  add.set_name("Evil_Crate");
  f.admin->AddBlacklist(add);
  assert(Throws<docbuild::util::AlreadyExists>([&] { f.admin->AddBlacklist(add); }));

  auto list = f.admin->ListBlacklist(ListBlacklistRequest{});
  assert(list.names_size() == 1);
  assert(list.names(0) == "evil-crate");

  RemoveBlacklistRequest remove;
  remove.set_name("evil-crate");
  f.admin->RemoveBlacklist(remove);
  assert(Throws<docbuild::util::NotFound>([&] { f.admin->RemoveBlacklist(remove); }));
  assert(f.admin->ListBlacklist(ListBlacklistRequest{}).names_size() == 0);
}

void TestPriorityRules() {
  Fixture f;

  SetPriorityRuleRequest first;
  first.set_pattern("windows-%");
  first.set_priority(30);
  auto created = f.admin->SetPriorityRule(first);

  SetPriorityRuleRequest second;
  second.set_pattern("%-sys");
  second.set_priority(25);
  f.admin->SetPriorityRule(second);

  first.set_priority(35);
  auto updated = f.admin->SetPriorityRule(first);
  assert(updated.rule().id() == created.rule().id());

  auto rules = f.admin->ListPriorityRules(ListPriorityRulesRequest{});
  assert(rules.rules_size() == 2);
  assert(rules.rules(0).pattern() == "windows-%");
  assert(rules.rules(0).priority() == 35);

  RemovePriorityRuleRequest remove;
  remove.set_pattern("%-sys");
  f.admin->RemovePriorityRule(remove);
  assert(f.admin->ListPriorityRules(ListPriorityRulesRequest{}).rules_size() == 1);

  SetPriorityRuleRequest empty;
  assert(Throws<docbuild::util::InvalidArgument>([&] { f.admin->SetPriorityRule(empty); }));
}

void TestSandboxOverrides() {
  Fixture f;

  SetSandboxOverrideRequest set;
  set.mutable_sandbox_override()->set_name("Big_Crate");
  set.mutable_sandbox_override()->set_timeout_seconds(3600);
  auto resp = f.admin->SetSandboxOverride(set);
  assert(resp.sandbox_override().name() == "big-crate");
  assert(resp.sandbox_override().has_timeout_seconds());
  assert(!resp.sandbox_override().has_memory_bytes());

  auto list = f.admin->ListSandboxOverrides(ListSandboxOverridesRequest{});
  assert(list.overrides_size() == 1);
  assert(list.overrides(0).timeout_seconds() == 3600);

  SetSandboxOverrideRequest zero;
  zero.mutable_sandbox_override()->set_name("big-crate");
  zero.mutable_sandbox_override()->set_timeout_seconds(0);
  assert(Throws<docbuild::util::InvalidArgument>([&] { f.admin->SetSandboxOverride(zero); }));

  RemoveSandboxOverrideRequest remove;
  remove.set_name("big_crate");
  f.admin->RemoveSandboxOverride(remove);
  assert(Throws<docbuild::util::NotFound>([&] { f.admin->RemoveSandboxOverride(remove); }));
}

void TestCheckpointAdministration() {
  Fixture f;

  auto initial = f.admin->GetCheckpoint(GetCheckpointRequest{});
  assert(initial.checkpoint().name() == "registry-index");
  assert(initial.checkpoint().reference().empty());

  SetCheckpointRequest set;
  set.set_reference("1");
  auto resp = f.admin->SetCheckpoint(set);
  assert(resp.checkpoint().reference() == "1");
  assert(resp.checkpoint().version() == 1);

  // only the release after the reference is picked up
  auto report = f.sync->Run();
  assert(report.enqueued == 1);
  assert(f.queue->List()[0].normalized_name == "tokio");

  SetCheckpointRequest reset;
  reset.set_reset_to_head(true);
  assert(f.admin->SetCheckpoint(reset).checkpoint().reference() == "2");

  assert(Throws<docbuild::util::InvalidArgument>([&] { f.admin->SetCheckpoint(SetCheckpointRequest{}); }));

  SetCheckpointRequest not_reset;
  not_reset.set_reset_to_head(false);
  assert(Throws<docbuild::util::InvalidArgument>([&] { f.admin->SetCheckpoint(not_reset); }));
}

void TestNotifyRegistryActivity() {
  Fixture f;

  NotifyRegistryActivityRequest req;
  req.set_body(R"({"crate":"serde"})");
  req.set_signature("sha256=0000");
  assert(Throws<docbuild::util::Unauthenticated>([&] { f.admin->NotifyRegistryActivity(req); }));

  req.set_signature(docbuild::registry::NotificationVerifier::Sign(kSecret, req.body()));
  assert(f.admin->NotifyRegistryActivity(req).accepted());
}

void TestRepairReleaseStatuses() {
  Fixture f;
  f.sync->Run();

  // sync already wrote consistent rows
  auto first = f.admin->RepairReleaseStatuses(RepairReleaseStatusesRequest{});
  assert(first.releases_checked() == 2);
  assert(first.releases_repaired() == 0);

  uint64_t release_id = 0;
  {
    auto tx      = f.repo->Begin();
    auto package = f.repo->GetPackage(*tx, "serde");
    release_id   = f.repo->GetRelease(*tx, package->id, "1.0.0")->id;
    docbuild::db::model::BuildRecord build{.release_id = release_id, .status = BUILD_STATUS_SUCCESS, .started_at_ms = 1, .finished_at_ms = 2};
    docbuild::db::ThrowIfError(f.repo->InsertBuild(*tx, build), "insert build");
    tx->Commit();
  }

  auto resp = f.admin->RepairReleaseStatuses(RepairReleaseStatusesRequest{});
  assert(resp.releases_checked() == 2);
  assert(resp.releases_repaired() == 1);
  assert(resp.builds_abandoned() == 0);

  auto tx = f.repo->Begin();
  assert(f.repo->GetReleaseStatus(*tx, release_id)->status == BUILD_STATUS_SUCCESS);
  tx->Commit();
}

void TestRemovePackage() {
  Fixture f;
  f.sync->Run();
  f.queue->Enqueue(docbuild::queue::EnqueueRequest{.name = "serde", .version = "0.9.0"});

  RemovePackageRequest req;
  req.set_name("Serde");
  auto resp = f.admin->RemovePackage(req);
  assert(resp.releases_removed() == 1);

  for (const auto& entry : f.queue->List()) {
    assert(entry.normalized_name != "serde");
  }
  auto tx = f.repo->Begin();
  assert(!f.repo->GetPackage(*tx, "serde").has_value());
  assert(f.repo->GetPackage(*tx, "tokio").has_value());
  tx->Commit();

  assert(Throws<docbuild::util::NotFound>([&] { f.admin->RemovePackage(req); }));
}

void TestEnqueueRejectsBlacklisted() {
  Fixture f;

  AddBlacklistRequest add;
  add.set_name("serde");
  f.admin->AddBlacklist(add);

  EnqueueReleaseRequest req;
  req.set_name("Serde");
  req.set_version("1.0.0");
  assert(Throws<docbuild::util::FailedPrecondition>([&] { f.admin->EnqueueRelease(req); }));
  assert(f.queue->List().empty());
}

void TestRemoveRelease() {
  Fixture f;
  f.sync->Run();
  assert(f.queue->List().size() == 2);

  RemoveReleaseRequest req;
  req.set_name("serde");
  req.set_version("1.0.0");
  f.admin->RemoveRelease(req);

  assert(f.queue->List().size() == 1);
  assert(f.queue->List()[0].normalized_name == "tokio");
  {
    auto tx      = f.repo->Begin();
    auto package = f.repo->GetPackage(*tx, "serde");
    assert(package.has_value());
    assert(!f.repo->GetRelease(*tx, package->id, "1.0.0").has_value());
    tx->Commit();
  }

  assert(Throws<docbuild::util::NotFound>([&] { f.admin->RemoveRelease(req); }));
}

void TestRunConsistencyCheck() {
  Fixture f;
  f.sync->Run();
  std::ofstream(f.journal, std::ios::app) << R"({"seq": 3, "kind": "PUBLISH", "name": "rand", "vers": "0.8.0", "has_lib": true})"
                                          << "\n";

  RunConsistencyCheckRequest dry;
  dry.set_dry_run(true);
  auto preview = f.admin->RunConsistencyCheck(dry);
  assert(!preview.skipped());
  assert(preview.packages_checked() == 3);
  assert(preview.builds_queued() == 1);
  assert(f.queue->List().size() == 2);

  auto resp = f.admin->RunConsistencyCheck(RunConsistencyCheckRequest{});
  assert(resp.builds_queued() == 1);
  assert(resp.packages_deleted() == 0);

  bool found = false;
  for (const auto& entry : f.queue->List()) {
    if (entry.normalized_name == "rand") {
      found = true;
      assert(entry.priority == docbuild::queue::kConsistencyCheckPriority);
    }
  }
  assert(found);
}

void TestQueueRebuilds() {
  Fixture f;

  // rebuilds are disabled in the orchestrator options
  assert(f.admin->QueueRebuilds(QueueRebuildsRequest{}).queued() == 0);

  {
    auto                               tx = f.repo->Begin();
    docbuild::db::model::PackageRecord package{.name = "serde", .normalized_name = "serde"};
    assert(f.repo->UpsertPackage(*tx, package));
    docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = "1.0.0"};
    assert(f.repo->UpsertRelease(*tx, release));
    release.has_docs = true;
    assert(f.repo->UpdateReleaseOutputs(*tx, release));
    assert(f.repo->SetLatestRelease(*tx, package.id, release.id));
    tx->Commit();
  }

  QueueRebuildsRequest req;
  req.set_max_queued(10);
  assert(f.admin->QueueRebuilds(req).queued() == 1);
  assert(f.queue->List().size() == 1);
  assert(f.queue->List()[0].priority == docbuild::queue::kRebuildPriority);

  // the pending rebuild counts against the budget
  req.set_max_queued(1);
  assert(f.admin->QueueRebuilds(req).queued() == 0);
}

} // namespace

int main() {
  TestIncompleteContextIsRejected();
  TestEnqueueRelease();
  TestLockUnlockAndResetAttempts();
  TestBlacklist();
  TestPriorityRules();
  TestSandboxOverrides();
  TestCheckpointAdministration();
  TestNotifyRegistryActivity();
  TestRepairReleaseStatuses();
  TestRemovePackage();
  TestEnqueueRejectsBlacklisted();
  TestRemoveRelease();
  TestRunConsistencyCheck();
  TestQueueRebuilds();

  std::cout << "docbuild_unit_admin_service: pass\n";
  return 0;
}
