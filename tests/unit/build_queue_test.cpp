#include "internal/queue/build_queue.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/admission.hpp"
#include "internal/util/errors.hpp"

namespace {

using docbuild::db::memory::MemoryRepository;
using docbuild::queue::AttemptOutcome;
using docbuild::queue::BuildQueue;
using docbuild::queue::EnqueueRequest;
using docbuild::queue::QueueOptions;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<uint64_t>         clock = std::make_shared<uint64_t>(1'000'000);

  BuildQueue MakeQueue(uint32_t max_attempts = 3) {
    QueueOptions options;
    options.max_attempts           = max_attempts;
    options.delay_between_attempts = std::chrono::seconds(60);
    options.claim_timeout          = std::chrono::seconds(600);
    options.candidate_batch_size   = 2;
    options.build_timeout          = std::chrono::seconds(300);
    auto now                       = clock;
    return BuildQueue(repo, options, [now] { return *now; });
  }

  void Advance(std::chrono::seconds by) {
    *clock += static_cast<uint64_t>(by.count()) * 1000;
  }

  // Package with one documented release marked latest, last built at built_at_ms.
  void AddDocumentedRelease(const std::string& name, const std::string& version, uint64_t built_at_ms) {
    auto                               tx = repo->Begin();
    docbuild::db::model::PackageRecord package{.name = name, .normalized_name = name};
    assert(repo->UpsertPackage(*tx, package));
    docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = version};
    assert(repo->UpsertRelease(*tx, release));
    release.has_docs = true;
    assert(repo->UpdateReleaseOutputs(*tx, release));
    assert(repo->SetLatestRelease(*tx, package.id, release.id));
    docbuild::db::model::BuildRecord build{.release_id     = release.id,
                                           .status         = docbuild::v1::BUILD_STATUS_SUCCESS,
                                           .started_at_ms  = built_at_ms - 1,
                                           .finished_at_ms = built_at_ms};
    assert(repo->InsertBuild(*tx, build));
    tx->Commit();
  }
};

void TestEnqueueIsIdempotentAndKeepsFirstPriority() {
  Fixture f;
  auto    queue = f.MakeQueue();

  auto first = queue.Enqueue(EnqueueRequest{.name = "Serde_Json", .version = "1.0.0", .priority = 0, .registry = "crates.io"});
  assert(first.created);
  assert(first.entry.normalized_name == "serde-json");
  assert(first.entry.name == "Serde_Json");

  auto second = queue.Enqueue(EnqueueRequest{.name = "serde-json", .version = "1.0.0", .priority = 20, .registry = "mirror"});
  assert(!second.created);
  assert(second.entry.id == first.entry.id);
  assert(second.entry.priority == 0);
  assert(second.entry.registry == "mirror");

  assert(queue.List().size() == 1);
}

void TestEnqueueValidatesInput() {
  Fixture f;
  auto    queue = f.MakeQueue();

  bool threw = false;
  try {
    queue.Enqueue(EnqueueRequest{.name = "serde", .version = ""});
  } catch (const docbuild::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.Enqueue(EnqueueRequest{.name = "", .version = "1.0.0"});
  } catch (const docbuild::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestDequeueOrderIsPriorityThenArrival() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "c", .version = "1.0.0", .priority = 5});
  queue.Enqueue(EnqueueRequest{.name = "a", .version = "1.0.0", .priority = 5});
  queue.Enqueue(EnqueueRequest{.name = "urgent", .version = "1.0.0", .priority = -1});
  queue.Enqueue(EnqueueRequest{.name = "b", .version = "1.0.0", .priority = 5});

  // batch size 2 forces the candidate window to grow
  assert(queue.DequeueNext("w1")->normalized_name == "urgent");
  assert(queue.DequeueNext("w1")->normalized_name == "c");
  assert(queue.DequeueNext("w2")->normalized_name == "a");
  assert(queue.DequeueNext("w2")->normalized_name == "b");
  assert(!queue.DequeueNext("w3").has_value());

  auto stats = queue.Stats();
  assert(stats.pending == 4);
  assert(stats.in_flight == 4);
}

void TestFailedAttemptsBackOffAndStopAtMax() {
  Fixture f;
  auto    queue = f.MakeQueue(2);

  queue.Enqueue(EnqueueRequest{.name = "flaky", .version = "0.1.0"});

  auto entry = queue.DequeueNext("w1");
  assert(entry.has_value());
  queue.RecordAttemptResult(*entry, AttemptOutcome::kFailure);

  // still inside the retry delay
  assert(!queue.DequeueNext("w1").has_value());

  f.Advance(std::chrono::seconds(61));
  entry = queue.DequeueNext("w1");
  assert(entry.has_value());
  assert(entry->attempt == 1);
  queue.RecordAttemptResult(*entry, AttemptOutcome::kFailure);

  f.Advance(std::chrono::seconds(120));
  assert(!queue.DequeueNext("w1").has_value());

  auto stats = queue.Stats();
  assert(stats.failed == 1);
  assert(stats.pending == 0);
  assert(queue.List(false).empty());
  assert(queue.List(true).size() == 1);

  auto reset = queue.ResetAttempts("flaky", "0.1.0");
  assert(reset.attempt == 0);
  assert(queue.DequeueNext("w1").has_value());
}

void TestInfrastructureErrorKeepsAttemptCount() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "net", .version = "2.0.0"});
  auto entry = queue.DequeueNext("w1");
  queue.RecordAttemptResult(*entry, AttemptOutcome::kInfrastructureError);

  f.Advance(std::chrono::seconds(61));
  entry = queue.DequeueNext("w1");
  assert(entry.has_value());
  assert(entry->attempt == 0);

  queue.RecordAttemptResult(*entry, AttemptOutcome::kSuccess);
  assert(queue.List().empty());
}

void TestExpiredClaimIsReclaimedAndStaleResultIgnored() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "slow", .version = "1.0.0"});
  auto first = queue.DequeueNext("w1");
  assert(first.has_value());
  assert(!queue.DequeueNext("w2").has_value());

  f.Advance(std::chrono::seconds(601));
  auto second = queue.DequeueNext("w2");
  assert(second.has_value());
  assert(second->claimed_by == "w2");

  // w1 finally reports; its claim is gone so nothing changes
  queue.RecordAttemptResult(*first, AttemptOutcome::kSuccess);
  auto entries = queue.List();
  assert(entries.size() == 1);
  assert(entries[0].claimed_by == "w2");

  queue.RecordAttemptResult(*second, AttemptOutcome::kSuccess);
  assert(queue.List().empty());
}

void TestLockPausesDequeue() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "serde", .version = "1.0.0"});
  queue.Lock();
  assert(queue.IsLocked());
  assert(!queue.DequeueNext("w1").has_value());
  assert(queue.Stats().locked);

  queue.Unlock();
  assert(!queue.IsLocked());
  assert(queue.DequeueNext("w1").has_value());
}

void TestRequeueResetsEntry() {
  Fixture f;
  auto    queue = f.MakeQueue(1);

  queue.Enqueue(EnqueueRequest{.name = "broken", .version = "1.0.0", .priority = 0});
  auto entry = queue.DequeueNext("w1");
  queue.RecordAttemptResult(*entry, AttemptOutcome::kFailure);
  assert(queue.Stats().failed == 1);

  auto requeued = queue.Requeue(EnqueueRequest{.name = "broken", .version = "1.0.0", .priority = 20});
  assert(!requeued.created);
  assert(requeued.entry.attempt == 0);
  assert(requeued.entry.priority == 20);

  entry = queue.DequeueNext("w1");
  assert(entry.has_value());
  assert(entry->priority == 20);
}

void TestStaleEntriesArePruned() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "done", .version = "1.0.0"});
  queue.Enqueue(EnqueueRequest{.name = "todo", .version = "1.0.0"});

  {
    auto                               tx = f.repo->Begin();
    docbuild::db::model::PackageRecord package{.name = "done", .normalized_name = "done"};
    assert(f.repo->UpsertPackage(*tx, package));
    docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = "1.0.0"};
    assert(f.repo->UpsertRelease(*tx, release));
    docbuild::db::model::BuildRecord build{.release_id     = release.id,
                                           .status         = docbuild::v1::BUILD_STATUS_SUCCESS,
                                           .started_at_ms  = *f.clock,
                                           .finished_at_ms = *f.clock + 1};
    assert(f.repo->InsertBuild(*tx, build));
    tx->Commit();
  }

  auto entry = queue.DequeueNext("w1");
  assert(entry.has_value());
  assert(entry->normalized_name == "todo");

  std::set<std::string> remaining;
  for (const auto& e : queue.List()) remaining.insert(e.normalized_name);
  assert(remaining == std::set<std::string>{"todo"});
}

void TestAdministrativeNotFound() {
  Fixture f;
  auto    queue = f.MakeQueue();

  bool threw = false;
  try {
    queue.Remove("ghost", "1.0.0");
  } catch (const docbuild::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.ResetAttempts("ghost", "1.0.0");
  } catch (const docbuild::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestBlacklistedEntriesAreDroppedAtDequeue() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "Spam_Crate", .version = "1.0.0", .priority = 0});
  queue.Enqueue(EnqueueRequest{.name = "fine", .version = "1.0.0", .priority = 5});
  {
    auto tx = f.repo->Begin();
    assert(f.repo->InsertBlacklistEntry(*tx, "spam-crate"));
    tx->Commit();
  }

  auto entry = queue.DequeueNext("w1");
  assert(entry.has_value());
  assert(entry->normalized_name == "fine");

  auto entries = queue.List();
  assert(entries.size() == 1);
  assert(entries[0].normalized_name == "fine");
}

void TestTimeoutOverrideExtendsClaim() {
  Fixture f;
  auto    queue = f.MakeQueue();

  {
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertSandboxOverride(*tx, {.normalized_name = "huge", .timeout_seconds = 3900}));
    tx->Commit();
  }
  {
    auto tx = f.repo->Begin();
    assert(queue.ClaimTimeoutFor(*tx, "huge") == std::chrono::seconds(600 + 3600));
    assert(queue.ClaimTimeoutFor(*tx, "small") == std::chrono::seconds(600));
    tx->Commit();
  }

  queue.Enqueue(EnqueueRequest{.name = "huge", .version = "1.0.0"});
  auto first = queue.DequeueNext("w1");
  assert(first.has_value());

  // past the default claim timeout, still inside the overridden build
  f.Advance(std::chrono::seconds(601));
  assert(!queue.DequeueNext("w2").has_value());
  assert(queue.Stats().in_flight == 1);

  f.Advance(std::chrono::seconds(3600));
  auto second = queue.DequeueNext("w2");
  assert(second.has_value());
  assert(second->claimed_by == "w2");
}

void TestShorterOverrideKeepsDefaultClaim() {
  Fixture f;
  auto    queue = f.MakeQueue();

  auto tx = f.repo->Begin();
  assert(f.repo->UpsertSandboxOverride(*tx, {.normalized_name = "quick", .timeout_seconds = 60}));
  assert(queue.ClaimTimeoutFor(*tx, "quick") == std::chrono::seconds(600));
  assert(queue.WindowFor(*tx, "quick", std::chrono::seconds(10)) == std::chrono::seconds(10));
  tx->Commit();
}

void TestDeprioritizeOtherReleases() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "serde", .version = "1.0.0", .priority = 0});
  queue.Enqueue(EnqueueRequest{.name = "serde", .version = "1.0.1", .priority = 10});
  queue.Enqueue(EnqueueRequest{.name = "serde", .version = "1.0.2", .priority = 0});
  queue.Enqueue(EnqueueRequest{.name = "tokio", .version = "1.0.0", .priority = 0});

  {
    auto tx = f.repo->Begin();
    assert(queue.DeprioritizeOtherReleases(*tx, "serde", "1.0.2", 5) == 1);
    tx->Commit();
  }

  std::map<std::string, int32_t> priorities;
  for (const auto& e : queue.List()) priorities[e.normalized_name + " " + e.version] = e.priority;
  assert(priorities["serde 1.0.0"] == 5);
  assert(priorities["serde 1.0.1"] == 10);
  assert(priorities["serde 1.0.2"] == 0);
  assert(priorities["tokio 1.0.0"] == 0);
}

void TestRemoveEntriesByPackageOrVersion() {
  Fixture f;
  auto    queue = f.MakeQueue();

  queue.Enqueue(EnqueueRequest{.name = "serde", .version = "1.0.0"});
  queue.Enqueue(EnqueueRequest{.name = "serde", .version = "1.0.1"});
  queue.Enqueue(EnqueueRequest{.name = "serde", .version = "1.0.2"});
  queue.Enqueue(EnqueueRequest{.name = "tokio", .version = "1.0.0"});

  auto tx = f.repo->Begin();
  assert(queue.RemoveEntries(*tx, "serde", std::string("1.0.1")) == 1);
  assert(queue.RemoveEntries(*tx, "serde", std::string("9.9.9")) == 0);
  assert(queue.RemoveEntries(*tx, "serde") == 2);
  tx->Commit();

  auto entries = queue.List();
  assert(entries.size() == 1);
  assert(entries[0].normalized_name == "tokio");
}

void TestQueueRebuildsOldestFirstUpToLimit() {
  Fixture f;
  auto    queue = f.MakeQueue();

  f.AddDocumentedRelease("newest", "3.0.0", 900'000);
  f.AddDocumentedRelease("oldest", "1.0.0", 100'000);
  f.AddDocumentedRelease("middle", "2.0.0", 500'000);
  {
    // latest release without docs is never rebuilt
    auto                               tx = f.repo->Begin();
    docbuild::db::model::PackageRecord package{.name = "nodocs", .normalized_name = "nodocs"};
    assert(f.repo->UpsertPackage(*tx, package));
    docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = "0.1.0"};
    assert(f.repo->UpsertRelease(*tx, release));
    assert(f.repo->SetLatestRelease(*tx, package.id, release.id));
    tx->Commit();
  }

  assert(queue.QueueRebuilds(2) == 2);
  std::set<std::string> queued;
  for (const auto& e : queue.List()) {
    assert(e.priority == docbuild::queue::kRebuildPriority);
    queued.insert(e.normalized_name);
  }
  assert((queued == std::set<std::string>{"oldest", "middle"}));

  // limit reached
  assert(queue.QueueRebuilds(2) == 0);

  // one slot left; the two oldest are already queued
  assert(queue.QueueRebuilds(3) == 0);
  assert(queue.List().size() == 2);

  // other work does not count against the rebuild limit
  queue.Enqueue(EnqueueRequest{.name = "fresh", .version = "1.0.0", .priority = 0});
  auto entry = queue.DequeueNext("w1");
  assert(entry->normalized_name == "fresh");
}

} // namespace

int main() {
  TestEnqueueIsIdempotentAndKeepsFirstPriority();
  TestEnqueueValidatesInput();
  TestDequeueOrderIsPriorityThenArrival();
  TestFailedAttemptsBackOffAndStopAtMax();
  TestInfrastructureErrorKeepsAttemptCount();
  TestExpiredClaimIsReclaimedAndStaleResultIgnored();
  TestLockPausesDequeue();
  TestRequeueResetsEntry();
  TestStaleEntriesArePruned();
  TestAdministrativeNotFound();
  TestBlacklistedEntriesAreDroppedAtDequeue();
  TestTimeoutOverrideExtendsClaim();
  TestShorterOverrideKeepsDefaultClaim();
  TestDeprioritizeOtherReleases();
  TestRemoveEntriesByPackageOrVersion();
  TestQueueRebuildsOldestFirstUpToLimit();

  std::cout << "docbuild_unit_build_queue: pass\n";
  return 0;
}
