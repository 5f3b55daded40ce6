#include "internal/status/status_aggregator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using docbuild::db::model::BuildRecord;
using docbuild::db::model::ReleaseStatusRecord;
using docbuild::status::StatusAggregator;
using docbuild::v1::BUILD_STATUS_FAILURE;
using docbuild::v1::BUILD_STATUS_IN_PROGRESS;
using docbuild::v1::BUILD_STATUS_SUCCESS;

BuildRecord Build(docbuild::v1::BuildStatus status, uint64_t finished_at_ms) {
  BuildRecord build;
  build.status         = status;
  build.started_at_ms  = 1;
  build.finished_at_ms = finished_at_ms;
  return build;
}

uint64_t SeedRelease(docbuild::db::Repository& repo) {
  auto                                tx = repo.Begin();
  docbuild::db::model::PackageRecord package{.name = "serde", .normalized_name = "serde"};
  assert(repo.UpsertPackage(*tx, package));
  docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = "1.0.0"};
  assert(repo.UpsertRelease(*tx, release));
  tx->Commit();
  return release.id;
}

void TestEmptyHistoryIsInProgress() {
  const auto status = StatusAggregator::Aggregate(9, {});
  assert(status.release_id == 9);
  assert(status.status == BUILD_STATUS_IN_PROGRESS);
  assert(status.last_build_time_ms == 0);
}

void TestSuccessWinsRegardlessOfOrder() {
  std::vector<BuildRecord> builds{Build(BUILD_STATUS_FAILURE, 300), Build(BUILD_STATUS_SUCCESS, 100), Build(BUILD_STATUS_IN_PROGRESS, 0)};

  const auto forward = StatusAggregator::Aggregate(1, builds);
  std::vector<BuildRecord> reversed(builds.rbegin(), builds.rend());
  const auto backward = StatusAggregator::Aggregate(1, reversed);

  assert(forward.status == BUILD_STATUS_SUCCESS);
  assert(forward.last_build_time_ms == 300);
  assert(forward == backward);
}

void TestFailureOverInProgress() {
  const auto status = StatusAggregator::Aggregate(1, {Build(BUILD_STATUS_IN_PROGRESS, 0), Build(BUILD_STATUS_FAILURE, 50)});
  assert(status.status == BUILD_STATUS_FAILURE);
  assert(status.last_build_time_ms == 50);
}

void TestRepairFixesDrift() {
  auto       repo       = std::make_shared<docbuild::db::memory::MemoryRepository>();
  const auto release_id = SeedRelease(*repo);

  StatusAggregator aggregator(repo);
  {
    auto        tx    = repo->Begin();
    BuildRecord build = Build(BUILD_STATUS_SUCCESS, 42);
    build.release_id  = release_id;
    assert(repo->InsertBuild(*tx, build));
    // stale cache on purpose
    assert(repo->UpsertReleaseStatus(*tx, ReleaseStatusRecord{.release_id = release_id, .status = BUILD_STATUS_FAILURE}));
    tx->Commit();
  }

  auto report = aggregator.RepairAll();
  assert(report.releases_checked == 1);
  assert(report.releases_repaired == 1);

  auto tx     = repo->Begin();
  auto status = repo->GetReleaseStatus(*tx, release_id);
  assert(status.has_value());
  assert(status->status == BUILD_STATUS_SUCCESS);
  assert(status->last_build_time_ms == 42);
  tx->Commit();

  report = aggregator.RepairAll();
  assert(report.releases_repaired == 0);
}

void TestAbandonedBuildsAreFailed() {
  auto       repo       = std::make_shared<docbuild::db::memory::MemoryRepository>();
  const auto release_id = SeedRelease(*repo);

  StatusAggregator aggregator(repo);
  uint64_t         old_id   = 0;
  uint64_t         fresh_id = 0;
  {
    auto        tx  = repo->Begin();
    BuildRecord old = Build(BUILD_STATUS_IN_PROGRESS, 0);
    old.release_id  = release_id;
    old.started_at_ms = 1000;
    assert(repo->InsertBuild(*tx, old));
    old_id = old.id;

    BuildRecord fresh   = old;
    fresh.id            = 0;
    fresh.started_at_ms = 9000;
    assert(repo->InsertBuild(*tx, fresh));
    fresh_id = fresh.id;

    aggregator.Recompute(*tx, release_id);
    tx->Commit();
  }

  assert(aggregator.FailAbandonedBuilds(10000, std::chrono::seconds(5)) == 1);

  auto tx = repo->Begin();
  auto old = repo->GetBuild(*tx, old_id);
  assert(old->status == BUILD_STATUS_FAILURE);
  assert(old->finished_at_ms == 10000);
  assert(old->log == "abandoned");
  assert(repo->GetBuild(*tx, fresh_id)->status == BUILD_STATUS_IN_PROGRESS);

  auto status = repo->GetReleaseStatus(*tx, release_id);
  assert(status->status == BUILD_STATUS_FAILURE);
  assert(status->last_build_time_ms == 10000);
  tx->Commit();

  assert(aggregator.FailAbandonedBuilds(11000, std::chrono::seconds(6)) == 0);
}

void TestAbandonWindowWidensPerPackage() {
  auto repo = std::make_shared<docbuild::db::memory::MemoryRepository>();

  uint64_t slow_build = 0;
  uint64_t fast_build = 0;
  {
    auto tx = repo->Begin();
    for (const std::string name : {"slow", "fast"}) {
      docbuild::db::model::PackageRecord package{.name = name, .normalized_name = name};
      assert(repo->UpsertPackage(*tx, package));
      docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = "1.0.0"};
      assert(repo->UpsertRelease(*tx, release));

      BuildRecord build   = Build(BUILD_STATUS_IN_PROGRESS, 0);
      build.release_id    = release.id;
      build.started_at_ms = 1000;
      assert(repo->InsertBuild(*tx, build));
      (name == "slow" ? slow_build : fast_build) = build.id;
    }
    tx->Commit();
  }

  StatusAggregator aggregator(repo);
  const auto       window_for = [](docbuild::db::Transaction&, const std::string& name) {
    return name == "slow" ? std::chrono::seconds(60) : std::chrono::seconds(5);
  };

  // 20s in: past the fast window, inside the slow one
  assert(aggregator.FailAbandonedBuilds(21000, std::chrono::seconds(5), window_for) == 1);
  {
    auto tx = repo->Begin();
    assert(repo->GetBuild(*tx, fast_build)->status == BUILD_STATUS_FAILURE);
    assert(repo->GetBuild(*tx, slow_build)->status == BUILD_STATUS_IN_PROGRESS);
    tx->Commit();
  }

  assert(aggregator.FailAbandonedBuilds(62000, std::chrono::seconds(5), window_for) == 1);
  auto tx = repo->Begin();
  assert(repo->GetBuild(*tx, slow_build)->status == BUILD_STATUS_FAILURE);
  tx->Commit();
}

void TestRecomputeOfUnknownReleaseThrows() {
  auto             repo = std::make_shared<docbuild::db::memory::MemoryRepository>();
  StatusAggregator aggregator(repo);

  auto tx    = repo->Begin();
  bool threw = false;
  try {
    aggregator.Recompute(*tx, 42);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(!repo->GetReleaseStatus(*tx, 42).has_value());
  tx->Rollback();
}

} // namespace

int main() {
  TestEmptyHistoryIsInProgress();
  TestSuccessWinsRegardlessOfOrder();
  TestFailureOverInProgress();
  TestRepairFixesDrift();
  TestAbandonedBuildsAreFailed();
  TestAbandonWindowWidensPerPackage();
  TestRecomputeOfUnknownReleaseThrows();

  std::cout << "docbuild_unit_status_aggregator: pass\n";
  return 0;
}
