#include "status_aggregator.hpp"

#include <algorithm>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"

namespace docbuild::status {

using docbuild::v1::BUILD_STATUS_FAILURE;
using docbuild::v1::BUILD_STATUS_IN_PROGRESS;
using docbuild::v1::BUILD_STATUS_SUCCESS;

StatusAggregator::StatusAggregator(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::ReleaseStatusRecord StatusAggregator::Aggregate(uint64_t release_id, const std::vector<db::model::BuildRecord>& builds) {
  db::model::ReleaseStatusRecord status;
  status.release_id = release_id;
  status.status     = BUILD_STATUS_IN_PROGRESS;

  bool any_success = false;
  bool any_failure = false;
  for (const auto& build : builds) {
    if (build.status == BUILD_STATUS_SUCCESS) {
      any_success = true;
    } else if (build.status == BUILD_STATUS_FAILURE) {
      any_failure = true;
    } else {
      continue;
    }
    status.last_build_time_ms = std::max(status.last_build_time_ms, build.finished_at_ms);
  }

  if (any_success) {
    status.status = BUILD_STATUS_SUCCESS;
  } else if (any_failure) {
    status.status = BUILD_STATUS_FAILURE;
  }
  return status;
}

db::model::ReleaseStatusRecord StatusAggregator::Recompute(db::Transaction& tx, uint64_t release_id) {
  db::ThrowIfError(repository_->LockRelease(tx, release_id), "lock release");
  auto status = Aggregate(release_id, repository_->ListBuilds(tx, release_id));
  db::ThrowIfError(repository_->UpsertReleaseStatus(tx, status), "upsert release status");
  return status;
}

RepairReport StatusAggregator::RepairAll() {
  std::vector<uint64_t> release_ids;
  {
    auto tx     = repository_->Begin();
    release_ids = repository_->ListReleaseIds(*tx);
    tx->Commit();
  }

  RepairReport report;
  for (auto release_id : release_ids) {
    const bool repaired = db::RetryOnConflict("repair release status", [&] {
      auto tx     = repository_->Begin();
      auto locked = repository_->LockRelease(*tx, release_id);
      if (locked.code == db::ErrorCode::NotFound) {
        // deleted since the id scan
        tx->Commit();
        return false;
      }
      db::ThrowIfError(locked, "lock release");
      auto expected = Aggregate(release_id, repository_->ListBuilds(*tx, release_id));
      auto current  = repository_->GetReleaseStatus(*tx, release_id);
      if (current && *current == expected) {
        tx->Commit();
        return false;
      }
      db::ThrowIfError(repository_->UpsertReleaseStatus(*tx, expected), "repair release status");
      tx->Commit();
      return true;
    });

    ++report.releases_checked;
    if (repaired) {
      ++report.releases_repaired;
      DOCBUILD_LOG_WARN("repaired release status drift", {observability::IntField("release_id", static_cast<int64_t>(release_id))});
    }
  }

  DOCBUILD_LOG_INFO("release status repair finished",
                    {observability::IntField("checked", static_cast<int64_t>(report.releases_checked)),
                     observability::IntField("repaired", static_cast<int64_t>(report.releases_repaired))});
  return report;
}

uint64_t StatusAggregator::FailAbandonedBuilds(uint64_t now_ms, std::chrono::seconds min_window, const AbandonWindowFn& window_for) {
  const auto started_before = [now_ms](std::chrono::seconds window) {
    const uint64_t window_ms = static_cast<uint64_t>(window.count()) * 1000;
    return now_ms > window_ms ? now_ms - window_ms : uint64_t{0};
  };

  return db::RetryOnConflict("fail abandoned builds", [&] {
    auto tx         = repository_->Begin();
    auto candidates = repository_->ListInProgressBuilds(*tx, started_before(min_window));
    if (candidates.empty()) {
      tx->Commit();
      return uint64_t{0};
    }

    uint64_t              failed = 0;
    std::vector<uint64_t> releases;
    for (auto& build : candidates) {
      if (window_for) {
        auto release = repository_->GetReleaseById(*tx, build.release_id);
        auto package = release ? repository_->GetPackageById(*tx, release->package_id) : std::nullopt;
        if (package && build.started_at_ms >= started_before(window_for(*tx, package->normalized_name))) {
          continue;
        }
      }

      build.status         = BUILD_STATUS_FAILURE;
      build.finished_at_ms = now_ms;
      build.log += build.log.empty() ? "abandoned" : "\nabandoned";
      auto finished = repository_->FinishBuild(*tx, build);
      if (finished.code == db::ErrorCode::Conflict || finished.code == db::ErrorCode::NotFound) {
        // concluded or removed after the scan
        continue;
      }
      db::ThrowIfError(finished, "fail abandoned build");
      releases.push_back(build.release_id);
      ++failed;

      DOCBUILD_LOG_WARN("failed abandoned build", {observability::IntField("build_id", static_cast<int64_t>(build.id)),
                                                   observability::StringField("worker", build.worker)});
    }

    std::sort(releases.begin(), releases.end());
    releases.erase(std::unique(releases.begin(), releases.end()), releases.end());
    for (auto release_id : releases) {
      Recompute(*tx, release_id);
    }
    tx->Commit();
    return failed;
  });
}

} // namespace docbuild::status
