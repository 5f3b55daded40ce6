#include "index_sync.hpp"

#include <chrono>
#include <functional>
#include <map>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"

namespace docbuild::sync {

using db::model::CheckpointRecord;

namespace {

/*
  Releases the checkpoint lock on scope exit. Failures are logged; the
  lock expires on its own after the TTL.
*/
class CheckpointLockGuard {
 public:
  CheckpointLockGuard(db::Repository& repository, std::string name, std::string holder)
      : repository_(repository), name_(std::move(name)), holder_(std::move(holder)) {
  }

  ~CheckpointLockGuard() {
    try {
      db::RetryOnConflict("release checkpoint lock", [&] {
        auto tx = repository_.Begin();
        db::ThrowIfError(repository_.ReleaseCheckpointLock(*tx, name_, holder_), "release checkpoint lock");
        tx->Commit();
      });
    } catch (const std::exception& e) {
      DOCBUILD_LOG_WARN("failed to release checkpoint lock",
                        {observability::StringField("checkpoint", name_), observability::StringField("error", e.what())});
    }
  }

  CheckpointLockGuard(const CheckpointLockGuard&)            = delete;
  CheckpointLockGuard& operator=(const CheckpointLockGuard&) = delete;

 private:
  db::Repository& repository_;
  std::string     name_;
  std::string     holder_;
};

std::string_view ToString(registry::ChangeKind kind) {
  switch (kind) {
    case registry::ChangeKind::kAdded:
      return "added";
    case registry::ChangeKind::kYanked:
      return "yanked";
    case registry::ChangeKind::kUnyanked:
      return "unyanked";
    case registry::ChangeKind::kVersionDeleted:
      return "version_deleted";
    case registry::ChangeKind::kPackageDeleted:
      return "package_deleted";
  }
  return "unknown";
}

} // namespace

IndexSync::IndexSync(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::RegistryIndex> index,
                     std::shared_ptr<queue::BuildQueue> queue, SyncOptions options, ClockFn clock)
    : repository_(std::move(repository)),
      index_(std::move(index)),
      queue_(std::move(queue)),
      catalog_(repository_),
      options_(std::move(options)),
      clock_(std::move(clock)) {
  if (!repository_ || !index_ || !queue_) {
    throw std::invalid_argument("IndexSync requires repository, index and queue");
  }
}

uint64_t IndexSync::NowMs() const {
  return clock_ ? clock_() : util::NowMillis();
}

CheckpointRecord IndexSync::EnsureCheckpoint(db::Transaction& tx) {
  if (auto existing = repository_->GetCheckpoint(tx, options_.checkpoint_name)) {
    return *existing;
  }

  CheckpointRecord checkpoint;
  checkpoint.name          = options_.checkpoint_name;
  checkpoint.updated_at_ms = NowMs();
  db::ThrowIfError(repository_->InsertCheckpoint(tx, checkpoint), "create checkpoint");
  return checkpoint;
}

std::optional<CheckpointRecord> IndexSync::AcquireLease() {
  const uint64_t ttl_ms = static_cast<uint64_t>(options_.lock_ttl.count()) * 1000;
  return db::RetryOnConflict("acquire checkpoint lock", [&]() -> std::optional<CheckpointRecord> {
    auto       tx       = repository_->Begin();
    auto       current  = EnsureCheckpoint(*tx);
    const auto now      = NowMs();
    auto       acquired = repository_->AcquireCheckpointLock(*tx, options_.checkpoint_name, options_.holder, now, now + ttl_ms);
    if (acquired.code == db::ErrorCode::Conflict) {
      tx->Rollback();
      return std::nullopt;
    }
    db::ThrowIfError(acquired, "acquire checkpoint lock");
    tx->Commit();
    return current;
  });
}

// ------------------------------------------------------------------
// Run
// ------------------------------------------------------------------

SyncReport IndexSync::Run() {
  observability::SpanScope span("sync.run");
  span.SetAttribute("checkpoint", options_.checkpoint_name);

  const auto started = std::chrono::steady_clock::now();
  SyncReport report;

  // 1. lease
  auto checkpoint = AcquireLease();
  if (!checkpoint) {
    DOCBUILD_LOG_INFO("sync skipped, checkpoint locked by another holder", {observability::StringField("checkpoint", options_.checkpoint_name)});
    report.skipped = true;
    return report;
  }

  CheckpointLockGuard guard(*repository_, options_.checkpoint_name, options_.holder);
  report.previous_reference = checkpoint->reference;

  try {
    // 2. admission snapshot
    std::vector<db::model::PriorityRuleRecord> rules;
    std::vector<std::string>                   blocked;
    {
      auto tx = repository_->Begin();
      rules   = repository_->ListPriorityRules(*tx);
      blocked = repository_->ListBlacklist(*tx);
      tx->Commit();
    }
    const queue::PriorityResolver resolver(std::move(rules));
    const queue::BlacklistFilter  blacklist(blocked);

    // 3. diff; read-only, nothing written yet
    auto diff            = index_->ChangesSince(checkpoint->reference);
    report.changes       = diff.changes.size();
    report.new_reference = diff.new_reference;

    // 4. apply
    for (const auto& change : diff.changes) {
      ApplyChange(change, resolver, blacklist, report);
    }

    // 5. advance
    if (diff.new_reference != checkpoint->reference) {
      report.checkpoint_advanced = db::RetryOnConflict("advance checkpoint", [&] {
        auto tx  = repository_->Begin();
        auto cas = repository_->CompareAndSwapCheckpoint(*tx, options_.checkpoint_name, checkpoint->version, diff.new_reference, NowMs());
        if (cas.code == db::ErrorCode::Conflict) {
          tx->Rollback();
          return false;
        }
        db::ThrowIfError(cas, "advance checkpoint");
        tx->Commit();
        return true;
      });
      if (!report.checkpoint_advanced) {
        DOCBUILD_LOG_WARN("checkpoint changed during sync, not advancing",
                          {observability::StringField("checkpoint", options_.checkpoint_name),
                           observability::StringField("reference", diff.new_reference)});
      }
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordSyncRun(false, report.changes);
    DOCBUILD_LOG_ERROR("sync failed", {observability::StringField("checkpoint", options_.checkpoint_name),
                                       observability::StringField("reference", checkpoint->reference),
                                       observability::StringField("error", e.what())});
    throw;
  }

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().RecordSyncRun(true, report.changes);
  span.SetAttribute("changes", static_cast<int64_t>(report.changes));

  DOCBUILD_LOG_INFO("sync finished", {observability::StringField("from", report.previous_reference),
                                      observability::StringField("to", report.new_reference),
                                      observability::IntField("changes", static_cast<int64_t>(report.changes)),
                                      observability::IntField("enqueued", static_cast<int64_t>(report.enqueued)),
                                      observability::IntField("blacklisted", static_cast<int64_t>(report.blacklisted)),
                                      observability::DurationMsField("duration_ms", elapsed_ms)});
  return report;
}

void IndexSync::ApplyChange(const registry::IndexChange& change, const queue::PriorityResolver& resolver,
                            const queue::BlacklistFilter& blacklist, SyncReport& report) {
  const auto& release = change.release;

  switch (change.kind) {
    case registry::ChangeKind::kAdded: {
      if (blacklist.IsBlocked(release.name)) {
        ++report.blacklisted;
        DOCBUILD_LOG_DEBUG("dropping blacklisted release",
                           {observability::StringField("name", release.name), observability::StringField("version", release.version)});
        return;
      }

      enum class Applied { kEnqueued, kAlreadyQueued, kAlreadyBuilt };
      const auto applied = db::RetryOnConflict("apply added release", [&] {
        auto tx    = repository_->Begin();
        auto entry = catalog_.UpsertFromRegistry(*tx, release);
        catalog_.RefreshLatest(*tx, entry.package.id);

        auto status = repository_->GetReleaseStatus(*tx, entry.release.id);
        if (status && status->status == docbuild::v1::BUILD_STATUS_SUCCESS) {
          tx->Commit();
          return Applied::kAlreadyBuilt;
        }

        queue::EnqueueRequest request;
        request.name     = release.name;
        request.version  = release.version;
        request.priority = resolver.Resolve(release.name, entry.created);
        request.registry = options_.registry_name;
        auto result      = queue_->Enqueue(*tx, request);
        if (result.created) {
          queue_->DeprioritizeOtherReleases(*tx, entry.package.normalized_name, release.version, queue::kDefaultPriority);
        }
        tx->Commit();
        return result.created ? Applied::kEnqueued : Applied::kAlreadyQueued;
      });

      ++report.added;
      if (applied == Applied::kEnqueued) {
        ++report.enqueued;
      } else if (applied == Applied::kAlreadyBuilt) {
        ++report.already_built;
      }
      return;
    }

    case registry::ChangeKind::kYanked:
    case registry::ChangeKind::kUnyanked: {
      const bool yanked = change.kind == registry::ChangeKind::kYanked;
      const bool known  = db::RetryOnConflict("apply yank", [&] {
        auto tx    = repository_->Begin();
        bool found = catalog_.SetYanked(*tx, release.name, release.version, yanked);
        tx->Commit();
        return found;
      });

      if (known) {
        ++report.yank_updates;
      } else {
        ++report.unknown_yanks;
        DOCBUILD_LOG_INFO("yank state change for unknown release", {observability::StringField("change", ToString(change.kind)),
                                                                    observability::StringField("name", release.name),
                                                                    observability::StringField("version", release.version)});
      }
      return;
    }

    case registry::ChangeKind::kVersionDeleted: {
      const bool known = db::RetryOnConflict("apply version delete", [&] {
        auto tx      = repository_->Begin();
        bool removed = catalog_.RemoveRelease(*tx, release.name, release.version);
        queue_->RemoveEntries(*tx, util::NormalizeName(release.name), release.version);
        tx->Commit();
        return removed;
      });
      if (known) {
        ++report.releases_deleted;
        DOCBUILD_LOG_INFO("deleted release removed from the index",
                          {observability::StringField("name", release.name), observability::StringField("version", release.version)});
      }
      return;
    }

    case registry::ChangeKind::kPackageDeleted: {
      const auto removed = db::RetryOnConflict("apply package delete", [&] {
        auto tx       = repository_->Begin();
        auto releases = catalog_.RemovePackage(*tx, release.name);
        queue_->RemoveEntries(*tx, util::NormalizeName(release.name));
        tx->Commit();
        return releases;
      });
      if (removed) {
        ++report.packages_deleted;
        DOCBUILD_LOG_INFO("deleted package removed from the index",
                          {observability::StringField("name", release.name), observability::IntField("releases", static_cast<int64_t>(*removed))});
      }
      return;
    }
  }
}

// ------------------------------------------------------------------
// Consistency check
// ------------------------------------------------------------------

bool IndexSync::QueueFromIndex(const catalog::ReleaseMetadata& release, int32_t priority) {
  return db::RetryOnConflict("queue from index", [&] {
    auto tx    = repository_->Begin();
    auto entry = catalog_.UpsertFromRegistry(*tx, release);
    catalog_.RefreshLatest(*tx, entry.package.id);

    queue::EnqueueRequest request;
    request.name     = release.name;
    request.version  = release.version;
    request.priority = priority;
    request.registry = options_.registry_name;
    auto result      = queue_->Enqueue(*tx, request);
    tx->Commit();
    return result.created;
  });
}

ConsistencyReport IndexSync::CheckConsistency(bool dry_run) {
  observability::SpanScope span("sync.consistency_check");
  span.SetAttribute("dry_run", static_cast<int64_t>(dry_run));

  ConsistencyReport report;
  report.dry_run = dry_run;

  auto checkpoint = AcquireLease();
  if (!checkpoint) {
    DOCBUILD_LOG_INFO("consistency check skipped, checkpoint locked by another holder",
                      {observability::StringField("checkpoint", options_.checkpoint_name)});
    report.skipped = true;
    return report;
  }
  CheckpointLockGuard guard(*repository_, options_.checkpoint_name, options_.holder);

  // index first; an unreadable index aborts before anything is written
  const auto index = index_->Snapshot();

  struct CatalogPackage {
    std::string                 name;
    std::map<std::string, bool> yanked; // by version
  };
  std::map<std::string, CatalogPackage> catalog;
  std::vector<std::string>              blocked;
  {
    auto tx = repository_->Begin();
    for (const auto& package : repository_->ListPackages(*tx)) {
      auto& entry = catalog[package.normalized_name];
      entry.name  = package.name;
      for (const auto& release : repository_->ListReleases(*tx, package.id)) {
        entry.yanked[release.version] = release.yanked;
      }
    }
    blocked = repository_->ListBlacklist(*tx);
    tx->Commit();
  }
  const queue::BlacklistFilter blacklist(blocked);

  const auto apply = [&](const char* what, const std::function<void(db::Transaction&)>& fn) {
    if (dry_run) return;
    db::RetryOnConflict(what, [&] {
      auto tx = repository_->Begin();
      fn(*tx);
      tx->Commit();
    });
  };
  const auto queue_release = [&](const catalog::ReleaseMetadata& release) {
    if (dry_run || QueueFromIndex(release, queue::kConsistencyCheckPriority)) {
      ++report.builds_queued;
    }
  };

  // packages the index no longer has
  for (const auto& [normalized, package] : catalog) {
    if (index.contains(normalized)) continue;
    ++report.packages_deleted;
    DOCBUILD_LOG_INFO("package missing from the index", {observability::StringField("name", normalized),
                                                         observability::BoolField("dry_run", dry_run)});
    apply("delete package missing from index", [&](db::Transaction& tx) {
      catalog_.RemovePackage(tx, normalized);
      queue_->RemoveEntries(tx, normalized);
    });
  }

  for (const auto& [normalized, indexed] : index) {
    ++report.packages_checked;
    if (blacklist.IsBlocked(normalized)) continue;

    auto known = catalog.find(normalized);
    if (known == catalog.end()) {
      for (const auto& [version, release] : indexed.versions) {
        queue_release(release);
      }
      continue;
    }

    for (const auto& [version, release] : indexed.versions) {
      auto row = known->second.yanked.find(version);
      if (row == known->second.yanked.end()) {
        queue_release(release);
      } else if (row->second != release.yanked) {
        ++report.yanks_corrected;
        apply("correct yank", [&](db::Transaction& tx) { catalog_.SetYanked(tx, release.name, version, release.yanked); });
      }
    }

    for (const auto& [version, yanked] : known->second.yanked) {
      if (indexed.versions.contains(version)) continue;
      ++report.releases_deleted;
      DOCBUILD_LOG_INFO("release missing from the index", {observability::StringField("name", normalized),
                                                           observability::StringField("version", version),
                                                           observability::BoolField("dry_run", dry_run)});
      apply("delete release missing from index", [&](db::Transaction& tx) {
        catalog_.RemoveRelease(tx, normalized, version);
        queue_->RemoveEntries(tx, normalized, version);
      });
    }
  }

  DOCBUILD_LOG_INFO("consistency check finished", {observability::BoolField("dry_run", dry_run),
                                                   observability::IntField("packages", static_cast<int64_t>(report.packages_checked)),
                                                   observability::IntField("queued", static_cast<int64_t>(report.builds_queued)),
                                                   observability::IntField("packages_deleted", static_cast<int64_t>(report.packages_deleted)),
                                                   observability::IntField("releases_deleted", static_cast<int64_t>(report.releases_deleted)),
                                                   observability::IntField("yanks_corrected", static_cast<int64_t>(report.yanks_corrected))});
  return report;
}

// ------------------------------------------------------------------
// Checkpoint administration
// ------------------------------------------------------------------

CheckpointRecord IndexSync::Checkpoint() {
  auto tx         = repository_->Begin();
  auto checkpoint = repository_->GetCheckpoint(*tx, options_.checkpoint_name);
  tx->Commit();
  if (checkpoint) {
    return *checkpoint;
  }
  CheckpointRecord empty;
  empty.name = options_.checkpoint_name;
  return empty;
}

CheckpointRecord IndexSync::SetReference(const std::string& reference) {
  auto updated = db::RetryOnConflict("set checkpoint reference", [&] {
    auto       tx      = repository_->Begin();
    auto       current = EnsureCheckpoint(*tx);
    const auto now     = NowMs();
    db::ThrowIfError(repository_->CompareAndSwapCheckpoint(*tx, options_.checkpoint_name, current.version, reference, now),
                     "set checkpoint reference");
    tx->Commit();

    current.reference     = reference;
    current.version      += 1;
    current.updated_at_ms = now;
    return current;
  });

  DOCBUILD_LOG_INFO("checkpoint reference set", {observability::StringField("checkpoint", options_.checkpoint_name),
                                                 observability::StringField("reference", reference)});
  return updated;
}

CheckpointRecord IndexSync::ResetToHead() {
  return SetReference(index_->HeadReference());
}

} // namespace docbuild::sync
