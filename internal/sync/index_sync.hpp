#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/catalog/release_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/queue/admission.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/registry/registry_index.hpp"

namespace docbuild::sync {

struct SyncOptions {
  std::string          checkpoint_name = "registry-index";
  std::string          holder          = "docbuild";
  std::chrono::seconds lock_ttl{300};
  // registry-of-origin tag written on queue entries
  std::string registry_name;
};

struct SyncReport {
  bool skipped = false; // another holder owns the checkpoint lock

  std::string previous_reference;
  std::string new_reference;
  bool        checkpoint_advanced = false;

  uint64_t changes       = 0;
  uint64_t added         = 0;
  uint64_t enqueued      = 0;
  uint64_t already_built = 0;
  uint64_t blacklisted   = 0;
  uint64_t yank_updates  = 0;
  uint64_t unknown_yanks = 0;

  uint64_t releases_deleted = 0;
  uint64_t packages_deleted = 0;
};

struct ConsistencyReport {
  bool skipped = false; // another holder owns the checkpoint lock
  bool dry_run = false;

  uint64_t packages_checked = 0;
  uint64_t builds_queued    = 0;
  uint64_t packages_deleted = 0;
  uint64_t releases_deleted = 0;
  uint64_t yanks_corrected  = 0;
};

/*
  IndexSync

  Moves the registry index forward into the catalog and the build queue.

  CRITICAL GUARANTEES:

  - Only one holder mutates per checkpoint at a time (lease row lock)
  - Every applied change is an idempotent upsert in its own transaction
  - The checkpoint advances only after all changes committed, by
    compare-and-swap on its version; a concurrent reset wins
  - An unreadable index aborts the run before anything is written
  - Queuing a new version lowers the queued older versions of the same
    package to at least kDefaultPriority
  - Deleting a version or package from the index deletes it from the
    catalog and the queue
*/
class IndexSync {
 public:
  using ClockFn = std::function<uint64_t()>;

  IndexSync(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::RegistryIndex> index,
            std::shared_ptr<queue::BuildQueue> queue, SyncOptions options, ClockFn clock = {});

  // Throws util::RegistryUnavailable when the index cannot be read.
  SyncReport Run();

  db::model::CheckpointRecord Checkpoint();

  // Re-baselines tracking at the current head of the index.
  db::model::CheckpointRecord ResetToHead();

  db::model::CheckpointRecord SetReference(const std::string& reference);

  /*
    Compares the whole index with the catalog under the checkpoint lock and
    repairs drift: packages and releases missing from the index are deleted,
    releases missing from the catalog are added and queued at
    kConsistencyCheckPriority, yank flags are corrected. Blacklisted packages
    are ignored. dry_run only counts.
  */
  ConsistencyReport CheckConsistency(bool dry_run);

 private:
  std::optional<db::model::CheckpointRecord> AcquireLease();

  // true when a new queue entry was created
  bool QueueFromIndex(const catalog::ReleaseMetadata& release, int32_t priority);

  void ApplyChange(const registry::IndexChange& change, const queue::PriorityResolver& resolver,
                   const queue::BlacklistFilter& blacklist, SyncReport& report);

  db::model::CheckpointRecord EnsureCheckpoint(db::Transaction& tx);

  uint64_t NowMs() const;

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<registry::RegistryIndex> index_;
  std::shared_ptr<queue::BuildQueue>       queue_;
  catalog::ReleaseCatalog                  catalog_;
  SyncOptions                              options_;
  ClockFn                                  clock_;
};

} // namespace docbuild::sync
