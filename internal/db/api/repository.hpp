#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/admission_records.hpp"
#include "internal/db/model/build_record.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/db/model/package_record.hpp"
#include "internal/db/model/queue_entry_record.hpp"
#include "internal/db/model/release_record.hpp"
#include "internal/db/model/release_status_record.hpp"

namespace docbuild::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Conditional writes (ClaimQueueEntry, CompareAndSwapCheckpoint,
    AcquireCheckpointLock, FinishBuild) return ErrorCode::Conflict when their
    precondition does not hold; nothing is written in that case
  - Deleting a package cascades to its releases, builds and statuses;
    deleting a release cascades to its builds and status

  Names passed in are already normalized (util::NormalizeName).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Packages / releases
  // ---------------------------------------------------------------------

  // Inserts when normalized_name is unknown; always fills record.id.
  virtual Result UpsertPackage(Transaction&, model::PackageRecord&) = 0;

  virtual std::optional<model::PackageRecord> GetPackage(Transaction&, const std::string& normalized_name) = 0;

  virtual std::optional<model::PackageRecord> GetPackageById(Transaction&, uint64_t package_id) = 0;

  // Ordered by id.
  virtual std::vector<model::PackageRecord> ListPackages(Transaction&) = 0;

  virtual Result SetLatestRelease(Transaction&, uint64_t package_id, uint64_t release_id) = 0;

  virtual Result DeletePackage(Transaction&, uint64_t package_id) = 0;

  // Inserts or refreshes registry metadata only; build outputs are kept. Fills record.id.
  virtual Result UpsertRelease(Transaction&, model::ReleaseRecord&) = 0;

  virtual std::optional<model::ReleaseRecord> GetRelease(Transaction&, uint64_t package_id, const std::string& version) = 0;

  virtual std::optional<model::ReleaseRecord> GetReleaseById(Transaction&, uint64_t release_id) = 0;

  // Cascades to builds and status. The package's latest pointer is left to the caller.
  virtual Result DeleteRelease(Transaction&, uint64_t release_id) = 0;

  /*
    Serializes status recomputes of one release until the transaction ends.
    Backends whose write transactions are already serialized only check
    that the release exists.
  */
  virtual Result LockRelease(Transaction&, uint64_t release_id) = 0;

  virtual std::vector<model::ReleaseRecord> ListReleases(Transaction&, uint64_t package_id) = 0;

  virtual std::vector<uint64_t> ListReleaseIds(Transaction&) = 0;

  virtual Result SetReleaseYanked(Transaction&, uint64_t release_id, bool yanked) = 0;

  // Writes is_library and the build output columns.
  virtual Result UpdateReleaseOutputs(Transaction&, const model::ReleaseRecord&) = 0;

  // ---------------------------------------------------------------------
  // Builds / status
  // ---------------------------------------------------------------------

  virtual Result InsertBuild(Transaction&, model::BuildRecord&) = 0;

  // Writes status, finished_at and log. Conflict when the build is no longer in_progress.
  virtual Result FinishBuild(Transaction&, const model::BuildRecord&) = 0;

  virtual std::optional<model::BuildRecord> GetBuild(Transaction&, uint64_t build_id) = 0;

  // Ordered by id.
  virtual std::vector<model::BuildRecord> ListBuilds(Transaction&, uint64_t release_id) = 0;

  virtual std::vector<model::BuildRecord> ListInProgressBuilds(Transaction&, uint64_t started_before_ms) = 0;

  virtual Result UpsertReleaseStatus(Transaction&, const model::ReleaseStatusRecord&) = 0;

  virtual std::optional<model::ReleaseStatusRecord> GetReleaseStatus(Transaction&, uint64_t release_id) = 0;

  // ---------------------------------------------------------------------
  // Queue
  // ---------------------------------------------------------------------

  // AlreadyExists when (normalized_name, version) is present. Fills record.id.
  virtual Result InsertQueueEntry(Transaction&, model::QueueEntryRecord&) = 0;

  // Writes priority, registry, attempt, last_attempt, queued_at and the claim.
  virtual Result UpdateQueueEntry(Transaction&, const model::QueueEntryRecord&) = 0;

  virtual Result DeleteQueueEntry(Transaction&, uint64_t entry_id) = 0;

  virtual std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string& normalized_name, const std::string& version) = 0;

  virtual std::optional<model::QueueEntryRecord> GetQueueEntryById(Transaction&, uint64_t entry_id) = 0;

  /*
    Entries with attempt < max_attempts in dequeue order (priority, id).
    Backends with row locks skip rows locked by other transactions.
  */
  virtual std::vector<model::QueueEntryRecord> ListQueueCandidates(Transaction&, uint32_t max_attempts, std::size_t limit) = 0;

  // Every entry, dequeue order.
  virtual std::vector<model::QueueEntryRecord> ListQueue(Transaction&) = 0;

  // Sets the claim only when the entry is unclaimed or its claim started before claim_expired_before_ms.
  virtual Result ClaimQueueEntry(Transaction&, uint64_t entry_id, const std::string& worker, uint64_t now_ms,
                                 uint64_t claim_expired_before_ms) = 0;

  // ---------------------------------------------------------------------
  // Admission: priority rules, blacklist, sandbox overrides
  // ---------------------------------------------------------------------

  // Updates priority in place when the pattern exists (keeping its position), else appends.
  virtual Result UpsertPriorityRule(Transaction&, model::PriorityRuleRecord&) = 0;

  virtual Result DeletePriorityRule(Transaction&, const std::string& pattern) = 0;

  virtual std::vector<model::PriorityRuleRecord> ListPriorityRules(Transaction&) = 0;

  virtual Result InsertBlacklistEntry(Transaction&, const std::string& normalized_name) = 0;

  virtual Result DeleteBlacklistEntry(Transaction&, const std::string& normalized_name) = 0;

  virtual std::vector<std::string> ListBlacklist(Transaction&) = 0;

  virtual Result UpsertSandboxOverride(Transaction&, const model::SandboxOverrideRecord&) = 0;

  virtual Result DeleteSandboxOverride(Transaction&, const std::string& normalized_name) = 0;

  virtual std::optional<model::SandboxOverrideRecord> GetSandboxOverride(Transaction&, const std::string& normalized_name) = 0;

  virtual std::vector<model::SandboxOverrideRecord> ListSandboxOverrides(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Sync checkpoint
  // ---------------------------------------------------------------------

  virtual std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& name) = 0;

  // AlreadyExists when the row is present.
  virtual Result InsertCheckpoint(Transaction&, const model::CheckpointRecord&) = 0;

  // Sets reference and bumps version only when version == expected_version.
  virtual Result CompareAndSwapCheckpoint(Transaction&, const std::string& name, uint64_t expected_version,
                                          const std::string& reference, uint64_t now_ms) = 0;

  // Succeeds when the lock is free, expired at now_ms, or already held by holder.
  virtual Result AcquireCheckpointLock(Transaction&, const std::string& name, const std::string& holder, uint64_t now_ms,
                                       uint64_t expires_at_ms) = 0;

  // No-op unless held by holder.
  virtual Result ReleaseCheckpointLock(Transaction&, const std::string& name, const std::string& holder) = 0;

  // ---------------------------------------------------------------------
  // Settings
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetSetting(Transaction&, const std::string& key) = 0;

  virtual Result SetSetting(Transaction&, const std::string& key, const std::string& value) = 0;
};

} // namespace docbuild::db
