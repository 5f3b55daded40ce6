#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace docbuild::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertPackage(Transaction&, model::PackageRecord&) override;
  std::optional<model::PackageRecord> GetPackage(Transaction&, const std::string& normalized_name) override;
  std::optional<model::PackageRecord> GetPackageById(Transaction&, uint64_t package_id) override;
  std::vector<model::PackageRecord> ListPackages(Transaction&) override;
  Result SetLatestRelease(Transaction&, uint64_t package_id, uint64_t release_id) override;
  Result DeletePackage(Transaction&, uint64_t package_id) override;

  Result UpsertRelease(Transaction&, model::ReleaseRecord&) override;
  std::optional<model::ReleaseRecord> GetRelease(Transaction&, uint64_t package_id, const std::string& version) override;
  std::optional<model::ReleaseRecord> GetReleaseById(Transaction&, uint64_t release_id) override;
  Result DeleteRelease(Transaction&, uint64_t release_id) override;
  Result LockRelease(Transaction&, uint64_t release_id) override;
  std::vector<model::ReleaseRecord> ListReleases(Transaction&, uint64_t package_id) override;
  std::vector<uint64_t> ListReleaseIds(Transaction&) override;
  Result SetReleaseYanked(Transaction&, uint64_t release_id, bool yanked) override;
  Result UpdateReleaseOutputs(Transaction&, const model::ReleaseRecord&) override;

  Result InsertBuild(Transaction&, model::BuildRecord&) override;
  Result FinishBuild(Transaction&, const model::BuildRecord&) override;
  std::optional<model::BuildRecord> GetBuild(Transaction&, uint64_t build_id) override;
  std::vector<model::BuildRecord> ListBuilds(Transaction&, uint64_t release_id) override;
  std::vector<model::BuildRecord> ListInProgressBuilds(Transaction&, uint64_t started_before_ms) override;
  Result UpsertReleaseStatus(Transaction&, const model::ReleaseStatusRecord&) override;
  std::optional<model::ReleaseStatusRecord> GetReleaseStatus(Transaction&, uint64_t release_id) override;

  Result InsertQueueEntry(Transaction&, model::QueueEntryRecord&) override;
  Result UpdateQueueEntry(Transaction&, const model::QueueEntryRecord&) override;
  Result DeleteQueueEntry(Transaction&, uint64_t entry_id) override;
  std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string& normalized_name,
                                                       const std::string& version) override;
  std::optional<model::QueueEntryRecord> GetQueueEntryById(Transaction&, uint64_t entry_id) override;
  std::vector<model::QueueEntryRecord> ListQueueCandidates(Transaction&, uint32_t max_attempts, std::size_t limit) override;
  std::vector<model::QueueEntryRecord> ListQueue(Transaction&) override;
  Result ClaimQueueEntry(Transaction&, uint64_t entry_id, const std::string& worker, uint64_t now_ms,
                         uint64_t claim_expired_before_ms) override;

  Result UpsertPriorityRule(Transaction&, model::PriorityRuleRecord&) override;
  Result DeletePriorityRule(Transaction&, const std::string& pattern) override;
  std::vector<model::PriorityRuleRecord> ListPriorityRules(Transaction&) override;
  Result InsertBlacklistEntry(Transaction&, const std::string& normalized_name) override;
  Result DeleteBlacklistEntry(Transaction&, const std::string& normalized_name) override;
  std::vector<std::string> ListBlacklist(Transaction&) override;
  Result UpsertSandboxOverride(Transaction&, const model::SandboxOverrideRecord&) override;
  Result DeleteSandboxOverride(Transaction&, const std::string& normalized_name) override;
  std::optional<model::SandboxOverrideRecord> GetSandboxOverride(Transaction&, const std::string& normalized_name) override;
  std::vector<model::SandboxOverrideRecord> ListSandboxOverrides(Transaction&) override;

  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& name) override;
  Result InsertCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  Result CompareAndSwapCheckpoint(Transaction&, const std::string& name, uint64_t expected_version,
                                  const std::string& reference, uint64_t now_ms) override;
  Result AcquireCheckpointLock(Transaction&, const std::string& name, const std::string& holder, uint64_t now_ms,
                               uint64_t expires_at_ms) override;
  Result ReleaseCheckpointLock(Transaction&, const std::string& name, const std::string& holder) override;

  std::optional<std::string> GetSetting(Transaction&, const std::string& key) override;
  Result SetSetting(Transaction&, const std::string& key, const std::string& value) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  // Translate, then `none` when the statement touched no row
  static Result ExpectChange(sqlite3* db, int rc, ErrorCode none, const char* what);
};

}
