#include "pg_repository.hpp"

#include "internal/db/sql/schema.hpp"

namespace docbuild::db::postgres {

namespace {

constexpr const char* kPackageCols = "id,name,normalized_name,latest_release_id,downloads";
constexpr const char* kReleaseCols =
    "id,package_id,version,yanked,is_library,dependencies,targets,default_target,doc_targets,has_docs,documented_items,total_items";
constexpr const char* kBuildCols = "id,release_id,toolchain_version,builder_version,status,started_at_ms,finished_at_ms,log,worker";
constexpr const char* kQueueCols =
    "id,name,normalized_name,version,priority,registry,attempt,last_attempt_ms,queued_at_ms,claimed_by,claimed_at_ms";
constexpr const char* kCheckpointCols = "name,reference,version,updated_at_ms,lock_holder,lock_expires_at_ms";

std::string Select(const char* cols, const char* rest) {
  return std::string("SELECT ") + cols + " " + rest;
}

model::PackageRecord ReadPackage(const pqxx::row& row) {
  model::PackageRecord r;
  r.id                = row[0].as<uint64_t>();
  r.name              = row[1].c_str();
  r.normalized_name   = row[2].c_str();
  r.latest_release_id = row[3].as<uint64_t>();
  r.downloads         = row[4].as<uint64_t>();
  return r;
}

model::ReleaseRecord ReadRelease(const pqxx::row& row) {
  model::ReleaseRecord r;
  r.id               = row[0].as<uint64_t>();
  r.package_id       = row[1].as<uint64_t>();
  r.version          = row[2].c_str();
  r.yanked           = row[3].as<bool>();
  r.is_library       = row[4].as<bool>();
  r.dependencies     = sql::SplitList(row[5].c_str());
  r.targets          = sql::SplitList(row[6].c_str());
  r.default_target   = row[7].c_str();
  r.doc_targets      = sql::SplitList(row[8].c_str());
  r.has_docs         = row[9].as<bool>();
  r.documented_items = row[10].as<uint64_t>();
  r.total_items      = row[11].as<uint64_t>();
  return r;
}

model::BuildRecord ReadBuild(const pqxx::row& row) {
  model::BuildRecord r;
  r.id                = row[0].as<uint64_t>();
  r.release_id        = row[1].as<uint64_t>();
  r.toolchain_version = row[2].c_str();
  r.builder_version   = row[3].c_str();
  r.status            = static_cast<docbuild::v1::BuildStatus>(row[4].as<int>());
  r.started_at_ms     = row[5].as<uint64_t>();
  r.finished_at_ms    = row[6].as<uint64_t>();
  r.log               = row[7].c_str();
  r.worker            = row[8].c_str();
  return r;
}

model::QueueEntryRecord ReadQueueEntry(const pqxx::row& row) {
  model::QueueEntryRecord r;
  r.id              = row[0].as<uint64_t>();
  r.name            = row[1].c_str();
  r.normalized_name = row[2].c_str();
  r.version         = row[3].c_str();
  r.priority        = row[4].as<int32_t>();
  r.registry        = row[5].c_str();
  r.attempt         = row[6].as<uint32_t>();
  r.last_attempt_ms = row[7].as<uint64_t>();
  r.queued_at_ms    = row[8].as<uint64_t>();
  r.claimed_by      = row[9].c_str();
  r.claimed_at_ms   = row[10].as<uint64_t>();
  return r;
}

model::CheckpointRecord ReadCheckpoint(const pqxx::row& row) {
  model::CheckpointRecord r;
  r.name               = row[0].c_str();
  r.reference          = row[1].c_str();
  r.version            = row[2].as<uint64_t>();
  r.updated_at_ms      = row[3].as<uint64_t>();
  r.lock_holder        = row[4].c_str();
  r.lock_expires_at_ms = row[5].as<uint64_t>();
  return r;
}

model::SandboxOverrideRecord ReadOverride(const pqxx::row& row) {
  model::SandboxOverrideRecord r;
  r.normalized_name = row[0].c_str();
  if (!row[1].is_null()) r.memory_bytes = row[1].as<uint64_t>();
  if (!row[2].is_null()) r.timeout_seconds = row[2].as<uint32_t>();
  if (!row[3].is_null()) r.max_targets = row[3].as<uint32_t>();
  return r;
}

template <typename Reader>
auto First(const pqxx::result& res, Reader read) -> std::optional<decltype(read(res[0]))> {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

template <typename Reader>
auto All(const pqxx::result& res, Reader read) -> std::vector<decltype(read(res[0]))> {
  std::vector<decltype(read(res[0]))> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

Result Changed(const pqxx::result& res, ErrorCode none, const char* what) {
  if (res.affected_rows() == 0) return Result::Err(none, what);
  return Result::Ok();
}

std::optional<uint64_t> Widen(const std::optional<uint32_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<uint64_t>(*v);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Packages / releases
// ------------------------------------------------------------------

Result PgRepository::UpsertPackage(Transaction& t, model::PackageRecord& r) {
  try {
    // DO UPDATE (a no-op write) so RETURNING yields the existing row too
    auto res = TX(t).Work().exec_params(
        "INSERT INTO packages(name,normalized_name,latest_release_id,downloads) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(normalized_name) DO UPDATE SET normalized_name=EXCLUDED.normalized_name RETURNING " +
            std::string(kPackageCols) + ";",
        r.name, r.normalized_name, r.latest_release_id, r.downloads);
    r = ReadPackage(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PackageRecord> PgRepository::GetPackage(Transaction& t, const std::string& normalized_name) {
  return First(TX(t).Work().exec_params(Select(kPackageCols, "FROM packages WHERE normalized_name=$1;"), normalized_name), ReadPackage);
}

std::optional<model::PackageRecord> PgRepository::GetPackageById(Transaction& t, uint64_t package_id) {
  return First(TX(t).Work().exec_params(Select(kPackageCols, "FROM packages WHERE id=$1;"), package_id), ReadPackage);
}

std::vector<model::PackageRecord> PgRepository::ListPackages(Transaction& t) {
  return All(TX(t).Work().exec(Select(kPackageCols, "FROM packages ORDER BY id;")), ReadPackage);
}

Result PgRepository::SetLatestRelease(Transaction& t, uint64_t package_id, uint64_t release_id) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE packages SET latest_release_id=$2 WHERE id=$1;", package_id, release_id);
    return Changed(res, ErrorCode::NotFound, "package not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeletePackage(Transaction& t, uint64_t package_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM packages WHERE id=$1;", package_id);
    return Changed(res, ErrorCode::NotFound, "package not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertRelease(Transaction& t, model::ReleaseRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO releases(package_id,version,yanked,is_library,dependencies,targets) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(package_id,version) DO UPDATE SET yanked=EXCLUDED.yanked, is_library=EXCLUDED.is_library, "
        "dependencies=EXCLUDED.dependencies, targets=EXCLUDED.targets RETURNING " +
            std::string(kReleaseCols) + ";",
        r.package_id, r.version, r.yanked, r.is_library, sql::JoinList(r.dependencies), sql::JoinList(r.targets));
    r = ReadRelease(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReleaseRecord> PgRepository::GetRelease(Transaction& t, uint64_t package_id, const std::string& version) {
  return First(TX(t).Work().exec_params(Select(kReleaseCols, "FROM releases WHERE package_id=$1 AND version=$2;"), package_id, version),
               ReadRelease);
}

std::optional<model::ReleaseRecord> PgRepository::GetReleaseById(Transaction& t, uint64_t release_id) {
  return First(TX(t).Work().exec_params(Select(kReleaseCols, "FROM releases WHERE id=$1;"), release_id), ReadRelease);
}

Result PgRepository::DeleteRelease(Transaction& t, uint64_t release_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM releases WHERE id=$1;", release_id);
    return Changed(res, ErrorCode::NotFound, "release not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// READ COMMITTED: without the row lock two recomputes may each upsert a status from a stale build list
Result PgRepository::LockRelease(Transaction& t, uint64_t release_id) {
  try {
    auto res = TX(t).Work().exec_prepared("lock_release", release_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "release not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReleaseRecord> PgRepository::ListReleases(Transaction& t, uint64_t package_id) {
  return All(TX(t).Work().exec_params(Select(kReleaseCols, "FROM releases WHERE package_id=$1 ORDER BY id;"), package_id), ReadRelease);
}

std::vector<uint64_t> PgRepository::ListReleaseIds(Transaction& t) {
  return All(TX(t).Work().exec("SELECT id FROM releases ORDER BY id;"), [](const pqxx::row& row) { return row[0].as<uint64_t>(); });
}

Result PgRepository::SetReleaseYanked(Transaction& t, uint64_t release_id, bool yanked) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE releases SET yanked=$2 WHERE id=$1;", release_id, yanked);
    return Changed(res, ErrorCode::NotFound, "release not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateReleaseOutputs(Transaction& t, const model::ReleaseRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE releases SET is_library=$2,default_target=$3,doc_targets=$4,has_docs=$5,documented_items=$6,total_items=$7 WHERE id=$1;",
        r.id, r.is_library, r.default_target, sql::JoinList(r.doc_targets), r.has_docs, r.documented_items, r.total_items);
    return Changed(res, ErrorCode::NotFound, "release not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Builds / status
// ------------------------------------------------------------------

Result PgRepository::InsertBuild(Transaction& t, model::BuildRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO builds(release_id,toolchain_version,builder_version,status,started_at_ms,finished_at_ms,log,worker) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id;",
        r.release_id, r.toolchain_version, r.builder_version, static_cast<int>(r.status), r.started_at_ms, r.finished_at_ms, r.log,
        r.worker);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FinishBuild(Transaction& t, const model::BuildRecord& r) {
  try {
    // a concurrent finisher holds the row lock; the WHERE is re-checked against its committed status
    auto res = TX(t).Work().exec_prepared("finish_build", r.id, static_cast<int>(r.status), r.finished_at_ms, r.log,
                                          static_cast<int>(docbuild::v1::BUILD_STATUS_IN_PROGRESS));
    if (res.affected_rows() == 0) {
      if (!GetBuild(t, r.id)) return Result::Err(ErrorCode::NotFound, "build not found");
      return Result::Err(ErrorCode::Conflict, "build already finished");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BuildRecord> PgRepository::GetBuild(Transaction& t, uint64_t build_id) {
  return First(TX(t).Work().exec_params(Select(kBuildCols, "FROM builds WHERE id=$1;"), build_id), ReadBuild);
}

std::vector<model::BuildRecord> PgRepository::ListBuilds(Transaction& t, uint64_t release_id) {
  return All(TX(t).Work().exec_prepared("list_builds", release_id), ReadBuild);
}

std::vector<model::BuildRecord> PgRepository::ListInProgressBuilds(Transaction& t, uint64_t started_before_ms) {
  return All(TX(t).Work().exec_params(Select(kBuildCols, "FROM builds WHERE status=$1 AND started_at_ms<$2 ORDER BY id;"),
                                      static_cast<int>(docbuild::v1::BUILD_STATUS_IN_PROGRESS), started_before_ms),
             ReadBuild);
}

Result PgRepository::UpsertReleaseStatus(Transaction& t, const model::ReleaseStatusRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_release_status", r.release_id, static_cast<int>(r.status), r.last_build_time_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReleaseStatusRecord> PgRepository::GetReleaseStatus(Transaction& t, uint64_t release_id) {
  auto res = TX(t).Work().exec_params("SELECT release_id,status,last_build_time_ms FROM release_build_status WHERE release_id=$1;", release_id);
  return First(res, [](const pqxx::row& row) {
    model::ReleaseStatusRecord r;
    r.release_id         = row[0].as<uint64_t>();
    r.status             = static_cast<docbuild::v1::BuildStatus>(row[1].as<int>());
    r.last_build_time_ms = row[2].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Queue
// ------------------------------------------------------------------

Result PgRepository::InsertQueueEntry(Transaction& t, model::QueueEntryRecord& r) {
  try {
    // DO NOTHING keeps the transaction usable on duplicates
    auto res = TX(t).Work().exec_params(
        "INSERT INTO build_queue(name,normalized_name,version,priority,registry,attempt,last_attempt_ms,queued_at_ms,claimed_by,claimed_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) ON CONFLICT(normalized_name,version) DO NOTHING RETURNING id;",
        r.name, r.normalized_name, r.version, r.priority, r.registry, r.attempt, r.last_attempt_ms, r.queued_at_ms, r.claimed_by,
        r.claimed_at_ms);
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateQueueEntry(Transaction& t, const model::QueueEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE build_queue SET priority=$2,registry=$3,attempt=$4,last_attempt_ms=$5,queued_at_ms=$6,claimed_by=$7,claimed_at_ms=$8 "
        "WHERE id=$1;",
        r.id, r.priority, r.registry, r.attempt, r.last_attempt_ms, r.queued_at_ms, r.claimed_by, r.claimed_at_ms);
    return Changed(res, ErrorCode::NotFound, "queue entry not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteQueueEntry(Transaction& t, uint64_t entry_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM build_queue WHERE id=$1;", entry_id);
    return Changed(res, ErrorCode::NotFound, "queue entry not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::QueueEntryRecord> PgRepository::GetQueueEntry(Transaction& t, const std::string& normalized_name,
                                                                    const std::string& version) {
  return First(TX(t).Work().exec_params(Select(kQueueCols, "FROM build_queue WHERE normalized_name=$1 AND version=$2;"),
                                        normalized_name, version),
               ReadQueueEntry);
}

std::optional<model::QueueEntryRecord> PgRepository::GetQueueEntryById(Transaction& t, uint64_t entry_id) {
  return First(TX(t).Work().exec_params(Select(kQueueCols, "FROM build_queue WHERE id=$1;"), entry_id), ReadQueueEntry);
}

std::vector<model::QueueEntryRecord> PgRepository::ListQueueCandidates(Transaction& t, uint32_t max_attempts, std::size_t limit) {
  return All(TX(t).Work().exec_prepared("list_queue_candidates", max_attempts, static_cast<uint64_t>(limit)), ReadQueueEntry);
}

std::vector<model::QueueEntryRecord> PgRepository::ListQueue(Transaction& t) {
  return All(TX(t).Work().exec(Select(kQueueCols, "FROM build_queue ORDER BY priority ASC, id ASC;")), ReadQueueEntry);
}

Result PgRepository::ClaimQueueEntry(Transaction& t, uint64_t entry_id, const std::string& worker, uint64_t now_ms,
                                     uint64_t claim_expired_before_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("claim_queue_entry", entry_id, worker, now_ms, claim_expired_before_ms);
    return Changed(res, ErrorCode::Conflict, "queue entry already claimed");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Admission
// ------------------------------------------------------------------

Result PgRepository::UpsertPriorityRule(Transaction& t, model::PriorityRuleRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO priority_rules(pattern,priority) VALUES($1,$2) ON CONFLICT(pattern) DO UPDATE SET priority=EXCLUDED.priority "
        "RETURNING id;",
        r.pattern, r.priority);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeletePriorityRule(Transaction& t, const std::string& pattern) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM priority_rules WHERE pattern=$1;", pattern);
    return Changed(res, ErrorCode::NotFound, "priority rule not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PriorityRuleRecord> PgRepository::ListPriorityRules(Transaction& t) {
  return All(TX(t).Work().exec("SELECT id,pattern,priority FROM priority_rules ORDER BY id;"), [](const pqxx::row& row) {
    model::PriorityRuleRecord r;
    r.id       = row[0].as<uint64_t>();
    r.pattern  = row[1].c_str();
    r.priority = row[2].as<int32_t>();
    return r;
  });
}

Result PgRepository::InsertBlacklistEntry(Transaction& t, const std::string& normalized_name) {
  try {
    auto res = TX(t).Work().exec_params("INSERT INTO blacklist(normalized_name) VALUES($1) ON CONFLICT DO NOTHING;", normalized_name);
    return Changed(res, ErrorCode::AlreadyExists, "already blacklisted");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteBlacklistEntry(Transaction& t, const std::string& normalized_name) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM blacklist WHERE normalized_name=$1;", normalized_name);
    return Changed(res, ErrorCode::NotFound, "blacklist entry not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListBlacklist(Transaction& t) {
  return All(TX(t).Work().exec("SELECT normalized_name FROM blacklist ORDER BY normalized_name;"),
             [](const pqxx::row& row) { return std::string(row[0].c_str()); });
}

Result PgRepository::UpsertSandboxOverride(Transaction& t, const model::SandboxOverrideRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO sandbox_overrides(normalized_name,memory_bytes,timeout_seconds,max_targets) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(normalized_name) DO UPDATE SET memory_bytes=EXCLUDED.memory_bytes, timeout_seconds=EXCLUDED.timeout_seconds, "
        "max_targets=EXCLUDED.max_targets;",
        r.normalized_name, r.memory_bytes, Widen(r.timeout_seconds), Widen(r.max_targets));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSandboxOverride(Transaction& t, const std::string& normalized_name) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM sandbox_overrides WHERE normalized_name=$1;", normalized_name);
    return Changed(res, ErrorCode::NotFound, "sandbox override not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SandboxOverrideRecord> PgRepository::GetSandboxOverride(Transaction& t, const std::string& normalized_name) {
  return First(TX(t).Work().exec_params(
                   "SELECT normalized_name,memory_bytes,timeout_seconds,max_targets FROM sandbox_overrides WHERE normalized_name=$1;",
                   normalized_name),
               ReadOverride);
}

std::vector<model::SandboxOverrideRecord> PgRepository::ListSandboxOverrides(Transaction& t) {
  return All(TX(t).Work().exec("SELECT normalized_name,memory_bytes,timeout_seconds,max_targets FROM sandbox_overrides ORDER BY normalized_name;"),
             ReadOverride);
}

// ------------------------------------------------------------------
// Sync checkpoint
// ------------------------------------------------------------------

std::optional<model::CheckpointRecord> PgRepository::GetCheckpoint(Transaction& t, const std::string& name) {
  return First(TX(t).Work().exec_params(Select(kCheckpointCols, "FROM sync_checkpoints WHERE name=$1;"), name), ReadCheckpoint);
}

Result PgRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO sync_checkpoints(name,reference,version,updated_at_ms,lock_holder,lock_expires_at_ms) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT DO NOTHING;",
        r.name, r.reference, r.version, r.updated_at_ms, r.lock_holder, r.lock_expires_at_ms);
    return Changed(res, ErrorCode::AlreadyExists, "checkpoint exists");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CompareAndSwapCheckpoint(Transaction& t, const std::string& name, uint64_t expected_version,
                                              const std::string& reference, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE sync_checkpoints SET reference=$3, version=version+1, updated_at_ms=$4 WHERE name=$1 AND version=$2;", name,
        expected_version, reference, now_ms);
    return Changed(res, ErrorCode::Conflict, "checkpoint version moved");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AcquireCheckpointLock(Transaction& t, const std::string& name, const std::string& holder, uint64_t now_ms,
                                           uint64_t expires_at_ms) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE sync_checkpoints SET lock_holder=$2, lock_expires_at_ms=$3 "
        "WHERE name=$1 AND (lock_holder='' OR lock_holder=$2 OR lock_expires_at_ms<=$4);",
        name, holder, expires_at_ms, now_ms);
    return Changed(res, ErrorCode::Conflict, "checkpoint locked");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReleaseCheckpointLock(Transaction& t, const std::string& name, const std::string& holder) {
  try {
    TX(t).Work().exec_params("UPDATE sync_checkpoints SET lock_holder='', lock_expires_at_ms=0 WHERE name=$1 AND lock_holder=$2;", name,
                             holder);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<std::string> PgRepository::GetSetting(Transaction& t, const std::string& key) {
  return First(TX(t).Work().exec_params("SELECT value FROM settings WHERE key=$1;", key),
               [](const pqxx::row& row) { return std::string(row[0].c_str()); });
}

Result PgRepository::SetSetting(Transaction& t, const std::string& key, const std::string& value) {
  try {
    TX(t).Work().exec_params("INSERT INTO settings(key,value) VALUES($1,$2) ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value;", key,
                             value);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace docbuild::db::postgres
