#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/schema.hpp"

namespace docbuild::db::sqlite {

using docbuild::db::ErrorCode;
using docbuild::db::Result;

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

model::PackageRecord ReadPackage(const Statement& st) {
  model::PackageRecord r;
  r.id                = st.ColU64(0);
  r.name              = st.ColText(1);
  r.normalized_name   = st.ColText(2);
  r.latest_release_id = st.ColU64(3);
  r.downloads         = st.ColU64(4);
  return r;
}

model::ReleaseRecord ReadRelease(const Statement& st) {
  model::ReleaseRecord r;
  r.id               = st.ColU64(0);
  r.package_id       = st.ColU64(1);
  r.version          = st.ColText(2);
  r.yanked           = st.ColBool(3);
  r.is_library       = st.ColBool(4);
  r.dependencies     = sql::SplitList(st.ColText(5));
  r.targets          = sql::SplitList(st.ColText(6));
  r.default_target   = st.ColText(7);
  r.doc_targets      = sql::SplitList(st.ColText(8));
  r.has_docs         = st.ColBool(9);
  r.documented_items = st.ColU64(10);
  r.total_items      = st.ColU64(11);
  return r;
}

model::BuildRecord ReadBuild(const Statement& st) {
  model::BuildRecord r;
  r.id                = st.ColU64(0);
  r.release_id        = st.ColU64(1);
  r.toolchain_version = st.ColText(2);
  r.builder_version   = st.ColText(3);
  r.status            = static_cast<docbuild::v1::BuildStatus>(st.ColI64(4));
  r.started_at_ms     = st.ColU64(5);
  r.finished_at_ms    = st.ColU64(6);
  r.log               = st.ColText(7);
  r.worker            = st.ColText(8);
  return r;
}

model::QueueEntryRecord ReadQueueEntry(const Statement& st) {
  model::QueueEntryRecord r;
  r.id              = st.ColU64(0);
  r.name            = st.ColText(1);
  r.normalized_name = st.ColText(2);
  r.version         = st.ColText(3);
  r.priority        = static_cast<int32_t>(st.ColI64(4));
  r.registry        = st.ColText(5);
  r.attempt         = static_cast<uint32_t>(st.ColU64(6));
  r.last_attempt_ms = st.ColU64(7);
  r.queued_at_ms    = st.ColU64(8);
  r.claimed_by      = st.ColText(9);
  r.claimed_at_ms   = st.ColU64(10);
  return r;
}

model::CheckpointRecord ReadCheckpoint(const Statement& st) {
  model::CheckpointRecord r;
  r.name               = st.ColText(0);
  r.reference          = st.ColText(1);
  r.version            = st.ColU64(2);
  r.updated_at_ms      = st.ColU64(3);
  r.lock_holder        = st.ColText(4);
  r.lock_expires_at_ms = st.ColU64(5);
  return r;
}

template <typename Record, typename Reader>
std::optional<Record> QueryOne(Statement& st, Reader read) {
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return read(st);
}

template <typename Record, typename Reader>
std::vector<Record> QueryAll(Statement& st, Reader read) {
  std::vector<Record> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(read(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int ext = sqlite3_extended_errcode(db);
            if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::ExpectChange(sqlite3* db, int rc, ErrorCode none, const char* what) {
    auto result = Translate(db, rc);
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(none, what);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Packages / releases
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPackage(Transaction& t, model::PackageRecord& r) {
    if (auto existing = GetPackage(t, r.normalized_name)) {
        r = *existing;
        return Result::Ok();
    }

    auto* db = TX(t).Handle();
    Statement st(db, "INSERT INTO packages(name,normalized_name,latest_release_id,downloads) VALUES(?,?,?,?);");
    st.BindText(1, r.name);
    st.BindText(2, r.normalized_name);
    st.BindU64(3, r.latest_release_id);
    st.BindU64(4, r.downloads);

    auto result = Translate(db, st.Step());
    if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::PackageRecord> SqliteRepository::GetPackage(Transaction& t, const std::string& normalized_name) {
    Statement st(TX(t).Handle(), Select(kPackageCols, "FROM packages WHERE normalized_name=?;").c_str());
    st.BindText(1, normalized_name);
    return QueryOne<model::PackageRecord>(st, ReadPackage);
}

std::optional<model::PackageRecord> SqliteRepository::GetPackageById(Transaction& t, uint64_t package_id) {
    Statement st(TX(t).Handle(), Select(kPackageCols, "FROM packages WHERE id=?;").c_str());
    st.BindU64(1, package_id);
    return QueryOne<model::PackageRecord>(st, ReadPackage);
}

std::vector<model::PackageRecord> SqliteRepository::ListPackages(Transaction& t) {
    Statement st(TX(t).Handle(), Select(kPackageCols, "FROM packages ORDER BY id;").c_str());
    return QueryAll<model::PackageRecord>(st, ReadPackage);
}

Result SqliteRepository::SetLatestRelease(Transaction& t, uint64_t package_id, uint64_t release_id) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE packages SET latest_release_id=? WHERE id=?;");
    st.BindU64(1, release_id);
    st.BindU64(2, package_id);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "package not found");
}

Result SqliteRepository::DeletePackage(Transaction& t, uint64_t package_id) {
    auto* db = TX(t).Handle();
    // releases, builds and statuses go through ON DELETE CASCADE
    Statement st(db, "DELETE FROM packages WHERE id=?;");
    st.BindU64(1, package_id);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "package not found");
}

Result SqliteRepository::UpsertRelease(Transaction& t, model::ReleaseRecord& r) {
    auto* db = TX(t).Handle();
    {
        Statement st(db,
                     "INSERT INTO releases(package_id,version,yanked,is_library,dependencies,targets) VALUES(?,?,?,?,?,?) "
                     "ON CONFLICT(package_id,version) DO UPDATE SET yanked=excluded.yanked, is_library=excluded.is_library, "
                     "dependencies=excluded.dependencies, targets=excluded.targets;");
        st.BindU64(1, r.package_id);
        st.BindText(2, r.version);
        st.BindBool(3, r.yanked);
        st.BindBool(4, r.is_library);
        st.BindText(5, sql::JoinList(r.dependencies));
        st.BindText(6, sql::JoinList(r.targets));

        auto result = Translate(db, st.Step());
        if (!result) return result;
    }

    auto stored = GetRelease(t, r.package_id, r.version);
    if (!stored) return Result::Err(ErrorCode::InternalError, "release vanished after upsert");
    r = *stored;
    return Result::Ok();
}

std::optional<model::ReleaseRecord> SqliteRepository::GetRelease(Transaction& t, uint64_t package_id, const std::string& version) {
    Statement st(TX(t).Handle(), Select(kReleaseCols, "FROM releases WHERE package_id=? AND version=?;").c_str());
    st.BindU64(1, package_id);
    st.BindText(2, version);
    return QueryOne<model::ReleaseRecord>(st, ReadRelease);
}

std::optional<model::ReleaseRecord> SqliteRepository::GetReleaseById(Transaction& t, uint64_t release_id) {
    Statement st(TX(t).Handle(), Select(kReleaseCols, "FROM releases WHERE id=?;").c_str());
    st.BindU64(1, release_id);
    return QueryOne<model::ReleaseRecord>(st, ReadRelease);
}

Result SqliteRepository::DeleteRelease(Transaction& t, uint64_t release_id) {
    auto* db = TX(t).Handle();
    Statement st(db, "DELETE FROM releases WHERE id=?;");
    st.BindU64(1, release_id);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "release not found");
}

Result SqliteRepository::LockRelease(Transaction& t, uint64_t release_id) {
    // BEGIN IMMEDIATE already holds the database write lock
    Statement st(TX(t).Handle(), "SELECT id FROM releases WHERE id=?;");
    st.BindU64(1, release_id);
    if (st.Step() != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "release not found");
    return Result::Ok();
}

std::vector<model::ReleaseRecord> SqliteRepository::ListReleases(Transaction& t, uint64_t package_id) {
    Statement st(TX(t).Handle(), Select(kReleaseCols, "FROM releases WHERE package_id=? ORDER BY id;").c_str());
    st.BindU64(1, package_id);
    return QueryAll<model::ReleaseRecord>(st, ReadRelease);
}

std::vector<uint64_t> SqliteRepository::ListReleaseIds(Transaction& t) {
    Statement st(TX(t).Handle(), "SELECT id FROM releases ORDER BY id;");
    return QueryAll<uint64_t>(st, [](const Statement& s) { return s.ColU64(0); });
}

Result SqliteRepository::SetReleaseYanked(Transaction& t, uint64_t release_id, bool yanked) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE releases SET yanked=? WHERE id=?;");
    st.BindBool(1, yanked);
    st.BindU64(2, release_id);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "release not found");
}

Result SqliteRepository::UpdateReleaseOutputs(Transaction& t, const model::ReleaseRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "UPDATE releases SET is_library=?,default_target=?,doc_targets=?,has_docs=?,documented_items=?,total_items=? "
                 "WHERE id=?;");
    st.BindBool(1, r.is_library);
    st.BindText(2, r.default_target);
    st.BindText(3, sql::JoinList(r.doc_targets));
    st.BindBool(4, r.has_docs);
    st.BindU64(5, r.documented_items);
    st.BindU64(6, r.total_items);
    st.BindU64(7, r.id);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "release not found");
}

// ------------------------------------------------------------------
// Builds / status
// ------------------------------------------------------------------

Result SqliteRepository::InsertBuild(Transaction& t, model::BuildRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "INSERT INTO builds(release_id,toolchain_version,builder_version,status,started_at_ms,finished_at_ms,log,worker) "
                 "VALUES(?,?,?,?,?,?,?,?);");
    st.BindU64(1, r.release_id);
    st.BindText(2, r.toolchain_version);
    st.BindText(3, r.builder_version);
    st.BindI64(4, static_cast<int64_t>(r.status));
    st.BindU64(5, r.started_at_ms);
    st.BindU64(6, r.finished_at_ms);
    st.BindText(7, r.log);
    st.BindText(8, r.worker);

    auto result = Translate(db, st.Step());
    if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

Result SqliteRepository::FinishBuild(Transaction& t, const model::BuildRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE builds SET status=?,finished_at_ms=?,log=? WHERE id=? AND status=?;");
    st.BindI64(1, static_cast<int64_t>(r.status));
    st.BindU64(2, r.finished_at_ms);
    st.BindText(3, r.log);
    st.BindU64(4, r.id);
    st.BindI64(5, static_cast<int64_t>(docbuild::v1::BUILD_STATUS_IN_PROGRESS));

    auto result = ExpectChange(db, st.Step(), ErrorCode::Conflict, "build already finished");
    if (result.code == ErrorCode::Conflict && !GetBuild(t, r.id)) {
        return Result::Err(ErrorCode::NotFound, "build not found");
    }
    return result;
}

std::optional<model::BuildRecord> SqliteRepository::GetBuild(Transaction& t, uint64_t build_id) {
    Statement st(TX(t).Handle(), Select(kBuildCols, "FROM builds WHERE id=?;").c_str());
    st.BindU64(1, build_id);
    return QueryOne<model::BuildRecord>(st, ReadBuild);
}

std::vector<model::BuildRecord> SqliteRepository::ListBuilds(Transaction& t, uint64_t release_id) {
    Statement st(TX(t).Handle(), Select(kBuildCols, "FROM builds WHERE release_id=? ORDER BY id;").c_str());
    st.BindU64(1, release_id);
    return QueryAll<model::BuildRecord>(st, ReadBuild);
}

std::vector<model::BuildRecord> SqliteRepository::ListInProgressBuilds(Transaction& t, uint64_t started_before_ms) {
    Statement st(TX(t).Handle(), Select(kBuildCols, "FROM builds WHERE status=? AND started_at_ms<? ORDER BY id;").c_str());
    st.BindI64(1, static_cast<int64_t>(docbuild::v1::BUILD_STATUS_IN_PROGRESS));
    st.BindU64(2, started_before_ms);
    return QueryAll<model::BuildRecord>(st, ReadBuild);
}

Result SqliteRepository::UpsertReleaseStatus(Transaction& t, const model::ReleaseStatusRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "INSERT INTO release_build_status(release_id,status,last_build_time_ms) VALUES(?,?,?) "
                 "ON CONFLICT(release_id) DO UPDATE SET status=excluded.status, last_build_time_ms=excluded.last_build_time_ms;");
    st.BindU64(1, r.release_id);
    st.BindI64(2, static_cast<int64_t>(r.status));
    st.BindU64(3, r.last_build_time_ms);
    return Translate(db, st.Step());
}

std::optional<model::ReleaseStatusRecord> SqliteRepository::GetReleaseStatus(Transaction& t, uint64_t release_id) {
    Statement st(TX(t).Handle(), "SELECT release_id,status,last_build_time_ms FROM release_build_status WHERE release_id=?;");
    st.BindU64(1, release_id);
    return QueryOne<model::ReleaseStatusRecord>(st, [](const Statement& s) {
        model::ReleaseStatusRecord r;
        r.release_id         = s.ColU64(0);
        r.status             = static_cast<docbuild::v1::BuildStatus>(s.ColI64(1));
        r.last_build_time_ms = s.ColU64(2);
        return r;
    });
}

// ------------------------------------------------------------------
// Queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertQueueEntry(Transaction& t, model::QueueEntryRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "INSERT INTO build_queue(name,normalized_name,version,priority,registry,attempt,last_attempt_ms,queued_at_ms,"
                 "claimed_by,claimed_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
    st.BindText(1, r.name);
    st.BindText(2, r.normalized_name);
    st.BindText(3, r.version);
    st.BindI64(4, r.priority);
    st.BindText(5, r.registry);
    st.BindU64(6, r.attempt);
    st.BindU64(7, r.last_attempt_ms);
    st.BindU64(8, r.queued_at_ms);
    st.BindText(9, r.claimed_by);
    st.BindU64(10, r.claimed_at_ms);

    auto result = Translate(db, st.Step());
    if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

Result SqliteRepository::UpdateQueueEntry(Transaction& t, const model::QueueEntryRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "UPDATE build_queue SET priority=?,registry=?,attempt=?,last_attempt_ms=?,queued_at_ms=?,claimed_by=?,claimed_at_ms=? "
                 "WHERE id=?;");
    st.BindI64(1, r.priority);
    st.BindText(2, r.registry);
    st.BindU64(3, r.attempt);
    st.BindU64(4, r.last_attempt_ms);
    st.BindU64(5, r.queued_at_ms);
    st.BindText(6, r.claimed_by);
    st.BindU64(7, r.claimed_at_ms);
    st.BindU64(8, r.id);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "queue entry not found");
}

Result SqliteRepository::DeleteQueueEntry(Transaction& t, uint64_t entry_id) {
    auto* db = TX(t).Handle();
    Statement st(db, "DELETE FROM build_queue WHERE id=?;");
    st.BindU64(1, entry_id);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "queue entry not found");
}

std::optional<model::QueueEntryRecord> SqliteRepository::GetQueueEntry(Transaction& t, const std::string& normalized_name,
                                                                        const std::string& version) {
    Statement st(TX(t).Handle(), Select(kQueueCols, "FROM build_queue WHERE normalized_name=? AND version=?;").c_str());
    st.BindText(1, normalized_name);
    st.BindText(2, version);
    return QueryOne<model::QueueEntryRecord>(st, ReadQueueEntry);
}

std::optional<model::QueueEntryRecord> SqliteRepository::GetQueueEntryById(Transaction& t, uint64_t entry_id) {
    Statement st(TX(t).Handle(), Select(kQueueCols, "FROM build_queue WHERE id=?;").c_str());
    st.BindU64(1, entry_id);
    return QueryOne<model::QueueEntryRecord>(st, ReadQueueEntry);
}

std::vector<model::QueueEntryRecord> SqliteRepository::ListQueueCandidates(Transaction& t, uint32_t max_attempts, std::size_t limit) {
    // BEGIN IMMEDIATE already serializes writers; no row locks needed
    Statement st(TX(t).Handle(), Select(kQueueCols, "FROM build_queue WHERE attempt<? ORDER BY priority ASC, id ASC LIMIT ?;").c_str());
    st.BindU64(1, max_attempts);
    st.BindU64(2, limit);
    return QueryAll<model::QueueEntryRecord>(st, ReadQueueEntry);
}

std::vector<model::QueueEntryRecord> SqliteRepository::ListQueue(Transaction& t) {
    Statement st(TX(t).Handle(), Select(kQueueCols, "FROM build_queue ORDER BY priority ASC, id ASC;").c_str());
    return QueryAll<model::QueueEntryRecord>(st, ReadQueueEntry);
}

Result SqliteRepository::ClaimQueueEntry(Transaction& t, uint64_t entry_id, const std::string& worker, uint64_t now_ms,
                                         uint64_t claim_expired_before_ms) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE build_queue SET claimed_by=?, claimed_at_ms=? WHERE id=? AND (claimed_by='' OR claimed_at_ms<?);");
    st.BindText(1, worker);
    st.BindU64(2, now_ms);
    st.BindU64(3, entry_id);
    st.BindU64(4, claim_expired_before_ms);
    return ExpectChange(db, st.Step(), ErrorCode::Conflict, "queue entry already claimed");
}

// ------------------------------------------------------------------
// Admission
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPriorityRule(Transaction& t, model::PriorityRuleRecord& r) {
    auto* db = TX(t).Handle();
    {
        Statement st(db,
                     "INSERT INTO priority_rules(pattern,priority) VALUES(?,?) "
                     "ON CONFLICT(pattern) DO UPDATE SET priority=excluded.priority;");
        st.BindText(1, r.pattern);
        st.BindI64(2, r.priority);
        auto result = Translate(db, st.Step());
        if (!result) return result;
    }

    Statement st(db, "SELECT id FROM priority_rules WHERE pattern=?;");
    st.BindText(1, r.pattern);
    if (st.Step() != SQLITE_ROW) return Result::Err(ErrorCode::InternalError, "priority rule vanished after upsert");
    r.id = st.ColU64(0);
    return Result::Ok();
}

Result SqliteRepository::DeletePriorityRule(Transaction& t, const std::string& pattern) {
    auto* db = TX(t).Handle();
    Statement st(db, "DELETE FROM priority_rules WHERE pattern=?;");
    st.BindText(1, pattern);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "priority rule not found");
}

std::vector<model::PriorityRuleRecord> SqliteRepository::ListPriorityRules(Transaction& t) {
    Statement st(TX(t).Handle(), "SELECT id,pattern,priority FROM priority_rules ORDER BY id;");
    return QueryAll<model::PriorityRuleRecord>(st, [](const Statement& s) {
        model::PriorityRuleRecord r;
        r.id       = s.ColU64(0);
        r.pattern  = s.ColText(1);
        r.priority = static_cast<int32_t>(s.ColI64(2));
        return r;
    });
}

Result SqliteRepository::InsertBlacklistEntry(Transaction& t, const std::string& normalized_name) {
    auto* db = TX(t).Handle();
    Statement st(db, "INSERT INTO blacklist(normalized_name) VALUES(?);");
    st.BindText(1, normalized_name);
    return Translate(db, st.Step());
}

Result SqliteRepository::DeleteBlacklistEntry(Transaction& t, const std::string& normalized_name) {
    auto* db = TX(t).Handle();
    Statement st(db, "DELETE FROM blacklist WHERE normalized_name=?;");
    st.BindText(1, normalized_name);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "blacklist entry not found");
}

std::vector<std::string> SqliteRepository::ListBlacklist(Transaction& t) {
    Statement st(TX(t).Handle(), "SELECT normalized_name FROM blacklist ORDER BY normalized_name;");
    return QueryAll<std::string>(st, [](const Statement& s) { return s.ColText(0); });
}

Result SqliteRepository::UpsertSandboxOverride(Transaction& t, const model::SandboxOverrideRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "INSERT INTO sandbox_overrides(normalized_name,memory_bytes,timeout_seconds,max_targets) VALUES(?,?,?,?) "
                 "ON CONFLICT(normalized_name) DO UPDATE SET memory_bytes=excluded.memory_bytes, "
                 "timeout_seconds=excluded.timeout_seconds, max_targets=excluded.max_targets;");
    st.BindText(1, r.normalized_name);
    st.BindOptU64(2, r.memory_bytes);
    st.BindOptU64(3, r.timeout_seconds ? std::optional<uint64_t>(*r.timeout_seconds) : std::nullopt);
    st.BindOptU64(4, r.max_targets ? std::optional<uint64_t>(*r.max_targets) : std::nullopt);
    return Translate(db, st.Step());
}

Result SqliteRepository::DeleteSandboxOverride(Transaction& t, const std::string& normalized_name) {
    auto* db = TX(t).Handle();
    Statement st(db, "DELETE FROM sandbox_overrides WHERE normalized_name=?;");
    st.BindText(1, normalized_name);
    return ExpectChange(db, st.Step(), ErrorCode::NotFound, "sandbox override not found");
}

namespace {

model::SandboxOverrideRecord ReadOverride(const Statement& s) {
    model::SandboxOverrideRecord r;
    r.normalized_name = s.ColText(0);
    if (!s.ColIsNull(1)) r.memory_bytes = s.ColU64(1);
    if (!s.ColIsNull(2)) r.timeout_seconds = static_cast<uint32_t>(s.ColU64(2));
    if (!s.ColIsNull(3)) r.max_targets = static_cast<uint32_t>(s.ColU64(3));
    return r;
}

} // namespace

std::optional<model::SandboxOverrideRecord> SqliteRepository::GetSandboxOverride(Transaction& t, const std::string& normalized_name) {
    Statement st(TX(t).Handle(),
                 "SELECT normalized_name,memory_bytes,timeout_seconds,max_targets FROM sandbox_overrides WHERE normalized_name=?;");
    st.BindText(1, normalized_name);
    return QueryOne<model::SandboxOverrideRecord>(st, ReadOverride);
}

std::vector<model::SandboxOverrideRecord> SqliteRepository::ListSandboxOverrides(Transaction& t) {
    Statement st(TX(t).Handle(),
                 "SELECT normalized_name,memory_bytes,timeout_seconds,max_targets FROM sandbox_overrides ORDER BY normalized_name;");
    return QueryAll<model::SandboxOverrideRecord>(st, ReadOverride);
}

// ------------------------------------------------------------------
// Sync checkpoint
// ------------------------------------------------------------------

std::optional<model::CheckpointRecord> SqliteRepository::GetCheckpoint(Transaction& t, const std::string& name) {
    Statement st(TX(t).Handle(), Select(kCheckpointCols, "FROM sync_checkpoints WHERE name=?;").c_str());
    st.BindText(1, name);
    return QueryOne<model::CheckpointRecord>(st, ReadCheckpoint);
}

Result SqliteRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "INSERT INTO sync_checkpoints(name,reference,version,updated_at_ms,lock_holder,lock_expires_at_ms) "
                 "VALUES(?,?,?,?,?,?);");
    st.BindText(1, r.name);
    st.BindText(2, r.reference);
    st.BindU64(3, r.version);
    st.BindU64(4, r.updated_at_ms);
    st.BindText(5, r.lock_holder);
    st.BindU64(6, r.lock_expires_at_ms);
    return Translate(db, st.Step());
}

Result SqliteRepository::CompareAndSwapCheckpoint(Transaction& t, const std::string& name, uint64_t expected_version,
                                                  const std::string& reference, uint64_t now_ms) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE sync_checkpoints SET reference=?, version=version+1, updated_at_ms=? WHERE name=? AND version=?;");
    st.BindText(1, reference);
    st.BindU64(2, now_ms);
    st.BindText(3, name);
    st.BindU64(4, expected_version);
    return ExpectChange(db, st.Step(), ErrorCode::Conflict, "checkpoint version moved");
}

Result SqliteRepository::AcquireCheckpointLock(Transaction& t, const std::string& name, const std::string& holder, uint64_t now_ms,
                                               uint64_t expires_at_ms) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "UPDATE sync_checkpoints SET lock_holder=?, lock_expires_at_ms=? "
                 "WHERE name=? AND (lock_holder='' OR lock_holder=? OR lock_expires_at_ms<=?);");
    st.BindText(1, holder);
    st.BindU64(2, expires_at_ms);
    st.BindText(3, name);
    st.BindText(4, holder);
    st.BindU64(5, now_ms);
    return ExpectChange(db, st.Step(), ErrorCode::Conflict, "checkpoint locked");
}

Result SqliteRepository::ReleaseCheckpointLock(Transaction& t, const std::string& name, const std::string& holder) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE sync_checkpoints SET lock_holder='', lock_expires_at_ms=0 WHERE name=? AND lock_holder=?;");
    st.BindText(1, name);
    st.BindText(2, holder);
    return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
    Statement st(TX(t).Handle(), "SELECT value FROM settings WHERE key=?;");
    st.BindText(1, key);
    return QueryOne<std::string>(st, [](const Statement& s) { return s.ColText(0); });
}

Result SqliteRepository::SetSetting(Transaction& t, const std::string& key, const std::string& value) {
    auto* db = TX(t).Handle();
    Statement st(db, "INSERT INTO settings(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    st.BindText(1, key);
    st.BindText(2, value);
    return Translate(db, st.Step());
}

} // namespace docbuild::db::sqlite
