#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace docbuild::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

namespace {

bool QueueOrder(const model::QueueEntryRecord& a, const model::QueueEntryRecord& b) {
  if (a.priority != b.priority) return a.priority < b.priority;
  return a.id < b.id;
}

template <typename Map, typename Pred>
void EraseIf(Map& map, Pred pred) {
  for (auto it = map.begin(); it != map.end();) {
    if (pred(it->second)) {
      it = map.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace

// ------------------------------------------------------------------
// Packages / releases
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPackage(Transaction& t, model::PackageRecord& r) {
  for (const auto& [id, existing] : TX(t).View().packages) {
    if (existing.normalized_name == r.normalized_name) {
      r = existing;
      return Result::Ok();
    }
  }

  auto& s = TX(t).Mutable();
  r.id    = s.next_package_id++;
  s.packages[r.id] = r;
  return Result::Ok();
}

std::optional<model::PackageRecord> MemoryRepository::GetPackage(Transaction& t, const std::string& normalized_name) {
  for (const auto& [id, r] : TX(t).View().packages) {
    if (r.normalized_name == normalized_name) return r;
  }
  return std::nullopt;
}

std::optional<model::PackageRecord> MemoryRepository::GetPackageById(Transaction& t, uint64_t package_id) {
  const auto& s  = TX(t).View();
  auto        it = s.packages.find(package_id);
  if (it == s.packages.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PackageRecord> MemoryRepository::ListPackages(Transaction& t) {
  std::vector<model::PackageRecord> out;
  for (const auto& [id, r] : TX(t).View().packages) out.push_back(r);
  return out;
}

Result MemoryRepository::SetLatestRelease(Transaction& t, uint64_t package_id, uint64_t release_id) {
  if (!TX(t).View().packages.contains(package_id)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().packages[package_id].latest_release_id = release_id;
  return Result::Ok();
}

Result MemoryRepository::DeletePackage(Transaction& t, uint64_t package_id) {
  if (!TX(t).View().packages.contains(package_id)) return Result::Err(ErrorCode::NotFound);

  auto& s = TX(t).Mutable();
  std::set<uint64_t> release_ids;
  for (const auto& [id, release] : s.releases) {
    if (release.package_id == package_id) release_ids.insert(id);
  }

  EraseIf(s.builds, [&](const model::BuildRecord& b) { return release_ids.contains(b.release_id); });
  EraseIf(s.statuses, [&](const model::ReleaseStatusRecord& st) { return release_ids.contains(st.release_id); });
  EraseIf(s.releases, [&](const model::ReleaseRecord& r) { return r.package_id == package_id; });
  s.packages.erase(package_id);
  return Result::Ok();
}

Result MemoryRepository::UpsertRelease(Transaction& t, model::ReleaseRecord& r) {
  if (!TX(t).View().packages.contains(r.package_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "release references unknown package");
  }

  auto& s = TX(t).Mutable();
  for (auto& [id, existing] : s.releases) {
    if (existing.package_id == r.package_id && existing.version == r.version) {
      existing.yanked       = r.yanked;
      existing.is_library   = r.is_library;
      existing.dependencies = r.dependencies;
      existing.targets      = r.targets;
      r                     = existing;
      return Result::Ok();
    }
  }

  r.id             = s.next_release_id++;
  s.releases[r.id] = r;
  return Result::Ok();
}

std::optional<model::ReleaseRecord> MemoryRepository::GetRelease(Transaction& t, uint64_t package_id, const std::string& version) {
  for (const auto& [id, r] : TX(t).View().releases) {
    if (r.package_id == package_id && r.version == version) return r;
  }
  return std::nullopt;
}

std::optional<model::ReleaseRecord> MemoryRepository::GetReleaseById(Transaction& t, uint64_t release_id) {
  const auto& s  = TX(t).View();
  auto        it = s.releases.find(release_id);
  if (it == s.releases.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteRelease(Transaction& t, uint64_t release_id) {
  if (!TX(t).View().releases.contains(release_id)) return Result::Err(ErrorCode::NotFound);

  auto& s = TX(t).Mutable();
  EraseIf(s.builds, [&](const model::BuildRecord& b) { return b.release_id == release_id; });
  s.statuses.erase(release_id);
  s.releases.erase(release_id);
  return Result::Ok();
}

Result MemoryRepository::LockRelease(Transaction& t, uint64_t release_id) {
  // commits are already serialized; a concurrent writer fails with Conflict
  if (!TX(t).View().releases.contains(release_id)) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::ReleaseRecord> MemoryRepository::ListReleases(Transaction& t, uint64_t package_id) {
  std::vector<model::ReleaseRecord> out;
  for (const auto& [id, r] : TX(t).View().releases) {
    if (r.package_id == package_id) out.push_back(r);
  }
  return out;
}

std::vector<uint64_t> MemoryRepository::ListReleaseIds(Transaction& t) {
  std::vector<uint64_t> out;
  for (const auto& [id, r] : TX(t).View().releases) out.push_back(id);
  return out;
}

Result MemoryRepository::SetReleaseYanked(Transaction& t, uint64_t release_id, bool yanked) {
  if (!TX(t).View().releases.contains(release_id)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().releases[release_id].yanked = yanked;
  return Result::Ok();
}

Result MemoryRepository::UpdateReleaseOutputs(Transaction& t, const model::ReleaseRecord& r) {
  if (!TX(t).View().releases.contains(r.id)) return Result::Err(ErrorCode::NotFound);

  auto& existing            = TX(t).Mutable().releases[r.id];
  existing.is_library       = r.is_library;
  existing.default_target   = r.default_target;
  existing.doc_targets      = r.doc_targets;
  existing.has_docs         = r.has_docs;
  existing.documented_items = r.documented_items;
  existing.total_items      = r.total_items;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Builds / status
// ------------------------------------------------------------------

Result MemoryRepository::InsertBuild(Transaction& t, model::BuildRecord& r) {
  if (!TX(t).View().releases.contains(r.release_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "build references unknown release");
  }

  auto& s = TX(t).Mutable();
  r.id    = s.next_build_id++;
  s.builds[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::FinishBuild(Transaction& t, const model::BuildRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.builds.find(r.id);
  if (it == view.builds.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != docbuild::v1::BUILD_STATUS_IN_PROGRESS) return Result::Err(ErrorCode::Conflict, "build already finished");

  auto& existing          = TX(t).Mutable().builds[r.id];
  existing.status         = r.status;
  existing.finished_at_ms = r.finished_at_ms;
  existing.log            = r.log;
  return Result::Ok();
}

std::optional<model::BuildRecord> MemoryRepository::GetBuild(Transaction& t, uint64_t build_id) {
  const auto& s  = TX(t).View();
  auto        it = s.builds.find(build_id);
  if (it == s.builds.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BuildRecord> MemoryRepository::ListBuilds(Transaction& t, uint64_t release_id) {
  std::vector<model::BuildRecord> out;
  for (const auto& [id, b] : TX(t).View().builds) {
    if (b.release_id == release_id) out.push_back(b);
  }
  return out;
}

std::vector<model::BuildRecord> MemoryRepository::ListInProgressBuilds(Transaction& t, uint64_t started_before_ms) {
  std::vector<model::BuildRecord> out;
  for (const auto& [id, b] : TX(t).View().builds) {
    if (b.status == docbuild::v1::BUILD_STATUS_IN_PROGRESS && b.started_at_ms < started_before_ms) out.push_back(b);
  }
  return out;
}

Result MemoryRepository::UpsertReleaseStatus(Transaction& t, const model::ReleaseStatusRecord& r) {
  if (!TX(t).View().releases.contains(r.release_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "status references unknown release");
  }
  TX(t).Mutable().statuses[r.release_id] = r;
  return Result::Ok();
}

std::optional<model::ReleaseStatusRecord> MemoryRepository::GetReleaseStatus(Transaction& t, uint64_t release_id) {
  const auto& s  = TX(t).View();
  auto        it = s.statuses.find(release_id);
  if (it == s.statuses.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Queue
// ------------------------------------------------------------------

Result MemoryRepository::InsertQueueEntry(Transaction& t, model::QueueEntryRecord& r) {
  if (GetQueueEntry(t, r.normalized_name, r.version)) return Result::Err(ErrorCode::AlreadyExists);

  auto& s = TX(t).Mutable();
  r.id    = s.next_queue_id++;
  s.queue[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateQueueEntry(Transaction& t, const model::QueueEntryRecord& r) {
  if (!TX(t).View().queue.contains(r.id)) return Result::Err(ErrorCode::NotFound);

  auto& existing           = TX(t).Mutable().queue[r.id];
  existing.priority        = r.priority;
  existing.registry        = r.registry;
  existing.attempt         = r.attempt;
  existing.last_attempt_ms = r.last_attempt_ms;
  existing.queued_at_ms    = r.queued_at_ms;
  existing.claimed_by      = r.claimed_by;
  existing.claimed_at_ms   = r.claimed_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteQueueEntry(Transaction& t, uint64_t entry_id) {
  if (!TX(t).View().queue.contains(entry_id)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().queue.erase(entry_id);
  return Result::Ok();
}

std::optional<model::QueueEntryRecord> MemoryRepository::GetQueueEntry(Transaction& t, const std::string& normalized_name,
                                                                        const std::string& version) {
  for (const auto& [id, e] : TX(t).View().queue) {
    if (e.normalized_name == normalized_name && e.version == version) return e;
  }
  return std::nullopt;
}

std::optional<model::QueueEntryRecord> MemoryRepository::GetQueueEntryById(Transaction& t, uint64_t entry_id) {
  const auto& s  = TX(t).View();
  auto        it = s.queue.find(entry_id);
  if (it == s.queue.end()) return std::nullopt;
  return it->second;
}

std::vector<model::QueueEntryRecord> MemoryRepository::ListQueueCandidates(Transaction& t, uint32_t max_attempts, std::size_t limit) {
  std::vector<model::QueueEntryRecord> out;
  for (const auto& [id, e] : TX(t).View().queue) {
    if (e.attempt < max_attempts) out.push_back(e);
  }
  std::sort(out.begin(), out.end(), QueueOrder);
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::QueueEntryRecord> MemoryRepository::ListQueue(Transaction& t) {
  std::vector<model::QueueEntryRecord> out;
  for (const auto& [id, e] : TX(t).View().queue) out.push_back(e);
  std::sort(out.begin(), out.end(), QueueOrder);
  return out;
}

Result MemoryRepository::ClaimQueueEntry(Transaction& t, uint64_t entry_id, const std::string& worker, uint64_t now_ms,
                                         uint64_t claim_expired_before_ms) {
  const auto& view = TX(t).View();
  auto        it   = view.queue.find(entry_id);
  if (it == view.queue.end()) return Result::Err(ErrorCode::Conflict, "queue entry vanished");
  if (!it->second.claimed_by.empty() && it->second.claimed_at_ms >= claim_expired_before_ms) {
    return Result::Err(ErrorCode::Conflict, "queue entry already claimed");
  }

  auto& e         = TX(t).Mutable().queue[entry_id];
  e.claimed_by    = worker;
  e.claimed_at_ms = now_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Admission
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPriorityRule(Transaction& t, model::PriorityRuleRecord& r) {
  auto& s = TX(t).Mutable();
  for (auto& [id, existing] : s.priority_rules) {
    if (existing.pattern == r.pattern) {
      existing.priority = r.priority;
      r                 = existing;
      return Result::Ok();
    }
  }
  r.id                   = s.next_rule_id++;
  s.priority_rules[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeletePriorityRule(Transaction& t, const std::string& pattern) {
  for (const auto& [id, r] : TX(t).View().priority_rules) {
    if (r.pattern == pattern) {
      TX(t).Mutable().priority_rules.erase(id);
      return Result::Ok();
    }
  }
  return Result::Err(ErrorCode::NotFound);
}

std::vector<model::PriorityRuleRecord> MemoryRepository::ListPriorityRules(Transaction& t) {
  std::vector<model::PriorityRuleRecord> out;
  for (const auto& [id, r] : TX(t).View().priority_rules) out.push_back(r);
  return out;
}

Result MemoryRepository::InsertBlacklistEntry(Transaction& t, const std::string& normalized_name) {
  if (TX(t).View().blacklist.contains(normalized_name)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().blacklist.insert(normalized_name);
  return Result::Ok();
}

Result MemoryRepository::DeleteBlacklistEntry(Transaction& t, const std::string& normalized_name) {
  if (!TX(t).View().blacklist.contains(normalized_name)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().blacklist.erase(normalized_name);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListBlacklist(Transaction& t) {
  const auto& b = TX(t).View().blacklist;
  return {b.begin(), b.end()};
}

Result MemoryRepository::UpsertSandboxOverride(Transaction& t, const model::SandboxOverrideRecord& r) {
  TX(t).Mutable().overrides[r.normalized_name] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSandboxOverride(Transaction& t, const std::string& normalized_name) {
  if (!TX(t).View().overrides.contains(normalized_name)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().overrides.erase(normalized_name);
  return Result::Ok();
}

std::optional<model::SandboxOverrideRecord> MemoryRepository::GetSandboxOverride(Transaction& t, const std::string& normalized_name) {
  const auto& s  = TX(t).View();
  auto        it = s.overrides.find(normalized_name);
  if (it == s.overrides.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SandboxOverrideRecord> MemoryRepository::ListSandboxOverrides(Transaction& t) {
  std::vector<model::SandboxOverrideRecord> out;
  for (const auto& [name, r] : TX(t).View().overrides) out.push_back(r);
  return out;
}

// ------------------------------------------------------------------
// Sync checkpoint
// ------------------------------------------------------------------

std::optional<model::CheckpointRecord> MemoryRepository::GetCheckpoint(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.checkpoints.find(name);
  if (it == s.checkpoints.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  if (TX(t).View().checkpoints.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().checkpoints[r.name] = r;
  return Result::Ok();
}

Result MemoryRepository::CompareAndSwapCheckpoint(Transaction& t, const std::string& name, uint64_t expected_version,
                                                  const std::string& reference, uint64_t now_ms) {
  auto current = GetCheckpoint(t, name);
  if (!current) return Result::Err(ErrorCode::Conflict, "checkpoint missing");
  if (current->version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "checkpoint version moved");
  }

  auto& cp         = TX(t).Mutable().checkpoints[name];
  cp.reference     = reference;
  cp.version       = expected_version + 1;
  cp.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::AcquireCheckpointLock(Transaction& t, const std::string& name, const std::string& holder, uint64_t now_ms,
                                               uint64_t expires_at_ms) {
  auto current = GetCheckpoint(t, name);
  if (!current) return Result::Err(ErrorCode::Conflict, "checkpoint missing");
  if (!current->lock_holder.empty() && current->lock_holder != holder && current->lock_expires_at_ms > now_ms) {
    return Result::Err(ErrorCode::Conflict, "checkpoint locked by " + current->lock_holder);
  }

  auto& cp              = TX(t).Mutable().checkpoints[name];
  cp.lock_holder        = holder;
  cp.lock_expires_at_ms = expires_at_ms;
  return Result::Ok();
}

Result MemoryRepository::ReleaseCheckpointLock(Transaction& t, const std::string& name, const std::string& holder) {
  auto current = GetCheckpoint(t, name);
  if (!current || current->lock_holder != holder) return Result::Ok();

  auto& cp              = TX(t).Mutable().checkpoints[name];
  cp.lock_holder.clear();
  cp.lock_expires_at_ms = 0;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<std::string> MemoryRepository::GetSetting(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.settings.find(key);
  if (it == s.settings.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetSetting(Transaction& t, const std::string& key, const std::string& value) {
  TX(t).Mutable().settings[key] = value;
  return Result::Ok();
}

} // namespace docbuild::db::memory
