#include "build_queue.hpp"

#include <algorithm>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/admission.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"

namespace docbuild::queue {

using db::model::QueueEntryRecord;

std::string_view ToString(AttemptOutcome outcome) {
  switch (outcome) {
    case AttemptOutcome::kSuccess:
      return "success";
    case AttemptOutcome::kFailure:
      return "failure";
    case AttemptOutcome::kInfrastructureError:
      return "infrastructure_error";
  }
  return "unknown";
}

BuildQueue::BuildQueue(std::shared_ptr<db::Repository> repository, QueueOptions options, ClockFn clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
  if (options_.max_attempts == 0) {
    throw std::invalid_argument("queue max_attempts must be positive");
  }
  if (options_.candidate_batch_size == 0) {
    options_.candidate_batch_size = 32;
  }
}

uint64_t BuildQueue::NowMs() const {
  return clock_ ? clock_() : util::NowMillis();
}

namespace {

uint64_t Before(uint64_t now_ms, std::chrono::seconds window) {
  const uint64_t window_ms = static_cast<uint64_t>(window.count()) * 1000;
  return now_ms > window_ms ? now_ms - window_ms : 0;
}

} // namespace

std::chrono::seconds BuildQueue::WindowFor(db::Transaction& tx, const std::string& normalized_name, std::chrono::seconds base) {
  auto override_record = repository_->GetSandboxOverride(tx, normalized_name);
  if (!override_record || !override_record->timeout_seconds) {
    return base;
  }
  const std::chrono::seconds timeout(*override_record->timeout_seconds);
  return timeout > options_.build_timeout ? base + (timeout - options_.build_timeout) : base;
}

std::chrono::seconds BuildQueue::ClaimTimeoutFor(db::Transaction& tx, const std::string& normalized_name) {
  return WindowFor(tx, normalized_name, options_.claim_timeout);
}

// ------------------------------------------------------------------
// Enqueue
// ------------------------------------------------------------------

EnqueueResult BuildQueue::Enqueue(db::Transaction& tx, const EnqueueRequest& request) {
  util::ValidateName(request.name);
  if (request.version.empty()) {
    throw util::InvalidArgument("version is required");
  }

  const auto normalized = util::NormalizeName(request.name);
  if (auto existing = repository_->GetQueueEntry(tx, normalized, request.version)) {
    // first priority wins; only the registry-origin tag is refreshed
    if (!request.registry.empty() && existing->registry != request.registry) {
      existing->registry = request.registry;
      db::ThrowIfError(repository_->UpdateQueueEntry(tx, *existing), "refresh queue entry registry");
    }
    return {std::move(*existing), false};
  }

  QueueEntryRecord entry;
  entry.name            = request.name;
  entry.normalized_name = normalized;
  entry.version         = request.version;
  entry.priority        = request.priority;
  entry.registry        = request.registry;
  entry.queued_at_ms    = NowMs();
  db::ThrowIfError(repository_->InsertQueueEntry(tx, entry), "enqueue " + normalized + " " + request.version);

  observability::Metrics::Instance().RecordQueuedBuild(entry.priority);
  DOCBUILD_LOG_INFO("queued build", {observability::StringField("name", normalized), observability::StringField("version", entry.version),
                                     observability::IntField("priority", entry.priority)});
  return {std::move(entry), true};
}

EnqueueResult BuildQueue::Enqueue(const EnqueueRequest& request) {
  return db::RetryOnConflict("enqueue", [&] {
    auto tx     = repository_->Begin();
    auto result = Enqueue(*tx, request);
    tx->Commit();
    return result;
  });
}

EnqueueResult BuildQueue::Requeue(const EnqueueRequest& request) {
  return db::RetryOnConflict("requeue", [&] {
    auto tx = repository_->Begin();

    const auto normalized = util::NormalizeName(request.name);
    auto       existing   = repository_->GetQueueEntry(*tx, normalized, request.version);
    if (!existing) {
      auto result = Enqueue(*tx, request);
      tx->Commit();
      return result;
    }

    existing->priority        = request.priority;
    existing->registry        = request.registry.empty() ? existing->registry : request.registry;
    existing->attempt         = 0;
    existing->last_attempt_ms = 0;
    existing->queued_at_ms    = NowMs();
    existing->claimed_by.clear();
    existing->claimed_at_ms = 0;
    db::ThrowIfError(repository_->UpdateQueueEntry(*tx, *existing), "requeue " + normalized + " " + request.version);
    tx->Commit();

    DOCBUILD_LOG_INFO("requeued build", {observability::StringField("name", normalized), observability::StringField("version", request.version),
                                         observability::IntField("priority", request.priority)});
    return EnqueueResult{std::move(*existing), false};
  });
}

// ------------------------------------------------------------------
// Dequeue
// ------------------------------------------------------------------

bool BuildQueue::IsStale(db::Transaction& tx, const QueueEntryRecord& entry) {
  auto package = repository_->GetPackage(tx, entry.normalized_name);
  if (!package) return false;
  auto release = repository_->GetRelease(tx, package->id, entry.version);
  if (!release) return false;

  for (const auto& build : repository_->ListBuilds(tx, release->id)) {
    if (build.status == docbuild::v1::BUILD_STATUS_SUCCESS && build.finished_at_ms >= entry.queued_at_ms) {
      return true;
    }
  }
  return false;
}

std::optional<QueueEntryRecord> BuildQueue::DequeueNext(const std::string& worker) {
  observability::SpanScope span("queue.dequeue");
  span.SetAttribute("worker", worker);

  return db::RetryOnConflict("dequeue", [&]() -> std::optional<QueueEntryRecord> {
    auto tx = repository_->Begin();
    if (IsLocked(*tx)) {
      return std::nullopt;
    }

    const uint64_t now      = NowMs();
    const uint64_t delay_ms = static_cast<uint64_t>(options_.delay_between_attempts.count()) * 1000;

    const BlacklistFilter blacklist(repository_->ListBlacklist(*tx));

    bool        pruned = false;
    std::size_t limit  = options_.candidate_batch_size;
    for (;;) {
      auto candidates = repository_->ListQueueCandidates(*tx, options_.max_attempts, limit);
      for (auto& candidate : candidates) {
        const uint64_t claim_expired = Before(now, ClaimTimeoutFor(*tx, candidate.normalized_name));
        if (!candidate.claimed_by.empty() && candidate.claimed_at_ms >= claim_expired) {
          continue;
        }
        if (candidate.last_attempt_ms != 0 && now < candidate.last_attempt_ms + delay_ms) {
          continue;
        }
        if (blacklist.IsBlocked(candidate.normalized_name)) {
          db::ThrowIfError(repository_->DeleteQueueEntry(*tx, candidate.id), "drop blacklisted queue entry");
          DOCBUILD_LOG_INFO("dropped blacklisted queue entry", {observability::StringField("name", candidate.normalized_name),
                                                                observability::StringField("version", candidate.version)});
          pruned = true;
          continue;
        }
        if (IsStale(*tx, candidate)) {
          db::ThrowIfError(repository_->DeleteQueueEntry(*tx, candidate.id), "prune stale queue entry");
          DOCBUILD_LOG_INFO("pruned stale queue entry", {observability::StringField("name", candidate.normalized_name),
                                                         observability::StringField("version", candidate.version)});
          pruned = true;
          continue;
        }

        auto claimed = repository_->ClaimQueueEntry(*tx, candidate.id, worker, now, claim_expired);
        if (claimed.code == db::ErrorCode::Conflict) {
          continue;
        }
        db::ThrowIfError(claimed, "claim queue entry");
        tx->Commit();

        candidate.claimed_by    = worker;
        candidate.claimed_at_ms = now;
        span.SetRelease(candidate.normalized_name, candidate.version);
        return candidate;
      }

      if (candidates.size() < limit) {
        break;
      }
      limit *= 2;
    }

    if (pruned) {
      tx->Commit();
    }
    return std::nullopt;
  });
}

void BuildQueue::RecordAttemptResult(const QueueEntryRecord& entry, AttemptOutcome outcome) {
  db::RetryOnConflict("record attempt result", [&] {
    auto tx      = repository_->Begin();
    auto current = repository_->GetQueueEntryById(*tx, entry.id);
    if (!current) {
      DOCBUILD_LOG_WARN("queue entry vanished before its result was recorded",
                        {observability::StringField("name", entry.normalized_name), observability::StringField("version", entry.version)});
      return;
    }
    if (current->claimed_by != entry.claimed_by || current->claimed_at_ms != entry.claimed_at_ms) {
      DOCBUILD_LOG_WARN("queue claim lost before result was recorded",
                        {observability::StringField("name", entry.normalized_name), observability::StringField("version", entry.version),
                         observability::StringField("claimed_by", current->claimed_by)});
      return;
    }

    const uint64_t now = NowMs();
    switch (outcome) {
      case AttemptOutcome::kSuccess:
        db::ThrowIfError(repository_->DeleteQueueEntry(*tx, current->id), "delete built queue entry");
        break;
      case AttemptOutcome::kFailure:
        current->attempt += 1;
        current->last_attempt_ms = now;
        current->claimed_by.clear();
        current->claimed_at_ms = 0;
        db::ThrowIfError(repository_->UpdateQueueEntry(*tx, *current), "record failed attempt");
        if (current->attempt >= options_.max_attempts) {
          DOCBUILD_LOG_WARN("queue entry reached max attempts",
                            {observability::StringField("name", current->normalized_name), observability::StringField("version", current->version),
                             observability::IntField("attempt", current->attempt)});
        }
        break;
      case AttemptOutcome::kInfrastructureError:
        current->last_attempt_ms = now;
        current->claimed_by.clear();
        current->claimed_at_ms = 0;
        db::ThrowIfError(repository_->UpdateQueueEntry(*tx, *current), "release queue claim");
        break;
    }
    tx->Commit();
  });
}

// ------------------------------------------------------------------
// Administration
// ------------------------------------------------------------------

QueueEntryRecord BuildQueue::ResetAttempts(const std::string& name, const std::string& version) {
  return db::RetryOnConflict("reset attempts", [&] {
    auto tx    = repository_->Begin();
    auto entry = repository_->GetQueueEntry(*tx, util::NormalizeName(name), version);
    if (!entry) {
      throw util::NotFound("queue entry not found: " + name + " " + version);
    }
    entry->attempt         = 0;
    entry->last_attempt_ms = 0;
    db::ThrowIfError(repository_->UpdateQueueEntry(*tx, *entry), "reset attempts");
    tx->Commit();
    return std::move(*entry);
  });
}

void BuildQueue::Remove(const std::string& name, const std::string& version) {
  db::RetryOnConflict("remove queue entry", [&] {
    auto tx    = repository_->Begin();
    auto entry = repository_->GetQueueEntry(*tx, util::NormalizeName(name), version);
    if (!entry) {
      throw util::NotFound("queue entry not found: " + name + " " + version);
    }
    db::ThrowIfError(repository_->DeleteQueueEntry(*tx, entry->id), "remove queue entry");
    tx->Commit();
  });
}

uint64_t BuildQueue::RemoveEntries(db::Transaction& tx, const std::string& normalized_name, const std::optional<std::string>& version) {
  uint64_t removed = 0;
  for (const auto& entry : repository_->ListQueue(tx)) {
    if (entry.normalized_name != normalized_name || (version && entry.version != *version)) {
      continue;
    }
    db::ThrowIfError(repository_->DeleteQueueEntry(tx, entry.id), "remove queue entry");
    ++removed;
  }
  if (removed > 0) {
    DOCBUILD_LOG_INFO("removed queue entries", {observability::StringField("name", normalized_name),
                                                observability::StringField("version", version.value_or("*")),
                                                observability::IntField("entries", static_cast<int64_t>(removed))});
  }
  return removed;
}

uint64_t BuildQueue::DeprioritizeOtherReleases(db::Transaction& tx, const std::string& normalized_name, const std::string& version,
                                               int32_t priority) {
  uint64_t changed = 0;
  for (auto& entry : repository_->ListQueue(tx)) {
    if (entry.normalized_name != normalized_name || entry.version == version || entry.priority >= priority) {
      continue;
    }
    entry.priority = priority;
    db::ThrowIfError(repository_->UpdateQueueEntry(tx, entry), "deprioritize queue entry");
    ++changed;
  }
  return changed;
}

uint64_t BuildQueue::QueueRebuilds(uint32_t max_queued) {
  observability::SpanScope span("queue.rebuilds");

  return db::RetryOnConflict("queue rebuilds", [&] {
    auto tx = repository_->Begin();

    uint64_t already_queued = 0;
    for (const auto& entry : repository_->ListQueue(*tx)) {
      if (entry.attempt < options_.max_attempts && entry.priority >= kRebuildPriority) {
        ++already_queued;
      }
    }
    if (already_queued >= max_queued) {
      tx->Commit();
      DOCBUILD_LOG_INFO("not queueing rebuilds, limit reached", {observability::IntField("queued", static_cast<int64_t>(already_queued))});
      return uint64_t{0};
    }

    struct Candidate {
      std::string name;
      std::string version;
      uint64_t    last_attempt_ms = 0;
    };
    std::vector<Candidate> candidates;
    for (const auto& package : repository_->ListPackages(*tx)) {
      if (package.latest_release_id == 0) continue;
      auto release = repository_->GetReleaseById(*tx, package.latest_release_id);
      if (!release || !release->has_docs) continue;

      Candidate candidate{package.name, release->version, 0};
      for (const auto& build : repository_->ListBuilds(*tx, release->id)) {
        candidate.last_attempt_ms = std::max(candidate.last_attempt_ms, build.finished_at_ms != 0 ? build.finished_at_ms : build.started_at_ms);
      }
      candidates.push_back(std::move(candidate));
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.last_attempt_ms < b.last_attempt_ms; });

    const uint64_t budget = max_queued - already_queued;
    if (candidates.size() > budget) {
      candidates.resize(budget);
    }

    uint64_t queued = 0;
    for (const auto& candidate : candidates) {
      EnqueueRequest request;
      request.name     = candidate.name;
      request.version  = candidate.version;
      request.priority = kRebuildPriority;
      if (Enqueue(*tx, request).created) {
        ++queued;
      }
    }
    tx->Commit();

    DOCBUILD_LOG_INFO("queued rebuilds", {observability::IntField("queued", static_cast<int64_t>(queued)),
                                          observability::IntField("limit", max_queued)});
    return queued;
  });
}

void BuildQueue::SetLocked(bool locked) {
  db::RetryOnConflict("set queue lock", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->SetSetting(*tx, kQueueLockedSetting, locked ? "1" : "0"), "set queue lock");
    tx->Commit();
  });
  DOCBUILD_LOG_INFO(locked ? "build queue locked" : "build queue unlocked");
}

void BuildQueue::Lock() {
  SetLocked(true);
}

void BuildQueue::Unlock() {
  SetLocked(false);
}

bool BuildQueue::IsLocked(db::Transaction& tx) {
  auto value = repository_->GetSetting(tx, kQueueLockedSetting);
  return value && *value == "1";
}

bool BuildQueue::IsLocked() {
  auto tx     = repository_->Begin();
  bool locked = IsLocked(*tx);
  tx->Commit();
  return locked;
}

std::vector<QueueEntryRecord> BuildQueue::List(bool include_failed) {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListQueue(*tx);
  tx->Commit();

  if (!include_failed) {
    std::erase_if(entries, [&](const QueueEntryRecord& e) { return e.attempt >= options_.max_attempts; });
  }
  return entries;
}

QueueStats BuildQueue::Stats() {
  auto tx = repository_->Begin();
  QueueStats stats;
  stats.locked = IsLocked(*tx);

  const uint64_t now = NowMs();
  for (const auto& entry : repository_->ListQueue(*tx)) {
    if (entry.attempt >= options_.max_attempts) {
      ++stats.failed;
      continue;
    }
    ++stats.pending;
    ++stats.pending_by_priority[entry.priority];
    if (!entry.claimed_by.empty() && entry.claimed_at_ms >= Before(now, ClaimTimeoutFor(*tx, entry.normalized_name))) {
      ++stats.in_flight;
    }
  }
  tx->Commit();

  auto& metrics = observability::Metrics::Instance();
  metrics.SetQueueDepth("pending", stats.pending);
  metrics.SetQueueDepth("failed", stats.failed);
  metrics.SetQueueDepth("in_flight", stats.in_flight);
  return stats;
}

} // namespace docbuild::queue
