#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace docbuild::queue {

struct QueueOptions {
  uint32_t             max_attempts = 5;
  std::chrono::seconds delay_between_attempts{60};
  // a claim older than this is treated as abandoned
  std::chrono::seconds claim_timeout{7200};
  std::size_t          candidate_batch_size = 32;
  // default sandbox timeout; a package override above it widens that package's windows
  std::chrono::seconds build_timeout{15 * 60};
};

struct EnqueueRequest {
  std::string name;
  std::string version;
  int32_t     priority = 0;
  std::string registry;
};

struct EnqueueResult {
  db::model::QueueEntryRecord entry;
  bool                        created = false;
};

enum class AttemptOutcome {
  kSuccess,
  kFailure,
  kInfrastructureError,
};

std::string_view ToString(AttemptOutcome outcome);

struct QueueStats {
  uint64_t                    pending   = 0; // attempt < max_attempts
  uint64_t                    failed    = 0; // attempt >= max_attempts, inert
  uint64_t                    in_flight = 0; // live claim
  std::map<int32_t, uint64_t> pending_by_priority;
  bool                        locked = false;
};

inline constexpr const char* kQueueLockedSetting = "queue_locked";

/*
  BuildQueue

  Durable queue of (name, version) build requests on top of
  db::Repository.

  CRITICAL GUARANTEES:

  - Enqueue is an idempotent upsert: an existing entry keeps its priority
    and attempt count
  - DequeueNext hands an entry to exactly one worker (conditional claim)
  - A claim stays live for claim_timeout plus however far the package's
    sandbox timeout override exceeds build_timeout
  - DequeueNext drops blacklisted entries instead of claiming them
  - Entries at max_attempts are never dequeued and never deleted
    implicitly; ResetAttempts / Requeue / Remove are the only way out
  - Lock() pauses dequeuing without touching queued state
*/
class BuildQueue {
 public:
  using ClockFn = std::function<uint64_t()>;

  BuildQueue(std::shared_ptr<db::Repository> repository, QueueOptions options, ClockFn clock = {});

  EnqueueResult Enqueue(db::Transaction& tx, const EnqueueRequest& request);
  EnqueueResult Enqueue(const EnqueueRequest& request);

  // Administrative re-enqueue: resets attempts, claim and queued_at.
  EnqueueResult Requeue(const EnqueueRequest& request);

  std::optional<db::model::QueueEntryRecord> DequeueNext(const std::string& worker);

  // base widened by however far the package's sandbox timeout override exceeds build_timeout
  std::chrono::seconds WindowFor(db::Transaction& tx, const std::string& normalized_name, std::chrono::seconds base);
  std::chrono::seconds ClaimTimeoutFor(db::Transaction& tx, const std::string& normalized_name);

  // entry must be the record returned by DequeueNext
  void RecordAttemptResult(const db::model::QueueEntryRecord& entry, AttemptOutcome outcome);

  db::model::QueueEntryRecord ResetAttempts(const std::string& name, const std::string& version);
  void                        Remove(const std::string& name, const std::string& version);

  // Deletes every entry of the package, or only its version when one is given. Returns how many.
  uint64_t RemoveEntries(db::Transaction& tx, const std::string& normalized_name, const std::optional<std::string>& version = std::nullopt);

  // Raises every other queued version of the package to at least priority.
  uint64_t DeprioritizeOtherReleases(db::Transaction& tx, const std::string& normalized_name, const std::string& version, int32_t priority);

  /*
    Queues the latest documented release of the packages whose last build
    attempt is oldest, at kRebuildPriority, until max_queued pending entries
    have a priority value of kRebuildPriority or more. Returns how many were
    queued.
  */
  uint64_t QueueRebuilds(uint32_t max_queued);

  void Lock();
  void Unlock();
  bool IsLocked();
  bool IsLocked(db::Transaction& tx);

  std::vector<db::model::QueueEntryRecord> List(bool include_failed = true);
  QueueStats                               Stats();

  const QueueOptions& Options() const {
    return options_;
  }

 private:
  bool     IsStale(db::Transaction& tx, const db::model::QueueEntryRecord& entry);
  void     SetLocked(bool locked);
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  QueueOptions                    options_;
  ClockFn                         clock_;
};

} // namespace docbuild::queue
