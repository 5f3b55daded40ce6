#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace docbuild::status {

struct RepairReport {
  uint64_t releases_checked  = 0;
  uint64_t releases_repaired = 0;
};

/*
  StatusAggregator

  ReleaseStatus is a cache of Aggregate(builds). Every write to the builds
  of a release must call Recompute in the same transaction.

  CRITICAL GUARANTEES:

  - success wins over failure, failure over in_progress
  - last_build_time is the latest finished_at among concluded builds
  - Aggregate is order independent
  - Recompute holds the release row lock, so concurrent recomputes of one
    release apply in commit order
*/
class StatusAggregator {
 public:
  // How long a build of the named package may stay in_progress before it is abandoned.
  using AbandonWindowFn = std::function<std::chrono::seconds(db::Transaction&, const std::string& normalized_name)>;

  explicit StatusAggregator(std::shared_ptr<db::Repository> repository);

  static db::model::ReleaseStatusRecord Aggregate(uint64_t release_id, const std::vector<db::model::BuildRecord>& builds);

  db::model::ReleaseStatusRecord Recompute(db::Transaction& tx, uint64_t release_id);

  RepairReport RepairAll();

  /*
    Fails in_progress builds older than their window. min_window bounds the
    scan; window_for, when set, may only widen it per package. A build that
    concludes concurrently is left alone. Returns how many were failed.
  */
  uint64_t FailAbandonedBuilds(uint64_t now_ms, std::chrono::seconds min_window, const AbandonWindowFn& window_for = {});

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace docbuild::status
