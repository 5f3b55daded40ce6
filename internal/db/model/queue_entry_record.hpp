#pragma once

#include <cstdint>
#include <string>

namespace docbuild::db::model {

/*
  Pending build request. Unique (normalized_name, version); id grows with
  insertion order and breaks priority ties.

  claimed_by/claimed_at mark an entry as in flight. A claim older than the
  queue's claim timeout is considered abandoned.
*/
struct QueueEntryRecord {
  uint64_t    id = 0;
  std::string name;
  std::string normalized_name;
  std::string version;
  int32_t     priority = 0;
  std::string registry;

  uint32_t attempt         = 0;
  uint64_t last_attempt_ms = 0; // 0 = never attempted
  uint64_t queued_at_ms    = 0;

  std::string claimed_by; // empty = unclaimed
  uint64_t    claimed_at_ms = 0;
};

} // namespace docbuild::db::model
