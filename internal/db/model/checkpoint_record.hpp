#pragma once

#include <cstdint>
#include <string>

namespace docbuild::db::model {

/*
  Sync progress pointer.

  version is bumped on every reference change and is the compare-and-swap
  token. lock_holder/lock_expires_at_ms guard the mutating phase of a sync.
  An empty reference means "read the index from the beginning".
*/
struct CheckpointRecord {
  std::string name;
  std::string reference;
  uint64_t    version       = 0;
  uint64_t    updated_at_ms = 0;

  std::string lock_holder;
  uint64_t    lock_expires_at_ms = 0;
};

} // namespace docbuild::db::model
