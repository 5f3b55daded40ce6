#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace docbuild::db::model {

/*
  One published version of a package. Unique (package_id, version).

  Registry metadata (yanked, is_library, dependencies, targets) is written
  by synchronization; build outputs (default_target, doc_targets, has_docs,
  coverage) are written by the executor.
*/
struct ReleaseRecord {
  uint64_t    id         = 0;
  uint64_t    package_id = 0;
  std::string version;

  // registry metadata
  bool                     yanked     = false;
  bool                     is_library = true;
  std::vector<std::string> dependencies;
  std::vector<std::string> targets;

  // build outputs
  std::string              default_target;
  std::vector<std::string> doc_targets;
  bool                     has_docs         = false;
  uint64_t                 documented_items = 0;
  uint64_t                 total_items      = 0;
};

} // namespace docbuild::db::model
