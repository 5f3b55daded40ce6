#pragma once

#include <cstdint>
#include <string>

namespace docbuild::db::model {

/*
  Persistent package row.

  name is the spelling first observed in the registry; normalized_name is
  the unique key (see util::NormalizeName).
*/
struct PackageRecord {
  uint64_t    id = 0;
  std::string name;
  std::string normalized_name;

  // 0 = no latest release (none built or all yanked)
  uint64_t latest_release_id = 0;

  uint64_t downloads = 0;
};

} // namespace docbuild::db::model
