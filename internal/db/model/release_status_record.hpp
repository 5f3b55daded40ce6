#pragma once

#include <cstdint>

#include "docbuild/v1/types.pb.h"

namespace docbuild::db::model {

/*
  Materialized aggregate of a release's builds. Always written by
  status::StatusAggregator, never edited directly.
*/
struct ReleaseStatusRecord {
  uint64_t                  release_id         = 0;
  docbuild::v1::BuildStatus status             = docbuild::v1::BUILD_STATUS_IN_PROGRESS;
  uint64_t                  last_build_time_ms = 0; // 0 = no concluded build

  bool operator==(const ReleaseStatusRecord&) const = default;
};

} // namespace docbuild::db::model
