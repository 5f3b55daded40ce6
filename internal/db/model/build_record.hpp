#pragma once

#include <cstdint>
#include <string>

#include "docbuild/v1/types.pb.h"

namespace docbuild::db::model {

/*
  One executor invocation. Append-only: rows are inserted in_progress and
  later finished exactly once.
*/
struct BuildRecord {
  uint64_t id         = 0;
  uint64_t release_id = 0;

  std::string toolchain_version;
  std::string builder_version;

  docbuild::v1::BuildStatus status = docbuild::v1::BUILD_STATUS_IN_PROGRESS;

  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0; // 0 while in progress

  std::string log;
  std::string worker;
};

} // namespace docbuild::db::model
