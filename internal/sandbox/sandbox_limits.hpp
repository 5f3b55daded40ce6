#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "config/config.pb.h"
#include "internal/db/model/admission_records.hpp"

namespace docbuild::sandbox {

struct SandboxLimits {
  uint64_t             memory_bytes = 0; // 0 = unlimited
  std::chrono::seconds timeout{0};       // 0 = unlimited
  uint32_t             max_targets   = 1;
  bool                 networking    = false;
  uint64_t             max_log_bytes = 0; // 0 = unlimited

  bool operator==(const SandboxLimits&) const = default;
};

SandboxLimits LimitsFromConfig(const docbuild::runtime::config::SandboxLimitsConfig& config);

/*
  Merges a package override over the global defaults. Fields the override
  leaves unset keep the default, except that an override timeout without
  an override max_targets builds the default target only. max_targets is
  never below 1, the default target always builds.
*/
SandboxLimits ResolveLimits(const SandboxLimits& defaults, const std::optional<db::model::SandboxOverrideRecord>& override_record);

} // namespace docbuild::sandbox
