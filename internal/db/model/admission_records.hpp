#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace docbuild::db::model {

// pattern uses SQL LIKE syntax; rules apply in id order
struct PriorityRuleRecord {
  uint64_t    id = 0;
  std::string pattern;
  int32_t     priority = 0;
};

// Sparse per-package limits; unset fields fall back to global defaults.
struct SandboxOverrideRecord {
  std::string             normalized_name;
  std::optional<uint64_t> memory_bytes;
  std::optional<uint32_t> timeout_seconds;
  std::optional<uint32_t> max_targets;
};

} // namespace docbuild::db::model
