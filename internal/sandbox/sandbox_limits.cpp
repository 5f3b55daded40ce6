#include "sandbox_limits.hpp"

#include <algorithm>

namespace docbuild::sandbox {

SandboxLimits LimitsFromConfig(const docbuild::runtime::config::SandboxLimitsConfig& config) {
  SandboxLimits limits;
  limits.memory_bytes  = config.memory_bytes();
  limits.timeout       = std::chrono::seconds(config.timeout_seconds());
  limits.max_targets   = std::max<uint32_t>(config.max_targets(), 1);
  limits.networking    = config.networking();
  limits.max_log_bytes = config.max_log_bytes();
  return limits;
}

SandboxLimits ResolveLimits(const SandboxLimits& defaults, const std::optional<db::model::SandboxOverrideRecord>& override_record) {
  SandboxLimits limits = defaults;
  if (override_record) {
    if (override_record->memory_bytes) {
      limits.memory_bytes = *override_record->memory_bytes;
    }
    if (override_record->timeout_seconds) {
      limits.timeout = std::chrono::seconds(*override_record->timeout_seconds);
    }
    if (override_record->max_targets) {
      limits.max_targets = *override_record->max_targets;
    } else if (override_record->timeout_seconds) {
      // a raised timeout pays for one target, not all of them
      limits.max_targets = 1;
    }
  }
  limits.max_targets = std::max<uint32_t>(limits.max_targets, 1);
  return limits;
}

} // namespace docbuild::sandbox
