#include "internal/sandbox/sandbox_limits.hpp"

#include <cassert>
#include <iostream>
#include <optional>

namespace {

using docbuild::db::model::SandboxOverrideRecord;
using docbuild::sandbox::LimitsFromConfig;
using docbuild::sandbox::ResolveLimits;
using docbuild::sandbox::SandboxLimits;

SandboxLimits Defaults() {
  docbuild::runtime::config::SandboxLimitsConfig config;
  config.set_memory_bytes(3ULL << 30);
  config.set_timeout_seconds(900);
  config.set_max_targets(10);
  config.set_networking(false);
  config.set_max_log_bytes(4096);
  return LimitsFromConfig(config);
}

void TestConfigIsCopied() {
  const auto limits = Defaults();
  assert(limits.memory_bytes == (3ULL << 30));
  assert(limits.timeout == std::chrono::seconds(900));
  assert(limits.max_targets == 10);
  assert(!limits.networking);
  assert(limits.max_log_bytes == 4096);
}

void TestNoOverrideKeepsDefaults() {
  assert(ResolveLimits(Defaults(), std::nullopt) == Defaults());
}

void TestPartialOverride() {
  SandboxOverrideRecord record{.normalized_name = "big-crate", .memory_bytes = 6ULL << 30};

  const auto limits = ResolveLimits(Defaults(), record);
  assert(limits.memory_bytes == (6ULL << 30));
  assert(limits.timeout == std::chrono::seconds(900));
  assert(limits.max_targets == 10);
  assert(limits.max_log_bytes == 4096);
}

void TestTimeoutOverrideBuildsDefaultTargetOnly() {
  SandboxOverrideRecord record{.normalized_name = "big-crate", .timeout_seconds = 3600};

  const auto limits = ResolveLimits(Defaults(), record);
  assert(limits.timeout == std::chrono::seconds(3600));
  assert(limits.memory_bytes == (3ULL << 30));
  assert(limits.max_targets == 1);
}

void TestExplicitTargetsWinOverTimeoutRule() {
  SandboxOverrideRecord record{.normalized_name = "big-crate", .timeout_seconds = 3600, .max_targets = 4};

  const auto limits = ResolveLimits(Defaults(), record);
  assert(limits.timeout == std::chrono::seconds(3600));
  assert(limits.max_targets == 4);
}

void TestTargetsOverrideAboveDefault() {
  SandboxOverrideRecord record{.normalized_name = "multi", .max_targets = 20};

  const auto limits = ResolveLimits(Defaults(), record);
  assert(limits.max_targets == 20);
  assert(limits.timeout == std::chrono::seconds(900));
}

void TestEmptyOverrideKeepsDefaults() {
  SandboxOverrideRecord record{.normalized_name = "plain"};
  assert(ResolveLimits(Defaults(), record) == Defaults());
}

void TestZeroTargetsConfigClampsToOne() {
  docbuild::runtime::config::SandboxLimitsConfig config;
  config.set_timeout_seconds(60);
  const auto limits = LimitsFromConfig(config);
  assert(limits.max_targets == 1);
  assert(limits.memory_bytes == 0);
  assert(limits.max_log_bytes == 0);
}

void TestMaxTargetsNeverBelowOne() {
  SandboxOverrideRecord record{.normalized_name = "tiny", .memory_bytes = 1ULL << 30, .max_targets = 0};

  const auto limits = ResolveLimits(Defaults(), record);
  assert(limits.memory_bytes == (1ULL << 30));
  assert(limits.max_targets == 1);
}

} // namespace

int main() {
  TestConfigIsCopied();
  TestNoOverrideKeepsDefaults();
  TestPartialOverride();
  TestTimeoutOverrideBuildsDefaultTargetOnly();
  TestExplicitTargetsWinOverTimeoutRule();
  TestTargetsOverrideAboveDefault();
  TestEmptyOverrideKeepsDefaults();
  TestZeroTargetsConfigClampsToOne();
  TestMaxTargetsNeverBelowOne();

  std::cout << "docbuild_unit_sandbox_limits: pass\n";
  return 0;
}
