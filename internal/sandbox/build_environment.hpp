#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "docbuild/v1/registry.pb.h"
#include "internal/sandbox/sandbox_limits.hpp"

namespace docbuild::sandbox {

enum class Termination {
  kExited,
  kTimeout,
  kMemoryLimit,
  kSignaled,
};

std::string_view ToString(Termination termination);

struct TargetBuildRequest {
  std::string           name;
  std::string           version;
  std::string           target;
  bool                  default_target = false;
  std::filesystem::path work_dir;
  std::filesystem::path output_dir;
  SandboxLimits         limits;
};

struct TargetBuildResult {
  int                                     exit_code   = -1;
  Termination                             termination = Termination::kExited;
  std::string                             log;
  std::filesystem::path                   doc_dir;
  std::optional<docbuild::v1::DocCoverage> coverage;
};

/*
  Runs the documentation tool for one (release, target).

  A failing build is a normal result. Implementations throw
  util::SandboxError only when the environment itself could not be set up.
*/
class BuildEnvironment {
 public:
  virtual ~BuildEnvironment() = default;

  virtual TargetBuildResult BuildTarget(const TargetBuildRequest& request) = 0;
};

} // namespace docbuild::sandbox
