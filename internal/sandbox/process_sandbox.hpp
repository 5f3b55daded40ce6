#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "internal/sandbox/build_environment.hpp"

namespace docbuild::sandbox {

struct ProcessSpec {
  std::vector<std::string>           argv;
  std::map<std::string, std::string> environment;
  std::filesystem::path              work_dir;
  SandboxLimits                      limits;
};

struct ProcessResult {
  int                       exit_code   = -1;
  Termination               termination = Termination::kExited;
  std::string               output; // stdout + stderr, interleaved
  bool                      truncated = false;
  std::chrono::milliseconds elapsed{0};
};

/*
  Runs argv in its own process group with the given limits.

  - memory: RLIMIT_AS in the child plus RSS polling of the whole group
  - timeout: SIGKILL to the whole group
  - networking off: fresh user + network namespace
  - output past max_log_bytes is dropped

  Throws util::SandboxError when the process could not be started.
*/
ProcessResult RunSandboxed(const ProcessSpec& spec);

// Replaces {name}, {version}, {target} and {output_dir} in every argument.
std::vector<std::string> ExpandCommand(const std::vector<std::string>& command_template, const TargetBuildRequest& request);

// First line of the command's output. Throws util::SandboxError when it fails.
std::string DetectToolchainVersion(const std::vector<std::string>& command);

struct ProcessSandboxOptions {
  std::vector<std::string>           command;
  std::map<std::string, std::string> environment;
  // relative to the target output directory
  std::string doc_subdir = "doc";
};

inline constexpr const char* kCoverageFileName = "doc-coverage.json";

class ProcessSandbox final : public BuildEnvironment {
 public:
  explicit ProcessSandbox(ProcessSandboxOptions options);

  TargetBuildResult BuildTarget(const TargetBuildRequest& request) override;

 private:
  ProcessSandboxOptions options_;
};

} // namespace docbuild::sandbox
