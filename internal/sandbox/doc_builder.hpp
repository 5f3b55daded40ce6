#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "internal/catalog/release_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/sandbox/build_environment.hpp"
#include "internal/status/status_aggregator.hpp"

namespace docbuild::sandbox {

// Decides whether a default-target build produced usable documentation.
using DocOutputPredicate = std::function<bool(const TargetBuildResult& result, bool is_library)>;

/*
  Exit 0 and, for libraries, a non-empty documentation directory.
  Non-library releases succeed without documentation.
*/
bool DefaultDocOutputPredicate(const TargetBuildResult& result, bool is_library);

struct DocBuilderOptions {
  std::string           worker = "docbuild";
  std::string           builder_version;
  std::string           toolchain_version;
  std::filesystem::path work_dir = "/tmp/docbuild";
  std::string           default_target;
  SandboxLimits         default_limits;
  bool                  keep_work_dirs = false;
};

struct BuildOutcome {
  uint64_t                  build_id = 0;
  docbuild::v1::BuildStatus status   = docbuild::v1::BUILD_STATUS_FAILURE;
  queue::AttemptOutcome     attempt  = queue::AttemptOutcome::kFailure;
  std::vector<std::string>  doc_targets;
};

/*
  DocBuilder

  Builds one release and records exactly one BuildAttempt for it.

  CRITICAL GUARANTEES:

  - The attempt is committed in_progress before any work starts
  - The attempt always ends success or failure; timeouts and memory
    kills are failures
  - A failed rebuild never clears the outputs of a successful release
  - Errors of the builder itself mark the attempt failure and report
    AttemptOutcome::kInfrastructureError
  - An attempt already failed as abandoned keeps that result; the late
    outcome is discarded and reported as kInfrastructureError
*/
class DocBuilder {
 public:
  using ClockFn = std::function<uint64_t()>;

  DocBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<BuildEnvironment> environment,
             DocBuilderOptions options, DocOutputPredicate predicate = DefaultDocOutputPredicate, ClockFn clock = {});

  // worker defaults to options.worker
  BuildOutcome Build(const std::string& name, const std::string& version, const std::string& worker = {});

  // Recorded under the worker holding the entry's claim.
  BuildOutcome Build(const db::model::QueueEntryRecord& entry);

 private:
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<BuildEnvironment> environment_;
  catalog::ReleaseCatalog           catalog_;
  status::StatusAggregator          aggregator_;
  DocBuilderOptions                 options_;
  DocOutputPredicate                predicate_;
  ClockFn                           clock_;
};

} // namespace docbuild::sandbox
