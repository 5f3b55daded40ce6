#include "internal/sandbox/doc_builder.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/status/status_aggregator.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using docbuild::db::memory::MemoryRepository;
using docbuild::queue::AttemptOutcome;
using docbuild::sandbox::BuildEnvironment;
using docbuild::sandbox::DocBuilder;
using docbuild::sandbox::DocBuilderOptions;
using docbuild::sandbox::TargetBuildRequest;
using docbuild::sandbox::TargetBuildResult;
using docbuild::sandbox::Termination;
using docbuild::v1::BUILD_STATUS_FAILURE;
using docbuild::v1::BUILD_STATUS_SUCCESS;

enum class Script { kDocs, kNoDocs, kFail, kTimeout, kThrow };

/*
  Scripted environment. Each target behaves as configured (default: docs
  written), every request is recorded.
*/
class FakeEnvironment final : public BuildEnvironment {
 public:
  TargetBuildResult BuildTarget(const TargetBuildRequest& request) override {
    requests.push_back(request);
    if (during_build) {
      during_build();
    }

    const auto it     = scripts.find(request.target);
    const auto script = it == scripts.end() ? Script::kDocs : it->second;

    TargetBuildResult result;
    result.doc_dir = request.output_dir / "doc";
    result.log     = "building " + request.target;

    switch (script) {
      case Script::kThrow:
        throw docbuild::util::SandboxError("sandbox setup failed");
      case Script::kTimeout:
        result.termination = Termination::kTimeout;
        result.exit_code   = 128 + 9;
        return result;
      case Script::kFail:
        result.exit_code = 101;
        return result;
      case Script::kNoDocs:
        result.exit_code = 0;
        return result;
      case Script::kDocs: {
        fs::create_directories(result.doc_dir);
        std::ofstream(result.doc_dir / "index.html") << "<html></html>";
        result.exit_code = 0;
        docbuild::v1::DocCoverage coverage;
        coverage.set_total_items(10);
        coverage.set_documented_items(8);
        result.coverage = coverage;
        return result;
      }
    }
    return result;
  }

  std::map<std::string, Script>   scripts;
  std::vector<TargetBuildRequest> requests;
  std::function<void()>           during_build;
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeEnvironment>  env  = std::make_shared<FakeEnvironment>();
  fs::path                          work = fs::temp_directory_path() / ("docbuild_doc_builder_" + std::to_string(getpid()));
  uint64_t                          now  = 5000;

  DocBuilder MakeBuilder() {
    DocBuilderOptions options;
    options.worker                     = "builder-1";
    options.builder_version            = "docbuild 1.0";
    options.toolchain_version          = "rustc 1.80.0";
    options.work_dir                   = work;
    options.default_target             = "x86_64-unknown-linux-gnu";
    options.default_limits.max_targets = 2;
    options.default_limits.timeout     = std::chrono::seconds(900);
    return DocBuilder(repo, env, options, docbuild::sandbox::DefaultDocOutputPredicate, [this] { return now++; });
  }

  void SeedRelease(const std::string& name, const std::string& version, std::vector<std::string> targets, bool is_library = true) {
    auto                               tx = repo->Begin();
    docbuild::db::model::PackageRecord package{.name = name, .normalized_name = name};
    assert(repo->UpsertPackage(*tx, package));
    docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = version, .is_library = is_library};
    release.targets = std::move(targets);
    assert(repo->UpsertRelease(*tx, release));
    tx->Commit();
  }

  docbuild::db::model::ReleaseRecord Release(const std::string& name, const std::string& version) {
    auto tx      = repo->Begin();
    auto package = repo->GetPackage(*tx, name);
    assert(package.has_value());
    auto release = repo->GetRelease(*tx, package->id, version);
    assert(release.has_value());
    tx->Commit();
    return *release;
  }

  docbuild::v1::BuildStatus Status(uint64_t release_id) {
    auto tx     = repo->Begin();
    auto status = repo->GetReleaseStatus(*tx, release_id);
    tx->Commit();
    assert(status.has_value());
    return status->status;
  }

  ~Fixture() {
    std::error_code ec;
    fs::remove_all(work, ec);
  }
};

void TestSuccessfulBuildRecordsOutputs() {
  Fixture f;
  f.SeedRelease("serde", "1.0.0", {"x86_64-unknown-linux-gnu", "i686-pc-windows-msvc", "aarch64-apple-darwin"});
  auto builder = f.MakeBuilder();

  auto outcome = builder.Build("serde", "1.0.0");
  assert(outcome.status == BUILD_STATUS_SUCCESS);
  assert(outcome.attempt == AttemptOutcome::kSuccess);

  // capped at max_targets, default first
  assert(f.env->requests.size() == 2);
  assert(f.env->requests[0].target == "x86_64-unknown-linux-gnu");
  assert(f.env->requests[0].default_target);
  assert(f.env->requests[1].target == "i686-pc-windows-msvc");
  assert(!f.env->requests[1].default_target);
  assert(outcome.doc_targets.size() == 2);

  auto release = f.Release("serde", "1.0.0");
  assert(release.has_docs);
  assert(release.default_target == "x86_64-unknown-linux-gnu");
  assert(release.doc_targets.size() == 2);
  assert(release.total_items == 10);
  assert(release.documented_items == 8);
  assert(f.Status(release.id) == BUILD_STATUS_SUCCESS);

  auto tx    = f.repo->Begin();
  auto build = f.repo->GetBuild(*tx, outcome.build_id);
  assert(build.has_value());
  assert(build->status == BUILD_STATUS_SUCCESS);
  assert(build->worker == "builder-1");
  assert(build->toolchain_version == "rustc 1.80.0");
  assert(build->finished_at_ms > build->started_at_ms);
  assert(build->log.find("==> x86_64-unknown-linux-gnu") != std::string::npos);
  assert(f.repo->GetPackage(*tx, "serde")->latest_release_id == release.id);
  tx->Commit();

  // work directories are removed
  assert(!fs::exists(f.work) || fs::is_empty(f.work));
}

void TestFailedDefaultTargetSkipsOthers() {
  Fixture f;
  f.SeedRelease("broken", "0.1.0", {"x86_64-unknown-linux-gnu", "i686-pc-windows-msvc"});
  f.env->scripts["x86_64-unknown-linux-gnu"] = Script::kFail;
  auto builder                               = f.MakeBuilder();

  auto outcome = builder.Build("broken", "0.1.0");
  assert(outcome.status == BUILD_STATUS_FAILURE);
  assert(outcome.attempt == AttemptOutcome::kFailure);
  assert(f.env->requests.size() == 1);

  auto release = f.Release("broken", "0.1.0");
  assert(!release.has_docs);
  assert(release.doc_targets.empty());
  assert(f.Status(release.id) == BUILD_STATUS_FAILURE);
}

void TestTimeoutIsFailure() {
  Fixture f;
  f.SeedRelease("slow", "1.0.0", {});
  f.env->scripts["x86_64-unknown-linux-gnu"] = Script::kTimeout;
  auto builder                               = f.MakeBuilder();

  auto outcome = builder.Build("slow", "1.0.0");
  assert(outcome.status == BUILD_STATUS_FAILURE);
  assert(outcome.attempt == AttemptOutcome::kFailure);
}

void TestFailedRebuildKeepsSuccessfulOutputs() {
  Fixture f;
  f.SeedRelease("serde", "1.0.0", {"x86_64-unknown-linux-gnu"});
  auto builder = f.MakeBuilder();

  assert(builder.Build("serde", "1.0.0").status == BUILD_STATUS_SUCCESS);

  f.env->scripts["x86_64-unknown-linux-gnu"] = Script::kFail;
  auto rebuild                               = builder.Build("serde", "1.0.0");
  assert(rebuild.status == BUILD_STATUS_FAILURE);

  auto release = f.Release("serde", "1.0.0");
  assert(release.has_docs);
  assert(release.doc_targets.size() == 1);
  assert(f.Status(release.id) == BUILD_STATUS_SUCCESS);
}

void TestSecondaryFailureDoesNotChangeOutcome() {
  Fixture f;
  f.SeedRelease("winonly", "1.0.0", {"x86_64-unknown-linux-gnu", "i686-pc-windows-msvc"});
  f.env->scripts["i686-pc-windows-msvc"] = Script::kFail;
  auto builder                           = f.MakeBuilder();

  auto outcome = builder.Build("winonly", "1.0.0");
  assert(outcome.status == BUILD_STATUS_SUCCESS);
  assert(outcome.doc_targets.size() == 1);
  assert(f.env->requests.size() == 2);
}

void TestEnvironmentErrorIsInfrastructure() {
  Fixture f;
  f.SeedRelease("serde", "1.0.0", {});
  f.env->scripts["x86_64-unknown-linux-gnu"] = Script::kThrow;
  auto builder                               = f.MakeBuilder();

  auto outcome = builder.Build("serde", "1.0.0");
  assert(outcome.status == BUILD_STATUS_FAILURE);
  assert(outcome.attempt == AttemptOutcome::kInfrastructureError);

  auto tx    = f.repo->Begin();
  auto build = f.repo->GetBuild(*tx, outcome.build_id);
  assert(build->status == BUILD_STATUS_FAILURE);
  assert(build->log.find("internal error: sandbox setup failed") != std::string::npos);
  tx->Commit();
}

void TestBinaryWithoutDocsSucceeds() {
  Fixture f;
  f.SeedRelease("cli-tool", "2.0.0", {}, false);
  f.env->scripts["x86_64-unknown-linux-gnu"] = Script::kNoDocs;
  auto builder                               = f.MakeBuilder();

  auto outcome = builder.Build("cli-tool", "2.0.0");
  assert(outcome.status == BUILD_STATUS_SUCCESS);
  assert(!f.Release("cli-tool", "2.0.0").has_docs);

  // a library without docs is a failure
  f.SeedRelease("empty-lib", "1.0.0", {});
  f.env->requests.clear();
  assert(builder.Build("empty-lib", "1.0.0").status == BUILD_STATUS_FAILURE);
}

void TestSandboxOverrideApplies() {
  Fixture f;
  f.SeedRelease("huge", "1.0.0", {"x86_64-unknown-linux-gnu", "i686-pc-windows-msvc"});
  {
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertSandboxOverride(*tx, docbuild::db::model::SandboxOverrideRecord{
                                                  .normalized_name = "huge", .memory_bytes = 8ULL << 30, .timeout_seconds = 7200, .max_targets = 1}));
    tx->Commit();
  }
  auto builder = f.MakeBuilder();

  builder.Build("huge", "1.0.0");
  assert(f.env->requests.size() == 1);
  assert(f.env->requests[0].limits.timeout == std::chrono::seconds(7200));
  assert(f.env->requests[0].limits.memory_bytes == (8ULL << 30));
}

void TestUnknownReleaseUsesConfiguredDefaultTarget() {
  Fixture f;
  auto    builder = f.MakeBuilder();

  docbuild::db::model::QueueEntryRecord entry;
  entry.name       = "Fresh_Crate";
  entry.version    = "0.0.1";
  entry.claimed_by = "worker-7";

  auto outcome = builder.Build(entry);
  assert(outcome.status == BUILD_STATUS_SUCCESS);
  assert(f.env->requests.size() == 1);
  assert(f.env->requests[0].target == "x86_64-unknown-linux-gnu");

  auto tx = f.repo->Begin();
  assert(f.repo->GetBuild(*tx, outcome.build_id)->worker == "worker-7");
  assert(f.repo->GetPackage(*tx, "fresh-crate").has_value());
  tx->Commit();
}

void TestTimeoutOverrideBuildsDefaultTargetOnly() {
  Fixture f;
  f.SeedRelease("slow", "1.0.0", {"x86_64-unknown-linux-gnu", "i686-pc-windows-msvc"});
  {
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertSandboxOverride(*tx, {.normalized_name = "slow", .timeout_seconds = 3600}));
    tx->Commit();
  }
  auto builder = f.MakeBuilder();

  auto outcome = builder.Build("slow", "1.0.0");
  assert(outcome.status == BUILD_STATUS_SUCCESS);
  assert(f.env->requests.size() == 1);
  assert(f.env->requests[0].limits.max_targets == 1);
  assert(f.env->requests[0].limits.timeout == std::chrono::seconds(3600));
}

void TestLateResultAfterAbandonIsDiscarded() {
  Fixture f;
  f.SeedRelease("serde", "1.0.0", {});
  auto builder = f.MakeBuilder();

  // the sweep fails the attempt while the sandbox is still running
  docbuild::status::StatusAggregator aggregator(f.repo);
  f.env->during_build = [&] { assert(aggregator.FailAbandonedBuilds(1'000'000, std::chrono::seconds(0)) == 1); };

  auto outcome = builder.Build("serde", "1.0.0");
  assert(outcome.status == BUILD_STATUS_FAILURE);
  assert(outcome.attempt == AttemptOutcome::kInfrastructureError);
  assert(outcome.doc_targets.empty());

  auto release = f.Release("serde", "1.0.0");
  assert(!release.has_docs);
  assert(f.Status(release.id) == BUILD_STATUS_FAILURE);

  auto tx    = f.repo->Begin();
  auto build = f.repo->GetBuild(*tx, outcome.build_id);
  assert(build->status == BUILD_STATUS_FAILURE);
  assert(build->log == "abandoned");
  tx->Commit();
}

} // namespace

int main() {
  TestSuccessfulBuildRecordsOutputs();
  TestFailedDefaultTargetSkipsOthers();
  TestTimeoutIsFailure();
  TestFailedRebuildKeepsSuccessfulOutputs();
  TestSecondaryFailureDoesNotChangeOutcome();
  TestEnvironmentErrorIsInfrastructure();
  TestBinaryWithoutDocsSucceeds();
  TestSandboxOverrideApplies();
  TestUnknownReleaseUsesConfiguredDefaultTarget();
  TestTimeoutOverrideBuildsDefaultTargetOnly();
  TestLateResultAfterAbandonIsDiscarded();

  std::cout << "docbuild_unit_doc_builder: pass\n";
  return 0;
}
