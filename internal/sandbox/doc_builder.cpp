#include "doc_builder.hpp"

#include <algorithm>
#include <chrono>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docbuild::sandbox {

namespace fs = std::filesystem;

using docbuild::v1::BUILD_STATUS_FAILURE;
using docbuild::v1::BUILD_STATUS_IN_PROGRESS;
using docbuild::v1::BUILD_STATUS_SUCCESS;

namespace {

bool HasFiles(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return false;
  }
  return fs::directory_iterator(dir, ec) != fs::directory_iterator();
}

void AppendSection(std::string& log, const std::string& target, const std::string& body) {
  log += "==> " + target + "\n";
  log += body;
  if (!body.empty() && body.back() != '\n') {
    log += '\n';
  }
}

} // namespace

bool DefaultDocOutputPredicate(const TargetBuildResult& result, bool is_library) {
  if (result.termination != Termination::kExited || result.exit_code != 0) {
    return false;
  }
  return !is_library || HasFiles(result.doc_dir);
}

DocBuilder::DocBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<BuildEnvironment> environment, DocBuilderOptions options,
                       DocOutputPredicate predicate, ClockFn clock)
    : repository_(std::move(repository)),
      environment_(std::move(environment)),
      catalog_(repository_),
      aggregator_(repository_),
      options_(std::move(options)),
      predicate_(std::move(predicate)),
      clock_(std::move(clock)) {
  if (!predicate_) {
    predicate_ = DefaultDocOutputPredicate;
  }
}

uint64_t DocBuilder::NowMs() const {
  return clock_ ? clock_() : util::NowMillis();
}

BuildOutcome DocBuilder::Build(const db::model::QueueEntryRecord& entry) {
  return Build(entry.name, entry.version, entry.claimed_by);
}

BuildOutcome DocBuilder::Build(const std::string& name, const std::string& version, const std::string& worker) {
  observability::SpanScope span("builder.build");
  span.SetRelease(name, version);
  const auto started = std::chrono::steady_clock::now();

  // 1. record the attempt before any work starts
  struct Started {
    catalog::CatalogEntry                               entry;
    db::model::BuildRecord                              build;
    std::optional<db::model::SandboxOverrideRecord>     override_record;
  };
  auto begun = db::RetryOnConflict("start build", [&] {
    auto    tx = repository_->Begin();
    Started s;
    s.entry           = catalog_.EnsureRelease(*tx, name, version);
    s.override_record = repository_->GetSandboxOverride(*tx, s.entry.package.normalized_name);

    s.build.release_id        = s.entry.release.id;
    s.build.toolchain_version = options_.toolchain_version;
    s.build.builder_version   = options_.builder_version;
    s.build.status            = BUILD_STATUS_IN_PROGRESS;
    s.build.started_at_ms     = NowMs();
    s.build.worker            = worker.empty() ? options_.worker : worker;
    db::ThrowIfError(repository_->InsertBuild(*tx, s.build), "insert build");
    aggregator_.Recompute(*tx, s.entry.release.id);
    tx->Commit();
    return s;
  });

  const auto& release = begun.entry.release;
  auto&       build   = begun.build;
  span.SetAttribute("build_id", static_cast<int64_t>(build.id));

  // 2. limits, once per build
  const auto limits = ResolveLimits(options_.default_limits, begun.override_record);

  BuildOutcome outcome;
  outcome.build_id = build.id;

  db::model::ReleaseRecord outputs = release;
  std::string              log;
  const auto work_root = options_.work_dir / (begun.entry.package.normalized_name + "-" + version + "-" + std::to_string(build.id));

  try {
    // 3. targets: default first, capped
    const std::string default_target = release.targets.empty() ? options_.default_target : release.targets.front();
    std::vector<std::string> targets{default_target};
    for (const auto& target : release.targets) {
      if (targets.size() >= limits.max_targets) break;
      if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
        targets.push_back(target);
      }
    }

    std::error_code ec;
    fs::create_directories(work_root, ec);
    if (ec) {
      throw util::SandboxError("cannot create work directory " + work_root.string() + ": " + ec.message());
    }

    auto request = [&](const std::string& target, bool is_default) {
      TargetBuildRequest r;
      r.name           = name;
      r.version        = version;
      r.target         = target;
      r.default_target = is_default;
      r.work_dir       = work_root;
      r.output_dir     = work_root / "out" / target;
      r.limits         = limits;
      return r;
    };

    // 4. default target decides the outcome
    auto       primary = environment_->BuildTarget(request(default_target, true));
    const bool usable  = predicate_(primary, release.is_library);
    AppendSection(log, default_target, primary.log);

    outputs.default_target = default_target;
    outputs.doc_targets.clear();
    outputs.has_docs         = usable && HasFiles(primary.doc_dir);
    outputs.documented_items = primary.coverage ? primary.coverage->documented_items() : 0;
    outputs.total_items      = primary.coverage ? primary.coverage->total_items() : 0;

    if (usable) {
      outputs.doc_targets.push_back(default_target);

      // 5. remaining targets never change the outcome
      for (std::size_t i = 1; i < targets.size(); ++i) {
        auto secondary = environment_->BuildTarget(request(targets[i], false));
        AppendSection(log, targets[i], secondary.log);
        if (predicate_(secondary, release.is_library)) {
          outputs.doc_targets.push_back(targets[i]);
        } else {
          DOCBUILD_LOG_WARN("secondary target failed", {observability::StringField("name", name), observability::StringField("version", version),
                                                        observability::StringField("target", targets[i])});
        }
      }
    }

    outcome.status  = usable ? BUILD_STATUS_SUCCESS : BUILD_STATUS_FAILURE;
    outcome.attempt = usable ? queue::AttemptOutcome::kSuccess : queue::AttemptOutcome::kFailure;
    if (primary.termination != Termination::kExited) {
      span.SetAttribute("termination", ToString(primary.termination));
    }
  } catch (const std::exception& e) {
    log += std::string("internal error: ") + e.what() + "\n";
    outcome.status  = BUILD_STATUS_FAILURE;
    outcome.attempt = queue::AttemptOutcome::kInfrastructureError;
    span.RecordException(e.what());
    DOCBUILD_LOG_ERROR("build aborted by internal error", {observability::StringField("name", name), observability::StringField("version", version),
                                                           observability::IntField("build_id", static_cast<int64_t>(build.id)),
                                                           observability::StringField("error", e.what())});
  }

  // 6. conclude in one transaction
  build.status         = outcome.status;
  build.finished_at_ms = NowMs();
  build.log            = std::move(log);
  const bool concluded = db::RetryOnConflict("finish build", [&] {
    auto tx       = repository_->Begin();
    auto finished = repository_->FinishBuild(*tx, build);
    if (finished.code == db::ErrorCode::Conflict || finished.code == db::ErrorCode::NotFound) {
      // failed as abandoned, or the release was deleted meanwhile
      tx->Rollback();
      return false;
    }
    db::ThrowIfError(finished, "finish build");

    auto       current      = repository_->GetReleaseStatus(*tx, release.id);
    const bool keep_outputs = outcome.status != BUILD_STATUS_SUCCESS &&
                              (outcome.attempt == queue::AttemptOutcome::kInfrastructureError ||
                               (current && current->status == BUILD_STATUS_SUCCESS));
    if (!keep_outputs) {
      db::ThrowIfError(repository_->UpdateReleaseOutputs(*tx, outputs), "update release outputs");
    }
    catalog_.RefreshLatest(*tx, release.package_id);
    aggregator_.Recompute(*tx, release.id);
    tx->Commit();
    return true;
  });

  if (!concluded) {
    DOCBUILD_LOG_WARN("build was concluded elsewhere, result discarded",
                      {observability::StringField("name", name), observability::StringField("version", version),
                       observability::IntField("build_id", static_cast<int64_t>(build.id))});
    outcome.status  = BUILD_STATUS_FAILURE;
    outcome.attempt = queue::AttemptOutcome::kInfrastructureError;
    outputs.doc_targets.clear();
  }

  if (!options_.keep_work_dirs) {
    std::error_code ec;
    fs::remove_all(work_root, ec);
    if (ec) {
      DOCBUILD_LOG_WARN("failed to remove work directory",
                        {observability::StringField("path", work_root.string()), observability::StringField("error", ec.message())});
    }
  }

  outcome.doc_targets   = outputs.doc_targets;
  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  const auto label      = queue::ToString(outcome.attempt);
  auto&      metrics    = observability::Metrics::Instance();
  metrics.RecordBuildOutcome(label);
  metrics.ObserveBuildDurationMs(label, elapsed_ms);

  DOCBUILD_LOG_INFO("build finished", {observability::StringField("name", name), observability::StringField("version", version),
                                       observability::IntField("build_id", static_cast<int64_t>(build.id)),
                                       observability::StringField("outcome", label),
                                       observability::DurationMsField("duration_ms", elapsed_ms)});
  return outcome;
}

} // namespace docbuild::sandbox
