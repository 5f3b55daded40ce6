#include "query_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/status/status_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docbuild::service {

using namespace docbuild::v1;

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)), catalog_(ctx_.repository) {
  if (!ctx_.repository || !ctx_.queue) {
    throw std::invalid_argument("QueryService requires repository and queue");
  }
}

catalog::CatalogEntry QueryService::FindRelease(db::Transaction& tx, const std::string& name, const std::string& version) {
  auto entry = catalog_.Find(tx, name, version);
  if (!entry) {
    throw util::NotFound("release not found: " + name + " " + version);
  }
  return std::move(*entry);
}

GetReleaseStatusResponse QueryService::GetReleaseStatus(const GetReleaseStatusRequest& req) {
  return ObserveRpc("QueryService.GetReleaseStatus", [&] {
    auto tx     = ctx_.repository->Begin();
    auto entry  = FindRelease(*tx, req.name(), req.version());
    auto status = ctx_.repository->GetReleaseStatus(*tx, entry.release.id);
    if (!status) {
      // no cached row yet, derive it from the builds
      status = status::StatusAggregator::Aggregate(entry.release.id, ctx_.repository->ListBuilds(*tx, entry.release.id));
    }
    tx->Commit();

    GetReleaseStatusResponse resp;
    auto*                    out = resp.mutable_status();
    out->set_name(entry.package.name);
    out->set_version(entry.release.version);
    out->set_status(status->status);
    if (status->last_build_time_ms != 0) {
      *out->mutable_last_build_time() = util::MillisToProto(status->last_build_time_ms);
    }
    out->set_yanked(entry.release.yanked);
    out->set_is_library(entry.release.is_library);
    out->set_has_docs(entry.release.has_docs);
    out->set_default_target(entry.release.default_target);
    out->set_documented_items(entry.release.documented_items);
    out->set_total_items(entry.release.total_items);
    out->set_is_latest(entry.package.latest_release_id == entry.release.id);
    return resp;
  });
}

ListBuildsResponse QueryService::ListBuilds(const ListBuildsRequest& req) {
  return ObserveRpc("QueryService.ListBuilds", [&] {
    auto tx     = ctx_.repository->Begin();
    auto entry  = FindRelease(*tx, req.name(), req.version());
    auto builds = ctx_.repository->ListBuilds(*tx, entry.release.id);
    tx->Commit();

    ListBuildsResponse resp;
    for (const auto& build : builds) {
      *resp.add_builds() = ToProto(build, entry.package.name, entry.release.version, req.include_logs());
    }
    return resp;
  });
}

GetBuildResponse QueryService::GetBuild(const GetBuildRequest& req) {
  return ObserveRpc("QueryService.GetBuild", [&] {
    auto tx    = ctx_.repository->Begin();
    auto build = ctx_.repository->GetBuild(*tx, req.id());
    if (!build) {
      throw util::NotFound("build not found: " + std::to_string(req.id()));
    }
    auto release = ctx_.repository->GetReleaseById(*tx, build->release_id);
    auto package = release ? ctx_.repository->GetPackageById(*tx, release->package_id) : std::nullopt;
    tx->Commit();
    if (!release || !package) {
      throw std::runtime_error("build " + std::to_string(req.id()) + " references a missing release");
    }

    GetBuildResponse resp;
    *resp.mutable_build() = ToProto(*build, package->name, release->version, true);
    return resp;
  });
}

ListQueueResponse QueryService::ListQueue(const ListQueueRequest& req) {
  return ObserveRpc("QueryService.ListQueue", [&] {
    ListQueueResponse resp;
    for (const auto& entry : ctx_.queue->List(req.include_failed())) {
      *resp.add_entries() = ToProto(entry);
    }
    *resp.mutable_stats() = ToProto(ctx_.queue->Stats());
    return resp;
  });
}

} // namespace docbuild::service
