#pragma once

#include "docbuild/v1/query_service.pb.h"
#include "internal/catalog/release_catalog.hpp"
#include "service_context.hpp"

namespace docbuild::service {

/*
  Read-only views of release status, build history and the queue.
  Every call reads from one transaction.
*/
class QueryService {
 public:
  explicit QueryService(ServiceContext ctx);

  docbuild::v1::GetReleaseStatusResponse GetReleaseStatus(const docbuild::v1::GetReleaseStatusRequest& req);

  docbuild::v1::ListBuildsResponse ListBuilds(const docbuild::v1::ListBuildsRequest& req);

  docbuild::v1::GetBuildResponse GetBuild(const docbuild::v1::GetBuildRequest& req);

  docbuild::v1::ListQueueResponse ListQueue(const docbuild::v1::ListQueueRequest& req);

 private:
  // throws util::NotFound
  catalog::CatalogEntry FindRelease(db::Transaction& tx, const std::string& name, const std::string& version);

  ServiceContext          ctx_;
  catalog::ReleaseCatalog catalog_;
};

} // namespace docbuild::service
