#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "docbuild/v1/query_service.grpc.pb.h"
#include "internal/service/query_service.hpp"

namespace docbuild::grpc {

class QueryServer final : public docbuild::v1::DocBuildQueryService::Service {
public:
  explicit QueryServer(std::shared_ptr<docbuild::service::QueryService> svc);

  ::grpc::Status GetReleaseStatus(::grpc::ServerContext*,
                     const docbuild::v1::GetReleaseStatusRequest*,
                     docbuild::v1::GetReleaseStatusResponse*) override;

  ::grpc::Status ListBuilds(::grpc::ServerContext*,
                     const docbuild::v1::ListBuildsRequest*,
                     docbuild::v1::ListBuildsResponse*) override;

  ::grpc::Status GetBuild(::grpc::ServerContext*,
                     const docbuild::v1::GetBuildRequest*,
                     docbuild::v1::GetBuildResponse*) override;

  ::grpc::Status ListQueue(::grpc::ServerContext*,
                     const docbuild::v1::ListQueueRequest*,
                     docbuild::v1::ListQueueResponse*) override;

private:
  std::shared_ptr<docbuild::service::QueryService> service_;
};

} // namespace docbuild::grpc
