#include "query_server.hpp"

#include "grpc_error.hpp"

namespace docbuild::grpc {

using namespace docbuild::v1;

QueryServer::QueryServer(std::shared_ptr<docbuild::service::QueryService> svc) : service_(std::move(svc)) {
}

::grpc::Status QueryServer::GetReleaseStatus(::grpc::ServerContext*, const GetReleaseStatusRequest* req, GetReleaseStatusResponse* resp) {
  return Invoke([&] { *resp = service_->GetReleaseStatus(*req); });
}

::grpc::Status QueryServer::ListBuilds(::grpc::ServerContext*, const ListBuildsRequest* req, ListBuildsResponse* resp) {
  return Invoke([&] { *resp = service_->ListBuilds(*req); });
}

::grpc::Status QueryServer::GetBuild(::grpc::ServerContext*, const GetBuildRequest* req, GetBuildResponse* resp) {
  return Invoke([&] { *resp = service_->GetBuild(*req); });
}

::grpc::Status QueryServer::ListQueue(::grpc::ServerContext*, const ListQueueRequest* req, ListQueueResponse* resp) {
  return Invoke([&] { *resp = service_->ListQueue(*req); });
}

} // namespace docbuild::grpc
