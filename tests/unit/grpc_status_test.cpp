#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "docbuild/v1.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/query_server.hpp"
#include "internal/orchestrator/orchestrator.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/registry/journal_index.hpp"
#include "internal/registry/notification_verifier.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sync/index_sync.hpp"
#include "internal/util/errors.hpp"

namespace {

docbuild::service::ServiceContext BuildServiceContext() {
  docbuild::service::ServiceContext ctx;
  ctx.repository = std::make_shared<docbuild::db::memory::MemoryRepository>();
  ctx.queue      = std::make_shared<docbuild::queue::BuildQueue>(ctx.repository, docbuild::queue::QueueOptions{});
  ctx.sync       = std::make_shared<docbuild::sync::IndexSync>(
      ctx.repository, std::make_shared<docbuild::registry::JournalIndex>("/nonexistent/docbuild/index.jsonl"), ctx.queue,
      docbuild::sync::SyncOptions{});

  docbuild::orchestrator::OrchestratorOptions options;
  options.workers      = 0;
  options.sync_enabled = false;
  ctx.orchestrator     = std::make_shared<docbuild::orchestrator::Orchestrator>(ctx.repository, ctx.sync, ctx.queue, nullptr, options);
  ctx.verifier         = std::make_shared<docbuild::registry::NotificationVerifier>("secret");
  return ctx;
}

void TestExceptionMapping() {
  using docbuild::grpc::ToStatus;

  assert(ToStatus(docbuild::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(docbuild::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(docbuild::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(docbuild::util::FailedPrecondition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(docbuild::util::Conflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(docbuild::util::RegistryUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(docbuild::util::Unauthenticated("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(docbuild::util::SandboxError("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestServiceNamesMatchGeneratedStubs() {
  assert(std::string(docbuild::v1::DocBuildAdminService::service_full_name()) == docbuild::v1::kAdminServiceName);
  assert(std::string(docbuild::v1::DocBuildQueryService::service_full_name()) == docbuild::v1::kQueryServiceName);
}

void TestInvokeReturnsOkWhenNothingThrows() {
  bool ran    = false;
  auto status = docbuild::grpc::Invoke([&] { ran = true; });
  assert(ran);
  assert(status.ok());
}

void TestUnknownReleaseReturnsNotFound() {
  auto ctx = BuildServiceContext();
  docbuild::grpc::QueryServer server(std::make_shared<docbuild::service::QueryService>(ctx));

  docbuild::v1::GetReleaseStatusRequest req;
  req.set_name("missing");
  req.set_version("1.0.0");
  docbuild::v1::GetReleaseStatusResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetReleaseStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestDuplicateBlacklistReturnsAlreadyExists() {
  auto ctx = BuildServiceContext();
  docbuild::grpc::AdminServer server(std::make_shared<docbuild::service::AdminService>(ctx));

  docbuild::v1::AddBlacklistRequest req;
  req.set_name("bad-crate");
  docbuild::v1::AddBlacklistResponse resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.AddBlacklist(&grpc_ctx, &req, &resp).ok());
  assert(server.AddBlacklist(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestBadSignatureReturnsUnauthenticated() {
  auto ctx = BuildServiceContext();
  docbuild::grpc::AdminServer server(std::make_shared<docbuild::service::AdminService>(ctx));

  docbuild::v1::NotifyRegistryActivityRequest req;
  req.set_body("{}");
  req.set_signature("sha256=deadbeef");
  docbuild::v1::NotifyRegistryActivityResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.NotifyRegistryActivity(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestUnreadableIndexReturnsUnavailable() {
  auto ctx = BuildServiceContext();
  docbuild::grpc::AdminServer server(std::make_shared<docbuild::service::AdminService>(ctx));

  docbuild::v1::SetCheckpointRequest req;
  req.set_reset_to_head(true);
  docbuild::v1::SetCheckpointResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.SetCheckpoint(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestMissingVersionReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  docbuild::grpc::AdminServer server(std::make_shared<docbuild::service::AdminService>(ctx));

  docbuild::v1::EnqueueReleaseRequest req;
  req.set_name("serde");
  docbuild::v1::EnqueueReleaseResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.EnqueueRelease(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestBlacklistedEnqueueReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  docbuild::grpc::AdminServer server(std::make_shared<docbuild::service::AdminService>(ctx));
  ::grpc::ServerContext       grpc_ctx;

  docbuild::v1::AddBlacklistRequest  block;
  docbuild::v1::AddBlacklistResponse block_resp;
  block.set_name("serde");
  assert(server.AddBlacklist(&grpc_ctx, &block, &block_resp).ok());

  docbuild::v1::EnqueueReleaseRequest req;
  req.set_name("serde");
  req.set_version("1.0.0");
  docbuild::v1::EnqueueReleaseResponse resp;

  const auto status = server.EnqueueRelease(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestReleaseWithoutStatusRowReportsInProgress() {
  auto ctx = BuildServiceContext();
  {
    auto                               tx = ctx.repository->Begin();
    docbuild::db::model::PackageRecord package{.name = "legacy", .normalized_name = "legacy"};
    assert(ctx.repository->UpsertPackage(*tx, package));
    docbuild::db::model::ReleaseRecord release{.package_id = package.id, .version = "0.1.0"};
    assert(ctx.repository->UpsertRelease(*tx, release));
    tx->Commit();
  }
  docbuild::grpc::QueryServer server(std::make_shared<docbuild::service::QueryService>(ctx));

  docbuild::v1::GetReleaseStatusRequest req;
  req.set_name("legacy");
  req.set_version("0.1.0");
  docbuild::v1::GetReleaseStatusResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  assert(server.GetReleaseStatus(&grpc_ctx, &req, &resp).ok());
  assert(resp.status().status() == docbuild::v1::BUILD_STATUS_IN_PROGRESS);
  assert(!resp.status().has_last_build_time());
}

void TestServerBindsEphemeralPort() {
  auto ctx = BuildServiceContext();

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<docbuild::grpc::AdminServer>(std::make_shared<docbuild::service::AdminService>(ctx)));
  services.push_back(std::make_unique<docbuild::grpc::QueryServer>(std::make_shared<docbuild::service::QueryService>(ctx)));

  docbuild::runtime::ServerOptions options;
  options.bind_address      = "127.0.0.1:0";
  options.max_message_bytes = 1 << 20;

  docbuild::runtime::Server server(options, std::move(services));
  server.Start();
  assert(server.BoundPort() > 0);
  server.Stop();
  server.Stop();
}

} // namespace

int main() {
  TestExceptionMapping();
  TestServiceNamesMatchGeneratedStubs();
  TestInvokeReturnsOkWhenNothingThrows();
  TestUnknownReleaseReturnsNotFound();
  TestDuplicateBlacklistReturnsAlreadyExists();
  TestBadSignatureReturnsUnauthenticated();
  TestUnreadableIndexReturnsUnavailable();
  TestMissingVersionReturnsInvalidArgument();
  TestBlacklistedEnqueueReturnsFailedPrecondition();
  TestReleaseWithoutStatusRowReportsInProgress();
  TestServerBindsEphemeralPort();

  std::cout << "docbuild_unit_grpc_status: pass\n";
  return 0;
}
