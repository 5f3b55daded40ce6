#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace docbuild::grpc {

using namespace docbuild::v1;

AdminServer::AdminServer(std::shared_ptr<docbuild::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::EnqueueRelease(::grpc::ServerContext*, const EnqueueReleaseRequest* req, EnqueueReleaseResponse* resp) {
  return Invoke([&] { *resp = service_->EnqueueRelease(*req); });
}

::grpc::Status AdminServer::LockQueue(::grpc::ServerContext*, const LockQueueRequest* req, LockQueueResponse* resp) {
  return Invoke([&] { *resp = service_->LockQueue(*req); });
}

::grpc::Status AdminServer::UnlockQueue(::grpc::ServerContext*, const UnlockQueueRequest* req, UnlockQueueResponse* resp) {
  return Invoke([&] { *resp = service_->UnlockQueue(*req); });
}

::grpc::Status AdminServer::ResetQueueAttempts(::grpc::ServerContext*, const ResetQueueAttemptsRequest* req, ResetQueueAttemptsResponse* resp) {
  return Invoke([&] { *resp = service_->ResetQueueAttempts(*req); });
}

::grpc::Status AdminServer::AddBlacklist(::grpc::ServerContext*, const AddBlacklistRequest* req, AddBlacklistResponse* resp) {
  return Invoke([&] { *resp = service_->AddBlacklist(*req); });
}

::grpc::Status AdminServer::RemoveBlacklist(::grpc::ServerContext*, const RemoveBlacklistRequest* req, RemoveBlacklistResponse* resp) {
  return Invoke([&] { *resp = service_->RemoveBlacklist(*req); });
}

::grpc::Status AdminServer::ListBlacklist(::grpc::ServerContext*, const ListBlacklistRequest* req, ListBlacklistResponse* resp) {
  return Invoke([&] { *resp = service_->ListBlacklist(*req); });
}

::grpc::Status AdminServer::SetPriorityRule(::grpc::ServerContext*, const SetPriorityRuleRequest* req, SetPriorityRuleResponse* resp) {
  return Invoke([&] { *resp = service_->SetPriorityRule(*req); });
}

::grpc::Status AdminServer::RemovePriorityRule(::grpc::ServerContext*, const RemovePriorityRuleRequest* req, RemovePriorityRuleResponse* resp) {
  return Invoke([&] { *resp = service_->RemovePriorityRule(*req); });
}

::grpc::Status AdminServer::ListPriorityRules(::grpc::ServerContext*, const ListPriorityRulesRequest* req, ListPriorityRulesResponse* resp) {
  return Invoke([&] { *resp = service_->ListPriorityRules(*req); });
}

::grpc::Status AdminServer::SetSandboxOverride(::grpc::ServerContext*, const SetSandboxOverrideRequest* req, SetSandboxOverrideResponse* resp) {
  return Invoke([&] { *resp = service_->SetSandboxOverride(*req); });
}

::grpc::Status AdminServer::RemoveSandboxOverride(::grpc::ServerContext*, const RemoveSandboxOverrideRequest* req, RemoveSandboxOverrideResponse* resp) {
  return Invoke([&] { *resp = service_->RemoveSandboxOverride(*req); });
}

::grpc::Status AdminServer::ListSandboxOverrides(::grpc::ServerContext*, const ListSandboxOverridesRequest* req, ListSandboxOverridesResponse* resp) {
  return Invoke([&] { *resp = service_->ListSandboxOverrides(*req); });
}

::grpc::Status AdminServer::GetCheckpoint(::grpc::ServerContext*, const GetCheckpointRequest* req, GetCheckpointResponse* resp) {
  return Invoke([&] { *resp = service_->GetCheckpoint(*req); });
}

::grpc::Status AdminServer::SetCheckpoint(::grpc::ServerContext*, const SetCheckpointRequest* req, SetCheckpointResponse* resp) {
  return Invoke([&] { *resp = service_->SetCheckpoint(*req); });
}

::grpc::Status AdminServer::NotifyRegistryActivity(::grpc::ServerContext*, const NotifyRegistryActivityRequest* req, NotifyRegistryActivityResponse* resp) {
  return Invoke([&] { *resp = service_->NotifyRegistryActivity(*req); });
}

::grpc::Status AdminServer::RepairReleaseStatuses(::grpc::ServerContext*, const RepairReleaseStatusesRequest* req, RepairReleaseStatusesResponse* resp) {
  return Invoke([&] { *resp = service_->RepairReleaseStatuses(*req); });
}

::grpc::Status AdminServer::RemovePackage(::grpc::ServerContext*, const RemovePackageRequest* req, RemovePackageResponse* resp) {
  return Invoke([&] { *resp = service_->RemovePackage(*req); });
}

::grpc::Status AdminServer::RemoveRelease(::grpc::ServerContext*, const RemoveReleaseRequest* req, RemoveReleaseResponse* resp) {
  return Invoke([&] { *resp = service_->RemoveRelease(*req); });
}

::grpc::Status AdminServer::RunConsistencyCheck(::grpc::ServerContext*, const RunConsistencyCheckRequest* req, RunConsistencyCheckResponse* resp) {
  return Invoke([&] { *resp = service_->RunConsistencyCheck(*req); });
}

::grpc::Status AdminServer::QueueRebuilds(::grpc::ServerContext*, const QueueRebuildsRequest* req, QueueRebuildsResponse* resp) {
  return Invoke([&] { *resp = service_->QueueRebuilds(*req); });
}

} // namespace docbuild::grpc
