#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "docbuild/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace docbuild::grpc {

class AdminServer final : public docbuild::v1::DocBuildAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<docbuild::service::AdminService> svc);

  ::grpc::Status EnqueueRelease(::grpc::ServerContext*,
                     const docbuild::v1::EnqueueReleaseRequest*,
                     docbuild::v1::EnqueueReleaseResponse*) override;

  ::grpc::Status LockQueue(::grpc::ServerContext*,
                     const docbuild::v1::LockQueueRequest*,
                     docbuild::v1::LockQueueResponse*) override;

  ::grpc::Status UnlockQueue(::grpc::ServerContext*,
                     const docbuild::v1::UnlockQueueRequest*,
                     docbuild::v1::UnlockQueueResponse*) override;

  ::grpc::Status ResetQueueAttempts(::grpc::ServerContext*,
                     const docbuild::v1::ResetQueueAttemptsRequest*,
                     docbuild::v1::ResetQueueAttemptsResponse*) override;

  ::grpc::Status AddBlacklist(::grpc::ServerContext*,
                     const docbuild::v1::AddBlacklistRequest*,
                     docbuild::v1::AddBlacklistResponse*) override;

  ::grpc::Status RemoveBlacklist(::grpc::ServerContext*,
                     const docbuild::v1::RemoveBlacklistRequest*,
                     docbuild::v1::RemoveBlacklistResponse*) override;

  ::grpc::Status ListBlacklist(::grpc::ServerContext*,
                     const docbuild::v1::ListBlacklistRequest*,
                     docbuild::v1::ListBlacklistResponse*) override;

  ::grpc::Status SetPriorityRule(::grpc::ServerContext*,
                     const docbuild::v1::SetPriorityRuleRequest*,
                     docbuild::v1::SetPriorityRuleResponse*) override;

  ::grpc::Status RemovePriorityRule(::grpc::ServerContext*,
                     const docbuild::v1::RemovePriorityRuleRequest*,
                     docbuild::v1::RemovePriorityRuleResponse*) override;

  ::grpc::Status ListPriorityRules(::grpc::ServerContext*,
                     const docbuild::v1::ListPriorityRulesRequest*,
                     docbuild::v1::ListPriorityRulesResponse*) override;

  ::grpc::Status SetSandboxOverride(::grpc::ServerContext*,
                     const docbuild::v1::SetSandboxOverrideRequest*,
                     docbuild::v1::SetSandboxOverrideResponse*) override;

  ::grpc::Status RemoveSandboxOverride(::grpc::ServerContext*,
                     const docbuild::v1::RemoveSandboxOverrideRequest*,
                     docbuild::v1::RemoveSandboxOverrideResponse*) override;

  ::grpc::Status ListSandboxOverrides(::grpc::ServerContext*,
                     const docbuild::v1::ListSandboxOverridesRequest*,
                     docbuild::v1::ListSandboxOverridesResponse*) override;

  ::grpc::Status GetCheckpoint(::grpc::ServerContext*,
                     const docbuild::v1::GetCheckpointRequest*,
                     docbuild::v1::GetCheckpointResponse*) override;

  ::grpc::Status SetCheckpoint(::grpc::ServerContext*,
                     const docbuild::v1::SetCheckpointRequest*,
                     docbuild::v1::SetCheckpointResponse*) override;

  ::grpc::Status NotifyRegistryActivity(::grpc::ServerContext*,
                     const docbuild::v1::NotifyRegistryActivityRequest*,
                     docbuild::v1::NotifyRegistryActivityResponse*) override;

  ::grpc::Status RepairReleaseStatuses(::grpc::ServerContext*,
                     const docbuild::v1::RepairReleaseStatusesRequest*,
                     docbuild::v1::RepairReleaseStatusesResponse*) override;

  ::grpc::Status RemovePackage(::grpc::ServerContext*,
                     const docbuild::v1::RemovePackageRequest*,
                     docbuild::v1::RemovePackageResponse*) override;

  ::grpc::Status RemoveRelease(::grpc::ServerContext*,
                     const docbuild::v1::RemoveReleaseRequest*,
                     docbuild::v1::RemoveReleaseResponse*) override;

  ::grpc::Status RunConsistencyCheck(::grpc::ServerContext*,
                     const docbuild::v1::RunConsistencyCheckRequest*,
                     docbuild::v1::RunConsistencyCheckResponse*) override;

  ::grpc::Status QueueRebuilds(::grpc::ServerContext*,
                     const docbuild::v1::QueueRebuildsRequest*,
                     docbuild::v1::QueueRebuildsResponse*) override;

private:
  std::shared_ptr<docbuild::service::AdminService> service_;
};

} // namespace docbuild::grpc
