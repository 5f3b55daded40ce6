#pragma once

#include "docbuild/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace docbuild::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  docbuild::v1::EnqueueReleaseResponse EnqueueRelease(const docbuild::v1::EnqueueReleaseRequest& req);

  docbuild::v1::LockQueueResponse   LockQueue(const docbuild::v1::LockQueueRequest& req);
  docbuild::v1::UnlockQueueResponse UnlockQueue(const docbuild::v1::UnlockQueueRequest& req);

  docbuild::v1::ResetQueueAttemptsResponse ResetQueueAttempts(const docbuild::v1::ResetQueueAttemptsRequest& req);

  docbuild::v1::AddBlacklistResponse    AddBlacklist(const docbuild::v1::AddBlacklistRequest& req);
  docbuild::v1::RemoveBlacklistResponse RemoveBlacklist(const docbuild::v1::RemoveBlacklistRequest& req);
  docbuild::v1::ListBlacklistResponse   ListBlacklist(const docbuild::v1::ListBlacklistRequest& req);

  docbuild::v1::SetPriorityRuleResponse    SetPriorityRule(const docbuild::v1::SetPriorityRuleRequest& req);
  docbuild::v1::RemovePriorityRuleResponse RemovePriorityRule(const docbuild::v1::RemovePriorityRuleRequest& req);
  docbuild::v1::ListPriorityRulesResponse  ListPriorityRules(const docbuild::v1::ListPriorityRulesRequest& req);

  docbuild::v1::SetSandboxOverrideResponse    SetSandboxOverride(const docbuild::v1::SetSandboxOverrideRequest& req);
  docbuild::v1::RemoveSandboxOverrideResponse RemoveSandboxOverride(const docbuild::v1::RemoveSandboxOverrideRequest& req);
  docbuild::v1::ListSandboxOverridesResponse  ListSandboxOverrides(const docbuild::v1::ListSandboxOverridesRequest& req);

  docbuild::v1::GetCheckpointResponse GetCheckpoint(const docbuild::v1::GetCheckpointRequest& req);
  docbuild::v1::SetCheckpointResponse SetCheckpoint(const docbuild::v1::SetCheckpointRequest& req);

  // Verifies the signature, then triggers a sync. The body itself is ignored.
  docbuild::v1::NotifyRegistryActivityResponse NotifyRegistryActivity(const docbuild::v1::NotifyRegistryActivityRequest& req);

  docbuild::v1::RepairReleaseStatusesResponse RepairReleaseStatuses(const docbuild::v1::RepairReleaseStatusesRequest& req);

  docbuild::v1::RemovePackageResponse RemovePackage(const docbuild::v1::RemovePackageRequest& req);
  docbuild::v1::RemoveReleaseResponse RemoveRelease(const docbuild::v1::RemoveReleaseRequest& req);

  docbuild::v1::RunConsistencyCheckResponse RunConsistencyCheck(const docbuild::v1::RunConsistencyCheckRequest& req);

  // max_queued 0 uses the configured limit.
  docbuild::v1::QueueRebuildsResponse QueueRebuilds(const docbuild::v1::QueueRebuildsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace docbuild::service
