#include "admin_service.hpp"

#include "internal/catalog/release_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/orchestrator/orchestrator.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/registry/notification_verifier.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/status/status_aggregator.hpp"
#include "internal/sync/index_sync.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace docbuild::service {

using namespace docbuild::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository || !ctx_.queue || !ctx_.sync || !ctx_.orchestrator || !ctx_.verifier) {
    throw std::invalid_argument("AdminService requires a complete ServiceContext");
  }
}

// ------------------------------------------------------------------
// Queue
// ------------------------------------------------------------------

EnqueueReleaseResponse AdminService::EnqueueRelease(const EnqueueReleaseRequest& req) {
  return ObserveRpc("AdminService.EnqueueRelease", [&] {
    std::optional<int32_t> priority;
    if (req.has_priority()) {
      priority = req.priority();
    }
    auto result = ctx_.orchestrator->ManualEnqueue(req.name(), req.version(), priority, req.registry());

    EnqueueReleaseResponse resp;
    *resp.mutable_entry() = ToProto(result.entry);
    resp.set_created(result.created);
    return resp;
  });
}

LockQueueResponse AdminService::LockQueue(const LockQueueRequest&) {
  return ObserveRpc("AdminService.LockQueue", [&] {
    ctx_.queue->Lock();
    LockQueueResponse resp;
    resp.set_locked(true);
    return resp;
  });
}

UnlockQueueResponse AdminService::UnlockQueue(const UnlockQueueRequest&) {
  return ObserveRpc("AdminService.UnlockQueue", [&] {
    ctx_.queue->Unlock();
    ctx_.orchestrator->Wake();
    UnlockQueueResponse resp;
    resp.set_locked(false);
    return resp;
  });
}

ResetQueueAttemptsResponse AdminService::ResetQueueAttempts(const ResetQueueAttemptsRequest& req) {
  return ObserveRpc("AdminService.ResetQueueAttempts", [&] {
    ResetQueueAttemptsResponse resp;
    *resp.mutable_entry() = ToProto(ctx_.queue->ResetAttempts(req.name(), req.version()));
    ctx_.orchestrator->Wake();
    return resp;
  });
}

// ------------------------------------------------------------------
// Blacklist
// ------------------------------------------------------------------

AddBlacklistResponse AdminService::AddBlacklist(const AddBlacklistRequest& req) {
  return ObserveRpc("AdminService.AddBlacklist", [&] {
    util::ValidateName(req.name());
    const auto normalized = util::NormalizeName(req.name());

    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->InsertBlacklistEntry(*tx, normalized), "blacklist " + normalized);
    tx->Commit();
    DOCBUILD_LOG_INFO("package blacklisted", {observability::StringField("name", normalized)});
    return AddBlacklistResponse{};
  });
}

RemoveBlacklistResponse AdminService::RemoveBlacklist(const RemoveBlacklistRequest& req) {
  return ObserveRpc("AdminService.RemoveBlacklist", [&] {
    const auto normalized = util::NormalizeName(req.name());

    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->DeleteBlacklistEntry(*tx, normalized), "remove blacklist entry " + normalized);
    tx->Commit();
    return RemoveBlacklistResponse{};
  });
}

ListBlacklistResponse AdminService::ListBlacklist(const ListBlacklistRequest&) {
  return ObserveRpc("AdminService.ListBlacklist", [&] {
    auto tx    = ctx_.repository->Begin();
    auto names = ctx_.repository->ListBlacklist(*tx);
    tx->Commit();

    ListBlacklistResponse resp;
    for (auto& name : names) {
      resp.add_names(std::move(name));
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Priority rules
// ------------------------------------------------------------------

SetPriorityRuleResponse AdminService::SetPriorityRule(const SetPriorityRuleRequest& req) {
  return ObserveRpc("AdminService.SetPriorityRule", [&] {
    if (req.pattern().empty()) {
      throw util::InvalidArgument("priority rule pattern is required");
    }

    db::model::PriorityRuleRecord rule;
    rule.pattern  = req.pattern();
    rule.priority = req.priority();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->UpsertPriorityRule(*tx, rule), "set priority rule");
    tx->Commit();

    SetPriorityRuleResponse resp;
    *resp.mutable_rule() = ToProto(rule);
    return resp;
  });
}

RemovePriorityRuleResponse AdminService::RemovePriorityRule(const RemovePriorityRuleRequest& req) {
  return ObserveRpc("AdminService.RemovePriorityRule", [&] {
    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->DeletePriorityRule(*tx, req.pattern()), "remove priority rule " + req.pattern());
    tx->Commit();
    return RemovePriorityRuleResponse{};
  });
}

ListPriorityRulesResponse AdminService::ListPriorityRules(const ListPriorityRulesRequest&) {
  return ObserveRpc("AdminService.ListPriorityRules", [&] {
    auto tx    = ctx_.repository->Begin();
    auto rules = ctx_.repository->ListPriorityRules(*tx);
    tx->Commit();

    ListPriorityRulesResponse resp;
    for (const auto& rule : rules) {
      *resp.add_rules() = ToProto(rule);
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Sandbox overrides
// ------------------------------------------------------------------

SetSandboxOverrideResponse AdminService::SetSandboxOverride(const SetSandboxOverrideRequest& req) {
  return ObserveRpc("AdminService.SetSandboxOverride", [&] {
    auto record = FromProto(req.sandbox_override());

    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->UpsertSandboxOverride(*tx, record), "set sandbox override " + record.normalized_name);
    tx->Commit();

    SetSandboxOverrideResponse resp;
    *resp.mutable_sandbox_override() = ToProto(record);
    return resp;
  });
}

RemoveSandboxOverrideResponse AdminService::RemoveSandboxOverride(const RemoveSandboxOverrideRequest& req) {
  return ObserveRpc("AdminService.RemoveSandboxOverride", [&] {
    const auto normalized = util::NormalizeName(req.name());

    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->DeleteSandboxOverride(*tx, normalized), "remove sandbox override " + normalized);
    tx->Commit();
    return RemoveSandboxOverrideResponse{};
  });
}

ListSandboxOverridesResponse AdminService::ListSandboxOverrides(const ListSandboxOverridesRequest&) {
  return ObserveRpc("AdminService.ListSandboxOverrides", [&] {
    auto tx        = ctx_.repository->Begin();
    auto overrides = ctx_.repository->ListSandboxOverrides(*tx);
    tx->Commit();

    ListSandboxOverridesResponse resp;
    for (const auto& record : overrides) {
      *resp.add_overrides() = ToProto(record);
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Synchronization
// ------------------------------------------------------------------

GetCheckpointResponse AdminService::GetCheckpoint(const GetCheckpointRequest&) {
  return ObserveRpc("AdminService.GetCheckpoint", [&] {
    GetCheckpointResponse resp;
    *resp.mutable_checkpoint() = ToProto(ctx_.sync->Checkpoint());
    return resp;
  });
}

SetCheckpointResponse AdminService::SetCheckpoint(const SetCheckpointRequest& req) {
  return ObserveRpc("AdminService.SetCheckpoint", [&] {
    SetCheckpointResponse resp;
    switch (req.target_case()) {
      case SetCheckpointRequest::kReference:
        *resp.mutable_checkpoint() = ToProto(ctx_.sync->SetReference(req.reference()));
        break;
      case SetCheckpointRequest::kResetToHead:
        if (!req.reset_to_head()) {
          throw util::InvalidArgument("reset_to_head must be true when set");
        }
        *resp.mutable_checkpoint() = ToProto(ctx_.sync->ResetToHead());
        break;
      default:
        throw util::InvalidArgument("one of reference or reset_to_head is required");
    }
    return resp;
  });
}

NotifyRegistryActivityResponse AdminService::NotifyRegistryActivity(const NotifyRegistryActivityRequest& req) {
  return ObserveRpc("AdminService.NotifyRegistryActivity", [&] {
    ctx_.verifier->Verify(req.body(), req.signature());
    ctx_.orchestrator->TriggerSync();

    NotifyRegistryActivityResponse resp;
    resp.set_accepted(true);
    return resp;
  });
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

RepairReleaseStatusesResponse AdminService::RepairReleaseStatuses(const RepairReleaseStatusesRequest&) {
  return ObserveRpc("AdminService.RepairReleaseStatuses", [&] {
    const uint64_t abandoned = ctx_.orchestrator->FailAbandonedBuilds();
    const auto     report    = status::StatusAggregator(ctx_.repository).RepairAll();

    RepairReleaseStatusesResponse resp;
    resp.set_releases_checked(report.releases_checked);
    resp.set_releases_repaired(report.releases_repaired);
    resp.set_builds_abandoned(abandoned);
    return resp;
  });
}

RemovePackageResponse AdminService::RemovePackage(const RemovePackageRequest& req) {
  return ObserveRpc("AdminService.RemovePackage", [&] {
    const auto normalized = util::NormalizeName(req.name());

    catalog::ReleaseCatalog catalog(ctx_.repository);
    const auto              removed = db::RetryOnConflict("remove package", [&] {
      auto tx       = ctx_.repository->Begin();
      auto releases = catalog.RemovePackage(*tx, normalized);
      if (!releases) {
        throw util::NotFound("package not found: " + normalized);
      }
      ctx_.queue->RemoveEntries(*tx, normalized);
      tx->Commit();
      return *releases;
    });

    DOCBUILD_LOG_INFO("package removed", {observability::StringField("name", normalized),
                                          observability::IntField("releases", static_cast<int64_t>(removed))});
    RemovePackageResponse resp;
    resp.set_releases_removed(removed);
    return resp;
  });
}

RemoveReleaseResponse AdminService::RemoveRelease(const RemoveReleaseRequest& req) {
  return ObserveRpc("AdminService.RemoveRelease", [&] {
    const auto normalized = util::NormalizeName(req.name());

    catalog::ReleaseCatalog catalog(ctx_.repository);
    db::RetryOnConflict("remove release", [&] {
      auto tx = ctx_.repository->Begin();
      if (!catalog.RemoveRelease(*tx, normalized, req.version())) {
        throw util::NotFound("release not found: " + normalized + " " + req.version());
      }
      ctx_.queue->RemoveEntries(*tx, normalized, req.version());
      tx->Commit();
    });

    DOCBUILD_LOG_INFO("release removed", {observability::StringField("name", normalized), observability::StringField("version", req.version())});
    return RemoveReleaseResponse{};
  });
}

RunConsistencyCheckResponse AdminService::RunConsistencyCheck(const RunConsistencyCheckRequest& req) {
  return ObserveRpc("AdminService.RunConsistencyCheck", [&] {
    const auto report = ctx_.sync->CheckConsistency(req.dry_run());
    if (!req.dry_run() && report.builds_queued > 0) {
      ctx_.orchestrator->Wake();
    }

    RunConsistencyCheckResponse resp;
    resp.set_skipped(report.skipped);
    resp.set_packages_checked(report.packages_checked);
    resp.set_builds_queued(report.builds_queued);
    resp.set_packages_deleted(report.packages_deleted);
    resp.set_releases_deleted(report.releases_deleted);
    resp.set_yanks_corrected(report.yanks_corrected);
    return resp;
  });
}

QueueRebuildsResponse AdminService::QueueRebuilds(const QueueRebuildsRequest& req) {
  return ObserveRpc("AdminService.QueueRebuilds", [&] {
    const uint64_t queued = req.max_queued() > 0 ? ctx_.queue->QueueRebuilds(req.max_queued()) : ctx_.orchestrator->QueueRebuilds();
    if (queued > 0) {
      ctx_.orchestrator->Wake();
    }

    QueueRebuildsResponse resp;
    resp.set_queued(queued);
    return resp;
  });
}

} // namespace docbuild::service
