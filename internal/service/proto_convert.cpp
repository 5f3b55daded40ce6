#include "proto_convert.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"

namespace docbuild::service {

using namespace docbuild::v1;

QueueEntry ToProto(const db::model::QueueEntryRecord& record) {
  QueueEntry entry;
  entry.set_id(record.id);
  entry.set_name(record.name);
  entry.set_version(record.version);
  entry.set_priority(record.priority);
  entry.set_registry(record.registry);
  entry.set_attempt(record.attempt);
  if (record.last_attempt_ms != 0) {
    *entry.mutable_last_attempt() = util::MillisToProto(record.last_attempt_ms);
  }
  *entry.mutable_queued_at() = util::MillisToProto(record.queued_at_ms);
  entry.set_claimed_by(record.claimed_by);
  return entry;
}

QueueStats ToProto(const queue::QueueStats& stats) {
  QueueStats proto;
  proto.set_pending(stats.pending);
  proto.set_failed(stats.failed);
  proto.set_in_flight(stats.in_flight);
  proto.set_locked(stats.locked);
  for (const auto& [priority, count] : stats.pending_by_priority) {
    (*proto.mutable_pending_by_priority())[priority] = count;
  }
  return proto;
}

BuildAttempt ToProto(const db::model::BuildRecord& record, const std::string& name, const std::string& version, bool include_log) {
  BuildAttempt build;
  build.set_id(record.id);
  build.set_name(name);
  build.set_version(version);
  build.set_toolchain_version(record.toolchain_version);
  build.set_builder_version(record.builder_version);
  build.set_status(record.status);
  *build.mutable_started_at() = util::MillisToProto(record.started_at_ms);
  if (record.finished_at_ms != 0) {
    *build.mutable_finished_at() = util::MillisToProto(record.finished_at_ms);
  }
  if (include_log) {
    build.set_log(record.log);
  }
  build.set_worker(record.worker);
  return build;
}

PriorityRule ToProto(const db::model::PriorityRuleRecord& record) {
  PriorityRule rule;
  rule.set_id(record.id);
  rule.set_pattern(record.pattern);
  rule.set_priority(record.priority);
  return rule;
}

SandboxOverride ToProto(const db::model::SandboxOverrideRecord& record) {
  SandboxOverride proto;
  proto.set_name(record.normalized_name);
  if (record.memory_bytes) proto.set_memory_bytes(*record.memory_bytes);
  if (record.timeout_seconds) proto.set_timeout_seconds(*record.timeout_seconds);
  if (record.max_targets) proto.set_max_targets(*record.max_targets);
  return proto;
}

SyncCheckpoint ToProto(const db::model::CheckpointRecord& record) {
  SyncCheckpoint checkpoint;
  checkpoint.set_name(record.name);
  checkpoint.set_reference(record.reference);
  checkpoint.set_version(record.version);
  if (record.updated_at_ms != 0) {
    *checkpoint.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  }
  checkpoint.set_lock_holder(record.lock_holder);
  return checkpoint;
}

db::model::SandboxOverrideRecord FromProto(const SandboxOverride& proto) {
  util::ValidateName(proto.name());

  db::model::SandboxOverrideRecord record;
  record.normalized_name = util::NormalizeName(proto.name());
  if (proto.has_memory_bytes()) record.memory_bytes = proto.memory_bytes();
  if (proto.has_timeout_seconds()) {
    if (proto.timeout_seconds() == 0) {
      throw util::InvalidArgument("timeout_seconds must be positive");
    }
    record.timeout_seconds = proto.timeout_seconds();
  }
  if (proto.has_max_targets()) record.max_targets = proto.max_targets();
  return record;
}

} // namespace docbuild::service
