#pragma once

#include "docbuild/v1/types.pb.h"
#include "internal/db/model/admission_records.hpp"
#include "internal/db/model/build_record.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/db/model/queue_entry_record.hpp"
#include "internal/queue/build_queue.hpp"

namespace docbuild::service {

docbuild::v1::QueueEntry ToProto(const db::model::QueueEntryRecord& record);

docbuild::v1::QueueStats ToProto(const queue::QueueStats& stats);

docbuild::v1::BuildAttempt ToProto(const db::model::BuildRecord& record, const std::string& name, const std::string& version, bool include_log);

docbuild::v1::PriorityRule ToProto(const db::model::PriorityRuleRecord& record);

docbuild::v1::SandboxOverride ToProto(const db::model::SandboxOverrideRecord& record);

docbuild::v1::SyncCheckpoint ToProto(const db::model::CheckpointRecord& record);

// Name is normalized. Throws util::InvalidArgument for an invalid name or an out-of-range timeout.
db::model::SandboxOverrideRecord FromProto(const docbuild::v1::SandboxOverride& proto);

} // namespace docbuild::service
