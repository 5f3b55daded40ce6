#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace docbuild::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

docbuild::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  docbuild::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

template <typename Message, typename Value>
void DefaultIfUnset(Message* message, Value (Message::*getter)() const, void (Message::*setter)(Value), Value fallback) {
  if ((message->*getter)() == Value{}) {
    (message->*setter)(fallback);
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

docbuild::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

docbuild::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(docbuild::runtime::config::RuntimeConfig& config) {
  using namespace docbuild::runtime::config;

  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50061");
  }
  DefaultIfUnset(server, &ServerConfig::max_message_bytes, &ServerConfig::set_max_message_bytes, 64u << 20);

  auto* registry = config.mutable_registry();
  if (registry->name().empty()) {
    registry->set_name("crates.io");
  }

  auto* sync = config.mutable_sync();
  DefaultIfUnset(sync, &SyncConfig::poll_interval_seconds, &SyncConfig::set_poll_interval_seconds, 60u);
  DefaultIfUnset(sync, &SyncConfig::lock_ttl_seconds, &SyncConfig::set_lock_ttl_seconds, 300u);
  if (sync->checkpoint_name().empty()) {
    sync->set_checkpoint_name("registry-index");
  }

  auto* queue = config.mutable_queue();
  DefaultIfUnset(queue, &QueueConfig::max_attempts, &QueueConfig::set_max_attempts, 5u);
  DefaultIfUnset(queue, &QueueConfig::delay_between_attempts_seconds, &QueueConfig::set_delay_between_attempts_seconds, 60u);
  DefaultIfUnset(queue, &QueueConfig::candidate_batch_size, &QueueConfig::set_candidate_batch_size, 32u);
  DefaultIfUnset(queue, &QueueConfig::rebuild_interval_seconds, &QueueConfig::set_rebuild_interval_seconds, 60u * 60u);

  auto* builder = config.mutable_builder();
  if (!builder->has_workers()) {
    builder->set_workers(1);
  }
  DefaultIfUnset(builder, &BuilderConfig::idle_poll_interval_ms, &BuilderConfig::set_idle_poll_interval_ms, 1000u);
  DefaultIfUnset(builder, &BuilderConfig::locked_poll_interval_ms, &BuilderConfig::set_locked_poll_interval_ms, 60000u);
  DefaultIfUnset(builder, &BuilderConfig::abandoned_build_grace_seconds, &BuilderConfig::set_abandoned_build_grace_seconds, 300u);
  DefaultIfUnset(builder, &BuilderConfig::abandoned_sweep_interval_seconds, &BuilderConfig::set_abandoned_sweep_interval_seconds, 300u);
  if (builder->builder_version().empty()) {
    builder->set_builder_version(DOCBUILD_VERSION);
  }
  if (builder->work_dir().empty()) {
    builder->set_work_dir("/tmp/docbuild");
  }
  if (builder->doc_subdir().empty()) {
    builder->set_doc_subdir("doc");
  }
  if (builder->default_target().empty()) {
    builder->set_default_target("x86_64-unknown-linux-gnu");
  }

  auto* limits = builder->mutable_limits();
  DefaultIfUnset(limits, &SandboxLimitsConfig::memory_bytes, &SandboxLimitsConfig::set_memory_bytes, uint64_t{3} * 1024 * 1024 * 1024);
  DefaultIfUnset(limits, &SandboxLimitsConfig::timeout_seconds, &SandboxLimitsConfig::set_timeout_seconds, 15u * 60u);
  DefaultIfUnset(limits, &SandboxLimitsConfig::max_targets, &SandboxLimitsConfig::set_max_targets, 10u);
  DefaultIfUnset(limits, &SandboxLimitsConfig::max_log_bytes, &SandboxLimitsConfig::set_max_log_bytes, uint64_t{100} * 1024);

  // a claim must outlive the longest default build
  const uint32_t min_claim = limits->timeout_seconds() * 2 + builder->abandoned_build_grace_seconds();
  if (queue->claim_timeout_seconds() == 0) {
    queue->set_claim_timeout_seconds(std::max(min_claim, 2u * 60u * 60u));
  }
}

void ConfigLoader::Validate(const docbuild::runtime::config::RuntimeConfig& config) {
  if (config.queue().max_attempts() == 0) {
    throw std::invalid_argument("queue.max_attempts must be positive");
  }
  if (config.builder().limits().max_targets() == 0) {
    throw std::invalid_argument("builder.limits.max_targets must be positive");
  }
  if (config.queue().claim_timeout_seconds() <= config.builder().limits().timeout_seconds()) {
    throw std::invalid_argument("queue.claim_timeout_seconds must exceed builder.limits.timeout_seconds");
  }
  if (config.registry().journal_path().empty()) {
    throw std::invalid_argument("registry.journal_path is required");
  }
  if (config.builder().workers() > 0 && config.builder().command().empty()) {
    throw std::invalid_argument("builder.command is required when builder.workers > 0");
  }
}

} // namespace docbuild::config
