#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace docbuild::runtime::config {
class RuntimeConfig;
}

namespace docbuild::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"docbuild"};
  std::string   service_version;
  // builder.worker_name; distinguishes daemons sharing one database
  std::string   service_instance;
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

#ifdef ENABLE_OTEL
OtlpConfig MakeOtlpConfig(const docbuild::runtime::config::RuntimeConfig& config);
#endif

// Both return false when the section is disabled or OTEL is compiled out.
bool InitializeTracing(const docbuild::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const docbuild::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  // docbuild.release.name / docbuild.release.version
  void SetRelease(std::string_view name, std::string_view version);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordBuildOutcome(std::string_view outcome);
  void ObserveBuildDurationMs(std::string_view outcome, double duration_ms);
  void RecordQueuedBuild(std::int32_t priority);
  void RecordSyncRun(bool success, std::uint64_t changes);
  void SetQueueDepth(std::string_view state, std::uint64_t entries);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const docbuild::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const docbuild::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::SetRelease(std::string_view, std::string_view) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordBuildOutcome(std::string_view) {
}

inline void Metrics::ObserveBuildDurationMs(std::string_view, double) {
}

inline void Metrics::RecordQueuedBuild(std::int32_t) {
}

inline void Metrics::RecordSyncRun(bool, std::uint64_t) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace docbuild::observability
