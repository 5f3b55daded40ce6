#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace docbuild::observability {
namespace {

std::string ResolveLevel(const docbuild::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("DOCBUILD_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const docbuild::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("DOCBUILD_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveTraceContextEnabled(const docbuild::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("DOCBUILD_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool        g_include_trace_context{false};
std::string g_instance;

// Values with spaces, quotes or '=' are quoted so each line stays key=value parseable.
void AppendValue(std::string& out, std::string_view value) {
  const bool needs_quotes = value.empty() || value.find_first_of(" \t\n\"=") != std::string_view::npos;
  if (!needs_quotes) {
    out.append(value);
    return;
  }

  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  if (!out.empty()) {
    out.push_back(' ');
  }
  out.append(key);
  out.push_back('=');
  AppendValue(out, value);
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, "trace_id", HexId(trace_bytes, 16));
  AppendField(out, "span_id", HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationMsField(std::string_view key, double value_ms) {
  return {std::string(key), fmt::format("{:.1f}ms", value_ms)};
}

void InitializeLogging(const docbuild::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("docbuild");
  if (!logger) {
    logger = spdlog::stdout_color_mt("docbuild");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = ResolveTraceContextEnabled(config);
  g_instance              = config.builder().worker_name();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string serialized;
  for (const auto& field : fields) {
    AppendField(serialized, field.key, field.value);
  }
  if (!g_instance.empty()) {
    AppendField(serialized, "instance", g_instance);
  }
  AppendTraceContext(serialized);

  if (serialized.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized);
}

} // namespace docbuild::observability
