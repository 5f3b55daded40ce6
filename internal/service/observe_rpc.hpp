#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace docbuild::service {

/*
  Wraps one RPC body: span, request metrics, and an error log for anything
  thrown. Exceptions are rethrown for the transport adapter to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  docbuild::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool ok) {
    auto& metrics = docbuild::observability::Metrics::Instance();
    metrics.RecordRequest(route, ok);
    metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DOCBUILD_LOG_ERROR("RPC failed", {docbuild::observability::StringField("route", route), docbuild::observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace docbuild::service
