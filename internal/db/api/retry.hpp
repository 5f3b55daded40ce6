#pragma once

#include <chrono>
#include <string_view>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace docbuild::db {

/*
  Re-runs fn (which opens and commits its own transaction) when it loses an
  optimistic-concurrency race. fn must be safe to repeat.
*/
template <typename Fn>
auto RetryOnConflict(std::string_view what, Fn&& fn, int max_attempts = 8) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::Conflict& e) {
      if (attempt >= max_attempts) {
        throw;
      }
      DOCBUILD_LOG_DEBUG("retrying after transaction conflict",
                         {observability::StringField("operation", what), observability::IntField("attempt", attempt),
                          observability::StringField("error", e.what())});
      std::this_thread::sleep_for(std::chrono::milliseconds(attempt));
    }
  }
}

} // namespace docbuild::db
