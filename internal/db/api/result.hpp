#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace docbuild::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Maps a failed Result onto the util exception hierarchy.
  Upper layers call this right after each repository write.
*/
inline void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace docbuild::db
