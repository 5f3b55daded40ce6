#pragma once

#include <stdexcept>
#include <string>

namespace docbuild::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The request is valid but the current state refuses it.
class FailedPrecondition : public std::runtime_error {
 public:
  explicit FailedPrecondition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic concurrency lost a race; the caller may retry.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient: the registry index could not be read.
class RegistryUnavailable : public std::runtime_error {
 public:
  explicit RegistryUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The sandbox itself failed (fork, limits, isolation), not the build inside it.
class SandboxError : public std::runtime_error {
 public:
  explicit SandboxError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace docbuild::util
