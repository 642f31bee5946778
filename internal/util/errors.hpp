#pragma once

#include <stdexcept>
#include <string>

namespace releasectl::util {

/*
  Central error types.

  Per-item reconcile errors are recovered by the controller; the gRPC
  layer translates the rest into status codes.
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

// Optimistic concurrency failure on a backend write.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed reconcile key. Never retried.
class KeyDecodeError : public std::runtime_error {
 public:
  explicit KeyDecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient cache access failure. Retried with backoff.
class LookupError : public std::runtime_error {
 public:
  explicit LookupError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Trigger/Delete could not converge this attempt. Retried with backoff.
class ConvergenceError : public std::runtime_error {
 public:
  explicit ConvergenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace releasectl::util
