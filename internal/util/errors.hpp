#pragma once

#include <stdexcept>
#include <string>

namespace recall::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  All of them are terminal for the caller: the scheduler never retries a
  review submission on its own.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Suppressed by ReviewScheduler::Schedule; only surfaces from direct store use.
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

// Quality rating outside [0,5].
class InvalidQuality : public InvalidArgument {
 public:
  explicit InvalidQuality(const std::string& msg) : InvalidArgument(msg) {
  }
};

// Record exists but belongs to another user.
class Forbidden : public std::runtime_error {
 public:
  explicit Forbidden(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Concurrent completion that could not be resolved as a safe replay.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace recall::util
