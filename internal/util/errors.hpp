#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace linecheck::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Empty or oversized scan input.
class InvalidInputError : public ValidationError {
 public:
  explicit InvalidInputError(const std::string& msg) : ValidationError(msg) {
  }
};

class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoActiveJobError : public std::runtime_error {
 public:
  explicit NoActiveJobError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LineLockedError : public std::runtime_error {
 public:
  explicit LineLockedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RateLimitedError : public std::runtime_error {
 public:
  RateLimitedError(const std::string& msg, std::uint64_t retry_after_seconds)
      : std::runtime_error(msg), retry_after_seconds_(retry_after_seconds) {
  }

  std::uint64_t RetryAfterSeconds() const noexcept {
    return retry_after_seconds_;
  }

 private:
  std::uint64_t retry_after_seconds_;
};

class InvalidPinError : public std::runtime_error {
 public:
  explicit InvalidPinError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace linecheck::util
