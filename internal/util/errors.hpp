#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace audit::util {

/*
  Central error types.

  These get translated later to gRPC status codes and problem details.
*/

// Malformed or missing fields. Caller-fixable, never retried.
// reason is a short metric label, e.g. "missing_service".
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg), reason_("invalid") {
  }

  ValidationError(std::string reason, const std::string& msg) : std::runtime_error(msg), reason_(std::move(reason)) {
  }

  const std::string& reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

// parent_event_id does not resolve to a stored event.
class ReferentialIntegrityError : public std::runtime_error {
 public:
  explicit ReferentialIntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Target month bucket does not exist. Operational, must alert.
class PartitionMissingError : public std::runtime_error {
 public:
  explicit PartitionMissingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store unreachable, busy or timed out.
class StorageUnavailableError : public std::runtime_error {
 public:
  explicit StorageUnavailableError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AggregationError : public std::runtime_error {
 public:
  explicit AggregationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

// Delete refused: the event has children or is under legal hold.
class DeleteRestricted : public std::runtime_error {
 public:
  explicit DeleteRestricted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace audit::util
