#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

#include "internal/model/dlq_state.hpp"

namespace audit::dlq {

// Replay targets. The payload is the serialized proto of the named kind.
inline constexpr const char* kAuditEventsDestination  = "audit_events";
inline constexpr const char* kActionTracesDestination = "action_traces";

/*
  A queued failed write. Times are unix millis.
*/
struct DlqEntry {
  std::string entry_id;
  std::string destination;
  std::string payload;

  uint32_t retry_count = 0;

  uint64_t enqueued_at_ms     = 0;
  uint64_t next_attempt_at_ms = 0;

  std::string last_error;

  model::DlqState state = model::DlqState::kPending;

  std::string lease_owner;
  uint64_t    lease_expires_at_ms = 0;
};

// Permanent, inspectable record of an entry that exhausted its retries.
struct DeadLetterRecord {
  std::string entry_id;
  std::string destination;
  std::string payload;

  uint32_t retry_count = 0;

  uint64_t enqueued_at_ms      = 0;
  uint64_t dead_lettered_at_ms = 0;

  std::string last_error;
};

struct LeaseRequest {
  std::string owner;

  uint64_t now_ms = 0;
  // pending entries with next_attempt_at_ms <= due_before_ms are eligible
  uint64_t due_before_ms = 0;

  uint32_t max_entries = 10;

  std::chrono::milliseconds lease_duration{30000};
};

inline constexpr uint64_t kNoDueHorizon = std::numeric_limits<uint64_t>::max();

} // namespace audit::dlq
