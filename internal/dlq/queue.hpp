#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dlq_entry.hpp"

namespace audit::dlq {

/*
  Durable holding area for writes the store rejected for non-caller
  reasons.

  Every state change follows model::CanTransition. Complete, Reschedule
  and DeadLetter throw util::LeaseConflict when the caller does not hold
  the entry's lease or the entry is not in flight.

  Backend failures surface as util::StorageUnavailableError.
*/
class Queue {
public:
  virtual ~Queue() = default;

  // Returns the new entry id. Throws util::ResourceExhausted when
  // max_entries entries are already pending or in flight.
  virtual std::string Enqueue(const std::string& destination, const std::string& payload,
                              const std::string& last_error, uint64_t now_ms) = 0;

  // Atomically claims due pending entries, plus in-flight entries whose
  // lease expired, for req.owner. Oldest due first.
  virtual std::vector<DlqEntry> LeaseDue(const LeaseRequest& req) = 0;

  // in_flight -> succeeded; the entry is removed.
  virtual void Complete(const std::string& entry_id, const std::string& owner) = 0;

  // in_flight -> pending, retry_count + 1.
  virtual void Reschedule(const std::string& entry_id, const std::string& owner, const std::string& error,
                          uint64_t next_attempt_at_ms) = 0;

  // in_flight -> dead_lettered, retry_count + 1. Never leased again.
  virtual void DeadLetter(const std::string& entry_id, const std::string& owner, const std::string& error,
                          uint64_t now_ms) = 0;

  // pending + in flight
  virtual uint64_t Depth() = 0;
  virtual uint64_t DeadLetterCount() = 0;

  // Oldest first. limit == 0 returns all.
  virtual std::vector<DeadLetterRecord> ListDeadLetters(std::size_t limit) = 0;
};

// Throws util::ResourceExhausted if depth has reached max_entries.
void EnsureCapacity(uint64_t depth, uint64_t max_entries);

// Logs when an enqueue moves depth across 80% (warn) or 90% (error) of
// max_entries.
void ReportCapacity(uint64_t depth_before, uint64_t depth_after, uint64_t max_entries);

} // namespace audit::dlq
