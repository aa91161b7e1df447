#include "memory_queue.hpp"

#include <algorithm>
#include <tuple>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace audit::dlq {

using model::CanTransition;
using model::DlqState;

MemoryQueue::MemoryQueue(uint64_t max_entries) : max_entries_(max_entries) {
}

std::string MemoryQueue::Enqueue(const std::string& destination, const std::string& payload,
                                 const std::string& last_error, uint64_t now_ms) {
  uint64_t before = 0;
  DlqEntry entry;
  {
    std::lock_guard lock(mutex_);
    before = entries_.size();
    EnsureCapacity(before, max_entries_);

    entry.entry_id           = util::GenerateUUIDString();
    entry.destination        = destination;
    entry.payload            = payload;
    entry.enqueued_at_ms     = now_ms;
    entry.next_attempt_at_ms = now_ms;
    entry.last_error         = last_error;
    entry.state              = DlqState::kPending;

    entries_.emplace(entry.entry_id, entry);
  }
  ReportCapacity(before, before + 1, max_entries_);
  return entry.entry_id;
}

std::vector<DlqEntry> MemoryQueue::LeaseDue(const LeaseRequest& req) {
  std::lock_guard lock(mutex_);

  std::vector<DlqEntry*> due;
  for (auto& [id, entry] : entries_) {
    if (entry.state == DlqState::kPending && entry.next_attempt_at_ms <= req.due_before_ms) {
      due.push_back(&entry);
    } else if (entry.state == DlqState::kInFlight && !leases_.HasActive(id, req.now_ms)) {
      due.push_back(&entry);
    }
  }

  std::sort(due.begin(), due.end(), [](const DlqEntry* a, const DlqEntry* b) {
    return std::tie(a->next_attempt_at_ms, a->enqueued_at_ms, a->entry_id) <
           std::tie(b->next_attempt_at_ms, b->enqueued_at_ms, b->entry_id);
  });

  const auto duration = static_cast<uint64_t>(req.lease_duration.count());

  std::vector<DlqEntry> out;
  for (auto* entry : due) {
    if (out.size() >= req.max_entries) break;

    // expired lease: in_flight -> pending, then lease again
    if (entry->state == DlqState::kInFlight && CanTransition(DlqState::kInFlight, DlqState::kPending)) {
      entry->state = DlqState::kPending;
      entry->lease_owner.clear();
    }

    auto lease = leases_.Acquire(entry->entry_id, req.owner, req.now_ms, duration);
    if (!lease || !CanTransition(entry->state, DlqState::kInFlight)) continue;

    entry->state               = DlqState::kInFlight;
    entry->lease_owner         = req.owner;
    entry->lease_expires_at_ms = lease->expires_at_ms;
    out.push_back(*entry);
  }
  return out;
}

DlqEntry& MemoryQueue::OwnedLocked(const std::string& entry_id, const std::string& owner, DlqState next) {
  auto it = entries_.find(entry_id);
  if (it == entries_.end()) {
    throw util::LeaseConflict("dlq entry " + entry_id + " is not queued");
  }

  auto& entry = it->second;
  if (entry.lease_owner != owner) {
    throw util::LeaseConflict("dlq entry " + entry_id + " is not leased by " + owner);
  }
  if (!CanTransition(entry.state, next)) {
    throw util::LeaseConflict("dlq entry " + entry_id + ": illegal transition " + std::string(model::ToString(entry.state)) +
                              " -> " + std::string(model::ToString(next)));
  }
  return entry;
}

void MemoryQueue::Complete(const std::string& entry_id, const std::string& owner) {
  std::lock_guard lock(mutex_);

  OwnedLocked(entry_id, owner, DlqState::kSucceeded);
  entries_.erase(entry_id);
  leases_.Release(entry_id);
}

void MemoryQueue::Reschedule(const std::string& entry_id, const std::string& owner, const std::string& error,
                             uint64_t next_attempt_at_ms) {
  std::lock_guard lock(mutex_);

  auto& entry = OwnedLocked(entry_id, owner, DlqState::kPending);
  entry.state               = DlqState::kPending;
  entry.retry_count        += 1;
  entry.last_error          = error;
  entry.next_attempt_at_ms  = next_attempt_at_ms;
  entry.lease_owner.clear();
  entry.lease_expires_at_ms = 0;
  leases_.Release(entry_id);
}

void MemoryQueue::DeadLetter(const std::string& entry_id, const std::string& owner, const std::string& error,
                             uint64_t now_ms) {
  std::lock_guard lock(mutex_);

  auto& entry = OwnedLocked(entry_id, owner, DlqState::kDeadLettered);

  DeadLetterRecord record;
  record.entry_id            = entry.entry_id;
  record.destination         = entry.destination;
  record.payload             = entry.payload;
  record.retry_count         = entry.retry_count + 1;
  record.enqueued_at_ms      = entry.enqueued_at_ms;
  record.dead_lettered_at_ms = now_ms;
  record.last_error          = error;

  dead_letters_.push_back(std::move(record));
  entries_.erase(entry_id);
  leases_.Release(entry_id);
}

uint64_t MemoryQueue::Depth() {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

uint64_t MemoryQueue::DeadLetterCount() {
  std::lock_guard lock(mutex_);
  return dead_letters_.size();
}

std::vector<DeadLetterRecord> MemoryQueue::ListDeadLetters(std::size_t limit) {
  std::lock_guard lock(mutex_);

  if (limit == 0 || limit >= dead_letters_.size()) return dead_letters_;
  return {dead_letters_.begin(), dead_letters_.begin() + static_cast<std::ptrdiff_t>(limit)};
}

} // namespace audit::dlq
