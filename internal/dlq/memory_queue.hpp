#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/lease/lease_table.hpp"
#include "queue.hpp"

namespace audit::dlq {

// Process-local queue. Contents are lost on restart.
class MemoryQueue final : public Queue {
public:
  explicit MemoryQueue(uint64_t max_entries = 10000);

  std::string Enqueue(const std::string& destination, const std::string& payload, const std::string& last_error,
                      uint64_t now_ms) override;
  std::vector<DlqEntry> LeaseDue(const LeaseRequest& req) override;
  void Complete(const std::string& entry_id, const std::string& owner) override;
  void Reschedule(const std::string& entry_id, const std::string& owner, const std::string& error,
                  uint64_t next_attempt_at_ms) override;
  void DeadLetter(const std::string& entry_id, const std::string& owner, const std::string& error,
                  uint64_t now_ms) override;

  uint64_t Depth() override;
  uint64_t DeadLetterCount() override;
  std::vector<DeadLetterRecord> ListDeadLetters(std::size_t limit) override;

private:
  // Entry in flight under owner, ready to move to `next`.
  DlqEntry& OwnedLocked(const std::string& entry_id, const std::string& owner, model::DlqState next);

  std::mutex mutex_;
  uint64_t   max_entries_;

  std::unordered_map<std::string, DlqEntry> entries_;
  std::vector<DeadLetterRecord>              dead_letters_;
  lease::LeaseTable                          leases_;
};

} // namespace audit::dlq
