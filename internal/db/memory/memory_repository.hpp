#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace audit::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  A read-write transaction holds the exclusive lock for its whole
  lifetime and applies writes in place, keeping an undo log for
  rollback. Read-only transactions share the lock with each other but
  not with a writer: a reader waits until the open writer commits or
  rolls back, and Begin(kReadOnly) throws util::StorageUnavailableError
  once lock_timeout passes. Readers never observe uncommitted writes.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds lock_timeout = std::chrono::seconds(2));

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kReadWrite) override;

  Result CreatePartition(Transaction&, const model::PartitionRecord&) override;
  bool HasPartition(Transaction&, const std::string&) override;
  std::vector<model::PartitionRecord> ListPartitions(Transaction&) override;

  Result InsertEvent(Transaction&, model::AuditEventRecord&) override;
  std::optional<model::AuditEventRecord> GetEvent(Transaction&, const std::string&) override;
  std::optional<model::AuditEventRecord> GetEventInPartition(Transaction&, const std::string& event_id,
                                                             const std::string& event_date) override;
  Result DeleteEvent(Transaction&, const std::string&) override;
  uint64_t CountChildren(Transaction&, const std::string&) override;
  std::vector<model::AuditEventRecord> ListEventsByCorrelation(Transaction&, const std::string&) override;
  std::string LatestChainHash(Transaction&, const std::string&) override;

  Result PlaceLegalHold(Transaction&, model::LegalHoldRecord&) override;
  Result ReleaseLegalHold(Transaction&, model::LegalHoldRecord&) override;
  std::vector<model::LegalHoldRecord> ListLegalHolds(Transaction&) override;

  Result InsertActionTrace(Transaction&, const model::ActionTraceRecord&) override;
  Result ScanActionTraces(Transaction&, const ActionTraceFilter&, const ActionTraceVisitor&) override;

private:
  friend class MemoryTransaction;

  struct Partition {
    model::PartitionRecord                                  range;
    std::unordered_map<std::string, model::AuditEventRecord> events;
    std::vector<model::ActionTraceRecord>                   traces;
  };

  struct State {
    std::map<std::string, Partition> partitions;

    // event_id -> event_date
    std::unordered_map<std::string, std::string> event_index;

    // parent event_id -> number of children
    std::unordered_map<std::string, uint64_t> child_counts;

    // correlation_id -> sequence -> event_id
    std::unordered_map<std::string, std::map<uint64_t, std::string>> chains;

    std::unordered_set<std::string> action_ids;

    // correlation_id -> hold
    std::map<std::string, model::LegalHoldRecord> legal_holds;

    uint64_t next_sequence = 1;
  };

  const model::AuditEventRecord* FindEvent(const std::string& event_id, const std::string& event_date) const;

  static model::AuditEventRecord* MutableEvent(State& s, const std::string& event_id);

  // Sets legal_hold on every event of the chain. Returns how many events
  // the chain holds; ids whose flag actually changed go to changed.
  static uint64_t SetHoldFlags(State& s, const std::string& correlation_id, bool hold, std::vector<std::string>& changed);

  std::shared_timed_mutex   mutex_;
  std::chrono::milliseconds lock_timeout_;
  State                     state_;
};

}
