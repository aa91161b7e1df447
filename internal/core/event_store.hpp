#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace audit::core {

enum class InsertStatus {
  kStored,
  kDuplicate, // event_id already present; nothing written
};

struct InsertResult {
  InsertStatus                status = InsertStatus::kStored;
  db::model::AuditEventRecord record; // stored row, or the new record on duplicate
};

/*
  Insert / Lookup / Delete over the repository, with typed errors.

  Insert runs in one read-write transaction: duplicate check, parent
  resolution, chain head read, hash and insert. Errors:
    util::ReferentialIntegrityError  parent_event_id does not resolve
    util::PartitionMissingError      month bucket missing
    util::ValidationError            row rejected by a backend constraint
    util::StorageUnavailableError    backend busy, down or timed out
  An event_id that already exists yields kDuplicate without comparing the
  content, so a producer reusing an id for a different event is not detected.
  Delete throws util::NotFound or util::DeleteRestricted.

  Legal holds flag every event of a correlation in one transaction and
  leave payloads and hashes as stored.
*/
class EventStore {
 public:
  explicit EventStore(std::shared_ptr<db::Repository> repository);

  // record carries validated producer fields with event_id assigned.
  InsertResult Insert(db::model::AuditEventRecord record, uint64_t now_ms);

  // All records in one transaction: either every non-duplicate record is
  // stored or none is. Later records may name earlier ones as parent.
  // Results follow input order. Errors as for Insert.
  std::vector<InsertResult> InsertBatch(std::vector<db::model::AuditEventRecord> records, uint64_t now_ms);

  std::optional<db::model::AuditEventRecord> Lookup(const std::string& event_id);

  void Delete(const std::string& event_id);

  InsertStatus InsertActionTrace(const db::model::ActionTraceRecord& record);

  // Throws util::NotFound when the correlation has no events.
  db::model::LegalHoldRecord PlaceLegalHold(db::model::LegalHoldRecord hold);

  // Throws util::NotFound when nothing in the correlation is held.
  db::model::LegalHoldRecord ReleaseLegalHold(const std::string& correlation_id);

  std::vector<db::model::LegalHoldRecord> LegalHolds();

  // Insertion order.
  std::vector<db::model::AuditEventRecord> Chain(const std::string& correlation_id);

  std::vector<db::model::PartitionRecord> Partitions();

  const std::shared_ptr<db::Repository>& Repository() const {
    return repository_;
  }

 private:
  InsertResult InsertInTx(db::Transaction& tx, db::model::AuditEventRecord record, uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
};

// Maps a failed Result to the matching util exception.
[[noreturn]] void RaiseStoreError(const db::Result& result, const std::string& context);

} // namespace audit::core
