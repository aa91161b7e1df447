#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/action_trace_record.hpp"
#include "internal/db/model/audit_event_record.hpp"
#include "internal/db/model/legal_hold_record.hpp"
#include "internal/db/model/partition_record.hpp"

namespace audit::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertEvent resolves the partition, checks the parent and inserts
    as one unit; a missing parent is ForeignKeyViolation, a missing
    bucket is PartitionMissing, a duplicate event_id is AlreadyExists
  - DeleteEvent checks for children and deletes as one unit; a row with
    children is RestrictViolation and stays in place
  - Nothing updates an event once stored except its legal_hold flag,
    which is hold metadata and outside the hash chain

  Begin() throws util::StorageUnavailableError when the backend cannot
  open a transaction within its configured timeout.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kReadWrite) = 0;

  // ---------------------------------------------------------------------
  // Partitions
  // ---------------------------------------------------------------------

  // Idempotent: creating an existing partition is Ok.
  virtual Result CreatePartition(Transaction&, const model::PartitionRecord&) = 0;

  virtual bool HasPartition(Transaction&, const std::string& partition_key) = 0;

  virtual std::vector<model::PartitionRecord> ListPartitions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Audit events
  // ---------------------------------------------------------------------

  // Assigns record.sequence on success.
  virtual Result InsertEvent(Transaction&, model::AuditEventRecord&) = 0;

  virtual std::optional<model::AuditEventRecord> GetEvent(Transaction&, const std::string& event_id) = 0;

  // Bucket-local lookup.
  virtual std::optional<model::AuditEventRecord> GetEventInPartition(Transaction&, const std::string& event_id,
                                                                     const std::string& event_date) = 0;

  virtual Result DeleteEvent(Transaction&, const std::string& event_id) = 0;

  virtual uint64_t CountChildren(Transaction&, const std::string& event_id) = 0;

  // Ordered by insertion sequence.
  virtual std::vector<model::AuditEventRecord> ListEventsByCorrelation(Transaction&, const std::string& correlation_id) = 0;

  // event_hash of the newest event in the chain, empty if none. Writers
  // must call this inside the transaction that inserts the next link.
  virtual std::string LatestChainHash(Transaction&, const std::string& correlation_id) = 0;

  // ---------------------------------------------------------------------
  // Legal holds
  // ---------------------------------------------------------------------

  // Flags every stored event of hold.correlation_id and records the hold;
  // placing it again refreshes reason, placed_by and placed_at_ms. NotFound
  // when the correlation has no events. Sets hold.event_count on success.
  virtual Result PlaceLegalHold(Transaction&, model::LegalHoldRecord& hold) = 0;

  // Clears the flag on every event of hold.correlation_id and drops the
  // hold. NotFound when nothing in the correlation is held. On success
  // hold carries the released record and the number of events cleared.
  virtual Result ReleaseLegalHold(Transaction&, model::LegalHoldRecord& hold) = 0;

  // Ordered by correlation_id.
  virtual std::vector<model::LegalHoldRecord> ListLegalHolds(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Action traces
  // ---------------------------------------------------------------------

  virtual Result InsertActionTrace(Transaction&, const model::ActionTraceRecord&) = 0;

  virtual Result ScanActionTraces(Transaction&, const ActionTraceFilter& filter, const ActionTraceVisitor& visit) = 0;
};

} // namespace audit::db
