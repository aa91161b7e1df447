#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace audit::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  // reader, when given, carries read-only transactions.
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<SqliteDB> reader = nullptr);

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
  std::shared_ptr<SqliteDB> db_;
  std::shared_ptr<SqliteDB> reader_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
