#pragma once

#include <chrono>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace audit::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool,
                        std::chrono::milliseconds timeout = std::chrono::seconds(10));

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
  std::shared_ptr<PgPool> pool_;
  std::chrono::milliseconds timeout_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
