#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace audit::testing {

/*
  Repository that forwards to a real backend but refuses to open
  transactions while marked down, the way an unreachable store does.
*/
class FlakyRepository final : public db::Repository {
 public:
  explicit FlakyRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void SetDown(bool down) {
    down_ = down;
  }

  // Fails the next n Begin() calls, then recovers.
  void FailNext(int n) {
    fail_next_ = n;
  }

  // Read-write transactions handed out so far.
  uint64_t WriteTransactions() const {
    return write_transactions_;
  }

  std::unique_ptr<db::Transaction> Begin(db::TxMode mode = db::TxMode::kReadWrite) override {
    if (down_ || fail_next_.fetch_sub(1) > 0) {
      throw util::StorageUnavailableError("store unreachable");
    }
    auto tx = inner_->Begin(mode);
    if (mode == db::TxMode::kReadWrite) ++write_transactions_;
    return tx;
  }

  db::Result CreatePartition(db::Transaction& tx, const db::model::PartitionRecord& p) override {
    return inner_->CreatePartition(tx, p);
  }

  bool HasPartition(db::Transaction& tx, const std::string& key) override {
    return inner_->HasPartition(tx, key);
  }

  std::vector<db::model::PartitionRecord> ListPartitions(db::Transaction& tx) override {
    return inner_->ListPartitions(tx);
  }

  db::Result InsertEvent(db::Transaction& tx, db::model::AuditEventRecord& r) override {
    return inner_->InsertEvent(tx, r);
  }

  std::optional<db::model::AuditEventRecord> GetEvent(db::Transaction& tx, const std::string& id) override {
    return inner_->GetEvent(tx, id);
  }

  std::optional<db::model::AuditEventRecord> GetEventInPartition(db::Transaction& tx, const std::string& id,
                                                                 const std::string& date) override {
    return inner_->GetEventInPartition(tx, id, date);
  }

  db::Result DeleteEvent(db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteEvent(tx, id);
  }

  uint64_t CountChildren(db::Transaction& tx, const std::string& id) override {
    return inner_->CountChildren(tx, id);
  }

  std::vector<db::model::AuditEventRecord> ListEventsByCorrelation(db::Transaction& tx,
                                                                   const std::string& correlation_id) override {
    return inner_->ListEventsByCorrelation(tx, correlation_id);
  }

  std::string LatestChainHash(db::Transaction& tx, const std::string& correlation_id) override {
    return inner_->LatestChainHash(tx, correlation_id);
  }

  db::Result PlaceLegalHold(db::Transaction& tx, db::model::LegalHoldRecord& hold) override {
    return inner_->PlaceLegalHold(tx, hold);
  }

  db::Result ReleaseLegalHold(db::Transaction& tx, db::model::LegalHoldRecord& hold) override {
    return inner_->ReleaseLegalHold(tx, hold);
  }

  std::vector<db::model::LegalHoldRecord> ListLegalHolds(db::Transaction& tx) override {
    return inner_->ListLegalHolds(tx);
  }

  db::Result InsertActionTrace(db::Transaction& tx, const db::model::ActionTraceRecord& r) override {
    return inner_->InsertActionTrace(tx, r);
  }

  db::Result ScanActionTraces(db::Transaction& tx, const db::ActionTraceFilter& filter,
                              const db::ActionTraceVisitor& visit) override {
    return inner_->ScanActionTraces(tx, filter, visit);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
  std::atomic<bool>               down_{false};
  std::atomic<int>                fail_next_{0};
  std::atomic<uint64_t>           write_transactions_{0};
};

} // namespace audit::testing
