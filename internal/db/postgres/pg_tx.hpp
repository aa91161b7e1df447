#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace audit::db::postgres {

// Throws util::StorageUnavailableError when no connection can be opened
// or the transaction cannot start.
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode, std::chrono::milliseconds timeout);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }
  bool Writable() const { return mode_ == TxMode::kReadWrite; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  TxMode mode_;
  bool committed_ = false;
  bool finished_ = false;
};

}
