#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace audit::db::sqlite {

/*
  Holds the connection's TxMutex for its whole lifetime.

  Writers open with BEGIN IMMEDIATE so the chain-head read and the event
  insert run under the database write lock. Readers open with BEGIN DEFERRED,
  normally on the query_only reader connection.
*/
class SqliteTransaction final : public db::Transaction {
public:
  // Throws util::StorageUnavailableError if the connection or the
  // database write lock cannot be obtained in time.
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); } // namespace audit::db::sqlite
  bool Writable() const { return mode_ == TxMode::kReadWrite; } // namespace audit::db::sqlite

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; } // namespace audit::db::sqlite

private:
  std::shared_ptr<SqliteDB> db_;
  TxMode mode_;
  std::unique_lock<std::timed_mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace audit::db::sqlite
