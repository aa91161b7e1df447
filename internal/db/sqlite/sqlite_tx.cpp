#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace audit::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), mode_(mode), lock_(db_->TxMutex(), std::defer_lock) {
  if (!lock_.try_lock_for(db_->LockTimeout())) {
    throw util::StorageUnavailableError("sqlite: timed out waiting for connection " + db_->Path());
  }

  try {
    db_->Exec(mode_ == TxMode::kReadWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  } catch (const std::exception& e) {
    throw util::StorageUnavailableError(std::string("sqlite: begin failed: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      AUDIT_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    throw util::StorageUnavailableError(std::string("sqlite: commit failed: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace audit::db::sqlite
