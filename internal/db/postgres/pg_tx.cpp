#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace audit::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode, std::chrono::milliseconds timeout)
    : mode_(mode) {
  try {
    conn_ = pool->Acquire(timeout);
    tx_ = std::make_unique<pqxx::work>(*conn_);

    const std::string ms = std::to_string(timeout.count());
    tx_->exec("SET LOCAL lock_timeout = " + ms);
    tx_->exec("SET LOCAL statement_timeout = " + ms);
    if (mode_ == TxMode::kReadOnly) tx_->exec("SET TRANSACTION READ ONLY");
  } catch (const pqxx::broken_connection& e) {
    throw util::StorageUnavailableError(std::string("postgres: connection failed: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw util::StorageUnavailableError(std::string("postgres: begin failed: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_ && tx_) {
    try { tx_->abort(); }
    catch (const std::exception& e) {
      AUDIT_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    throw util::StorageUnavailableError(std::string("postgres: commit failed: ") + e.what());
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    throw util::StorageUnavailableError(std::string("postgres: commit in doubt: ") + e.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
