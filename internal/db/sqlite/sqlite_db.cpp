#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace audit::db::sqlite {

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  Open();
  Configure();
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds lock_timeout, bool wal_mode)
    : SqliteDB(std::move(path), SqliteOptions{lock_timeout, wal_mode, false}) {}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

bool SqliteDB::InMemory() const {
  return path_.empty() || path_ == ":memory:" || path_.rfind("file::memory:", 0) == 0;
}

void SqliteDB::Open() {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc == SQLITE_OK) return;

  std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
  if (db_) sqlite3_close(db_);
  db_ = nullptr;
  throw util::StorageUnavailableError("sqlite: cannot open " + path_ + ": " + msg);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  std::string msg = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw std::runtime_error("sqlite: " + msg);
}

void SqliteDB::Configure() {
  if (const int rc = sqlite3_busy_timeout(db_, static_cast<int>(options_.lock_timeout.count())); rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite: busy_timeout: ") + sqlite3_errmsg(db_));
  }

  // parent/child integrity and restrict-on-delete rely on enforced foreign keys
  Exec("PRAGMA foreign_keys=ON;");

  if (!InMemory()) {
    Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");
    // audit rows must survive power loss once committed
    Exec(options_.wal_mode ? "PRAGMA synchronous=NORMAL;" : "PRAGMA synchronous=FULL;");
  }

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-16384;");

  if (options_.read_only) Exec("PRAGMA query_only=ON;");

  AUDIT_LOG_INFO("sqlite connection opened",
                 {observability::StringField("path", path_), observability::BoolField("wal", options_.wal_mode && !InMemory()),
                  observability::BoolField("read_only", options_.read_only)});
}

} // namespace audit::db::sqlite
