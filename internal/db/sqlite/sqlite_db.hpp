#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace audit::db::sqlite {

struct SqliteOptions {
  std::chrono::milliseconds lock_timeout{5000};
  bool wal_mode = true;
  // Sets query_only; used for the analytics reader handle.
  bool read_only = false;
};

/*
  Owns one sqlite3 connection.

  One connection carries one transaction at a time; TxMutex() serializes
  transactions from different threads on the same handle. ":memory:" and
  "file::memory:" paths get a private database, so WAL is never applied to them.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  SqliteDB(std::string path, std::chrono::milliseconds lock_timeout, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const;

  std::timed_mutex& TxMutex() {
    return tx_mutex_;
  }

  std::chrono::milliseconds LockTimeout() const {
    return options_.lock_timeout;
  }

  // Runs one or more statements without results (pragmas, DDL, BEGIN/COMMIT).
  void Exec(const std::string& sql);

 private:
  void Open();
  void Configure();

  sqlite3*         db_ = nullptr;
  std::string      path_;
  SqliteOptions    options_;
  std::timed_mutex tx_mutex_;
};

} // namespace audit::db::sqlite
