#include "sqlite_queue.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace audit::dlq {

using db::sqlite::SqliteTransaction;
using model::CanTransition;
using model::DlqState;

namespace {

constexpr const char* kCountEntries = "SELECT COUNT(*) FROM dlq_entries;";

constexpr const char* kInsertEntry =
    "INSERT INTO dlq_entries(entry_id,destination,payload,retry_count,enqueued_at_ms,next_attempt_at_ms,last_error,"
    "state,lease_owner,lease_expires_at_ms) VALUES(?,?,?,0,?,?,?,?,NULL,0);";

constexpr const char* kSelectDue =
    "SELECT entry_id,destination,payload,retry_count,enqueued_at_ms,next_attempt_at_ms,last_error,state"
    " FROM dlq_entries"
    " WHERE (state=?1 AND next_attempt_at_ms<=?2) OR (state=?3 AND lease_expires_at_ms<=?4)"
    " ORDER BY next_attempt_at_ms, enqueued_at_ms, entry_id LIMIT ?5;";

constexpr const char* kLeaseEntry =
    "UPDATE dlq_entries SET state=?,lease_owner=?,lease_expires_at_ms=? WHERE entry_id=?;";

constexpr const char* kSelectOwner = "SELECT state,lease_owner FROM dlq_entries WHERE entry_id=?;";

constexpr const char* kDeleteEntry = "DELETE FROM dlq_entries WHERE entry_id=?;";

constexpr const char* kRescheduleEntry =
    "UPDATE dlq_entries SET state=?,retry_count=retry_count+1,last_error=?,next_attempt_at_ms=?,lease_owner=NULL,"
    "lease_expires_at_ms=0 WHERE entry_id=?;";

constexpr const char* kInsertDeadLetter =
    "INSERT INTO dlq_dead_letters(entry_id,destination,payload,retry_count,enqueued_at_ms,last_error,dead_lettered_at_ms)"
    " SELECT entry_id,destination,payload,retry_count+1,enqueued_at_ms,?,? FROM dlq_entries WHERE entry_id=?;";

constexpr const char* kCountDeadLetters = "SELECT COUNT(*) FROM dlq_dead_letters;";

constexpr const char* kListDeadLetters =
    "SELECT entry_id,destination,payload,retry_count,enqueued_at_ms,last_error,dead_lettered_at_ms"
    " FROM dlq_dead_letters ORDER BY dead_lettered_at_ms, entry_id LIMIT ?;";

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

class MigrationRunner final : public db::sql::MigrationExecutor {
 public:
  explicit MigrationRunner(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw util::StorageUnavailableError(std::string("dlq prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void Step(sqlite3* db, sqlite3_stmt* st, const char* what) {
  const int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw util::StorageUnavailableError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(std::min<uint64_t>(v, INT64_MAX)));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint64_t Count(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  Step(db, st.get(), "dlq count");
  return ColU64(st.get(), 0);
}

// Validates that owner holds entry_id in flight and may move it to next.
void CheckOwned(sqlite3* db, const std::string& entry_id, const std::string& owner, DlqState next) {
  auto st = Prepare(db, kSelectOwner);
  BindText(st.get(), 1, entry_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw util::LeaseConflict("dlq entry " + entry_id + " is not queued");
  }

  const auto state = static_cast<DlqState>(sqlite3_column_int(st.get(), 0));
  if (ColText(st.get(), 1) != owner) {
    throw util::LeaseConflict("dlq entry " + entry_id + " is not leased by " + owner);
  }
  if (!CanTransition(state, next)) {
    throw util::LeaseConflict("dlq entry " + entry_id + ": illegal transition " + std::string(model::ToString(state)) +
                              " -> " + std::string(model::ToString(next)));
  }
}

} // namespace

SqliteQueue::SqliteQueue(std::shared_ptr<db::sqlite::SqliteDB> db, uint64_t max_entries)
    : db_(std::move(db)), max_entries_(max_entries) {
  MigrationRunner runner(*db_);
  db::sql::RunMigrations(runner, db::sql::SqliteDlqSchema());
}

std::string SqliteQueue::Enqueue(const std::string& destination, const std::string& payload,
                                 const std::string& last_error, uint64_t now_ms) {
  SqliteTransaction tx(db_, db::TxMode::kReadWrite);
  auto* h = tx.Handle();

  const auto before = Count(h, kCountEntries);
  EnsureCapacity(before, max_entries_);

  const auto entry_id = util::GenerateUUIDString();

  auto st = Prepare(h, kInsertEntry);
  BindText(st.get(), 1, entry_id);
  BindText(st.get(), 2, destination);
  BindBlob(st.get(), 3, payload);
  BindU64(st.get(), 4, now_ms);
  BindU64(st.get(), 5, now_ms);
  BindText(st.get(), 6, last_error);
  sqlite3_bind_int(st.get(), 7, static_cast<int>(DlqState::kPending));
  Step(h, st.get(), "dlq enqueue");

  tx.Commit();
  ReportCapacity(before, before + 1, max_entries_);
  return entry_id;
}

std::vector<DlqEntry> SqliteQueue::LeaseDue(const LeaseRequest& req) {
  SqliteTransaction tx(db_, db::TxMode::kReadWrite);
  auto* h = tx.Handle();

  std::vector<DlqEntry> out;
  {
    auto st = Prepare(h, kSelectDue);
    sqlite3_bind_int(st.get(), 1, static_cast<int>(DlqState::kPending));
    BindU64(st.get(), 2, req.due_before_ms);
    sqlite3_bind_int(st.get(), 3, static_cast<int>(DlqState::kInFlight));
    BindU64(st.get(), 4, req.now_ms);
    sqlite3_bind_int(st.get(), 5, static_cast<int>(req.max_entries));

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      DlqEntry e;
      e.entry_id           = ColText(st.get(), 0);
      e.destination        = ColText(st.get(), 1);
      e.payload            = ColBlob(st.get(), 2);
      e.retry_count        = static_cast<uint32_t>(sqlite3_column_int(st.get(), 3));
      e.enqueued_at_ms     = ColU64(st.get(), 4);
      e.next_attempt_at_ms = ColU64(st.get(), 5);
      e.last_error         = ColText(st.get(), 6);
      e.state              = static_cast<DlqState>(sqlite3_column_int(st.get(), 7));
      out.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
      throw util::StorageUnavailableError(std::string("dlq lease: ") + sqlite3_errmsg(h));
    }
  }

  const auto expires_at = req.now_ms + static_cast<uint64_t>(req.lease_duration.count());

  for (auto& e : out) {
    // expired lease: in_flight -> pending -> in_flight
    if (e.state == DlqState::kInFlight) e.state = DlqState::kPending;

    auto st = Prepare(h, kLeaseEntry);
    sqlite3_bind_int(st.get(), 1, static_cast<int>(DlqState::kInFlight));
    BindText(st.get(), 2, req.owner);
    BindU64(st.get(), 3, expires_at);
    BindText(st.get(), 4, e.entry_id);
    Step(h, st.get(), "dlq lease");

    e.state               = DlqState::kInFlight;
    e.lease_owner         = req.owner;
    e.lease_expires_at_ms = expires_at;
  }

  tx.Commit();
  return out;
}

void SqliteQueue::Complete(const std::string& entry_id, const std::string& owner) {
  SqliteTransaction tx(db_, db::TxMode::kReadWrite);
  auto* h = tx.Handle();

  CheckOwned(h, entry_id, owner, DlqState::kSucceeded);

  auto st = Prepare(h, kDeleteEntry);
  BindText(st.get(), 1, entry_id);
  Step(h, st.get(), "dlq complete");

  tx.Commit();
}

void SqliteQueue::Reschedule(const std::string& entry_id, const std::string& owner, const std::string& error,
                             uint64_t next_attempt_at_ms) {
  SqliteTransaction tx(db_, db::TxMode::kReadWrite);
  auto* h = tx.Handle();

  CheckOwned(h, entry_id, owner, DlqState::kPending);

  auto st = Prepare(h, kRescheduleEntry);
  sqlite3_bind_int(st.get(), 1, static_cast<int>(DlqState::kPending));
  BindText(st.get(), 2, error);
  BindU64(st.get(), 3, next_attempt_at_ms);
  BindText(st.get(), 4, entry_id);
  Step(h, st.get(), "dlq reschedule");

  tx.Commit();
}

void SqliteQueue::DeadLetter(const std::string& entry_id, const std::string& owner, const std::string& error,
                             uint64_t now_ms) {
  SqliteTransaction tx(db_, db::TxMode::kReadWrite);
  auto* h = tx.Handle();

  CheckOwned(h, entry_id, owner, DlqState::kDeadLettered);

  {
    auto st = Prepare(h, kInsertDeadLetter);
    BindText(st.get(), 1, error);
    BindU64(st.get(), 2, now_ms);
    BindText(st.get(), 3, entry_id);
    Step(h, st.get(), "dlq dead-letter");
  }
  {
    auto st = Prepare(h, kDeleteEntry);
    BindText(st.get(), 1, entry_id);
    Step(h, st.get(), "dlq dead-letter");
  }

  tx.Commit();
}

uint64_t SqliteQueue::Depth() {
  SqliteTransaction tx(db_, db::TxMode::kReadOnly);
  const auto depth = Count(tx.Handle(), kCountEntries);
  tx.Commit();
  return depth;
}

uint64_t SqliteQueue::DeadLetterCount() {
  SqliteTransaction tx(db_, db::TxMode::kReadOnly);
  const auto count = Count(tx.Handle(), kCountDeadLetters);
  tx.Commit();
  return count;
}

std::vector<DeadLetterRecord> SqliteQueue::ListDeadLetters(std::size_t limit) {
  SqliteTransaction tx(db_, db::TxMode::kReadOnly);
  auto* h = tx.Handle();

  auto st = Prepare(h, kListDeadLetters);
  // LIMIT -1 means no limit
  sqlite3_bind_int64(st.get(), 1, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  std::vector<DeadLetterRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    DeadLetterRecord r;
    r.entry_id            = ColText(st.get(), 0);
    r.destination         = ColText(st.get(), 1);
    r.payload             = ColBlob(st.get(), 2);
    r.retry_count         = static_cast<uint32_t>(sqlite3_column_int(st.get(), 3));
    r.enqueued_at_ms      = ColU64(st.get(), 4);
    r.last_error          = ColText(st.get(), 5);
    r.dead_lettered_at_ms = ColU64(st.get(), 6);
    out.push_back(std::move(r));
  }
  st.reset();

  tx.Commit();
  return out;
}

} // namespace audit::dlq
