#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/partition/partition_key.hpp"

namespace audit::db::sqlite {

using audit::db::ErrorCode;
using audit::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Stmt(st);
}

// Reads on a failed prepare mean a broken schema or connection; surface
// them instead of reporting "not found".
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty -> NULL, so optional references stay out of FK checks
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::AuditEventRecord ReadEvent(sqlite3_stmt* st) {
  model::AuditEventRecord r;
  r.sequence            = ColU64(st, 0);
  r.event_id            = ColText(st, 1);
  r.event_date          = ColText(st, 2);
  r.version             = ColText(st, 3);
  r.service             = ColText(st, 4);
  r.event_type          = ColText(st, 5);
  r.event_timestamp_ms  = ColU64(st, 6);
  r.correlation_id      = ColText(st, 7);
  r.outcome             = ColText(st, 8);
  r.operation           = ColText(st, 9);
  r.event_data_json     = ColText(st, 10);
  r.parent_event_id     = ColText(st, 11);
  r.parent_event_date   = ColText(st, 12);
  r.actor_type          = ColText(st, 13);
  r.actor_id            = ColText(st, 14);
  r.resource_type       = ColText(st, 15);
  r.resource_id         = ColText(st, 16);
  r.severity            = ColText(st, 17);
  r.retention_days      = ColI32(st, 18);
  r.legal_hold          = ColI32(st, 19) != 0;
  r.event_hash          = ColText(st, 20);
  r.previous_event_hash = ColText(st, 21);
  r.created_at_ms       = ColU64(st, 22);
  return r;
}

std::optional<std::string> PartitionKeyOf(const std::string& date) {
  try {
    return partition::KeyForDate(date);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

Result ReadOnly() {
  return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<SqliteDB> reader)
    : db_(std::move(db)), reader_(std::move(reader)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    if (mode == TxMode::kReadOnly && reader_)
        return std::make_unique<SqliteTransaction>(reader_, mode);
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (sqlite3_extended_errcode(db)) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            return Result::Err(ErrorCode::ForeignKeyViolation, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Partitions
// ------------------------------------------------------------------

Result SqliteRepository::CreatePartition(Transaction& t, const model::PartitionRecord& r) {
    if (!TX(t).Writable()) return ReadOnly();
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::INSERT_PARTITION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.partition_key);
    BindText(st.get(), 2, r.range_start);
    BindText(st.get(), 3, r.range_end);

    return Translate(db, sqlite3_step(st.get()));
}

bool SqliteRepository::HasPartition(Transaction& t, const std::string& partition_key) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PARTITION);
    BindText(st.get(), 1, partition_key);
    return sqlite3_step(st.get()) == SQLITE_ROW;
}

std::vector<model::PartitionRecord> SqliteRepository::ListPartitions(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PARTITIONS);

    std::vector<model::PartitionRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::PartitionRecord r;
        r.partition_key = ColText(st.get(), 0);
        r.range_start   = ColText(st.get(), 1);
        r.range_end     = ColText(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Audit events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::AuditEventRecord& r) {
    if (!TX(t).Writable()) return ReadOnly();
    auto* db = TX(t).Handle();

    // BEGIN IMMEDIATE already holds the write lock, so the partition
    // check, the FK check and the insert form one unit.
    auto key = PartitionKeyOf(r.event_date);
    if (!key) return Result::Err(ErrorCode::ConstraintViolation, "malformed event_date: " + r.event_date);
    if (!HasPartition(t, *key))
        return Result::Err(ErrorCode::PartitionMissing, "no partition " + *key + " for event_date " + r.event_date);

    auto st = Prepare(db, sql::INSERT_EVENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    auto* s = st.get();
    BindText(s, 1, *key);
    BindText(s, 2, r.event_id);
    BindText(s, 3, r.event_date);
    BindText(s, 4, r.version);
    BindText(s, 5, r.service);
    BindText(s, 6, r.event_type);
    BindU64(s, 7, r.event_timestamp_ms);
    BindText(s, 8, r.correlation_id);
    BindText(s, 9, r.outcome);
    BindText(s, 10, r.operation);
    BindText(s, 11, r.event_data_json);
    BindOptionalText(s, 12, r.parent_event_id);
    BindOptionalText(s, 13, r.parent_event_date);
    BindText(s, 14, r.actor_type);
    BindText(s, 15, r.actor_id);
    BindText(s, 16, r.resource_type);
    BindText(s, 17, r.resource_id);
    BindText(s, 18, r.severity);
    BindI32(s, 19, r.retention_days);
    BindI32(s, 20, r.legal_hold ? 1 : 0);
    BindText(s, 21, r.event_hash);
    BindText(s, 22, r.previous_event_hash);
    BindU64(s, 23, r.created_at_ms);

    auto result = Translate(db, sqlite3_step(s));
    if (result) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::AuditEventRecord>
SqliteRepository::GetEvent(Transaction& t, const std::string& event_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_EVENT);
    BindText(st.get(), 1, event_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadEvent(st.get());
}

std::optional<model::AuditEventRecord>
SqliteRepository::GetEventInPartition(Transaction& t, const std::string& event_id, const std::string& event_date) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_EVENT_IN_PARTITION);
    BindText(st.get(), 1, event_id);
    BindText(st.get(), 2, event_date);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadEvent(st.get());
}

Result SqliteRepository::DeleteEvent(Transaction& t, const std::string& event_id) {
    if (!TX(t).Writable()) return ReadOnly();
    auto* db = TX(t).Handle();

    auto existing = GetEvent(t, event_id);
    if (!existing) return Result::Err(ErrorCode::NotFound, "event " + event_id + " not found");

    if (auto children = CountChildren(t, event_id); children > 0)
        return Result::Err(ErrorCode::RestrictViolation,
                           "event " + event_id + " has " + std::to_string(children) + " child event(s)");

    if (existing->legal_hold)
        return Result::Err(ErrorCode::LegalHold, "event " + event_id + " is under legal hold");

    auto st = Prepare(db, sql::DELETE_EVENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, event_id);
    BindText(st.get(), 2, existing->event_date);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result.code == ErrorCode::ForeignKeyViolation)
        return Result::Err(ErrorCode::RestrictViolation, result.message);
    return result;
}

uint64_t SqliteRepository::CountChildren(Transaction& t, const std::string& event_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::COUNT_CHILDREN);
    BindText(st.get(), 1, event_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

std::vector<model::AuditEventRecord>
SqliteRepository::ListEventsByCorrelation(Transaction& t, const std::string& correlation_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_EVENTS_BY_CORRELATION);
    BindText(st.get(), 1, correlation_id);

    std::vector<model::AuditEventRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadEvent(st.get()));
    return out;
}

std::string SqliteRepository::LatestChainHash(Transaction& t, const std::string& correlation_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_CHAIN_HEAD);
    BindText(st.get(), 1, correlation_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return {};
    return ColText(st.get(), 0);
}

// ------------------------------------------------------------------
// Legal holds
// ------------------------------------------------------------------

Result SqliteRepository::PlaceLegalHold(Transaction& t, model::LegalHoldRecord& hold) {
    if (!TX(t).Writable()) return ReadOnly();
    auto* db = TX(t).Handle();

    auto flag = Prepare(db, sql::SET_EVENTS_LEGAL_HOLD);
    if (!flag) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(flag.get(), 1, hold.correlation_id);

    if (auto result = Translate(db, sqlite3_step(flag.get())); !result) return result;
    const auto flagged = static_cast<uint64_t>(sqlite3_changes(db));
    if (flagged == 0) return Result::Err(ErrorCode::NotFound, "no events for correlation_id " + hold.correlation_id);

    auto st = Prepare(db, sql::UPSERT_LEGAL_HOLD);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, hold.correlation_id);
    BindText(st.get(), 2, hold.reason);
    BindText(st.get(), 3, hold.placed_by);
    BindU64(st.get(), 4, hold.placed_at_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) hold.event_count = flagged;
    return result;
}

Result SqliteRepository::ReleaseLegalHold(Transaction& t, model::LegalHoldRecord& hold) {
    if (!TX(t).Writable()) return ReadOnly();
    auto* db = TX(t).Handle();

    bool recorded = false;
    {
        auto st = PrepareOrThrow(db, sql::SELECT_LEGAL_HOLD);
        BindText(st.get(), 1, hold.correlation_id);
        if (sqlite3_step(st.get()) == SQLITE_ROW) {
            recorded          = true;
            hold.reason       = ColText(st.get(), 0);
            hold.placed_by    = ColText(st.get(), 1);
            hold.placed_at_ms = ColU64(st.get(), 2);
        }
    }

    auto clear = Prepare(db, sql::CLEAR_EVENTS_LEGAL_HOLD);
    if (!clear) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(clear.get(), 1, hold.correlation_id);

    if (auto result = Translate(db, sqlite3_step(clear.get())); !result) return result;
    const auto cleared = static_cast<uint64_t>(sqlite3_changes(db));
    if (!recorded && cleared == 0)
        return Result::Err(ErrorCode::NotFound, "no legal hold on correlation_id " + hold.correlation_id);

    auto st = Prepare(db, sql::DELETE_LEGAL_HOLD);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, hold.correlation_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) hold.event_count = cleared;
    return result;
}

std::vector<model::LegalHoldRecord> SqliteRepository::ListLegalHolds(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_LEGAL_HOLDS);

    std::vector<model::LegalHoldRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::LegalHoldRecord r;
        r.correlation_id = ColText(st.get(), 0);
        r.reason         = ColText(st.get(), 1);
        r.placed_by      = ColText(st.get(), 2);
        r.placed_at_ms   = ColU64(st.get(), 3);
        r.event_count    = ColU64(st.get(), 4);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Action traces
// ------------------------------------------------------------------

Result SqliteRepository::InsertActionTrace(Transaction& t, const model::ActionTraceRecord& r) {
    if (!TX(t).Writable()) return ReadOnly();
    auto* db = TX(t).Handle();

    auto key = PartitionKeyOf(r.action_date);
    if (!key) return Result::Err(ErrorCode::ConstraintViolation, "malformed action_date: " + r.action_date);
    if (!HasPartition(t, *key))
        return Result::Err(ErrorCode::PartitionMissing, "no partition " + *key + " for action_date " + r.action_date);

    auto st = Prepare(db, sql::INSERT_ACTION_TRACE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    auto* s = st.get();
    BindText(s, 1, r.action_id);
    BindText(s, 2, *key);
    BindText(s, 3, r.action_date);
    BindText(s, 4, r.incident_type);
    BindText(s, 5, r.alert_name);
    BindText(s, 6, r.incident_severity);
    BindText(s, 7, r.playbook_id);
    BindText(s, 8, r.playbook_version);
    BindI32(s, 9, r.playbook_step_number);
    BindText(s, 10, r.playbook_execution_id);
    BindI32(s, 11, r.catalog_selected ? 1 : 0);
    BindI32(s, 12, r.chained ? 1 : 0);
    BindI32(s, 13, r.manual_escalation ? 1 : 0);
    BindText(s, 14, r.action_type);
    BindText(s, 15, r.execution_status);
    BindU64(s, 16, r.action_timestamp_ms);

    return Translate(db, sqlite3_step(s));
}

Result SqliteRepository::ScanActionTraces(Transaction& t, const ActionTraceFilter& filter, const ActionTraceVisitor& visit) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::SCAN_ACTION_TRACES);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    auto* s = st.get();
    BindU64(s, 1, filter.since_ms);
    // sqlite integers are signed; clamp the open upper bound
    BindU64(s, 2, std::min<uint64_t>(filter.until_ms, static_cast<uint64_t>(INT64_MAX)));

    const auto bind_filter = [s](int idx, const std::optional<std::string>& value) {
        if (value) BindText(s, idx, *value);
        else sqlite3_bind_null(s, idx);
    };
    bind_filter(3, filter.incident_type);
    bind_filter(4, filter.playbook_id);
    bind_filter(5, filter.playbook_version);
    bind_filter(6, filter.action_type);

    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        model::ActionTraceRecord r;
        r.action_id             = ColText(s, 0);
        r.action_date           = ColText(s, 1);
        r.incident_type         = ColText(s, 2);
        r.alert_name            = ColText(s, 3);
        r.incident_severity     = ColText(s, 4);
        r.playbook_id           = ColText(s, 5);
        r.playbook_version      = ColText(s, 6);
        r.playbook_step_number  = ColI32(s, 7);
        r.playbook_execution_id = ColText(s, 8);
        r.catalog_selected      = ColI32(s, 9) != 0;
        r.chained               = ColI32(s, 10) != 0;
        r.manual_escalation     = ColI32(s, 11) != 0;
        r.action_type           = ColText(s, 12);
        r.execution_status      = ColText(s, 13);
        r.action_timestamp_ms   = ColU64(s, 14);
        visit(r);
    }
    return Translate(db, rc);
}

} // namespace audit::db::sqlite
