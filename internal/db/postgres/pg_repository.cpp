#include "pg_repository.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>

#include "internal/partition/partition_key.hpp"

namespace audit::db::postgres {

namespace {

std::optional<std::string> Nullable(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::AuditEventRecord ReadEvent(const pqxx::row& row) {
  model::AuditEventRecord r;
  r.sequence            = row[0].as<uint64_t>();
  r.event_id            = row[1].c_str();
  r.event_date          = row[2].c_str();
  r.version             = row[3].c_str();
  r.service             = row[4].c_str();
  r.event_type          = row[5].c_str();
  r.event_timestamp_ms  = row[6].as<uint64_t>();
  r.correlation_id      = row[7].c_str();
  r.outcome             = row[8].c_str();
  r.operation           = row[9].c_str();
  r.event_data_json     = row[10].c_str();
  r.parent_event_id     = Text(row[11]);
  r.parent_event_date   = Text(row[12]);
  r.actor_type          = Text(row[13]);
  r.actor_id            = Text(row[14]);
  r.resource_type       = Text(row[15]);
  r.resource_id         = Text(row[16]);
  r.severity            = Text(row[17]);
  r.retention_days      = row[18].as<int32_t>();
  r.legal_hold          = row[19].as<bool>();
  r.event_hash          = row[20].c_str();
  r.previous_event_hash = row[21].c_str();
  r.created_at_ms       = row[22].as<uint64_t>();
  return r;
}

Result ReadOnly() {
  return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds timeout)
    : pool_(std::move(pool)), timeout_(timeout) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(TxMode mode) {
  return std::make_unique<PgTransaction>(pool_, mode, timeout_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e))
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e))
    return Result::Err(ErrorCode::ForeignKeyViolation, e.what());
  if (dynamic_cast<const pqxx::restrict_violation*>(&e))
    return Result::Err(ErrorCode::RestrictViolation, e.what());
  // "no partition of relation found for row"
  if (dynamic_cast<const pqxx::check_violation*>(&e))
    return Result::Err(ErrorCode::PartitionMissing, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e))
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e))
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e))
    return Result::Err(ErrorCode::Unavailable, e.what());
  if (auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    // lock_not_available, query_canceled (statement_timeout)
    if (sql->sqlstate() == "55P03" || sql->sqlstate() == "57014")
      return Result::Err(ErrorCode::Busy, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Partitions
// ------------------------------------------------------------------

Result PgRepository::CreatePartition(Transaction& t, const model::PartitionRecord& r) {
  if (!TX(t).Writable()) return ReadOnly();
  auto& w = TX(t).Work();
  try {
    const auto from = w.quote(r.range_start);
    const auto to   = w.quote(r.range_end);
    w.exec("CREATE TABLE IF NOT EXISTS " + w.quote_name("audit_events_" + r.partition_key) +
           " PARTITION OF audit_events FOR VALUES FROM (" + from + ") TO (" + to + ")");
    w.exec("CREATE TABLE IF NOT EXISTS " + w.quote_name("action_traces_" + r.partition_key) +
           " PARTITION OF action_traces FOR VALUES FROM (" + from + ") TO (" + to + ")");
    w.exec_prepared("insert_partition", r.partition_key, r.range_start, r.range_end);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::HasPartition(Transaction& t, const std::string& partition_key) {
  return !TX(t).Work().exec_prepared("has_partition", partition_key).empty();
}

std::vector<model::PartitionRecord> PgRepository::ListPartitions(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_partitions");

  std::vector<model::PartitionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PartitionRecord r;
    r.partition_key = row[0].c_str();
    r.range_start   = row[1].c_str();
    r.range_end     = row[2].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Audit events
// ------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, model::AuditEventRecord& r) {
  if (!TX(t).Writable()) return ReadOnly();
  try {
    const auto key = partition::KeyForDate(r.event_date);
    if (!HasPartition(t, key))
      return Result::Err(ErrorCode::PartitionMissing, "no partition " + key + " for event_date " + r.event_date);

    auto res = TX(t).Work().exec_prepared(
        "insert_event", r.event_id, r.event_date, r.version, r.service, r.event_type, r.event_timestamp_ms,
        r.correlation_id, r.outcome, r.operation, r.event_data_json, Nullable(r.parent_event_id),
        Nullable(r.parent_event_date), r.actor_type, r.actor_id, r.resource_type, r.resource_id, r.severity,
        r.retention_days, r.legal_hold, r.event_hash, r.previous_event_hash, r.created_at_ms);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::invalid_argument& e) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AuditEventRecord> PgRepository::GetEvent(Transaction& t, const std::string& event_id) {
  auto res = TX(t).Work().exec_prepared("get_event", event_id);
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

std::optional<model::AuditEventRecord>
PgRepository::GetEventInPartition(Transaction& t, const std::string& event_id, const std::string& event_date) {
  auto res = TX(t).Work().exec_prepared("get_event_in_partition", event_id, event_date);
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

Result PgRepository::DeleteEvent(Transaction& t, const std::string& event_id) {
  if (!TX(t).Writable()) return ReadOnly();
  try {
    auto existing = GetEvent(t, event_id);
    if (!existing) return Result::Err(ErrorCode::NotFound, "event " + event_id + " not found");

    if (auto children = CountChildren(t, event_id); children > 0)
      return Result::Err(ErrorCode::RestrictViolation,
                         "event " + event_id + " has " + std::to_string(children) + " child event(s)");

    if (existing->legal_hold)
      return Result::Err(ErrorCode::LegalHold, "event " + event_id + " is under legal hold");

    // ON DELETE RESTRICT rejects the row if any child still points at it
    TX(t).Work().exec_prepared("delete_event", event_id, existing->event_date);
    return Result::Ok();
  } catch (const pqxx::foreign_key_violation& e) {
    return Result::Err(ErrorCode::RestrictViolation, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountChildren(Transaction& t, const std::string& event_id) {
  auto res = TX(t).Work().exec_prepared("count_children", event_id);
  return res[0][0].as<uint64_t>();
}

std::vector<model::AuditEventRecord>
PgRepository::ListEventsByCorrelation(Transaction& t, const std::string& correlation_id) {
  auto res = TX(t).Work().exec_prepared("list_events_by_correlation", correlation_id);

  std::vector<model::AuditEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadEvent(row));
  return out;
}

std::string PgRepository::LatestChainHash(Transaction& t, const std::string& correlation_id) {
  auto& w = TX(t).Work();
  // Writers serialize per chain until commit.
  if (TX(t).Writable()) w.exec_prepared("chain_lock", correlation_id);

  auto res = w.exec_prepared("chain_head", correlation_id);
  if (res.empty()) return {};
  return res[0][0].c_str();
}

// ------------------------------------------------------------------
// Legal holds
// ------------------------------------------------------------------

Result PgRepository::PlaceLegalHold(Transaction& t, model::LegalHoldRecord& hold) {
  if (!TX(t).Writable()) return ReadOnly();
  try {
    auto&      w       = TX(t).Work();
    const auto flagged = static_cast<uint64_t>(w.exec_prepared("hold_events", hold.correlation_id).affected_rows());
    if (flagged == 0) return Result::Err(ErrorCode::NotFound, "no events for correlation_id " + hold.correlation_id);

    w.exec_prepared("upsert_legal_hold", hold.correlation_id, hold.reason, hold.placed_by, hold.placed_at_ms);
    hold.event_count = flagged;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReleaseLegalHold(Transaction& t, model::LegalHoldRecord& hold) {
  if (!TX(t).Writable()) return ReadOnly();
  try {
    auto& w = TX(t).Work();

    auto existing = w.exec_prepared("get_legal_hold", hold.correlation_id);
    if (!existing.empty()) {
      hold.reason       = existing[0][0].c_str();
      hold.placed_by    = existing[0][1].c_str();
      hold.placed_at_ms = existing[0][2].as<uint64_t>();
    }

    const auto cleared = static_cast<uint64_t>(w.exec_prepared("release_events", hold.correlation_id).affected_rows());
    if (existing.empty() && cleared == 0)
      return Result::Err(ErrorCode::NotFound, "no legal hold on correlation_id " + hold.correlation_id);

    w.exec_prepared("delete_legal_hold", hold.correlation_id);
    hold.event_count = cleared;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LegalHoldRecord> PgRepository::ListLegalHolds(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_legal_holds");

  std::vector<model::LegalHoldRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::LegalHoldRecord r;
    r.correlation_id = row[0].c_str();
    r.reason         = row[1].c_str();
    r.placed_by      = row[2].c_str();
    r.placed_at_ms   = row[3].as<uint64_t>();
    r.event_count    = row[4].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Action traces
// ------------------------------------------------------------------

Result PgRepository::InsertActionTrace(Transaction& t, const model::ActionTraceRecord& r) {
  if (!TX(t).Writable()) return ReadOnly();
  try {
    const auto key = partition::KeyForDate(r.action_date);
    if (!HasPartition(t, key))
      return Result::Err(ErrorCode::PartitionMissing, "no partition " + key + " for action_date " + r.action_date);

    TX(t).Work().exec_prepared("insert_action_trace", r.action_id, r.action_date, r.incident_type, r.alert_name,
                               r.incident_severity, r.playbook_id, r.playbook_version, r.playbook_step_number,
                               r.playbook_execution_id, r.catalog_selected, r.chained, r.manual_escalation,
                               r.action_type, r.execution_status, r.action_timestamp_ms);
    return Result::Ok();
  } catch (const std::invalid_argument& e) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ScanActionTraces(Transaction& t, const ActionTraceFilter& filter, const ActionTraceVisitor& visit) {
  try {
    const auto until = std::min<uint64_t>(filter.until_ms, static_cast<uint64_t>(INT64_MAX));
    auto res = TX(t).Work().exec_prepared("scan_action_traces", filter.since_ms, until, filter.incident_type,
                                          filter.playbook_id, filter.playbook_version, filter.action_type);
    for (const auto& row : res) {
      model::ActionTraceRecord r;
      r.action_id             = row[0].c_str();
      r.action_date           = row[1].c_str();
      r.incident_type         = row[2].c_str();
      r.alert_name            = Text(row[3]);
      r.incident_severity     = Text(row[4]);
      r.playbook_id           = Text(row[5]);
      r.playbook_version      = Text(row[6]);
      r.playbook_step_number  = row[7].is_null() ? 0 : row[7].as<int32_t>();
      r.playbook_execution_id = Text(row[8]);
      r.catalog_selected      = row[9].as<bool>();
      r.chained               = row[10].as<bool>();
      r.manual_escalation     = row[11].as<bool>();
      r.action_type           = row[12].c_str();
      r.execution_status      = row[13].c_str();
      r.action_timestamp_ms   = row[14].as<uint64_t>();
      visit(r);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
