#pragma once

namespace audit::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres uses the same column lists with $n placeholders; see
  PgPool::PrepareStatements.
*/

// partitions

static constexpr const char* INSERT_PARTITION =
    "INSERT INTO audit_partitions(partition_key,range_start,range_end)"
    " VALUES(?,?,?) ON CONFLICT(partition_key) DO NOTHING;";

static constexpr const char* SELECT_PARTITION =
    "SELECT 1 FROM audit_partitions WHERE partition_key=?;";

static constexpr const char* SELECT_PARTITIONS =
    "SELECT partition_key,range_start,range_end FROM audit_partitions ORDER BY range_start;";

// audit events

#define AUDIT_EVENT_COLUMNS                                                                        \
  "event_id,event_date,event_version,service,event_type,event_timestamp_ms,correlation_id,"        \
  "event_outcome,operation,event_data,parent_event_id,parent_event_date,actor_type,actor_id,"      \
  "resource_type,resource_id,severity,retention_days,legal_hold,event_hash,previous_event_hash,"   \
  "created_at_ms"

static constexpr const char* INSERT_EVENT =
    "INSERT INTO audit_events(partition_key," AUDIT_EVENT_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EVENT =
    "SELECT rowid," AUDIT_EVENT_COLUMNS " FROM audit_events WHERE event_id=?;";

static constexpr const char* SELECT_EVENT_IN_PARTITION =
    "SELECT rowid," AUDIT_EVENT_COLUMNS " FROM audit_events WHERE event_id=? AND event_date=?;";

static constexpr const char* SELECT_EVENTS_BY_CORRELATION =
    "SELECT rowid," AUDIT_EVENT_COLUMNS " FROM audit_events WHERE correlation_id=? ORDER BY rowid;";

static constexpr const char* SELECT_CHAIN_HEAD =
    "SELECT event_hash FROM audit_events WHERE correlation_id=? ORDER BY rowid DESC LIMIT 1;";

static constexpr const char* COUNT_CHILDREN =
    "SELECT COUNT(*) FROM audit_events WHERE parent_event_id=?;";

static constexpr const char* DELETE_EVENT =
    "DELETE FROM audit_events WHERE event_id=? AND event_date=?;";

#undef AUDIT_EVENT_COLUMNS

// legal holds

static constexpr const char* SET_EVENTS_LEGAL_HOLD =
    "UPDATE audit_events SET legal_hold=1 WHERE correlation_id=?;";

static constexpr const char* CLEAR_EVENTS_LEGAL_HOLD =
    "UPDATE audit_events SET legal_hold=0 WHERE correlation_id=? AND legal_hold=1;";

static constexpr const char* UPSERT_LEGAL_HOLD =
    "INSERT INTO legal_holds(correlation_id,reason,placed_by,placed_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(correlation_id) DO UPDATE SET reason=excluded.reason,placed_by=excluded.placed_by,"
    "placed_at_ms=excluded.placed_at_ms;";

static constexpr const char* SELECT_LEGAL_HOLD =
    "SELECT reason,placed_by,placed_at_ms FROM legal_holds WHERE correlation_id=?;";

static constexpr const char* DELETE_LEGAL_HOLD =
    "DELETE FROM legal_holds WHERE correlation_id=?;";

static constexpr const char* SELECT_LEGAL_HOLDS =
    "SELECT h.correlation_id,h.reason,h.placed_by,h.placed_at_ms,"
    "(SELECT COUNT(*) FROM audit_events e WHERE e.correlation_id=h.correlation_id AND e.legal_hold=1)"
    " FROM legal_holds h ORDER BY h.correlation_id;";

// action traces

static constexpr const char* INSERT_ACTION_TRACE =
    "INSERT INTO action_traces(action_id,partition_key,action_date,incident_type,alert_name,incident_severity,"
    "playbook_id,playbook_version,playbook_step_number,playbook_execution_id,catalog_selected,chained,"
    "manual_escalation,action_type,execution_status,action_timestamp_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

// Optional filters bind NULL to disable themselves.
static constexpr const char* SCAN_ACTION_TRACES =
    "SELECT action_id,action_date,incident_type,alert_name,incident_severity,playbook_id,playbook_version,"
    "playbook_step_number,playbook_execution_id,catalog_selected,chained,manual_escalation,action_type,"
    "execution_status,action_timestamp_ms FROM action_traces"
    " WHERE action_timestamp_ms>=?1 AND action_timestamp_ms<?2"
    " AND (?3 IS NULL OR incident_type=?3)"
    " AND (?4 IS NULL OR playbook_id=?4)"
    " AND (?5 IS NULL OR playbook_version=?5)"
    " AND (?6 IS NULL OR action_type=?6);";

} // namespace audit::db::sql
