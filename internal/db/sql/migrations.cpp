#include "migrations.hpp"

namespace audit::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS audit_partitions (partition_key TEXT PRIMARY KEY, range_start TEXT NOT NULL, range_end TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS audit_events ("
      " partition_key TEXT NOT NULL REFERENCES audit_partitions(partition_key) ON DELETE RESTRICT,"
      " event_id TEXT NOT NULL, event_date TEXT NOT NULL, event_version TEXT NOT NULL, service TEXT NOT NULL,"
      " event_type TEXT NOT NULL, event_timestamp_ms INTEGER NOT NULL, correlation_id TEXT NOT NULL,"
      " event_outcome TEXT NOT NULL, operation TEXT NOT NULL, event_data TEXT NOT NULL,"
      " parent_event_id TEXT, parent_event_date TEXT, actor_type TEXT, actor_id TEXT, resource_type TEXT,"
      " resource_id TEXT, severity TEXT, retention_days INTEGER NOT NULL, legal_hold INTEGER NOT NULL DEFAULT 0,"
      " event_hash TEXT NOT NULL, previous_event_hash TEXT NOT NULL, created_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY (event_id, event_date),"
      " FOREIGN KEY (parent_event_id, parent_event_date) REFERENCES audit_events(event_id, event_date) ON DELETE RESTRICT);",
      "CREATE UNIQUE INDEX IF NOT EXISTS audit_events_event_id ON audit_events(event_id);",
      "CREATE INDEX IF NOT EXISTS audit_events_parent ON audit_events(parent_event_id, parent_event_date);",
      "CREATE INDEX IF NOT EXISTS audit_events_correlation ON audit_events(correlation_id);",
      "CREATE TABLE IF NOT EXISTS legal_holds (correlation_id TEXT PRIMARY KEY, reason TEXT NOT NULL,"
      " placed_by TEXT NOT NULL, placed_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS action_traces ("
      " action_id TEXT PRIMARY KEY,"
      " partition_key TEXT NOT NULL REFERENCES audit_partitions(partition_key) ON DELETE RESTRICT,"
      " action_date TEXT NOT NULL, incident_type TEXT NOT NULL, alert_name TEXT, incident_severity TEXT,"
      " playbook_id TEXT, playbook_version TEXT, playbook_step_number INTEGER, playbook_execution_id TEXT,"
      " catalog_selected INTEGER NOT NULL, chained INTEGER NOT NULL, manual_escalation INTEGER NOT NULL,"
      " action_type TEXT NOT NULL, execution_status TEXT NOT NULL, action_timestamp_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS action_traces_time ON action_traces(action_timestamp_ms);",
      "CREATE INDEX IF NOT EXISTS action_traces_incident ON action_traces(incident_type, action_timestamp_ms);",
      "CREATE INDEX IF NOT EXISTS action_traces_playbook ON action_traces(playbook_id, playbook_version, action_timestamp_ms);",
  };
  return kSchema;
}

const std::vector<std::string>& SqliteDlqSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS dlq_entries ("
      " entry_id TEXT PRIMARY KEY, destination TEXT NOT NULL, payload BLOB NOT NULL,"
      " retry_count INTEGER NOT NULL DEFAULT 0, enqueued_at_ms INTEGER NOT NULL, next_attempt_at_ms INTEGER NOT NULL,"
      " last_error TEXT, state INTEGER NOT NULL, lease_owner TEXT, lease_expires_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS dlq_entries_due ON dlq_entries(state, next_attempt_at_ms);",
      "CREATE TABLE IF NOT EXISTS dlq_dead_letters ("
      " entry_id TEXT PRIMARY KEY, destination TEXT NOT NULL, payload BLOB NOT NULL, retry_count INTEGER NOT NULL,"
      " enqueued_at_ms INTEGER NOT NULL, last_error TEXT, dead_lettered_at_ms INTEGER NOT NULL);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS audit_partitions (partition_key TEXT PRIMARY KEY, range_start DATE NOT NULL, range_end DATE NOT NULL);",
      "CREATE SEQUENCE IF NOT EXISTS audit_events_seq;",
      "CREATE TABLE IF NOT EXISTS audit_events ("
      " seq BIGINT NOT NULL DEFAULT nextval('audit_events_seq'),"
      " event_id UUID NOT NULL, event_date DATE NOT NULL, event_version TEXT NOT NULL, service TEXT NOT NULL,"
      " event_type TEXT NOT NULL, event_timestamp_ms BIGINT NOT NULL, correlation_id TEXT NOT NULL,"
      " event_outcome TEXT NOT NULL, operation TEXT NOT NULL, event_data JSONB NOT NULL,"
      " parent_event_id UUID, parent_event_date DATE, actor_type TEXT, actor_id TEXT, resource_type TEXT,"
      " resource_id TEXT, severity TEXT, retention_days INTEGER NOT NULL, legal_hold BOOLEAN NOT NULL DEFAULT FALSE,"
      " event_hash TEXT NOT NULL, previous_event_hash TEXT NOT NULL, created_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY (event_id, event_date),"
      " FOREIGN KEY (parent_event_id, parent_event_date) REFERENCES audit_events(event_id, event_date) ON DELETE RESTRICT"
      ") PARTITION BY RANGE (event_date);",
      "CREATE INDEX IF NOT EXISTS audit_events_parent ON audit_events(parent_event_id, parent_event_date);",
      "CREATE INDEX IF NOT EXISTS audit_events_correlation ON audit_events(correlation_id, seq);",
      "CREATE TABLE IF NOT EXISTS legal_holds (correlation_id TEXT PRIMARY KEY, reason TEXT NOT NULL,"
      " placed_by TEXT NOT NULL, placed_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS action_traces ("
      " action_id UUID NOT NULL, action_date DATE NOT NULL, incident_type TEXT NOT NULL, alert_name TEXT,"
      " incident_severity TEXT, playbook_id TEXT, playbook_version TEXT, playbook_step_number INTEGER,"
      " playbook_execution_id TEXT, catalog_selected BOOLEAN NOT NULL, chained BOOLEAN NOT NULL,"
      " manual_escalation BOOLEAN NOT NULL, action_type TEXT NOT NULL, execution_status TEXT NOT NULL,"
      " action_timestamp_ms BIGINT NOT NULL,"
      " PRIMARY KEY (action_id, action_date)"
      ") PARTITION BY RANGE (action_date);",
      "CREATE INDEX IF NOT EXISTS action_traces_incident ON action_traces(incident_type, action_timestamp_ms);",
      "CREATE INDEX IF NOT EXISTS action_traces_playbook ON action_traces(playbook_id, playbook_version, action_timestamp_ms);",
  };
  return kSchema;
}

} // namespace audit::db::sql
