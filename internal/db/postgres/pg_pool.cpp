#include "pg_pool.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace audit::db::postgres {

namespace {

constexpr const char* kEventColumns =
    "event_id::text,event_date::text,event_version,service,event_type,event_timestamp_ms,correlation_id,"
    "event_outcome,operation,event_data::text,parent_event_id::text,parent_event_date::text,actor_type,actor_id,"
    "resource_type,resource_id,severity,retention_days,legal_hold,event_hash,previous_event_hash,created_at_ms";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lock(mutex_);

  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();
      return Connect();
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
    if (!ready) {
      throw util::StorageUnavailableError("postgres: no connection available within " + std::to_string(timeout.count()) +
                                          "ms (" + std::to_string(max_connections_) + " in use)");
    }
  }
}

// Called with a slot already reserved in live_connections_.
std::shared_ptr<pqxx::connection> PgPool::Connect() {
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception& e) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw util::StorageUnavailableError(std::string("postgres: connect failed: ") + e.what());
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string columns = kEventColumns;

  conn.prepare("has_partition", "SELECT 1 FROM audit_partitions WHERE partition_key=$1");

  conn.prepare("list_partitions",
               "SELECT partition_key,range_start::text,range_end::text FROM audit_partitions ORDER BY range_start");

  conn.prepare("insert_partition",
               "INSERT INTO audit_partitions(partition_key,range_start,range_end) "
               "VALUES($1,$2::date,$3::date) ON CONFLICT(partition_key) DO NOTHING");

  conn.prepare("insert_event",
               "INSERT INTO audit_events(event_id,event_date,event_version,service,event_type,event_timestamp_ms,"
               "correlation_id,event_outcome,operation,event_data,parent_event_id,parent_event_date,actor_type,"
               "actor_id,resource_type,resource_id,severity,retention_days,legal_hold,event_hash,"
               "previous_event_hash,created_at_ms) "
               "VALUES($1::uuid,$2::date,$3,$4,$5,$6,$7,$8,$9,$10::jsonb,$11::uuid,$12::date,$13,$14,$15,$16,$17,"
               "$18,$19,$20,$21,$22) RETURNING seq");

  conn.prepare("get_event", "SELECT seq," + columns + " FROM audit_events WHERE event_id=$1::uuid");

  conn.prepare("get_event_in_partition",
               "SELECT seq," + columns + " FROM audit_events WHERE event_id=$1::uuid AND event_date=$2::date");

  conn.prepare("list_events_by_correlation",
               "SELECT seq," + columns + " FROM audit_events WHERE correlation_id=$1 ORDER BY seq");

  conn.prepare("chain_lock", "SELECT pg_advisory_xact_lock(hashtext($1))");

  conn.prepare("chain_head",
               "SELECT event_hash FROM audit_events WHERE correlation_id=$1 ORDER BY seq DESC LIMIT 1");

  conn.prepare("count_children", "SELECT COUNT(*) FROM audit_events WHERE parent_event_id=$1::uuid");

  conn.prepare("delete_event", "DELETE FROM audit_events WHERE event_id=$1::uuid AND event_date=$2::date");

  conn.prepare("hold_events", "UPDATE audit_events SET legal_hold=TRUE WHERE correlation_id=$1");

  conn.prepare("release_events", "UPDATE audit_events SET legal_hold=FALSE WHERE correlation_id=$1 AND legal_hold");

  conn.prepare("upsert_legal_hold",
               "INSERT INTO legal_holds(correlation_id,reason,placed_by,placed_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(correlation_id) DO UPDATE SET reason=EXCLUDED.reason,placed_by=EXCLUDED.placed_by,"
               "placed_at_ms=EXCLUDED.placed_at_ms");

  conn.prepare("get_legal_hold", "SELECT reason,placed_by,placed_at_ms FROM legal_holds WHERE correlation_id=$1");

  conn.prepare("delete_legal_hold", "DELETE FROM legal_holds WHERE correlation_id=$1");

  conn.prepare("list_legal_holds",
               "SELECT h.correlation_id,h.reason,h.placed_by,h.placed_at_ms,"
               "(SELECT COUNT(*) FROM audit_events e WHERE e.correlation_id=h.correlation_id AND e.legal_hold) "
               "FROM legal_holds h ORDER BY h.correlation_id");

  conn.prepare("insert_action_trace",
               "INSERT INTO action_traces(action_id,action_date,incident_type,alert_name,incident_severity,"
               "playbook_id,playbook_version,playbook_step_number,playbook_execution_id,catalog_selected,chained,"
               "manual_escalation,action_type,execution_status,action_timestamp_ms) "
               "VALUES($1::uuid,$2::date,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15)");

  conn.prepare("scan_action_traces",
               "SELECT action_id::text,action_date::text,incident_type,alert_name,incident_severity,playbook_id,"
               "playbook_version,playbook_step_number,playbook_execution_id,catalog_selected,chained,"
               "manual_escalation,action_type,execution_status,action_timestamp_ms FROM action_traces "
               "WHERE action_timestamp_ms>=$1 AND action_timestamp_ms<$2 "
               "AND ($3::text IS NULL OR incident_type=$3) "
               "AND ($4::text IS NULL OR playbook_id=$4) "
               "AND ($5::text IS NULL OR playbook_version=$5) "
               "AND ($6::text IS NULL OR action_type=$6)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  if (!conn->is_open()) {
    delete conn;
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    return;
  }
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace audit::db::postgres
