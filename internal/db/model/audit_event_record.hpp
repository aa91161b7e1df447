#pragma once

#include <cstdint>
#include <string>

namespace audit::db::model {

/*
  Persistent audit event row.

  IMPORTANT:
  - Rows are append-only. The only update any backend exposes is the
    legal_hold flag, driven by Place/ReleaseLegalHold.
  - (event_id, event_date) is the physical key; event_id alone is
    globally unique.
  - parent_event_date is always derived from the stored parent, never
    taken from the producer.
*/

struct AuditEventRecord {
  std::string event_id;
  std::string event_date; // YYYY-MM-DD (UTC), partition routing

  std::string version;
  std::string service;
  std::string event_type;

  uint64_t event_timestamp_ms = 0;

  std::string correlation_id;
  std::string outcome;
  std::string operation;

  // JSON object text
  std::string event_data_json;

  // empty = no parent
  std::string parent_event_id;
  std::string parent_event_date;

  std::string actor_type;
  std::string actor_id;
  std::string resource_type;
  std::string resource_id;
  std::string severity;

  int32_t retention_days = 0;
  bool    legal_hold     = false;

  std::string event_hash;
  std::string previous_event_hash;

  uint64_t created_at_ms = 0;

  // store-assigned insertion order, 0 until stored
  uint64_t sequence = 0;
};

} // namespace audit::db::model
