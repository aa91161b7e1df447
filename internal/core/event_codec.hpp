#pragma once

#include <string>

#include "audit/store/v1/event.pb.h"
#include "internal/db/model/action_trace_record.hpp"
#include "internal/db/model/audit_event_record.hpp"

namespace audit::core {

/*
  Conversions between the wire messages and store rows.

  Timestamps are kept at millisecond precision; event_data travels as
  JSON object text in the row.
*/

// Producer fields only; event_date is derived from event_timestamp.
// Throws util::ValidationError if event_data cannot be rendered as JSON.
db::model::AuditEventRecord ToRecord(const audit::store::v1::AuditEvent& event);

// Throws std::runtime_error if the stored event_data is not valid JSON.
audit::store::v1::AuditEvent ToProto(const db::model::AuditEventRecord& record);

db::model::ActionTraceRecord ToRecord(const audit::store::v1::ActionTrace& trace);
audit::store::v1::ActionTrace ToProto(const db::model::ActionTraceRecord& record);

// Deterministic serialization of the event with event_hash,
// previous_event_hash, created_at and legal_hold cleared. legal_hold
// changes after insert, so it stays outside the chain.
std::string CanonicalBytes(const db::model::AuditEventRecord& record);

// SHA-256(previous_event_hash || CanonicalBytes(record)), hex.
std::string ComputeEventHash(const db::model::AuditEventRecord& record);

} // namespace audit::core
