#include "event_codec.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace audit::core {

namespace v1 = audit::store::v1;

db::model::AuditEventRecord ToRecord(const v1::AuditEvent& event) {
  db::model::AuditEventRecord r;
  r.event_id           = event.event_id();
  r.version            = event.version();
  r.service            = event.service();
  r.event_type         = event.event_type();
  r.event_timestamp_ms = util::ToUnixMillis(event.event_timestamp());
  r.event_date         = util::UtcDate(r.event_timestamp_ms);
  r.correlation_id     = event.correlation_id();
  r.outcome            = event.outcome();
  r.operation          = event.operation();
  r.parent_event_id    = event.parent_event_id();
  r.actor_type         = event.actor_type();
  r.actor_id           = event.actor_id();
  r.resource_type      = event.resource_type();
  r.resource_id        = event.resource_id();
  r.severity           = event.severity();
  r.retention_days     = event.retention_days();
  r.legal_hold         = event.legal_hold();

  auto status = google::protobuf::util::MessageToJsonString(event.event_data(), &r.event_data_json);
  if (!status.ok()) {
    throw util::ValidationError("event_data is not representable as JSON: " + std::string(status.message()));
  }
  return r;
}

v1::AuditEvent ToProto(const db::model::AuditEventRecord& r) {
  v1::AuditEvent event;
  event.set_event_id(r.event_id);
  event.set_version(r.version);
  event.set_service(r.service);
  event.set_event_type(r.event_type);
  *event.mutable_event_timestamp() = util::MillisToProto(r.event_timestamp_ms);
  event.set_correlation_id(r.correlation_id);
  event.set_outcome(r.outcome);
  event.set_operation(r.operation);
  event.set_parent_event_id(r.parent_event_id);
  event.set_parent_event_date(r.parent_event_date);
  event.set_event_date(r.event_date);
  if (r.created_at_ms != 0) *event.mutable_created_at() = util::MillisToProto(r.created_at_ms);
  event.set_actor_type(r.actor_type);
  event.set_actor_id(r.actor_id);
  event.set_resource_type(r.resource_type);
  event.set_resource_id(r.resource_id);
  event.set_severity(r.severity);
  event.set_retention_days(r.retention_days);
  event.set_legal_hold(r.legal_hold);
  event.set_event_hash(r.event_hash);
  event.set_previous_event_hash(r.previous_event_hash);

  if (!r.event_data_json.empty()) {
    auto status = google::protobuf::util::JsonStringToMessage(r.event_data_json, event.mutable_event_data());
    if (!status.ok()) {
      throw std::runtime_error("stored event_data of " + r.event_id + " is not valid JSON: " + std::string(status.message()));
    }
  }
  return event;
}

db::model::ActionTraceRecord ToRecord(const v1::ActionTrace& trace) {
  db::model::ActionTraceRecord r;
  r.action_id             = trace.action_id();
  r.incident_type         = trace.incident_type();
  r.alert_name            = trace.alert_name();
  r.incident_severity     = trace.incident_severity();
  r.playbook_id           = trace.playbook_id();
  r.playbook_version      = trace.playbook_version();
  r.playbook_step_number  = trace.playbook_step_number();
  r.playbook_execution_id = trace.playbook_execution_id();
  r.catalog_selected      = trace.catalog_selected();
  r.chained               = trace.chained();
  r.manual_escalation     = trace.manual_escalation();
  r.action_type           = trace.action_type();
  r.execution_status      = trace.execution_status();
  r.action_timestamp_ms   = util::ToUnixMillis(trace.action_timestamp());
  r.action_date           = util::UtcDate(r.action_timestamp_ms);
  return r;
}

v1::ActionTrace ToProto(const db::model::ActionTraceRecord& r) {
  v1::ActionTrace trace;
  trace.set_action_id(r.action_id);
  trace.set_incident_type(r.incident_type);
  trace.set_alert_name(r.alert_name);
  trace.set_incident_severity(r.incident_severity);
  trace.set_playbook_id(r.playbook_id);
  trace.set_playbook_version(r.playbook_version);
  trace.set_playbook_step_number(r.playbook_step_number);
  trace.set_playbook_execution_id(r.playbook_execution_id);
  trace.set_catalog_selected(r.catalog_selected);
  trace.set_chained(r.chained);
  trace.set_manual_escalation(r.manual_escalation);
  trace.set_action_type(r.action_type);
  trace.set_execution_status(r.execution_status);
  *trace.mutable_action_timestamp() = util::MillisToProto(r.action_timestamp_ms);
  return trace;
}

std::string CanonicalBytes(const db::model::AuditEventRecord& record) {
  auto event = ToProto(record);
  event.clear_event_hash();
  event.clear_previous_event_hash();
  event.clear_created_at();
  event.clear_legal_hold();

  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    event.SerializeToCodedStream(&coded);
  }
  return out;
}

std::string ComputeEventHash(const db::model::AuditEventRecord& record) {
  return util::ChainHash(record.previous_event_hash, CanonicalBytes(record));
}

} // namespace audit::core
