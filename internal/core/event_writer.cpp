#include "event_writer.hpp"

#include "event_codec.hpp"
#include "event_validator.hpp"
#include "internal/dlq/dlq_entry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace audit::core {

namespace v1 = audit::store::v1;

EventWriter::EventWriter(std::shared_ptr<EventStore> store) : store_(std::move(store)) {
}

WriteOutcome EventWriter::WriteEvent(v1::AuditEvent& event, uint64_t now_ms) {
  EventValidator::Validate(event);
  if (event.event_id().empty()) event.set_event_id(util::GenerateUUIDString());

  auto result = store_->Insert(ToRecord(event), now_ms);
  return {event.event_id(), result.status};
}

std::vector<WriteOutcome> EventWriter::WriteEventBatch(std::vector<v1::AuditEvent>& events, uint64_t now_ms) {
  std::vector<db::model::AuditEventRecord> records;
  records.reserve(events.size());

  for (std::size_t i = 0; i < events.size(); ++i) {
    auto& event = events[i];
    try {
      EventValidator::Validate(event);
      if (event.event_id().empty()) event.set_event_id(util::GenerateUUIDString());
      records.push_back(ToRecord(event));
    } catch (const util::ValidationError& e) {
      throw util::ValidationError(e.reason(), "events[" + std::to_string(i) + "]: " + e.what());
    }
  }

  const auto results = store_->InsertBatch(std::move(records), now_ms);

  std::vector<WriteOutcome> outcomes;
  outcomes.reserve(results.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    outcomes.push_back({events[i].event_id(), results[i].status});
  }
  return outcomes;
}

WriteOutcome EventWriter::WriteActionTrace(v1::ActionTrace& trace) {
  EventValidator::Validate(trace);
  if (trace.action_id().empty()) trace.set_action_id(util::GenerateUUIDString());

  return {trace.action_id(), store_->InsertActionTrace(ToRecord(trace))};
}

WriteOutcome EventWriter::Replay(const std::string& destination, const std::string& payload, uint64_t now_ms) {
  if (destination == dlq::kAuditEventsDestination) {
    v1::AuditEvent event;
    if (!event.ParseFromString(payload)) {
      throw util::ValidationError("invalid_payload", "dlq payload is not an AuditEvent");
    }
    return WriteEvent(event, now_ms);
  }

  if (destination == dlq::kActionTracesDestination) {
    v1::ActionTrace trace;
    if (!trace.ParseFromString(payload)) {
      throw util::ValidationError("invalid_payload", "dlq payload is not an ActionTrace");
    }
    return WriteActionTrace(trace);
  }

  throw util::ValidationError("invalid_destination", "unknown dlq destination: " + destination);
}

} // namespace audit::core
