#include "event_validator.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace audit::core {

namespace v1 = audit::store::v1;

namespace {

constexpr std::array<std::string_view, 3> kOutcomes = {"success", "failure", "pending"};

void Require(const std::string& value, std::string_view field) {
  if (value.empty()) {
    throw util::ValidationError("missing_" + std::string(field), std::string(field) + " is required");
  }
}

// 9999-12-31T23:59:59Z; event_date and partition keys carry a four-digit year.
constexpr int64_t kMaxTimestampSeconds = 253402300799;
constexpr int32_t kMaxNanos            = 999999999;

void RequireTimestamp(bool present, const google::protobuf::Timestamp& ts, std::string_view field) {
  const std::string name(field);
  if (!present || ts.seconds() <= 0) {
    throw util::ValidationError("missing_" + name, name + " is required");
  }
  if (ts.nanos() < 0 || ts.nanos() > kMaxNanos) {
    throw util::ValidationError("invalid_" + name, name + ".nanos must be within [0, 999999999]: " + std::to_string(ts.nanos()));
  }
  if (ts.seconds() > kMaxTimestampSeconds) {
    throw util::ValidationError("invalid_" + name, name + " is after 9999-12-31T23:59:59Z");
  }
}

// Optional id: empty is fine, otherwise a canonical UUID.
std::string NormalizeId(const std::string& value, std::string_view field) {
  if (value.empty()) return value;
  auto canonical = util::CanonicalUUID(value);
  if (!canonical) {
    throw util::ValidationError("invalid_" + std::string(field), std::string(field) + " is not a well-formed UUID: " + value);
  }
  return *canonical;
}

} // namespace

void EventValidator::Validate(v1::AuditEvent& event) {
  Require(event.service(), "service");
  Require(event.event_type(), "event_type");
  RequireTimestamp(event.has_event_timestamp(), event.event_timestamp(), "event_timestamp");
  Require(event.correlation_id(), "correlation_id");
  Require(event.outcome(), "outcome");
  Require(event.operation(), "operation");

  if (std::find(kOutcomes.begin(), kOutcomes.end(), event.outcome()) == kOutcomes.end()) {
    throw util::ValidationError("invalid_outcome", "outcome must be success, failure or pending: " + event.outcome());
  }

  event.set_event_id(NormalizeId(event.event_id(), "event_id"));
  event.set_parent_event_id(NormalizeId(event.parent_event_id(), "parent_event_id"));

  if (!event.event_id().empty() && event.event_id() == event.parent_event_id()) {
    throw util::ValidationError("invalid_parent_event_id", "event cannot be its own parent");
  }

  if (event.retention_days() < 0) {
    throw util::ValidationError("invalid_retention_days", "retention_days must not be negative");
  }

  if (event.version().empty()) event.set_version("1.0");

  // assigned by the store
  event.clear_parent_event_date();
  event.clear_event_date();
  event.clear_created_at();
  event.clear_event_hash();
  event.clear_previous_event_hash();
}

void EventValidator::Validate(v1::ActionTrace& trace) {
  Require(trace.incident_type(), "incident_type");
  Require(trace.action_type(), "action_type");
  Require(trace.execution_status(), "execution_status");
  RequireTimestamp(trace.has_action_timestamp(), trace.action_timestamp(), "action_timestamp");

  if (!trace.playbook_version().empty() && trace.playbook_id().empty()) {
    throw util::ValidationError("invalid_playbook_version", "playbook_version requires playbook_id");
  }

  trace.set_action_id(NormalizeId(trace.action_id(), "action_id"));
}

} // namespace audit::core
