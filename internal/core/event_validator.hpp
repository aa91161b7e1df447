#pragma once

#include "audit/store/v1/event.pb.h"

namespace audit::core {

/*
  Shape validation for inbound records. Stateless.

  Both functions normalize in place (lowercase ids, default version,
  output-only fields cleared) and throw util::ValidationError naming the
  first offending field.
*/
class EventValidator {
 public:
  static void Validate(audit::store::v1::AuditEvent& event);
  static void Validate(audit::store::v1::ActionTrace& trace);
};

} // namespace audit::core
