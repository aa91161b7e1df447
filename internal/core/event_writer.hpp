#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "audit/store/v1/event.pb.h"
#include "event_store.hpp"

namespace audit::core {

struct WriteOutcome {
  std::string  id;
  InsertStatus status = InsertStatus::kStored;
};

/*
  The one validated write path. The ingestion gateway calls it for live
  traffic and the recovery worker for DLQ replays, so both apply the same
  rules.
*/
class EventWriter {
 public:
  explicit EventWriter(std::shared_ptr<EventStore> store);

  // Validates and normalizes event in place, assigns event_id when
  // empty, then stores it. On a storage failure the caller still holds
  // the normalized event, id included.
  WriteOutcome WriteEvent(audit::store::v1::AuditEvent& event, uint64_t now_ms);

  // Validates every event before storing any; a ValidationError names the
  // offending index. The events are then stored in one transaction.
  std::vector<WriteOutcome> WriteEventBatch(std::vector<audit::store::v1::AuditEvent>& events, uint64_t now_ms);

  // Same contract for action traces (action_id assigned when empty).
  WriteOutcome WriteActionTrace(audit::store::v1::ActionTrace& trace);

  // Decodes a DLQ payload for destination and writes it. A payload that
  // does not parse is a util::ValidationError.
  WriteOutcome Replay(const std::string& destination, const std::string& payload, uint64_t now_ms);

  const std::shared_ptr<EventStore>& Store() const {
    return store_;
  }

 private:
  std::shared_ptr<EventStore> store_;
};

} // namespace audit::core
