#include "chain_verifier.hpp"

#include "event_codec.hpp"
#include "internal/util/errors.hpp"

namespace audit::core {

ChainVerifier::ChainVerifier(std::shared_ptr<EventStore> store) : store_(std::move(store)) {
}

ChainReport ChainVerifier::Verify(const std::string& correlation_id) const {
  if (correlation_id.empty()) {
    throw util::ValidationError("missing_correlation_id", "correlation_id is required");
  }

  ChainReport report;
  std::string previous;

  for (const auto& record : store_->Chain(correlation_id)) {
    ++report.events_checked;

    if (record.previous_event_hash != previous) {
      report.valid           = false;
      report.broken_event_id = record.event_id;
      report.detail          = "previous_event_hash does not match the preceding event";
      return report;
    }

    const auto expected = ComputeEventHash(record);
    if (record.event_hash != expected) {
      report.valid           = false;
      report.broken_event_id = record.event_id;
      report.detail          = "event_hash does not match event content";
      return report;
    }

    previous = record.event_hash;
  }

  return report;
}

} // namespace audit::core
