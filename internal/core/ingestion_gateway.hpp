#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "audit/store/v1/event.pb.h"
#include "event_writer.hpp"
#include "ingest_stats.hpp"
#include "internal/dlq/queue.hpp"
#include "request_context.hpp"

namespace audit::core {

enum class Disposition {
  kStored,
  kDuplicate,
  kQueued, // store failed; the record waits in the DLQ
};

struct IngestResult {
  std::string id;
  Disposition disposition = Disposition::kStored;
};

/*
  Validate-and-forward stage in front of the store.

  Accepted records come back as an IngestResult. Rejections are thrown:
    util::ValidationError           malformed record (reason() is the label)
    util::ReferentialIntegrityError parent_event_id does not resolve
  Any other store failure is absorbed into the DLQ and reported as
  kQueued. Only a failed DLQ enqueue reaches the caller, as
  util::StorageUnavailableError.

  Never retries synchronously.

  A batch is all-or-nothing at the store: one rejected item rejects the
  whole batch, and a store failure queues every item to the DLQ. Each
  item still reports its own disposition, since duplicates are per item.
*/
class IngestionGateway {
 public:
  static constexpr std::size_t kMaxBatchSize = 1000;

  IngestionGateway(std::shared_ptr<EventWriter> writer, std::shared_ptr<dlq::Queue> dlq);

  IngestResult IngestEvent(const RequestContext& ctx, audit::store::v1::AuditEvent event);
  IngestResult IngestActionTrace(const RequestContext& ctx, audit::store::v1::ActionTrace trace);

  // Results follow input order. An empty batch or one larger than
  // kMaxBatchSize is a util::ValidationError.
  std::vector<IngestResult> IngestEventBatch(const RequestContext& ctx, std::vector<audit::store::v1::AuditEvent> events);

  IngestCounters Counters() const {
    return stats_.Snapshot();
  }

 private:
  IngestResult Fallback(const RequestContext& ctx, const char* destination, const std::string& id,
                        const std::string& payload, const std::string& error);

  void Reject(const RequestContext& ctx, const std::string& reason, const std::string& detail);

  IngestResult Accept(std::string_view kind, const WriteOutcome& outcome);

  std::shared_ptr<EventWriter> writer_;
  std::shared_ptr<dlq::Queue>  dlq_;
  IngestStats                  stats_;
};

} // namespace audit::core
