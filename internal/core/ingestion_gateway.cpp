#include "ingestion_gateway.hpp"

#include <chrono>

#include "internal/dlq/dlq_entry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace audit::core {

namespace v1 = audit::store::v1;

using observability::StringField;

namespace {

class WriteTimer {
 public:
  WriteTimer(IngestStats& stats, std::string_view kind) : stats_(stats), kind_(kind), start_(std::chrono::steady_clock::now()) {
  }

  ~WriteTimer() {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_).count();
    stats_.ObserveWriteLatencyUs(static_cast<uint64_t>(us));
    observability::Metrics::Instance().ObserveWriteLatencyMs(kind_, static_cast<double>(us) / 1000.0);
  }

 private:
  IngestStats&                          stats_;
  std::string_view                      kind_;
  std::chrono::steady_clock::time_point start_;
};

uint64_t ReceivedAt(const RequestContext& ctx) {
  return ctx.received_at_ms != 0 ? ctx.received_at_ms : util::NowMs();
}

} // namespace

IngestionGateway::IngestionGateway(std::shared_ptr<EventWriter> writer, std::shared_ptr<dlq::Queue> dlq)
    : writer_(std::move(writer)), dlq_(std::move(dlq)) {
}

IngestResult IngestionGateway::IngestEvent(const RequestContext& ctx, v1::AuditEvent event) {
  try {
    WriteTimer timer(stats_, "event");
    return Accept("event", writer_->WriteEvent(event, ReceivedAt(ctx)));
  } catch (const util::ValidationError& e) {
    Reject(ctx, e.reason(), e.what());
    throw;
  } catch (const util::ReferentialIntegrityError& e) {
    Reject(ctx, "parent_not_found", e.what());
    throw;
  } catch (const util::PartitionMissingError& e) {
    stats_.RecordPartitionMissing();
    observability::Metrics::Instance().RecordPartitionMissing("event");
    AUDIT_LOG_ERROR("Partition missing for audit event",
                    {StringField("route", ctx.route), StringField("request_id", ctx.request_id),
                     StringField("event_id", event.event_id()), StringField("error", e.what())});
    return Fallback(ctx, dlq::kAuditEventsDestination, event.event_id(), event.SerializeAsString(), e.what());
  } catch (const std::exception& e) {
    return Fallback(ctx, dlq::kAuditEventsDestination, event.event_id(), event.SerializeAsString(), e.what());
  }
}

std::vector<IngestResult> IngestionGateway::IngestEventBatch(const RequestContext& ctx,
                                                             std::vector<v1::AuditEvent> events) {
  if (events.empty() || events.size() > kMaxBatchSize) {
    const std::string reason = events.empty() ? "empty_batch" : "batch_too_large";
    const auto        detail = "batch must hold 1.." + std::to_string(kMaxBatchSize) + " events, got " +
                        std::to_string(events.size());
    Reject(ctx, reason, detail);
    throw util::ValidationError(reason, detail);
  }

  std::string store_error;
  try {
    WriteTimer timer(stats_, "event_batch");
    const auto outcomes = writer_->WriteEventBatch(events, ReceivedAt(ctx));

    std::vector<IngestResult> results;
    results.reserve(outcomes.size());
    for (const auto& outcome : outcomes) results.push_back(Accept("event", outcome));
    return results;
  } catch (const util::ValidationError& e) {
    Reject(ctx, e.reason(), e.what());
    throw;
  } catch (const util::ReferentialIntegrityError& e) {
    Reject(ctx, "parent_not_found", e.what());
    throw;
  } catch (const util::PartitionMissingError& e) {
    stats_.RecordPartitionMissing();
    observability::Metrics::Instance().RecordPartitionMissing("event");
    AUDIT_LOG_ERROR("Partition missing for audit event batch",
                    {StringField("route", ctx.route), StringField("request_id", ctx.request_id),
                     StringField("error", e.what())});
    store_error = e.what();
  } catch (const std::exception& e) {
    store_error = e.what();
  }

  // Ids were assigned before the store call, so each queued item keeps
  // the id reported back to the caller.
  std::vector<IngestResult> results;
  results.reserve(events.size());
  for (const auto& event : events) {
    results.push_back(
        Fallback(ctx, dlq::kAuditEventsDestination, event.event_id(), event.SerializeAsString(), store_error));
  }
  return results;
}

IngestResult IngestionGateway::IngestActionTrace(const RequestContext& ctx, v1::ActionTrace trace) {
  try {
    WriteTimer timer(stats_, "action_trace");
    return Accept("action_trace", writer_->WriteActionTrace(trace));
  } catch (const util::ValidationError& e) {
    Reject(ctx, e.reason(), e.what());
    throw;
  } catch (const util::PartitionMissingError& e) {
    stats_.RecordPartitionMissing();
    observability::Metrics::Instance().RecordPartitionMissing("action_trace");
    AUDIT_LOG_ERROR("Partition missing for action trace",
                    {StringField("route", ctx.route), StringField("request_id", ctx.request_id),
                     StringField("action_id", trace.action_id()), StringField("error", e.what())});
    return Fallback(ctx, dlq::kActionTracesDestination, trace.action_id(), trace.SerializeAsString(), e.what());
  } catch (const std::exception& e) {
    return Fallback(ctx, dlq::kActionTracesDestination, trace.action_id(), trace.SerializeAsString(), e.what());
  }
}

IngestResult IngestionGateway::Accept(std::string_view kind, const WriteOutcome& outcome) {
  if (outcome.status == InsertStatus::kDuplicate) {
    stats_.RecordDuplicate();
    observability::Metrics::Instance().RecordIngest(kind, "duplicate");
    return {outcome.id, Disposition::kDuplicate};
  }

  stats_.RecordStored();
  observability::Metrics::Instance().RecordIngest(kind, "stored");
  return {outcome.id, Disposition::kStored};
}

void IngestionGateway::Reject(const RequestContext& ctx, const std::string& reason, const std::string& detail) {
  stats_.RecordRejected(reason);
  observability::Metrics::Instance().RecordValidationFailure(reason);
  AUDIT_LOG_INFO("Record rejected", {StringField("route", ctx.route), StringField("request_id", ctx.request_id),
                                     StringField("reason", reason), StringField("error", detail)});
}

IngestResult IngestionGateway::Fallback(const RequestContext& ctx, const char* destination, const std::string& id,
                                        const std::string& payload, const std::string& error) {
  try {
    dlq_->Enqueue(destination, payload, error, ReceivedAt(ctx));
  } catch (const std::exception& e) {
    stats_.RecordDlqEnqueueFailed();
    AUDIT_LOG_ERROR("Record lost: store write and DLQ enqueue both failed",
                    {StringField("route", ctx.route), StringField("request_id", ctx.request_id), StringField("id", id),
                     StringField("store_error", error), StringField("dlq_error", e.what())});
    throw util::StorageUnavailableError("store unavailable and dlq enqueue failed: " + std::string(e.what()));
  }

  stats_.RecordQueued();
  observability::Metrics::Instance().RecordDlqFallback(destination);
  AUDIT_LOG_WARN("Store write failed, record queued for recovery",
                 {StringField("route", ctx.route), StringField("request_id", ctx.request_id), StringField("id", id),
                  StringField("destination", destination), StringField("error", error)});
  return {id, Disposition::kQueued};
}

} // namespace audit::core
