#include "admin_service.hpp"

#include "internal/core/chain_verifier.hpp"
#include "internal/core/event_codec.hpp"
#include "internal/core/event_store.hpp"
#include "internal/core/ingestion_gateway.hpp"
#include "internal/dlq/queue.hpp"
#include "internal/dlq/recovery_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace audit::service {

using namespace audit::store::v1;
using observability::IntField;
using observability::StringField;

namespace {

void FillLegalHold(const db::model::LegalHoldRecord& record, LegalHold* out) {
  out->set_correlation_id(record.correlation_id);
  out->set_reason(record.reason);
  out->set_placed_by(record.placed_by);
  *out->mutable_placed_at() = util::MillisToProto(record.placed_at_ms);
  out->set_event_count(record.event_count);
}

void RequireCorrelationId(const std::string& correlation_id) {
  if (correlation_id.empty()) {
    throw util::ValidationError("missing_correlation_id", "correlation_id is required");
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", util::GenerateUUIDString(), [&] {
    StatsResponse resp;

    const auto ingest  = ctx_.gateway->Counters();
    auto*      counters = resp.mutable_ingest();
    counters->set_accepted(ingest.accepted);
    counters->set_rejected(ingest.rejected);
    counters->set_stored(ingest.stored);
    counters->set_duplicates(ingest.duplicates);
    counters->set_queued(ingest.queued);
    counters->set_dlq_enqueue_failed(ingest.dlq_enqueue_failed);
    counters->set_partition_missing(ingest.partition_missing);
    counters->set_write_latency_us_sum(ingest.write_latency_us_sum);
    counters->set_write_latency_us_count(ingest.write_latency_us_count);
    for (const auto& [reason, count] : ingest.rejected_by_reason) {
      (*counters->mutable_rejected_by_reason())[reason] = count;
    }

    if (ctx_.recovery) {
      const auto recovery = ctx_.recovery->Counters();
      resp.mutable_recovery()->set_replayed(recovery.replayed);
      resp.mutable_recovery()->set_rescheduled(recovery.rescheduled);
      resp.mutable_recovery()->set_dead_lettered(recovery.dead_lettered);
    }

    resp.set_dlq_depth(ctx_.dlq->Depth());
    resp.set_dead_letter_count(ctx_.dlq->DeadLetterCount());

    for (const auto& partition : ctx_.store->Partitions()) {
      resp.add_partitions(partition.partition_key);
    }
    return resp;
  });
}

GetEventResponse AdminService::GetEvent(const GetEventRequest& req) {
  return ObserveRpc("AdminService.GetEvent", util::GenerateUUIDString(), [&] {
    if (req.event_id().empty()) {
      throw util::ValidationError("missing_event_id", "event_id is required");
    }

    const auto record = ctx_.store->Lookup(req.event_id());
    if (!record) {
      throw util::NotFound("event not found: " + req.event_id());
    }

    GetEventResponse resp;
    *resp.mutable_event() = core::ToProto(*record);
    return resp;
  });
}

void AdminService::DeleteEvent(const DeleteEventRequest& req) {
  ObserveRpc("AdminService.DeleteEvent", util::GenerateUUIDString(), [&] {
    if (req.event_id().empty()) {
      throw util::ValidationError("missing_event_id", "event_id is required");
    }
    ctx_.store->Delete(req.event_id());
  });
}

ListDeadLettersResponse AdminService::ListDeadLetters(const ListDeadLettersRequest& req) {
  return ObserveRpc("AdminService.ListDeadLetters", util::GenerateUUIDString(), [&] {
    ListDeadLettersResponse resp;
    for (const auto& record : ctx_.dlq->ListDeadLetters(req.limit())) {
      auto* entry = resp.add_entries();
      entry->set_entry_id(record.entry_id);
      entry->set_destination(record.destination);
      entry->set_retry_count(record.retry_count);
      entry->set_last_error(record.last_error);
      *entry->mutable_enqueued_at()      = util::MillisToProto(record.enqueued_at_ms);
      *entry->mutable_dead_lettered_at() = util::MillisToProto(record.dead_lettered_at_ms);
      entry->set_payload(record.payload);
    }
    return resp;
  });
}

VerifyChainResponse AdminService::VerifyChain(const VerifyChainRequest& req) {
  return ObserveRpc("AdminService.VerifyChain", util::GenerateUUIDString(), [&] {
    const auto report = ctx_.chain_verifier->Verify(req.correlation_id());

    VerifyChainResponse resp;
    resp.set_valid(report.valid);
    resp.set_events_checked(report.events_checked);
    resp.set_broken_event_id(report.broken_event_id);
    resp.set_detail(report.detail);
    return resp;
  });
}

PlaceLegalHoldResponse AdminService::PlaceLegalHold(const PlaceLegalHoldRequest& req) {
  return ObserveRpc("AdminService.PlaceLegalHold", util::GenerateUUIDString(), [&] {
    RequireCorrelationId(req.correlation_id());
    if (req.reason().empty()) {
      throw util::ValidationError("missing_reason", "reason is required");
    }
    if (req.placed_by().empty()) {
      throw util::ValidationError("missing_placed_by", "placed_by is required");
    }

    db::model::LegalHoldRecord hold;
    hold.correlation_id = req.correlation_id();
    hold.reason         = req.reason();
    hold.placed_by      = req.placed_by();
    hold.placed_at_ms   = util::NowMs();

    const auto placed = ctx_.store->PlaceLegalHold(std::move(hold));
    AUDIT_LOG_INFO("Legal hold placed",
                   {StringField("correlation_id", placed.correlation_id), StringField("placed_by", placed.placed_by),
                    IntField("events", static_cast<int64_t>(placed.event_count))});

    PlaceLegalHoldResponse resp;
    FillLegalHold(placed, resp.mutable_hold());
    return resp;
  });
}

ReleaseLegalHoldResponse AdminService::ReleaseLegalHold(const ReleaseLegalHoldRequest& req) {
  return ObserveRpc("AdminService.ReleaseLegalHold", util::GenerateUUIDString(), [&] {
    RequireCorrelationId(req.correlation_id());

    const auto released = ctx_.store->ReleaseLegalHold(req.correlation_id());
    AUDIT_LOG_INFO("Legal hold released", {StringField("correlation_id", released.correlation_id),
                                           IntField("events", static_cast<int64_t>(released.event_count))});

    ReleaseLegalHoldResponse resp;
    FillLegalHold(released, resp.mutable_hold());
    return resp;
  });
}

ListLegalHoldsResponse AdminService::ListLegalHolds(const ListLegalHoldsRequest&) {
  return ObserveRpc("AdminService.ListLegalHolds", util::GenerateUUIDString(), [&] {
    ListLegalHoldsResponse resp;
    for (const auto& hold : ctx_.store->LegalHolds()) {
      FillLegalHold(hold, resp.add_holds());
    }
    return resp;
  });
}

} // namespace audit::service
