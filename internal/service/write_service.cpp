#include "write_service.hpp"

#include <vector>

#include "internal/core/ingestion_gateway.hpp"
#include "observe_rpc.hpp"

namespace audit::service {

using namespace audit::store::v1;

namespace {

WriteDisposition ToProto(core::Disposition d) {
  switch (d) {
    case core::Disposition::kStored:
      return WRITE_DISPOSITION_STORED;
    case core::Disposition::kDuplicate:
      return WRITE_DISPOSITION_DUPLICATE;
    case core::Disposition::kQueued:
      return WRITE_DISPOSITION_QUEUED;
  }
  return WRITE_DISPOSITION_UNSPECIFIED;
}

} // namespace

WriteService::WriteService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

WriteEventResponse WriteService::WriteEvent(const WriteEventRequest& req, const std::string& caller) {
  const auto rc = core::MakeRequestContext("WriteService.WriteEvent", caller);
  return ObserveRpc(rc.route, rc.request_id, [&] {
    const auto result = ctx_.gateway->IngestEvent(rc, req.event());

    WriteEventResponse resp;
    resp.set_event_id(result.id);
    resp.set_disposition(ToProto(result.disposition));
    return resp;
  });
}

WriteEventBatchResponse WriteService::WriteEventBatch(const WriteEventBatchRequest& req, const std::string& caller) {
  const auto rc = core::MakeRequestContext("WriteService.WriteEventBatch", caller);
  return ObserveRpc(rc.route, rc.request_id, [&] {
    std::vector<AuditEvent> events(req.events().begin(), req.events().end());
    const auto              results = ctx_.gateway->IngestEventBatch(rc, std::move(events));

    WriteEventBatchResponse resp;
    for (const auto& result : results) {
      auto* item = resp.add_results();
      item->set_event_id(result.id);
      item->set_disposition(ToProto(result.disposition));
    }
    return resp;
  });
}

RecordActionTraceResponse WriteService::RecordActionTrace(const RecordActionTraceRequest& req,
                                                          const std::string& caller) {
  const auto rc = core::MakeRequestContext("WriteService.RecordActionTrace", caller);
  return ObserveRpc(rc.route, rc.request_id, [&] {
    const auto result = ctx_.gateway->IngestActionTrace(rc, req.trace());

    RecordActionTraceResponse resp;
    resp.set_action_id(result.id);
    resp.set_disposition(ToProto(result.disposition));
    return resp;
  });
}

} // namespace audit::service
