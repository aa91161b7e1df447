#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "audit/store/v1.hpp"
#include "internal/analytics/aggregation_engine.hpp"
#include "internal/core/chain_verifier.hpp"
#include "internal/core/event_store.hpp"
#include "internal/core/event_writer.hpp"
#include "internal/core/ingestion_gateway.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dlq/memory_queue.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/analytics_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/write_server.hpp"
#include "internal/partition/partition_manager.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace audit::store::v1;

audit::service::ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<audit::db::memory::MemoryRepository>();
  audit::partition::PartitionManager(repository, {}).EnsurePartitions(audit::util::NowMs());

  audit::service::ServiceContext ctx;
  ctx.store          = std::make_shared<audit::core::EventStore>(repository);
  ctx.chain_verifier = std::make_shared<audit::core::ChainVerifier>(ctx.store);
  ctx.dlq            = std::make_shared<audit::dlq::MemoryQueue>();
  ctx.gateway   = std::make_shared<audit::core::IngestionGateway>(std::make_shared<audit::core::EventWriter>(ctx.store), ctx.dlq);
  ctx.analytics = std::make_shared<audit::analytics::AggregationEngine>(repository);
  return ctx;
}

AuditEvent MakeEvent() {
  AuditEvent event;
  event.set_service("gateway");
  event.set_event_type("workflow.started");
  *event.mutable_event_timestamp() = audit::util::MillisToProto(audit::util::NowMs());
  event.set_correlation_id("corr-grpc");
  event.set_outcome("success");
  event.set_operation("start");
  return event;
}

ProblemDetail ProblemOf(const ::grpc::Status& status) {
  ProblemDetail problem;
  assert(problem.ParseFromString(status.error_details()));
  return problem;
}

void TestExceptionMapping() {
  using namespace audit::util;

  struct Case {
    ::grpc::StatusCode code;
    int                status;
    ::grpc::Status     actual;
  };

  const Case cases[] = {
      {::grpc::StatusCode::INVALID_ARGUMENT, 400, audit::grpc::ToStatus(ValidationError("bad"))},
      {::grpc::StatusCode::INVALID_ARGUMENT, 400, audit::grpc::ToStatus(ReferentialIntegrityError("no parent"))},
      {::grpc::StatusCode::NOT_FOUND, 404, audit::grpc::ToStatus(NotFound("gone"))},
      {::grpc::StatusCode::FAILED_PRECONDITION, 409, audit::grpc::ToStatus(DeleteRestricted("children"))},
      {::grpc::StatusCode::ALREADY_EXISTS, 409, audit::grpc::ToStatus(AlreadyExists("dup"))},
      {::grpc::StatusCode::ABORTED, 409, audit::grpc::ToStatus(LeaseConflict("owner"))},
      {::grpc::StatusCode::RESOURCE_EXHAUSTED, 503, audit::grpc::ToStatus(ResourceExhausted("full"))},
      {::grpc::StatusCode::UNAVAILABLE, 503, audit::grpc::ToStatus(StorageUnavailableError("down"))},
      {::grpc::StatusCode::INTERNAL, 500, audit::grpc::ToStatus(PartitionMissingError("y1999m01"))},
      {::grpc::StatusCode::INTERNAL, 500, audit::grpc::ToStatus(AggregationError("scan"))},
      {::grpc::StatusCode::INTERNAL, 500, audit::grpc::ToStatus(std::runtime_error("boom"))},
  };

  for (const auto& c : cases) {
    assert(c.actual.error_code() == c.code);
    assert(ProblemOf(c.actual).status() == c.status);
  }
}

void TestProblemDetailShape() {
  const auto status  = audit::grpc::ToStatus(audit::util::ValidationError("missing_service", "service is required"),
                                             "/audit.store.v1.AuditWriteService/WriteEvent");
  const auto problem = ProblemOf(status);

  assert(problem.type().find("validation-error") != std::string::npos);
  assert(problem.title() == "Validation Error");
  assert(problem.status() == 400);
  assert(problem.detail() == "service is required");
  assert(problem.instance() == "/audit.store.v1.AuditWriteService/WriteEvent");
}

void TestWriteWithMissingFieldReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  audit::grpc::WriteServer server(std::make_shared<audit::service::WriteService>(ctx));

  WriteEventRequest req;
  *req.mutable_event() = MakeEvent();
  req.mutable_event()->clear_service();
  WriteEventResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.WriteEvent(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestWriteWithUnknownParentReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  audit::grpc::WriteServer server(std::make_shared<audit::service::WriteService>(ctx));

  WriteEventRequest req;
  *req.mutable_event() = MakeEvent();
  req.mutable_event()->set_parent_event_id(audit::util::GenerateUUIDString());
  WriteEventResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.WriteEvent(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ProblemOf(status).type().find("referential-integrity-error") != std::string::npos);
}

void TestDeleteParentReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  audit::grpc::WriteServer write(std::make_shared<audit::service::WriteService>(ctx));
  audit::grpc::AdminServer admin(std::make_shared<audit::service::AdminService>(ctx));

  WriteEventRequest parent_req;
  *parent_req.mutable_event() = MakeEvent();
  WriteEventResponse parent_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(write.WriteEvent(&grpc_ctx, &parent_req, &parent_resp).ok());
    assert(parent_resp.disposition() == WRITE_DISPOSITION_STORED);
  }

  WriteEventRequest child_req;
  *child_req.mutable_event() = MakeEvent();
  child_req.mutable_event()->set_parent_event_id(parent_resp.event_id());
  WriteEventResponse child_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(write.WriteEvent(&grpc_ctx, &child_req, &child_resp).ok());
  }

  DeleteEventRequest del;
  del.set_event_id(parent_resp.event_id());
  DeleteEventResponse del_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(admin.DeleteEvent(&grpc_ctx, &del, &del_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }

  GetEventRequest get;
  get.set_event_id(parent_resp.event_id());
  GetEventResponse get_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(admin.GetEvent(&grpc_ctx, &get, &get_resp).ok());
    assert(get_resp.event().event_id() == parent_resp.event_id());
  }
}

void TestGetMissingEventReturnsNotFound() {
  auto ctx = BuildServiceContext();
  audit::grpc::AdminServer admin(std::make_shared<audit::service::AdminService>(ctx));

  GetEventRequest req;
  req.set_event_id(audit::util::GenerateUUIDString());
  GetEventResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  assert(admin.GetEvent(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestAnalyticsVersionWithoutPlaybookReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  audit::grpc::AnalyticsServer server(std::make_shared<audit::service::AnalyticsService>(ctx));

  SuccessRateMultiDimensionalRequest req;
  req.mutable_dimensions()->set_playbook_version("v2");
  SuccessRateReport     resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.SuccessRateMultiDimensional(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ProblemOf(status).status() == 400);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestProblemDetailShape();
  TestWriteWithMissingFieldReturnsInvalidArgument();
  TestWriteWithUnknownParentReturnsInvalidArgument();
  TestDeleteParentReturnsFailedPrecondition();
  TestGetMissingEventReturnsNotFound();
  TestAnalyticsVersionWithoutPlaybookReturnsInvalidArgument();

  std::cout << "audit_store_unit_grpc_status: pass\n";
  return 0;
}
