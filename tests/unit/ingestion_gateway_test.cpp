#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "audit/store/v1/event.pb.h"
#include "internal/core/event_store.hpp"
#include "internal/core/event_writer.hpp"
#include "internal/core/ingestion_gateway.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dlq/memory_queue.hpp"
#include "internal/partition/partition_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/unit/flaky_repository.hpp"

namespace {

namespace v1 = audit::store::v1;
using audit::core::Disposition;
using audit::core::IngestionGateway;
using audit::core::RequestContext;

struct Harness {
  std::shared_ptr<audit::testing::FlakyRepository> repo;
  std::shared_ptr<audit::core::EventStore>         store;
  std::shared_ptr<audit::dlq::MemoryQueue>         dlq;
  std::unique_ptr<IngestionGateway>                gateway;

  explicit Harness(uint64_t dlq_capacity = 100) {
    repo = std::make_shared<audit::testing::FlakyRepository>(std::make_shared<audit::db::memory::MemoryRepository>());
    audit::partition::PartitionManager(repo, {}).EnsurePartitions(audit::util::NowMs());

    store   = std::make_shared<audit::core::EventStore>(repo);
    dlq     = std::make_shared<audit::dlq::MemoryQueue>(dlq_capacity);
    gateway = std::make_unique<IngestionGateway>(std::make_shared<audit::core::EventWriter>(store), dlq);
  }
};

RequestContext Ctx() {
  return audit::core::MakeRequestContext("/audit.store.v1.WriteService/WriteEvent", "test");
}

v1::AuditEvent MakeEvent() {
  v1::AuditEvent event;
  event.set_service("gateway");
  event.set_event_type("signal.received");
  *event.mutable_event_timestamp() = audit::util::MillisToProto(audit::util::NowMs());
  event.set_correlation_id("rr-gw");
  event.set_outcome("success");
  event.set_operation("ingest");
  return event;
}

v1::ActionTrace MakeTrace() {
  v1::ActionTrace trace;
  trace.set_incident_type("pod-oom-killer");
  trace.set_action_type("restart_pod");
  trace.set_execution_status("completed");
  *trace.mutable_action_timestamp() = audit::util::MillisToProto(audit::util::NowMs());
  return trace;
}

void TestStoredAndDuplicate() {
  Harness h;

  auto event = MakeEvent();
  event.set_event_id("33333333-3333-4333-8333-333333333333");

  auto first = h.gateway->IngestEvent(Ctx(), event);
  assert(first.disposition == Disposition::kStored);
  assert(first.id == "33333333-3333-4333-8333-333333333333");

  auto second = h.gateway->IngestEvent(Ctx(), event);
  assert(second.disposition == Disposition::kDuplicate);

  auto generated = h.gateway->IngestEvent(Ctx(), MakeEvent());
  assert(generated.disposition == Disposition::kStored);
  assert(generated.id.size() == 36);

  const auto c = h.gateway->Counters();
  assert(c.accepted == 3);
  assert(c.stored == 2);
  assert(c.duplicates == 1);
  assert(c.queued == 0);
  assert(c.write_latency_us_count == 3);
  assert(h.dlq->Depth() == 0);
}

void TestValidationFailureIsRejected() {
  Harness h;

  auto event = MakeEvent();
  event.clear_service();

  bool threw = false;
  try {
    h.gateway->IngestEvent(Ctx(), event);
  } catch (const audit::util::ValidationError& e) {
    threw = true;
    assert(e.reason() == "missing_service");
  }
  assert(threw);

  const auto c = h.gateway->Counters();
  assert(c.rejected == 1);
  assert(c.accepted == 0);
  assert(c.rejected_by_reason.at("missing_service") == 1);
  assert(h.dlq->Depth() == 0);
}

void TestOutOfRangeTimestampIsRejectedNotQueued() {
  Harness h;

  auto far_future = MakeEvent();
  far_future.mutable_event_timestamp()->set_seconds(253402300800);
  far_future.mutable_event_timestamp()->set_nanos(0);

  auto negative_nanos = MakeEvent();
  negative_nanos.mutable_event_timestamp()->set_seconds(1700000000);
  negative_nanos.mutable_event_timestamp()->set_nanos(-1);

  for (const auto& event : {far_future, negative_nanos}) {
    bool threw = false;
    try {
      h.gateway->IngestEvent(Ctx(), event);
    } catch (const audit::util::ValidationError& e) {
      threw = true;
      assert(e.reason() == "invalid_event_timestamp");
    }
    assert(threw);
  }

  auto trace = MakeTrace();
  trace.mutable_action_timestamp()->set_nanos(-1);
  bool threw = false;
  try {
    h.gateway->IngestActionTrace(Ctx(), trace);
  } catch (const audit::util::ValidationError& e) {
    threw = true;
    assert(e.reason() == "invalid_action_timestamp");
  }
  assert(threw);

  const auto c = h.gateway->Counters();
  assert(c.rejected == 3);
  assert(c.queued == 0);
  assert(c.accepted == 0);
  assert(h.dlq->Depth() == 0);
}

void TestUnknownParentIsRejectedNotQueued() {
  Harness h;

  auto event = MakeEvent();
  event.set_parent_event_id("44444444-4444-4444-8444-444444444444");

  bool threw = false;
  try {
    h.gateway->IngestEvent(Ctx(), event);
  } catch (const audit::util::ReferentialIntegrityError&) {
    threw = true;
  }
  assert(threw);
  assert(h.gateway->Counters().rejected_by_reason.at("parent_not_found") == 1);
  assert(h.dlq->Depth() == 0);
}

void TestStoreOutageQueuesRecord() {
  Harness h;
  h.repo->SetDown(true);

  auto result = h.gateway->IngestEvent(Ctx(), MakeEvent());
  assert(result.disposition == Disposition::kQueued);
  assert(result.id.size() == 36);
  assert(h.dlq->Depth() == 1);

  auto trace_result = h.gateway->IngestActionTrace(Ctx(), MakeTrace());
  assert(trace_result.disposition == Disposition::kQueued);
  assert(h.dlq->Depth() == 2);

  audit::dlq::LeaseRequest req;
  req.owner         = "inspector";
  req.now_ms        = audit::util::NowMs() + 1;
  req.due_before_ms = audit::dlq::kNoDueHorizon;
  const auto entries = h.dlq->LeaseDue(req);
  assert(entries.size() == 2);

  // the queued payload carries the id handed back to the caller
  bool found_event = false;
  for (const auto& entry : entries) {
    if (entry.destination != audit::dlq::kAuditEventsDestination) continue;
    v1::AuditEvent queued;
    assert(queued.ParseFromString(entry.payload));
    assert(queued.event_id() == result.id);
    assert(entry.last_error.find("store unreachable") != std::string::npos);
    found_event = true;
  }
  assert(found_event);

  const auto c = h.gateway->Counters();
  assert(c.queued == 2);
  assert(c.accepted == 2);
  assert(c.stored == 0);
}

void TestMissingPartitionQueuesRecord() {
  Harness h;

  auto event = MakeEvent();
  event.mutable_event_timestamp()->set_seconds(928195200); // 1999-06-01

  auto result = h.gateway->IngestEvent(Ctx(), event);
  assert(result.disposition == Disposition::kQueued);

  const auto c = h.gateway->Counters();
  assert(c.partition_missing == 1);
  assert(c.queued == 1);
}

void TestFullDlqSurfacesUnavailable() {
  Harness h(0);
  h.repo->SetDown(true);

  bool threw = false;
  try {
    h.gateway->IngestEvent(Ctx(), MakeEvent());
  } catch (const audit::util::StorageUnavailableError&) {
    threw = true;
  }
  assert(threw);

  const auto c = h.gateway->Counters();
  assert(c.dlq_enqueue_failed == 1);
  assert(c.accepted == 0);
  assert(c.queued == 0);
}

void TestBatchStoresInOrderWithDuplicates() {
  Harness h;

  auto existing = MakeEvent();
  existing.set_event_id("aaaaaaaa-0000-4000-8000-000000000001");
  assert(h.gateway->IngestEvent(Ctx(), existing).disposition == Disposition::kStored);

  auto parent = MakeEvent();
  parent.set_event_id("aaaaaaaa-0000-4000-8000-000000000002");
  auto child = MakeEvent();
  child.set_event_id("aaaaaaaa-0000-4000-8000-000000000003");
  child.set_parent_event_id(parent.event_id());

  const auto results = h.gateway->IngestEventBatch(Ctx(), {parent, child, existing, MakeEvent()});
  assert(results.size() == 4);
  assert(results[0].id == parent.event_id());
  assert(results[0].disposition == Disposition::kStored);
  assert(results[1].id == child.event_id());
  assert(results[1].disposition == Disposition::kStored);
  assert(results[2].disposition == Disposition::kDuplicate);
  assert(results[3].disposition == Disposition::kStored);
  assert(results[3].id.size() == 36);

  // a child may name a parent stored earlier in the same batch
  const auto stored_child = h.store->Lookup(child.event_id());
  assert(stored_child);
  assert(stored_child->parent_event_date == h.store->Lookup(parent.event_id())->event_date);

  const auto c = h.gateway->Counters();
  assert(c.stored == 4);
  assert(c.duplicates == 1);
  assert(h.dlq->Depth() == 0);
}

void TestBatchRejectionStoresNothing() {
  Harness h;

  auto good = MakeEvent();
  good.set_event_id("bbbbbbbb-0000-4000-8000-000000000001");
  auto bad = MakeEvent();
  bad.clear_operation();

  bool threw = false;
  try {
    h.gateway->IngestEventBatch(Ctx(), {good, bad});
  } catch (const audit::util::ValidationError& e) {
    threw = true;
    assert(e.reason() == "missing_operation");
    assert(std::string(e.what()).find("events[1]") != std::string::npos);
  }
  assert(threw);
  assert(!h.store->Lookup(good.event_id()));

  auto orphan = MakeEvent();
  orphan.set_parent_event_id("bbbbbbbb-0000-4000-8000-0000000000ff");
  threw = false;
  try {
    h.gateway->IngestEventBatch(Ctx(), {good, orphan});
  } catch (const audit::util::ReferentialIntegrityError&) {
    threw = true;
  }
  assert(threw);
  assert(!h.store->Lookup(good.event_id()));

  const auto c = h.gateway->Counters();
  assert(c.rejected_by_reason.at("missing_operation") == 1);
  assert(c.rejected_by_reason.at("parent_not_found") == 1);
  assert(c.stored == 0);
  assert(h.dlq->Depth() == 0);
}

void TestBatchSizeLimits() {
  Harness h;

  const auto reason_of = [&](std::vector<v1::AuditEvent> events) {
    try {
      h.gateway->IngestEventBatch(Ctx(), std::move(events));
    } catch (const audit::util::ValidationError& e) {
      return e.reason();
    }
    return std::string();
  };

  assert(reason_of({}) == "empty_batch");
  assert(reason_of(std::vector<v1::AuditEvent>(IngestionGateway::kMaxBatchSize + 1, MakeEvent())) == "batch_too_large");
  assert(h.gateway->Counters().rejected == 2);
}

void TestBatchOutageQueuesEveryItem() {
  Harness h;
  h.repo->SetDown(true);

  const auto results = h.gateway->IngestEventBatch(Ctx(), {MakeEvent(), MakeEvent(), MakeEvent()});
  assert(results.size() == 3);
  for (const auto& result : results) {
    assert(result.disposition == Disposition::kQueued);
    assert(result.id.size() == 36);
  }
  assert(results[0].id != results[1].id);
  assert(h.dlq->Depth() == 3);
  assert(h.gateway->Counters().queued == 3);
}

} // namespace

int main() {
  TestStoredAndDuplicate();
  TestValidationFailureIsRejected();
  TestOutOfRangeTimestampIsRejectedNotQueued();
  TestUnknownParentIsRejectedNotQueued();
  TestStoreOutageQueuesRecord();
  TestMissingPartitionQueuesRecord();
  TestFullDlqSurfacesUnavailable();
  TestBatchStoresInOrderWithDuplicates();
  TestBatchRejectionStoresNothing();
  TestBatchSizeLimits();
  TestBatchOutageQueuesEveryItem();

  std::cout << "audit_store_unit_ingestion_gateway: pass\n";
  return 0;
}
