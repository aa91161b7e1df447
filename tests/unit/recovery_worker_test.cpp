#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "audit/store/v1/event.pb.h"
#include "internal/core/event_store.hpp"
#include "internal/core/event_writer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dlq/backoff.hpp"
#include "internal/dlq/memory_queue.hpp"
#include "internal/dlq/recovery_worker.hpp"
#include "internal/partition/partition_manager.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "tests/unit/flaky_repository.hpp"

namespace {

namespace v1 = audit::store::v1;
using audit::dlq::RecoveryOptions;
using audit::dlq::RecoveryWorker;
using std::chrono::milliseconds;

struct Harness {
  uint64_t now_ms = audit::util::NowMs();

  std::shared_ptr<audit::testing::FlakyRepository> repo;
  std::shared_ptr<audit::core::EventStore>         store;
  std::shared_ptr<audit::core::EventWriter>        writer;
  std::shared_ptr<audit::dlq::MemoryQueue>         dlq = std::make_shared<audit::dlq::MemoryQueue>(100);

  Harness() {
    repo = std::make_shared<audit::testing::FlakyRepository>(std::make_shared<audit::db::memory::MemoryRepository>());
    audit::partition::PartitionManager(repo, {}).EnsurePartitions(now_ms);
    store  = std::make_shared<audit::core::EventStore>(repo);
    writer = std::make_shared<audit::core::EventWriter>(store);
  }

  RecoveryOptions Options(uint32_t max_retries = 3) const {
    RecoveryOptions options;
    options.max_retries     = max_retries;
    options.initial_backoff = milliseconds(1000);
    options.max_backoff     = milliseconds(60000);
    options.poll_interval   = milliseconds(10);
    return options;
  }

  v1::AuditEvent Event(const std::string& id) const {
    v1::AuditEvent event;
    event.set_event_id(id);
    event.set_service("gateway");
    event.set_event_type("signal.received");
    *event.mutable_event_timestamp() = audit::util::MillisToProto(now_ms);
    event.set_correlation_id("rr-recovery");
    event.set_outcome("success");
    event.set_operation("ingest");
    return event;
  }

  std::string Enqueue(const v1::AuditEvent& event) {
    return dlq->Enqueue(audit::dlq::kAuditEventsDestination, event.SerializeAsString(), "store unreachable", now_ms);
  }
};

void TestBackoffDelay() {
  const milliseconds initial(1000);
  const milliseconds max(300000);

  assert(audit::dlq::BackoffDelay(1, initial, max) == milliseconds(1000));
  assert(audit::dlq::BackoffDelay(2, initial, max) == milliseconds(2000));
  assert(audit::dlq::BackoffDelay(3, initial, max) == milliseconds(4000));
  assert(audit::dlq::BackoffDelay(9, initial, max) == milliseconds(256000));
  assert(audit::dlq::BackoffDelay(10, initial, max) == max);
  assert(audit::dlq::BackoffDelay(60, initial, max) == max);
}

void TestReplaySucceedsOnceStoreIsBack() {
  Harness h;
  RecoveryWorker worker(h.dlq, h.writer, h.Options());

  const std::string id = "55555555-5555-4555-8555-555555555555";
  h.Enqueue(h.Event(id));

  assert(worker.DrainOnce(h.now_ms) == 1);
  assert(h.dlq->Depth() == 0);
  assert(h.store->Lookup(id));

  const auto c = worker.Counters();
  assert(c.replayed == 1);
  assert(c.rescheduled == 0);
  assert(c.dead_lettered == 0);
}

void TestFailuresBackOffThenDeadLetter() {
  Harness h;
  RecoveryWorker worker(h.dlq, h.writer, h.Options(3));
  h.repo->SetDown(true);

  const auto entry_id = h.Enqueue(h.Event("66666666-6666-4666-8666-666666666666"));
  const uint64_t t0   = h.now_ms;

  // attempt 1 fails, next attempt at t0 + 1s
  assert(worker.DrainOnce(t0) == 1);
  assert(worker.DrainOnce(t0 + 999) == 0);

  // attempt 2 fails, next attempt 2s later
  assert(worker.DrainOnce(t0 + 1000) == 1);
  assert(worker.DrainOnce(t0 + 2999) == 0);

  // attempt 3 reaches max_retries
  assert(worker.DrainOnce(t0 + 3000) == 1);

  assert(h.dlq->Depth() == 0);
  assert(h.dlq->DeadLetterCount() == 1);

  const auto dead = h.dlq->ListDeadLetters(0);
  assert(dead[0].entry_id == entry_id);
  assert(dead[0].retry_count == 3);
  assert(dead[0].last_error.find("store unreachable") != std::string::npos);

  const auto c = worker.Counters();
  assert(c.replayed == 0);
  assert(c.rescheduled == 2);
  assert(c.dead_lettered == 1);

  // the store coming back does not revive a dead letter
  h.repo->SetDown(false);
  assert(worker.DrainOnce(t0 + 600000) == 0);
}

void TestRecoversAfterTransientFailure() {
  Harness h;
  RecoveryWorker worker(h.dlq, h.writer, h.Options(3));

  const std::string id = "77777777-7777-4777-8777-777777777777";
  h.Enqueue(h.Event(id));

  h.repo->FailNext(1);
  assert(worker.DrainOnce(h.now_ms) == 1);
  assert(h.dlq->Depth() == 1);
  assert(!h.store->Lookup(id));

  assert(worker.DrainOnce(h.now_ms + 1000) == 1);
  assert(h.dlq->Depth() == 0);
  assert(h.store->Lookup(id));
  assert(worker.Counters().rescheduled == 1);
  assert(worker.Counters().replayed == 1);
}

void TestReplayOfStoredEventIsIdempotent() {
  Harness h;
  RecoveryWorker worker(h.dlq, h.writer, h.Options());

  const std::string id = "88888888-8888-4888-8888-888888888888";
  auto event           = h.Event(id);
  auto copy            = event;
  h.writer->WriteEvent(copy, h.now_ms);

  h.Enqueue(event);
  assert(worker.DrainOnce(h.now_ms) == 1);

  assert(h.dlq->Depth() == 0);
  assert(worker.Counters().replayed == 1);
  assert(h.store->Chain("rr-recovery").size() == 1);
}

void TestStopDrainsDeferredEntries() {
  Harness h;

  const std::string id = "99999999-9999-4999-8999-999999999999";
  const auto entry_id  = h.Enqueue(h.Event(id));

  // push the entry an hour into the future
  audit::dlq::LeaseRequest req;
  req.owner         = "setup";
  req.now_ms        = h.now_ms;
  req.due_before_ms = h.now_ms;
  assert(h.dlq->LeaseDue(req).size() == 1);
  h.dlq->Reschedule(entry_id, "setup", "store unreachable", h.now_ms + 3600000);

  RecoveryWorker worker(h.dlq, h.writer, h.Options());
  worker.Start();
  worker.Stop();

  assert(h.dlq->Depth() == 0);
  assert(h.store->Lookup(id));
  assert(worker.Counters().replayed == 1);
}

void TestWorkerPoolReplaysEachEntryOnce() {
  Harness h;
  constexpr int kEntries = 60;

  for (int i = 0; i < kEntries; ++i) {
    h.Enqueue(h.Event(audit::util::GenerateUUIDString()));
  }
  const auto writes_before = h.repo->WriteTransactions();

  auto options       = h.Options();
  options.workers    = 4;
  options.batch_size = 5;
  RecoveryWorker worker(h.dlq, h.writer, options);
  worker.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (h.dlq->Depth() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  worker.Stop();

  assert(h.dlq->Depth() == 0);
  assert(h.dlq->DeadLetterCount() == 0);

  // one insert transaction per entry: no entry was leased by two threads
  assert(h.repo->WriteTransactions() - writes_before == kEntries);
  assert(h.store->Chain("rr-recovery").size() == kEntries);

  const auto c = worker.Counters();
  assert(c.replayed == kEntries);
  assert(c.rescheduled == 0);
  assert(c.dead_lettered == 0);
}

} // namespace

int main() {
  TestBackoffDelay();
  TestReplaySucceedsOnceStoreIsBack();
  TestFailuresBackOffThenDeadLetter();
  TestRecoversAfterTransientFailure();
  TestReplayOfStoredEventIsIdempotent();
  TestStopDrainsDeferredEntries();
  TestWorkerPoolReplaysEachEntryOnce();

  std::cout << "audit_store_unit_recovery_worker: pass\n";
  return 0;
}
