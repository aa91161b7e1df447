#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "audit/store/v1/event.pb.h"
#include "internal/core/chain_verifier.hpp"
#include "internal/core/event_codec.hpp"
#include "internal/core/event_store.hpp"
#include "internal/core/event_writer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/partition/partition_manager.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = audit::store::v1;
using audit::core::EventStore;
using audit::core::EventWriter;
using audit::core::InsertStatus;

// 2025-11-15T12:00:00Z
constexpr uint64_t kNowMs   = 1763208000000ULL;
constexpr int64_t  kNowSecs = 1763208000;

struct Harness {
  std::shared_ptr<audit::db::memory::MemoryRepository> repo = std::make_shared<audit::db::memory::MemoryRepository>();
  std::shared_ptr<EventStore>  store  = std::make_shared<EventStore>(repo);
  std::shared_ptr<EventWriter> writer = std::make_shared<EventWriter>(store);

  Harness() {
    audit::partition::PartitionManager partitions(repo, {});
    partitions.EnsurePartitions(kNowMs);
  }
};

v1::AuditEvent MakeEvent(const std::string& correlation_id, int64_t seconds = kNowSecs) {
  v1::AuditEvent event;
  event.set_service("gateway");
  event.set_event_type("signal.received");
  event.mutable_event_timestamp()->set_seconds(seconds);
  event.set_correlation_id(correlation_id);
  event.set_outcome("success");
  event.set_operation("ingest");
  (*event.mutable_event_data()->mutable_fields())["alert"].set_string_value("HighMemory");
  return event;
}

void TestParentChildScenario() {
  Harness h;

  auto a        = MakeEvent("rr-1");
  const auto id_a = h.writer->WriteEvent(a, kNowMs).id;

  auto b = MakeEvent("rr-1");
  b.set_parent_event_id(id_a);
  b.set_parent_event_date("1970-01-01"); // ignored
  const auto id_b = h.writer->WriteEvent(b, kNowMs + 1).id;

  auto stored_a = h.store->Lookup(id_a);
  auto stored_b = h.store->Lookup(id_b);
  assert(stored_a && stored_b);
  assert(stored_a->event_date == "2025-11-15");
  assert(stored_b->parent_event_id == id_a);
  assert(stored_b->parent_event_date == "2025-11-15");
  assert(stored_a->created_at_ms == kNowMs);
  assert(stored_a->event_data_json.find("HighMemory") != std::string::npos);

  // a parent with children cannot be removed
  bool restricted = false;
  try {
    h.store->Delete(id_a);
  } catch (const audit::util::DeleteRestricted&) {
    restricted = true;
  }
  assert(restricted);
  assert(h.store->Lookup(id_a));

  // unknown parent
  auto c = MakeEvent("rr-1");
  c.set_parent_event_id("00000000-0000-4000-8000-000000000099");
  bool rejected = false;
  try {
    h.writer->WriteEvent(c, kNowMs + 2);
  } catch (const audit::util::ReferentialIntegrityError&) {
    rejected = true;
  }
  assert(rejected);
  assert(h.store->Chain("rr-1").size() == 2);

  // leaf first, then the parent
  h.store->Delete(id_b);
  h.store->Delete(id_a);
  assert(!h.store->Lookup(id_a));

  bool missing = false;
  try {
    h.store->Delete(id_a);
  } catch (const audit::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestDuplicateEventIdIsIgnored() {
  Harness h;

  auto first = MakeEvent("rr-2");
  first.set_event_id("11111111-1111-4111-8111-111111111111");
  assert(h.writer->WriteEvent(first, kNowMs).status == InsertStatus::kStored);

  auto second = MakeEvent("rr-2");
  second.set_event_id("11111111-1111-4111-8111-111111111111");
  second.set_operation("different");
  const auto outcome = h.writer->WriteEvent(second, kNowMs + 5);
  assert(outcome.status == InsertStatus::kDuplicate);
  assert(outcome.id == "11111111-1111-4111-8111-111111111111");

  auto stored = h.store->Lookup(outcome.id);
  assert(stored);
  assert(stored->operation == "ingest");
  assert(h.store->Chain("rr-2").size() == 1);
}

void TestChainLinksAndHashes() {
  Harness h;

  for (int i = 0; i < 3; ++i) {
    auto event = MakeEvent("rr-3", kNowSecs + i);
    h.writer->WriteEvent(event, kNowMs + static_cast<uint64_t>(i));
  }
  auto other = MakeEvent("rr-other");
  h.writer->WriteEvent(other, kNowMs);

  const auto chain = h.store->Chain("rr-3");
  assert(chain.size() == 3);
  assert(chain[0].previous_event_hash.empty());
  for (std::size_t i = 0; i < chain.size(); ++i) {
    assert(chain[i].event_hash.size() == 64);
    assert(chain[i].event_hash == audit::core::ComputeEventHash(chain[i]));
    if (i > 0) {
      assert(chain[i].previous_event_hash == chain[i - 1].event_hash);
      assert(chain[i].sequence > chain[i - 1].sequence);
    }
  }
}

void TestLegalHoldBlocksDelete() {
  Harness h;

  auto event = MakeEvent("rr-4");
  event.set_legal_hold(true);
  const auto id = h.writer->WriteEvent(event, kNowMs).id;

  bool restricted = false;
  try {
    h.store->Delete(id);
  } catch (const audit::util::DeleteRestricted&) {
    restricted = true;
  }
  assert(restricted);
  assert(h.store->Lookup(id)->legal_hold);
}

void TestLegalHoldByCorrelationKeepsChain() {
  Harness h;

  auto first        = MakeEvent("rr-hold");
  const auto id_a   = h.writer->WriteEvent(first, kNowMs).id;
  auto second       = MakeEvent("rr-hold");
  const auto id_b   = h.writer->WriteEvent(second, kNowMs + 1).id;
  const auto hashes = h.store->Chain("rr-hold");

  audit::db::model::LegalHoldRecord hold;
  hold.correlation_id = "rr-hold";
  hold.reason         = "litigation 2025-17";
  hold.placed_by      = "compliance@example.com";
  hold.placed_at_ms   = kNowMs;

  const auto placed = h.store->PlaceLegalHold(hold);
  assert(placed.event_count == 2);

  const auto held = h.store->Chain("rr-hold");
  assert(held.size() == 2);
  for (std::size_t i = 0; i < held.size(); ++i) {
    assert(held[i].legal_hold);
    assert(held[i].event_hash == hashes[i].event_hash);
    assert(held[i].event_data_json == hashes[i].event_data_json);
  }
  assert(audit::core::ChainVerifier(h.store).Verify("rr-hold").valid);

  bool restricted = false;
  try {
    h.store->Delete(id_b);
  } catch (const audit::util::DeleteRestricted&) {
    restricted = true;
  }
  assert(restricted);

  const auto holds = h.store->LegalHolds();
  assert(holds.size() == 1);
  assert(holds[0].correlation_id == "rr-hold");
  assert(holds[0].reason == "litigation 2025-17");
  assert(holds[0].placed_by == "compliance@example.com");
  assert(holds[0].event_count == 2);

  const auto released = h.store->ReleaseLegalHold("rr-hold");
  assert(released.event_count == 2);
  assert(released.reason == "litigation 2025-17");
  assert(h.store->LegalHolds().empty());
  assert(!h.store->Lookup(id_a)->legal_hold);
  assert(audit::core::ChainVerifier(h.store).Verify("rr-hold").valid);

  h.store->Delete(id_b);
  assert(!h.store->Lookup(id_b));
}

void TestLegalHoldOnUnknownCorrelation() {
  Harness h;

  audit::db::model::LegalHoldRecord hold;
  hold.correlation_id = "rr-nothing";
  hold.reason         = "audit";
  hold.placed_by      = "ops";

  bool threw = false;
  try {
    h.store->PlaceLegalHold(hold);
  } catch (const audit::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    h.store->ReleaseLegalHold("rr-nothing");
  } catch (const audit::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->LegalHolds().empty());
}

void TestMissingPartitionIsTyped() {
  Harness h;

  // 1999-06-01, far outside the provisioned window
  auto event = MakeEvent("rr-5", 928195200);
  bool threw = false;
  try {
    h.writer->WriteEvent(event, kNowMs);
  } catch (const audit::util::PartitionMissingError&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->Chain("rr-5").empty());
}

void TestRefusedRowIsValidationError() {
  Harness h;

  auto record       = audit::core::ToRecord(MakeEvent("rr-6"));
  record.event_id   = "55555555-5555-4555-8555-555555555555";
  record.event_date = "not-a-date";

  bool threw = false;
  try {
    h.store->Insert(record, kNowMs);
  } catch (const audit::util::ValidationError& e) {
    threw = true;
    assert(e.reason() == "invalid_record");
  } catch (const audit::util::StorageUnavailableError&) {
    assert(false);
  }
  assert(threw);
  assert(!h.store->Lookup(record.event_id));
}

void TestActionTraceDuplicate() {
  Harness h;

  v1::ActionTrace trace;
  trace.set_action_id("22222222-2222-4222-8222-222222222222");
  trace.set_incident_type("pod-oom-killer");
  trace.set_action_type("restart_pod");
  trace.set_execution_status("completed");
  trace.mutable_action_timestamp()->set_seconds(kNowSecs);

  auto copy = trace;
  assert(h.writer->WriteActionTrace(trace).status == InsertStatus::kStored);
  assert(h.writer->WriteActionTrace(copy).status == InsertStatus::kDuplicate);
}

void TestPartitionsListed() {
  Harness h;

  const auto partitions = h.store->Partitions();
  assert(partitions.size() == 4);
  bool has_current = false;
  for (const auto& p : partitions) {
    if (p.partition_key == "y2025m11") {
      has_current = true;
      assert(p.range_start == "2025-11-01");
      assert(p.range_end == "2025-12-01");
    }
  }
  assert(has_current);
}

} // namespace

int main() {
  TestParentChildScenario();
  TestDuplicateEventIdIsIgnored();
  TestChainLinksAndHashes();
  TestLegalHoldBlocksDelete();
  TestLegalHoldByCorrelationKeepsChain();
  TestLegalHoldOnUnknownCorrelation();
  TestMissingPartitionIsTyped();
  TestRefusedRowIsValidationError();
  TestActionTraceDuplicate();
  TestPartitionsListed();

  std::cout << "audit_store_unit_event_store: pass\n";
  return 0;
}
