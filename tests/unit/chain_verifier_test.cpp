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
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace v1 = audit::store::v1;

// 2025-11-15T12:00:00Z
constexpr uint64_t kNowMs = 1763208000000ULL;

struct Harness {
  std::shared_ptr<audit::db::memory::MemoryRepository> repo = std::make_shared<audit::db::memory::MemoryRepository>();
  std::shared_ptr<audit::core::EventStore>  store    = std::make_shared<audit::core::EventStore>(repo);
  std::shared_ptr<audit::core::EventWriter> writer   = std::make_shared<audit::core::EventWriter>(store);
  audit::core::ChainVerifier                verifier{store};

  Harness() {
    audit::partition::PartitionManager(repo, {}).EnsurePartitions(kNowMs);
  }

  void Write(const std::string& correlation_id, int count) {
    for (int i = 0; i < count; ++i) {
      v1::AuditEvent event;
      event.set_service("executor");
      event.set_event_type("action.executed");
      *event.mutable_event_timestamp() = audit::util::MillisToProto(kNowMs + static_cast<uint64_t>(i));
      event.set_correlation_id(correlation_id);
      event.set_outcome("success");
      event.set_operation("restart_pod");
      writer->WriteEvent(event, kNowMs);
    }
  }

  // Appends a row straight to the repository, bypassing hashing.
  std::string Forge(const std::string& correlation_id, const std::string& previous_hash, const std::string& hash) {
    audit::db::model::AuditEventRecord r;
    r.event_id            = audit::util::GenerateUUIDString();
    r.event_date          = audit::util::UtcDate(kNowMs);
    r.version             = "1.0";
    r.service             = "intruder";
    r.event_type          = "action.executed";
    r.event_timestamp_ms  = kNowMs;
    r.correlation_id      = correlation_id;
    r.outcome             = "success";
    r.operation           = "delete_namespace";
    r.event_data_json     = "{}";
    r.previous_event_hash = previous_hash;
    r.event_hash          = hash;
    r.created_at_ms       = kNowMs;

    auto tx     = repo->Begin();
    auto result = repo->InsertEvent(*tx, r);
    assert(result);
    tx->Commit();
    return r.event_id;
  }

  std::string Head(const std::string& correlation_id) {
    auto tx   = repo->Begin(audit::db::TxMode::kReadOnly);
    auto head = repo->LatestChainHash(*tx, correlation_id);
    tx->Commit();
    return head;
  }
};

void TestIntactChain() {
  Harness h;
  h.Write("rr-intact", 4);

  const auto report = h.verifier.Verify("rr-intact");
  assert(report.valid);
  assert(report.events_checked == 4);
  assert(report.broken_event_id.empty());
}

void TestUnknownChainIsTriviallyValid() {
  Harness h;
  const auto report = h.verifier.Verify("rr-none");
  assert(report.valid);
  assert(report.events_checked == 0);
}

void TestTamperedContentIsDetected() {
  Harness h;
  h.Write("rr-content", 2);

  const auto forged = h.Forge("rr-content", h.Head("rr-content"), std::string(64, '0'));
  h.Write("rr-content", 1);

  const auto report = h.verifier.Verify("rr-content");
  assert(!report.valid);
  assert(report.broken_event_id == forged);
  assert(report.events_checked == 3);
  assert(report.detail.find("event_hash") != std::string::npos);
}

void TestBrokenLinkIsDetected() {
  Harness h;
  h.Write("rr-link", 2);

  const auto forged = h.Forge("rr-link", std::string(64, 'a'), std::string(64, 'b'));

  const auto report = h.verifier.Verify("rr-link");
  assert(!report.valid);
  assert(report.broken_event_id == forged);
  assert(report.detail.find("previous_event_hash") != std::string::npos);
}

void TestMissingCorrelationId() {
  Harness h;
  bool threw = false;
  try {
    h.verifier.Verify("");
  } catch (const audit::util::ValidationError& e) {
    threw = true;
    assert(e.reason() == "missing_correlation_id");
  }
  assert(threw);
}

} // namespace

int main() {
  TestIntactChain();
  TestUnknownChainIsTriviallyValid();
  TestTamperedContentIsDetected();
  TestBrokenLinkIsDetected();
  TestMissingCorrelationId();

  std::cout << "audit_store_unit_chain_verifier: pass\n";
  return 0;
}
