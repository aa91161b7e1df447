#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "audit/store/v1/analytics_service.pb.h"
#include "internal/analytics/aggregation_engine.hpp"
#include "internal/analytics/confidence.hpp"
#include "internal/analytics/time_range.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/partition/partition_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace v1 = audit::store::v1;
using audit::analytics::AggregationEngine;

// 2025-11-15T12:00:00Z
constexpr uint64_t kNowMs  = 1763208000000ULL;
constexpr uint64_t kHourMs = 3600000ULL;
constexpr uint64_t kDayMs  = 24 * kHourMs;

struct TraceSpec {
  std::string incident_type    = "pod-oom-killer";
  std::string playbook_id      = "oom-recovery";
  std::string playbook_version = "v1";
  std::string action_type      = "restart_pod";
  std::string status           = "completed";
  uint64_t    age_ms           = kHourMs;

  bool catalog_selected  = true;
  bool chained           = false;
  bool manual_escalation = false;
};

class Seeder {
 public:
  Seeder() : repo_(std::make_shared<audit::db::memory::MemoryRepository>()) {
    audit::partition::PartitionManager(repo_, {}).EnsurePartitions(kNowMs);
  }

  void Add(const TraceSpec& spec, int count = 1) {
    auto tx = repo_->Begin();
    for (int i = 0; i < count; ++i) {
      audit::db::model::ActionTraceRecord r;
      r.action_id           = audit::util::GenerateUUIDString();
      r.incident_type       = spec.incident_type;
      r.playbook_id         = spec.playbook_id;
      r.playbook_version    = spec.playbook_version;
      r.action_type         = spec.action_type;
      r.execution_status    = spec.status;
      r.catalog_selected    = spec.catalog_selected;
      r.chained             = spec.chained;
      r.manual_escalation   = spec.manual_escalation;
      r.action_timestamp_ms = kNowMs - spec.age_ms;
      r.action_date         = audit::util::UtcDate(r.action_timestamp_ms);
      const auto result = repo_->InsertActionTrace(*tx, r);
      assert(result);
    }
    tx->Commit();
  }

  // successful completed traces plus failed ones
  void AddOutcomes(TraceSpec spec, int successful, int failed) {
    spec.status = "completed";
    Add(spec, successful);
    spec.status = "failed";
    Add(spec, failed);
  }

  AggregationEngine Engine() const {
    return AggregationEngine(repo_);
  }

 private:
  std::shared_ptr<audit::db::memory::MemoryRepository> repo_;
};

template <typename Fn>
std::string RejectionReason(Fn&& fn) {
  try {
    fn();
  } catch (const audit::util::ValidationError& e) {
    return e.reason();
  }
  return "";
}

v1::SuccessRateByIncidentTypeRequest ByIncident(const std::string& incident_type) {
  v1::SuccessRateByIncidentTypeRequest req;
  req.set_incident_type(incident_type);
  return req;
}

void TestConfidenceTiers() {
  using audit::analytics::ClassifyConfidence;

  assert(ClassifyConfidence(150) == v1::CONFIDENCE_HIGH);
  assert(ClassifyConfidence(100) == v1::CONFIDENCE_HIGH);
  assert(ClassifyConfidence(99) == v1::CONFIDENCE_MEDIUM);
  assert(ClassifyConfidence(20) == v1::CONFIDENCE_MEDIUM);
  assert(ClassifyConfidence(19) == v1::CONFIDENCE_LOW);
  assert(ClassifyConfidence(5) == v1::CONFIDENCE_LOW);
  assert(ClassifyConfidence(4) == v1::CONFIDENCE_INSUFFICIENT_DATA);
  assert(ClassifyConfidence(0) == v1::CONFIDENCE_INSUFFICIENT_DATA);

  assert(audit::analytics::SuccessRate(0, 0) == 0.0);
  assert(audit::analytics::SuccessRate(135, 150) == 90.0);
  assert(audit::analytics::SuccessRate(3, 3) == 100.0);
}

void TestTimeRanges() {
  using audit::analytics::ParseTimeRange;

  assert(ParseTimeRange("1h")->count() == static_cast<int64_t>(kHourMs));
  assert(ParseTimeRange("24h")->count() == static_cast<int64_t>(kDayMs));
  assert(ParseTimeRange("7d")->count() == static_cast<int64_t>(7 * kDayMs));
  assert(ParseTimeRange("30d")->count() == static_cast<int64_t>(30 * kDayMs));
  assert(ParseTimeRange("90d")->count() == static_cast<int64_t>(90 * kDayMs));
  assert(!ParseTimeRange("2w"));
  assert(!ParseTimeRange(""));
  assert(!ParseTimeRange("7D"));
  assert(audit::analytics::AllowedTimeRanges().size() == 5);
}

void TestHighConfidenceReport() {
  Seeder seeder;
  seeder.AddOutcomes({}, 135, 15);

  const auto engine = seeder.Engine();
  auto report       = engine.ByIncidentType(ByIncident("pod-oom-killer"), kNowMs);

  assert(report.total_executions() == 150);
  assert(report.successful_executions() == 135);
  assert(report.failed_executions() == 15);
  assert(report.success_rate() == 90.0);
  assert(report.confidence() == v1::CONFIDENCE_HIGH);
  assert(report.min_samples_met());
  assert(report.time_range() == "7d");
  assert(report.dimensions().incident_type() == "pod-oom-killer");

  auto strict = ByIncident("pod-oom-killer");
  strict.set_min_samples(200);
  report = engine.ByIncidentType(strict, kNowMs);
  assert(report.confidence() == v1::CONFIDENCE_HIGH);
  assert(!report.min_samples_met());
}

void TestEmptyWindow() {
  Seeder seeder;
  const auto report = seeder.Engine().ByIncidentType(ByIncident("nothing-here"), kNowMs);

  assert(report.total_executions() == 0);
  assert(report.success_rate() == 0.0);
  assert(report.confidence() == v1::CONFIDENCE_INSUFFICIENT_DATA);
  assert(!report.min_samples_met());
  assert(report.breakdown_size() == 0);
}

void TestSuccessStatuses() {
  Seeder seeder;
  TraceSpec spec;
  spec.status = "completed";
  seeder.Add(spec, 2);
  spec.status = "success";
  seeder.Add(spec, 2);
  spec.status = "failed";
  seeder.Add(spec);
  spec.status = "timeout";
  seeder.Add(spec);

  const auto report = seeder.Engine().ByIncidentType(ByIncident("pod-oom-killer"), kNowMs);
  assert(report.total_executions() == 6);
  assert(report.successful_executions() == 4);
  assert(report.failed_executions() == 2);
}

void TestWindowBounds() {
  Seeder seeder;
  TraceSpec spec;

  spec.age_ms = 0; // exactly now: excluded
  seeder.Add(spec);
  spec.age_ms = 7 * kDayMs; // window start: included
  seeder.Add(spec);
  spec.age_ms = 8 * kDayMs; // outside 7d, inside 30d
  seeder.Add(spec);
  spec.age_ms = 2 * kHourMs; // outside 1h
  seeder.Add(spec);

  const auto engine = seeder.Engine();

  auto req = ByIncident("pod-oom-killer");
  assert(engine.ByIncidentType(req, kNowMs).total_executions() == 2);

  req.set_time_range("30d");
  assert(engine.ByIncidentType(req, kNowMs).total_executions() == 3);

  req.set_time_range("1h");
  assert(engine.ByIncidentType(req, kNowMs).total_executions() == 0);
}

void TestIncidentBreakdownOrdering() {
  Seeder seeder;
  TraceSpec spec;

  spec.playbook_id = "pb-a";
  seeder.AddOutcomes(spec, 9, 1); // 90%, 10
  spec.playbook_id = "pb-b";
  seeder.AddOutcomes(spec, 18, 2); // 90%, 20
  spec.playbook_id = "pb-c";
  spec.playbook_version = "v2";
  seeder.AddOutcomes(spec, 5, 0); // 100%, 5
  spec.playbook_id = "pb-d";
  spec.playbook_version = "v1";
  seeder.AddOutcomes(spec, 9, 1); // 90%, 10
  spec.playbook_id = "pb-a";
  spec.playbook_version = "v2";
  seeder.AddOutcomes(spec, 1, 1); // 50%, 2
  spec.playbook_id.clear();
  spec.playbook_version.clear();
  seeder.AddOutcomes(spec, 0, 3); // no playbook

  const auto report = seeder.Engine().ByIncidentType(ByIncident("pod-oom-killer"), kNowMs);
  assert(report.total_executions() == 50);
  assert(report.breakdown_size() == 5);

  assert(report.breakdown(0).key() == "pb-c");
  assert(report.breakdown(0).success_rate() == 100.0);
  assert(report.breakdown(1).key() == "pb-b");
  assert(report.breakdown(2).key() == "pb-a");
  assert(report.breakdown(2).playbook_version() == "v1");
  assert(report.breakdown(3).key() == "pb-d");
  assert(report.breakdown(4).key() == "pb-a");
  assert(report.breakdown(4).playbook_version() == "v2");
  assert(report.breakdown(4).executions() == 2);
  assert(report.breakdown(4).successful_executions() == 1);
  assert(report.breakdown(4).success_rate() == 50.0);
}

void TestPlaybookReport() {
  Seeder seeder;
  TraceSpec spec;
  spec.playbook_id = "oom-recovery";

  spec.incident_type = "pod-oom-killer";
  seeder.AddOutcomes(spec, 4, 4);
  spec.incident_type = "node-memory-pressure";
  seeder.AddOutcomes(spec, 3, 0);
  spec.playbook_version = "v2";
  seeder.AddOutcomes(spec, 1, 0);
  spec.playbook_id = "other";
  seeder.AddOutcomes(spec, 10, 0);

  const auto engine = seeder.Engine();

  v1::SuccessRateByPlaybookRequest req;
  req.set_playbook_id("oom-recovery");
  auto report = engine.ByPlaybook(req, kNowMs);

  assert(report.total_executions() == 12);
  assert(report.breakdown_size() == 2);
  assert(report.breakdown(0).key() == "node-memory-pressure");
  assert(report.breakdown(0).executions() == 4);
  assert(report.breakdown(0).playbook_version().empty());
  assert(report.breakdown(1).key() == "pod-oom-killer");
  assert(report.breakdown(1).success_rate() == 50.0);

  req.set_playbook_version("v2");
  report = engine.ByPlaybook(req, kNowMs);
  assert(report.total_executions() == 1);
  assert(report.dimensions().playbook_version() == "v2");
}

void TestMultiDimensional() {
  Seeder seeder;
  TraceSpec spec;

  seeder.AddOutcomes(spec, 3, 1);
  spec.action_type = "scale_up";
  seeder.AddOutcomes(spec, 1, 1);
  spec.incident_type = "disk-full";
  seeder.AddOutcomes(spec, 7, 0);

  v1::SuccessRateMultiDimensionalRequest req;
  req.mutable_dimensions()->set_incident_type("pod-oom-killer");
  req.mutable_dimensions()->set_action_type("scale_up");

  const auto report = seeder.Engine().MultiDimensional(req, kNowMs);
  assert(report.total_executions() == 2);
  assert(report.successful_executions() == 1);
  assert(report.success_rate() == 50.0);
  assert(report.breakdown_size() == 0);

  v1::SuccessRateMultiDimensionalRequest by_action;
  by_action.mutable_dimensions()->set_action_type("scale_up");
  assert(seeder.Engine().MultiDimensional(by_action, kNowMs).total_executions() == 9);
}

void TestAiExecutionModes() {
  Seeder seeder;
  TraceSpec spec;

  seeder.Add(spec, 2); // catalog
  spec.catalog_selected = false;
  spec.chained          = true;
  seeder.Add(spec); // chained
  spec.chained           = false;
  spec.manual_escalation = true;
  seeder.Add(spec); // manual
  spec.manual_escalation = false;
  seeder.Add(spec); // none set
  spec.chained           = true;
  spec.manual_escalation = true;
  seeder.Add(spec); // two set

  const auto report = seeder.Engine().ByIncidentType(ByIncident("pod-oom-killer"), kNowMs);
  const auto& modes = report.ai_execution_mode();
  assert(modes.catalog_selected() == 2);
  assert(modes.chained() == 1);
  assert(modes.manual_escalation() == 1);
  assert(modes.anomalies() == 2);
  assert(report.total_executions() == 6);
}

void TestValidation() {
  Seeder seeder;
  const auto engine = seeder.Engine();

  assert(RejectionReason([&] { engine.ByIncidentType(ByIncident(""), kNowMs); }) == "missing_incident_type");
  assert(RejectionReason([&] { engine.ByPlaybook({}, kNowMs); }) == "missing_playbook_id");
  assert(RejectionReason([&] { engine.MultiDimensional({}, kNowMs); }) == "missing_dimension");

  v1::SuccessRateMultiDimensionalRequest version_only;
  version_only.mutable_dimensions()->set_playbook_version("v1");
  assert(RejectionReason([&] { engine.MultiDimensional(version_only, kNowMs); }) == "version_without_playbook");

  auto bad_range = ByIncident("pod-oom-killer");
  bad_range.set_time_range("2w");
  assert(RejectionReason([&] { engine.ByIncidentType(bad_range, kNowMs); }) == "invalid_time_range");

  auto zero_samples = ByIncident("pod-oom-killer");
  zero_samples.set_min_samples(0);
  assert(RejectionReason([&] { engine.ByIncidentType(zero_samples, kNowMs); }) == "invalid_min_samples");
}

} // namespace

int main() {
  TestConfidenceTiers();
  TestTimeRanges();
  TestHighConfidenceReport();
  TestEmptyWindow();
  TestSuccessStatuses();
  TestWindowBounds();
  TestIncidentBreakdownOrdering();
  TestPlaybookReport();
  TestMultiDimensional();
  TestAiExecutionModes();
  TestValidation();

  std::cout << "audit_store_unit_aggregation_engine: pass\n";
  return 0;
}
