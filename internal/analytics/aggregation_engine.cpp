#include "aggregation_engine.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

#include "confidence.hpp"
#include "internal/util/errors.hpp"
#include "time_range.hpp"

namespace audit::analytics {

namespace v1 = audit::store::v1;

namespace {

struct Tally {
  int64_t executions = 0;
  int64_t successful = 0;
};

bool IsSuccessful(const std::string& status) {
  return status == "completed" || status == "success";
}

void CountMode(const db::model::ActionTraceRecord& row, v1::AiExecutionModeStats* modes) {
  const int set = static_cast<int>(row.catalog_selected) + static_cast<int>(row.chained) +
                  static_cast<int>(row.manual_escalation);
  if (set != 1) {
    modes->set_anomalies(modes->anomalies() + 1);
  } else if (row.catalog_selected) {
    modes->set_catalog_selected(modes->catalog_selected() + 1);
  } else if (row.chained) {
    modes->set_chained(modes->chained() + 1);
  } else {
    modes->set_manual_escalation(modes->manual_escalation() + 1);
  }
}

std::optional<std::string> Dimension(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

} // namespace

AggregationEngine::AggregationEngine(std::shared_ptr<db::Repository> repository, AnalyticsOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  if (options_.default_time_range.empty()) options_.default_time_range = kDefaultTimeRange;
  if (options_.default_min_samples <= 0) options_.default_min_samples = 5;
}

v1::SuccessRateReport AggregationEngine::ByIncidentType(const v1::SuccessRateByIncidentTypeRequest& req,
                                                        uint64_t now_ms) const {
  if (req.incident_type().empty()) {
    throw util::ValidationError("missing_incident_type", "incident_type is required");
  }

  Query q;
  q.dimensions.set_incident_type(req.incident_type());
  q.time_range  = ResolveTimeRange(req.time_range());
  q.min_samples = ResolveMinSamples(req.has_min_samples(), req.min_samples());
  q.breakdown   = Breakdown::kByPlaybook;
  return Run(q, now_ms);
}

v1::SuccessRateReport AggregationEngine::ByPlaybook(const v1::SuccessRateByPlaybookRequest& req,
                                                    uint64_t now_ms) const {
  if (req.playbook_id().empty()) {
    throw util::ValidationError("missing_playbook_id", "playbook_id is required");
  }

  Query q;
  q.dimensions.set_playbook_id(req.playbook_id());
  q.dimensions.set_playbook_version(req.playbook_version());
  q.time_range  = ResolveTimeRange(req.time_range());
  q.min_samples = ResolveMinSamples(req.has_min_samples(), req.min_samples());
  q.breakdown   = Breakdown::kByIncidentType;
  return Run(q, now_ms);
}

v1::SuccessRateReport AggregationEngine::MultiDimensional(const v1::SuccessRateMultiDimensionalRequest& req,
                                                          uint64_t now_ms) const {
  const auto& d = req.dimensions();
  if (d.incident_type().empty() && d.playbook_id().empty() && d.playbook_version().empty() &&
      d.action_type().empty()) {
    throw util::ValidationError("missing_dimension", "at least one dimension is required");
  }
  if (!d.playbook_version().empty() && d.playbook_id().empty()) {
    throw util::ValidationError("version_without_playbook", "playbook_version requires playbook_id");
  }

  Query q;
  q.dimensions  = d;
  q.time_range  = ResolveTimeRange(req.time_range());
  q.min_samples = ResolveMinSamples(req.has_min_samples(), req.min_samples());
  return Run(q, now_ms);
}

std::string AggregationEngine::ResolveTimeRange(const std::string& requested) const {
  const std::string range = requested.empty() ? options_.default_time_range : requested;
  if (!ParseTimeRange(range)) {
    throw util::ValidationError("invalid_time_range", "time_range must be one of 1h, 24h, 7d, 30d, 90d");
  }
  return range;
}

int32_t AggregationEngine::ResolveMinSamples(bool has_value, int32_t value) const {
  if (!has_value) return options_.default_min_samples;
  if (value <= 0) {
    throw util::ValidationError("invalid_min_samples", "min_samples must be positive");
  }
  return value;
}

v1::SuccessRateReport AggregationEngine::Run(const Query& query, uint64_t now_ms) const {
  const auto window = static_cast<uint64_t>(ParseTimeRange(query.time_range)->count());

  db::ActionTraceFilter filter;
  filter.incident_type    = Dimension(query.dimensions.incident_type());
  filter.playbook_id      = Dimension(query.dimensions.playbook_id());
  filter.playbook_version = Dimension(query.dimensions.playbook_version());
  filter.action_type      = Dimension(query.dimensions.action_type());
  filter.since_ms         = now_ms > window ? now_ms - window : 0;
  filter.until_ms         = now_ms;

  v1::SuccessRateReport report;
  *report.mutable_dimensions() = query.dimensions;
  report.set_time_range(query.time_range);

  Tally total;
  auto* modes = report.mutable_ai_execution_mode();

  // (key, playbook_version) -> tally
  std::map<std::pair<std::string, std::string>, Tally> groups;

  const auto visit = [&](const db::model::ActionTraceRecord& row) {
    const bool ok = IsSuccessful(row.execution_status);
    ++total.executions;
    if (ok) ++total.successful;
    CountMode(row, modes);

    if (query.breakdown == Breakdown::kByPlaybook) {
      if (row.playbook_id.empty()) return;
      auto& g = groups[{row.playbook_id, row.playbook_version}];
      ++g.executions;
      if (ok) ++g.successful;
    } else if (query.breakdown == Breakdown::kByIncidentType) {
      auto& g = groups[{row.incident_type, std::string()}];
      ++g.executions;
      if (ok) ++g.successful;
    }
  };

  try {
    auto tx     = repository_->Begin(db::TxMode::kReadOnly);
    auto result = repository_->ScanActionTraces(*tx, filter, visit);
    if (!result) {
      throw util::AggregationError("action trace scan failed: " + result.message);
    }
    tx->Commit();
  } catch (const util::AggregationError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::AggregationError(std::string("action trace scan failed: ") + e.what());
  }

  report.set_total_executions(total.executions);
  report.set_successful_executions(total.successful);
  report.set_failed_executions(total.executions - total.successful);
  report.set_success_rate(SuccessRate(total.successful, total.executions));
  report.set_confidence(ClassifyConfidence(total.executions));
  report.set_min_samples_met(total.executions >= query.min_samples);

  std::vector<v1::BreakdownEntry> entries;
  entries.reserve(groups.size());
  for (const auto& [key, tally] : groups) {
    v1::BreakdownEntry entry;
    entry.set_key(key.first);
    entry.set_playbook_version(key.second);
    entry.set_executions(tally.executions);
    entry.set_successful_executions(tally.successful);
    entry.set_success_rate(SuccessRate(tally.successful, tally.executions));
    entries.push_back(std::move(entry));
  }

  std::sort(entries.begin(), entries.end(), [](const v1::BreakdownEntry& a, const v1::BreakdownEntry& b) {
    if (a.success_rate() != b.success_rate()) return a.success_rate() > b.success_rate();
    if (a.executions() != b.executions()) return a.executions() > b.executions();
    return std::tie(a.key(), a.playbook_version()) < std::tie(b.key(), b.playbook_version());
  });

  for (auto& entry : entries) {
    *report.add_breakdown() = std::move(entry);
  }

  return report;
}

} // namespace audit::analytics
