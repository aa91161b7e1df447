#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "audit/store/v1/analytics_service.pb.h"
#include "internal/db/api/repository.hpp"

namespace audit::analytics {

struct AnalyticsOptions {
  std::string default_time_range  = "7d";
  int32_t     default_min_samples = 5;
};

/*
  Read-only success-rate reports over stored action traces.

  Validation failures throw util::ValidationError before any read.
  A failed scan throws util::AggregationError.

  Single-dimension reports carry a breakdown by the complementary
  dimension, best success_rate first. The multi-dimensional report
  carries none.
*/
class AggregationEngine {
 public:
  AggregationEngine(std::shared_ptr<db::Repository> repository, AnalyticsOptions options = {});

  audit::store::v1::SuccessRateReport ByIncidentType(const audit::store::v1::SuccessRateByIncidentTypeRequest& req,
                                                     uint64_t now_ms) const;

  audit::store::v1::SuccessRateReport ByPlaybook(const audit::store::v1::SuccessRateByPlaybookRequest& req,
                                                 uint64_t now_ms) const;

  audit::store::v1::SuccessRateReport MultiDimensional(
      const audit::store::v1::SuccessRateMultiDimensionalRequest& req, uint64_t now_ms) const;

 private:
  enum class Breakdown {
    kNone,
    kByPlaybook,
    kByIncidentType,
  };

  struct Query {
    audit::store::v1::AggregationDimensions dimensions;
    std::string                             time_range;
    int32_t                                 min_samples = 0;
    Breakdown                               breakdown   = Breakdown::kNone;
  };

  std::string ResolveTimeRange(const std::string& requested) const;
  int32_t     ResolveMinSamples(bool has_value, int32_t value) const;

  audit::store::v1::SuccessRateReport Run(const Query& query, uint64_t now_ms) const;

  std::shared_ptr<db::Repository> repository_;
  AnalyticsOptions                options_;
};

} // namespace audit::analytics
