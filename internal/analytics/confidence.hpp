#pragma once

#include <cstdint>

#include "audit/store/v1/analytics_service.pb.h"

namespace audit::analytics {

/*
  Sample-count tiers:
    total >= 100        high
    20 <= total < 100   medium
    5 <= total < 20     low
    total < 5           insufficient_data
*/
constexpr audit::store::v1::Confidence ClassifyConfidence(int64_t total) {
  if (total >= 100) return audit::store::v1::CONFIDENCE_HIGH;
  if (total >= 20) return audit::store::v1::CONFIDENCE_MEDIUM;
  if (total >= 5) return audit::store::v1::CONFIDENCE_LOW;
  return audit::store::v1::CONFIDENCE_INSUFFICIENT_DATA;
}

// Percentage in [0, 100]; 0 when total is 0.
constexpr double SuccessRate(int64_t successful, int64_t total) {
  if (total <= 0) return 0.0;
  return static_cast<double>(successful) * 100.0 / static_cast<double>(total);
}

} // namespace audit::analytics
