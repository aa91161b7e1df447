#pragma once

#include "audit/store/v1/analytics_service.pb.h"
#include "service_context.hpp"

namespace audit::service {

class AnalyticsService {
 public:
  explicit AnalyticsService(ServiceContext ctx);

  audit::store::v1::SuccessRateReport SuccessRateByIncidentType(
      const audit::store::v1::SuccessRateByIncidentTypeRequest& req);

  audit::store::v1::SuccessRateReport SuccessRateByPlaybook(const audit::store::v1::SuccessRateByPlaybookRequest& req);

  audit::store::v1::SuccessRateReport SuccessRateMultiDimensional(
      const audit::store::v1::SuccessRateMultiDimensionalRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace audit::service
