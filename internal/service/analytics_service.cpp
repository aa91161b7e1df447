#include "analytics_service.hpp"

#include "internal/analytics/aggregation_engine.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace audit::service {

using namespace audit::store::v1;

AnalyticsService::AnalyticsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SuccessRateReport AnalyticsService::SuccessRateByIncidentType(const SuccessRateByIncidentTypeRequest& req) {
  return ObserveRpc("AnalyticsService.SuccessRateByIncidentType", util::GenerateUUIDString(),
                    [&] { return ctx_.analytics->ByIncidentType(req, util::NowMs()); });
}

SuccessRateReport AnalyticsService::SuccessRateByPlaybook(const SuccessRateByPlaybookRequest& req) {
  return ObserveRpc("AnalyticsService.SuccessRateByPlaybook", util::GenerateUUIDString(),
                    [&] { return ctx_.analytics->ByPlaybook(req, util::NowMs()); });
}

SuccessRateReport AnalyticsService::SuccessRateMultiDimensional(const SuccessRateMultiDimensionalRequest& req) {
  return ObserveRpc("AnalyticsService.SuccessRateMultiDimensional", util::GenerateUUIDString(),
                    [&] { return ctx_.analytics->MultiDimensional(req, util::NowMs()); });
}

} // namespace audit::service
