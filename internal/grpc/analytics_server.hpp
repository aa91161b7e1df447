#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "audit/store/v1/analytics_service.grpc.pb.h"
#include "internal/service/analytics_service.hpp"

namespace audit::grpc {

class AnalyticsServer final : public audit::store::v1::AnalyticsService::Service {
 public:
  explicit AnalyticsServer(std::shared_ptr<audit::service::AnalyticsService> svc);

  ::grpc::Status SuccessRateByIncidentType(::grpc::ServerContext*,
                                           const audit::store::v1::SuccessRateByIncidentTypeRequest*,
                                           audit::store::v1::SuccessRateReport*) override;

  ::grpc::Status SuccessRateByPlaybook(::grpc::ServerContext*, const audit::store::v1::SuccessRateByPlaybookRequest*,
                                       audit::store::v1::SuccessRateReport*) override;

  ::grpc::Status SuccessRateMultiDimensional(::grpc::ServerContext*,
                                             const audit::store::v1::SuccessRateMultiDimensionalRequest*,
                                             audit::store::v1::SuccessRateReport*) override;

 private:
  std::shared_ptr<audit::service::AnalyticsService> service_;
};

} // namespace audit::grpc
