#include "analytics_server.hpp"

#include "grpc_error.hpp"

namespace audit::grpc {

using namespace audit::store::v1;

AnalyticsServer::AnalyticsServer(std::shared_ptr<audit::service::AnalyticsService> svc) : service_(std::move(svc)) {
}

::grpc::Status AnalyticsServer::SuccessRateByIncidentType(::grpc::ServerContext*,
                                                          const SuccessRateByIncidentTypeRequest* req,
                                                          SuccessRateReport* resp) {
  try {
    *resp = service_->SuccessRateByIncidentType(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AnalyticsService/SuccessRateByIncidentType");
  }
}

::grpc::Status AnalyticsServer::SuccessRateByPlaybook(::grpc::ServerContext*, const SuccessRateByPlaybookRequest* req,
                                                      SuccessRateReport* resp) {
  try {
    *resp = service_->SuccessRateByPlaybook(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AnalyticsService/SuccessRateByPlaybook");
  }
}

::grpc::Status AnalyticsServer::SuccessRateMultiDimensional(::grpc::ServerContext*,
                                                            const SuccessRateMultiDimensionalRequest* req,
                                                            SuccessRateReport* resp) {
  try {
    *resp = service_->SuccessRateMultiDimensional(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AnalyticsService/SuccessRateMultiDimensional");
  }
}

} // namespace audit::grpc
