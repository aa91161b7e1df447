#include "write_server.hpp"

#include <string>

#include "grpc_error.hpp"

namespace audit::grpc {

namespace {

// Identity set by the authentication layer in front of this service.
std::string CallerOf(const ::grpc::ServerContext* context) {
  const auto& metadata = context->client_metadata();
  const auto  it       = metadata.find("x-audit-caller");
  if (it == metadata.end()) return {};
  return std::string(it->second.data(), it->second.size());
}

} // namespace

WriteServer::WriteServer(std::shared_ptr<audit::service::WriteService> svc) : service_(std::move(svc)) {
}

::grpc::Status WriteServer::WriteEvent(::grpc::ServerContext* context, const audit::store::v1::WriteEventRequest* req,
                                       audit::store::v1::WriteEventResponse* resp) {
  try {
    *resp = service_->WriteEvent(*req, CallerOf(context));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditWriteService/WriteEvent");
  }
}

::grpc::Status WriteServer::WriteEventBatch(::grpc::ServerContext* context,
                                            const audit::store::v1::WriteEventBatchRequest* req,
                                            audit::store::v1::WriteEventBatchResponse* resp) {
  try {
    *resp = service_->WriteEventBatch(*req, CallerOf(context));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditWriteService/WriteEventBatch");
  }
}

::grpc::Status WriteServer::RecordActionTrace(::grpc::ServerContext* context,
                                              const audit::store::v1::RecordActionTraceRequest* req,
                                              audit::store::v1::RecordActionTraceResponse* resp) {
  try {
    *resp = service_->RecordActionTrace(*req, CallerOf(context));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditWriteService/RecordActionTrace");
  }
}

} // namespace audit::grpc
