#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace audit::grpc {

using namespace audit::store::v1;

AdminServer::AdminServer(std::shared_ptr<audit::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/Stats");
  }
}

::grpc::Status AdminServer::GetEvent(::grpc::ServerContext*, const GetEventRequest* req, GetEventResponse* resp) {
  try {
    *resp = service_->GetEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/GetEvent");
  }
}

::grpc::Status AdminServer::DeleteEvent(::grpc::ServerContext*, const DeleteEventRequest* req, DeleteEventResponse*) {
  try {
    service_->DeleteEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/DeleteEvent");
  }
}

::grpc::Status AdminServer::ListDeadLetters(::grpc::ServerContext*, const ListDeadLettersRequest* req,
                                            ListDeadLettersResponse* resp) {
  try {
    *resp = service_->ListDeadLetters(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/ListDeadLetters");
  }
}

::grpc::Status AdminServer::VerifyChain(::grpc::ServerContext*, const VerifyChainRequest* req,
                                        VerifyChainResponse* resp) {
  try {
    *resp = service_->VerifyChain(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/VerifyChain");
  }
}

::grpc::Status AdminServer::PlaceLegalHold(::grpc::ServerContext*, const PlaceLegalHoldRequest* req,
                                           PlaceLegalHoldResponse* resp) {
  try {
    *resp = service_->PlaceLegalHold(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/PlaceLegalHold");
  }
}

::grpc::Status AdminServer::ReleaseLegalHold(::grpc::ServerContext*, const ReleaseLegalHoldRequest* req,
                                             ReleaseLegalHoldResponse* resp) {
  try {
    *resp = service_->ReleaseLegalHold(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/ReleaseLegalHold");
  }
}

::grpc::Status AdminServer::ListLegalHolds(::grpc::ServerContext*, const ListLegalHoldsRequest* req,
                                           ListLegalHoldsResponse* resp) {
  try {
    *resp = service_->ListLegalHolds(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, "/audit.store.v1.AuditAdminService/ListLegalHolds");
  }
}

} // namespace audit::grpc
