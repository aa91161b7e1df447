#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "audit/store/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace audit::grpc {

class AdminServer final : public audit::store::v1::AuditAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<audit::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const audit::store::v1::StatsRequest*,
                       audit::store::v1::StatsResponse*) override;

  ::grpc::Status GetEvent(::grpc::ServerContext*, const audit::store::v1::GetEventRequest*,
                          audit::store::v1::GetEventResponse*) override;

  ::grpc::Status DeleteEvent(::grpc::ServerContext*, const audit::store::v1::DeleteEventRequest*,
                             audit::store::v1::DeleteEventResponse*) override;

  ::grpc::Status ListDeadLetters(::grpc::ServerContext*, const audit::store::v1::ListDeadLettersRequest*,
                                 audit::store::v1::ListDeadLettersResponse*) override;

  ::grpc::Status VerifyChain(::grpc::ServerContext*, const audit::store::v1::VerifyChainRequest*,
                             audit::store::v1::VerifyChainResponse*) override;

  ::grpc::Status PlaceLegalHold(::grpc::ServerContext*, const audit::store::v1::PlaceLegalHoldRequest*,
                                audit::store::v1::PlaceLegalHoldResponse*) override;

  ::grpc::Status ReleaseLegalHold(::grpc::ServerContext*, const audit::store::v1::ReleaseLegalHoldRequest*,
                                  audit::store::v1::ReleaseLegalHoldResponse*) override;

  ::grpc::Status ListLegalHolds(::grpc::ServerContext*, const audit::store::v1::ListLegalHoldsRequest*,
                                audit::store::v1::ListLegalHoldsResponse*) override;

 private:
  std::shared_ptr<audit::service::AdminService> service_;
};

} // namespace audit::grpc
