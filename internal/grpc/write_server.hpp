#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "audit/store/v1/write_service.grpc.pb.h"
#include "internal/service/write_service.hpp"

namespace audit::grpc {

class WriteServer final : public audit::store::v1::AuditWriteService::Service {
 public:
  explicit WriteServer(std::shared_ptr<audit::service::WriteService> svc);

  ::grpc::Status WriteEvent(::grpc::ServerContext*, const audit::store::v1::WriteEventRequest*,
                            audit::store::v1::WriteEventResponse*) override;

  ::grpc::Status WriteEventBatch(::grpc::ServerContext*, const audit::store::v1::WriteEventBatchRequest*,
                                 audit::store::v1::WriteEventBatchResponse*) override;

  ::grpc::Status RecordActionTrace(::grpc::ServerContext*, const audit::store::v1::RecordActionTraceRequest*,
                                   audit::store::v1::RecordActionTraceResponse*) override;

 private:
  std::shared_ptr<audit::service::WriteService> service_;
};

} // namespace audit::grpc
