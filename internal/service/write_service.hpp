#pragma once

#include <string>

#include "audit/store/v1/write_service.pb.h"
#include "service_context.hpp"

namespace audit::service {

class WriteService {
 public:
  explicit WriteService(ServiceContext ctx);

  // caller is the authenticated identity supplied by the transport, if any.
  audit::store::v1::WriteEventResponse WriteEvent(const audit::store::v1::WriteEventRequest& req,
                                                  const std::string& caller = {});

  audit::store::v1::WriteEventBatchResponse WriteEventBatch(const audit::store::v1::WriteEventBatchRequest& req,
                                                            const std::string& caller = {});

  audit::store::v1::RecordActionTraceResponse RecordActionTrace(const audit::store::v1::RecordActionTraceRequest& req,
                                                                const std::string& caller = {});

 private:
  ServiceContext ctx_;
};

} // namespace audit::service
