#pragma once

#include "audit/store/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace audit::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  audit::store::v1::StatsResponse Stats(const audit::store::v1::StatsRequest& req);

  audit::store::v1::GetEventResponse GetEvent(const audit::store::v1::GetEventRequest& req);

  // Restrict-on-delete: fails while children exist or legal_hold is set.
  void DeleteEvent(const audit::store::v1::DeleteEventRequest& req);

  audit::store::v1::ListDeadLettersResponse ListDeadLetters(const audit::store::v1::ListDeadLettersRequest& req);

  audit::store::v1::VerifyChainResponse VerifyChain(const audit::store::v1::VerifyChainRequest& req);

  // Flags every event of the correlation; payloads and hashes are untouched.
  audit::store::v1::PlaceLegalHoldResponse PlaceLegalHold(const audit::store::v1::PlaceLegalHoldRequest& req);

  audit::store::v1::ReleaseLegalHoldResponse ReleaseLegalHold(const audit::store::v1::ReleaseLegalHoldRequest& req);

  audit::store::v1::ListLegalHoldsResponse ListLegalHolds(const audit::store::v1::ListLegalHoldsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace audit::service
