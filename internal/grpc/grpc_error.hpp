#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

#include "audit/store/v1/problem.pb.h"
#include "internal/util/errors.hpp"

namespace audit::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The status error_details carry a serialized
  audit.store.v1.ProblemDetail; instance names the failing route.
*/

audit::store::v1::ProblemDetail ToProblem(const std::exception& e, const std::string& instance = {});

::grpc::Status ToStatus(const std::exception& e, const std::string& instance = {});

} // namespace audit::grpc
