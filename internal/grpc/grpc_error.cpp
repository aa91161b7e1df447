#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace audit::grpc {

namespace {

struct Mapping {
  ::grpc::StatusCode code;
  int                status;
  const char*        type;
  const char*        title;
};

Mapping Classify(const std::exception& e) {
  using namespace audit::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, 400, "validation-error", "Validation Error"};
  }
  if (dynamic_cast<const ReferentialIntegrityError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, 400, "referential-integrity-error", "Referential Integrity Error"};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, 404, "not-found", "Not Found"};
  }
  if (dynamic_cast<const DeleteRestricted*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, 409, "delete-restricted", "Delete Restricted"};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, 409, "already-exists", "Already Exists"};
  }
  if (dynamic_cast<const LeaseConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, 409, "lease-conflict", "Lease Conflict"};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, 503, "resource-exhausted", "Resource Exhausted"};
  }
  if (dynamic_cast<const StorageUnavailableError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, 503, "storage-unavailable", "Storage Unavailable"};
  }
  if (dynamic_cast<const PartitionMissingError*>(&e)) {
    return {::grpc::StatusCode::INTERNAL, 500, "partition-missing", "Partition Missing"};
  }
  if (dynamic_cast<const AggregationError*>(&e)) {
    return {::grpc::StatusCode::INTERNAL, 500, "aggregation-error", "Aggregation Error"};
  }

  return {::grpc::StatusCode::INTERNAL, 500, "internal-error", "Internal Error"};
}

} // namespace

audit::store::v1::ProblemDetail ToProblem(const std::exception& e, const std::string& instance) {
  const auto m = Classify(e);

  audit::store::v1::ProblemDetail problem;
  problem.set_type(std::string("https://audit-store/problems/") + m.type);
  problem.set_title(m.title);
  problem.set_status(m.status);
  problem.set_detail(e.what());
  problem.set_instance(instance);
  return problem;
}

::grpc::Status ToStatus(const std::exception& e, const std::string& instance) {
  const auto m       = Classify(e);
  const auto problem = ToProblem(e, instance);
  return {m.code, e.what(), problem.SerializeAsString()};
}

} // namespace audit::grpc
