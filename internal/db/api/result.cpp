#include "result.hpp"

namespace audit::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::ForeignKeyViolation:
      return "foreign_key_violation";
    case ErrorCode::RestrictViolation:
      return "restrict_violation";
    case ErrorCode::PartitionMissing:
      return "partition_missing";
    case ErrorCode::LegalHold:
      return "legal_hold";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace audit::db
