#include "internal/db/api/result.hpp"

namespace wfstore::db {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::Busy:
      return "BUSY";
    case ErrorCode::ConstraintViolation:
      return "CONSTRAINT_VIOLATION";
    case ErrorCode::SerializationFailure:
      return "SERIALIZATION_FAILURE";
    case ErrorCode::IOError:
      return "IO_ERROR";
    case ErrorCode::Corruption:
      return "CORRUPTION";
    case ErrorCode::DeadlineExceeded:
      return "DEADLINE_EXCEEDED";
    case ErrorCode::Cancelled:
      return "CANCELLED";
    case ErrorCode::ParameterExpansion:
      return "PARAMETER_EXPANSION";
    case ErrorCode::InvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorCode::InternalError:
      return "INTERNAL";
  }
  return "UNKNOWN";
}

} // namespace wfstore::db
