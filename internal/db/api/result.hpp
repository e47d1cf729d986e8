#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace wfstore::db {

/*
  Portable DB result codes.

  The store layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.

  The message of a backend failure is the driver's own text, unchanged.
*/

enum class ErrorCode {
  OK = 0,

  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  DeadlineExceeded,
  Cancelled,

  // variadic IN / VALUES expansion could not be built; nothing was executed
  ParameterExpansion,
  InvalidArgument,

  InternalError
};

struct Result {
  ErrorCode    code = ErrorCode::OK;
  std::string  message;
  std::int64_t rows_affected = 0;

  static Result Ok(std::int64_t rows_affected = 0) {
    return {ErrorCode::OK, {}, rows_affected};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg), 0};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

std::string_view ErrorCodeName(ErrorCode code);

} // namespace wfstore::db
