#pragma once

#include <string>
#include <utility>

namespace strands::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Outcome of a conditional update (compare-and-swap).

  The update carries its full expected-state predicate in the WHERE
  clause. swapped is true only if exactly one row matched and changed.
  A backend failure is reported through status and never as a miss.
*/
struct CasResult {
  Result status;
  bool   swapped = false;

  static CasResult Swapped() {
    return {Result::Ok(), true};
  }

  static CasResult Missed() {
    return {Result::Ok(), false};
  }

  static CasResult Failed(Result r) {
    return {std::move(r), false};
  }

  explicit operator bool() const {
    return status && swapped;
  }
};

} // namespace strands::db
