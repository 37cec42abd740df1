#pragma once

#include <stdexcept>
#include <string>

namespace jobsrv::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,  // row version moved since it was read
  Exhausted, // worker has no free slot
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

  // Worth re-running the whole transaction from a fresh snapshot.
  bool IsRetryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }
};

/*
  Thrown by Transaction::Commit when the backend refused the commit because a
  concurrent transaction won. Nothing was written; the caller may retry.
*/
class CommitConflict : public std::runtime_error {
 public:
  explicit CommitConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace jobsrv::db
