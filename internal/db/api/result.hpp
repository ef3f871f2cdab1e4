#pragma once

#include <string>
#include <utility>

namespace nove::db {

/*
  Outcome of a repository write.

  Backends translate driver errors (sqlite3 result codes, pqxx
  exceptions) into these codes; the registry decides what they mean
  for licenses and activations:

    AlreadyExists        duplicate license_key or (license_key, machine_id)
    ConstraintViolation  second trial for an email, or a foreign key miss
    NotFound             UPDATE matched no row
    Busy                 lock or serialization conflict; the caller may retry
    Unavailable          storage could not be reached or written
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  ConstraintViolation,

  Busy,
  Unavailable,
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

} // namespace nove::db
