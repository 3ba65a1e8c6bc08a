#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace sqlmigrate::db {

/*
  Portable DB result codes.

  Every backend translates its driver errors into these.
  The migration layer never sees pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  AlreadyExists,
  ConstraintViolation,
  Busy,

  InvalidStatement,
  Unavailable,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::InvalidStatement:
      return "invalid_statement";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

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

} // namespace sqlmigrate::db
