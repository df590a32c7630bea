#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace atomicswap::db {

/*
  Outcome of a repository write.

  SQLite result codes and pqxx exceptions are translated into these by
  each repository; nothing above internal/db sees a driver type. The
  coordinator turns a non-OK result into a util:: exception, with
  Conflict (lost compare-and-set) surfacing as InvalidState.
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
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
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

} // namespace atomicswap::db
