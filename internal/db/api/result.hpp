#pragma once

#include <string>
#include <string_view>

namespace codereview::db {

/*
  Outcome of a repository write.

  Backends map their native errors onto ErrorCode so the TaskStore can log
  and count a failed write-through without knowing which backend it talks to.
*/
enum class ErrorCode {
  OK = 0,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError,
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace codereview::db
