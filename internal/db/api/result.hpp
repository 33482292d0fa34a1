#pragma once

#include <string>
#include <string_view>

namespace resolver::db {

/*
  Backend neutral outcome of a repository write. Backends map sqlite result
  codes and pqxx exceptions onto these so the result writer never sees a
  driver type.
*/
enum class ErrorCode {
  OK = 0,

  AlreadyExists,
  ConstraintViolation,
  Busy,
  SerializationFailure,
  IOError,
  Corruption,
  InternalError,
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

  // "<code>: <message>", for error reports
  std::string Describe() const {
    std::string out(ToString(code));
    if (!message.empty()) out += ": " + message;
    return out;
  }
};

} // namespace resolver::db
