#pragma once

#include <string>
#include <utility>

namespace cardposter::db {

/*
  Outcome of a cache index mutation.

  Backends map their native errors onto ErrorCode; CacheStore turns a failed
  Result into a StorageError and never inspects sqlite codes directly.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,            // no row for the key
  Busy,                // index locked by another connection
  ConstraintViolation,

  IOError,
  Full,                // disk or database size limit
  Corruption,          // unreadable row or index file

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

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Full: return "full";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

} // namespace cardposter::db
