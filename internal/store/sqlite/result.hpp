#pragma once

#include <sqlite3.h>

#include <string>
#include <string_view>

namespace engram::store::sqlite {

/*
  Portable result codes for the embedded SQL layer.

  sqlite return codes are translated into these first and then raised as
  util:: exceptions, so no sqlite type crosses the Store interface.
*/

enum class ErrorCode {
  OK = 0,

  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

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

Result Translate(sqlite3* db, int rc);

// Throws the util:: exception matching result.code, prefixed by operation.
void ThrowIfError(const Result& result, std::string_view operation);

} // namespace engram::store::sqlite
