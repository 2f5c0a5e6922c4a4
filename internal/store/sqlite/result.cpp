#include "result.hpp"

#include "internal/util/errors.hpp"

namespace engram::store::sqlite {

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
    return Result::Ok();
  }

  const char* message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, message);
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

void ThrowIfError(const Result& result, std::string_view operation) {
  if (result) {
    return;
  }

  const std::string message = std::string(operation) + ": " + result.message;
  switch (result.code) {
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::IOError:
      throw util::ConnectionFailed(message);
    default:
      throw util::StoreError(message);
  }
}

} // namespace engram::store::sqlite
