#include "sqlite_db.hpp"

#include "internal/store/sqlite/result.hpp"
#include "internal/util/errors.hpp"

namespace engram::store::sqlite {

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::ConnectionFailed("open sqlite database " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc);
    if (err) {
      result.message = err;
    }
    sqlite3_free(err);
    ThrowIfError(result, "sqlite exec");
  }
}

void SqliteDB::Configure() {
  // WAL lets readers proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIfError(Translate(db_, sqlite3_busy_timeout(db_, 5000)), "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

// ------------------------------------------------------------
// Statement
// ------------------------------------------------------------

Statement::Statement(const SqliteDB& db, const char* sql) : db_(db.Handle()) {
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    ThrowIfError(Translate(db_, rc), "sqlite prepare");
  }
}

Statement::~Statement() {
  sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& value) {
  sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::BindOptionalText(int idx, const std::optional<std::string>& value) {
  if (value) {
    BindText(idx, *value);
  } else {
    sqlite3_bind_null(stmt_, idx);
  }
}

void Statement::BindBlob(int idx, const std::vector<unsigned char>& value) {
  sqlite3_bind_blob(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

bool Statement::Step(const char* operation) {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  ThrowIfError(Translate(db_, rc), operation);
  return false;
}

void Statement::Run(const char* operation) {
  while (Step(operation)) {
  }
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(stmt_, col)) : std::string();
}

std::optional<std::string> Statement::ColOptionalText(int col) const {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return ColText(col);
}

std::int64_t Statement::ColInt64(int col) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

std::vector<unsigned char> Statement::ColBlob(int col) const {
  const auto* data = static_cast<const unsigned char*>(sqlite3_column_blob(stmt_, col));
  const int   size = sqlite3_column_bytes(stmt_, col);
  if (!data || size <= 0) {
    return {};
  }
  return std::vector<unsigned char>(data, data + size);
}

} // namespace engram::store::sqlite
