#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram::store::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized (FULLMUTEX) mode with WAL journaling.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement owned for one call. Binds are 1-based, columns
  0-based, as in the sqlite C API.
*/
class Statement {
 public:
  Statement(const SqliteDB& db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindOptionalText(int idx, const std::optional<std::string>& value);
  void BindBlob(int idx, const std::vector<unsigned char>& value);

  // true while a row is available; throws on error.
  bool Step(const char* operation);

  // Runs to completion; throws on error.
  void Run(const char* operation);

  std::string                ColText(int col) const;
  std::optional<std::string> ColOptionalText(int col) const;
  std::int64_t               ColInt64(int col) const;
  std::vector<unsigned char> ColBlob(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace engram::store::sqlite
