#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/store/sqlite/result.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs     = std::filesystem;
namespace sqlite = engram::store::sqlite;
namespace util   = engram::util;

using engram::store::CallContext;

fs::path FreshDb(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "engram_sqlite_store_tests";
  fs::create_directories(dir);
  const auto path = dir / (name + ".db");
  fs::remove(path);
  fs::remove(path.string() + "-wal");
  fs::remove(path.string() + "-shm");
  return path;
}

engram::model::Note MakeNote(const std::string& id) {
  engram::model::Note note;
  note.id         = id;
  note.project_id = "/work/alpha";
  note.group_id   = "global";
  note.text       = "text of " + id;
  return note;
}

void TestTranslate() {
  assert(sqlite::Translate(nullptr, SQLITE_OK).code == sqlite::ErrorCode::OK);
  assert(sqlite::Translate(nullptr, SQLITE_DONE).code == sqlite::ErrorCode::OK);
  assert(sqlite::Translate(nullptr, SQLITE_BUSY).code == sqlite::ErrorCode::Busy);
  assert(sqlite::Translate(nullptr, SQLITE_CONSTRAINT).code == sqlite::ErrorCode::ConstraintViolation);
  assert(sqlite::Translate(nullptr, SQLITE_IOERR).code == sqlite::ErrorCode::IOError);
  assert(sqlite::Translate(nullptr, SQLITE_CORRUPT).code == sqlite::ErrorCode::Corruption);
  assert(sqlite::Translate(nullptr, SQLITE_MISUSE).code == sqlite::ErrorCode::InternalError);
}

void TestThrowIfError() {
  sqlite::ThrowIfError(sqlite::Result::Ok(), "noop");

  bool threw = false;
  try {
    sqlite::ThrowIfError(sqlite::Result::Err(sqlite::ErrorCode::ConstraintViolation, "dup"), "add group");
  } catch (const util::AlreadyExists& e) {
    threw = std::string(e.what()).find("add group") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    sqlite::ThrowIfError(sqlite::Result::Err(sqlite::ErrorCode::Corruption, "bad page"), "search");
  } catch (const util::NotFound&) {
    assert(false);
  } catch (const util::StoreError&) {
    threw = true;
  }
  assert(threw);
}

void TestStatementReportsSqlErrors() {
  sqlite::SqliteDB db(FreshDb("statement").string());
  db.Exec("CREATE TABLE kv (k TEXT PRIMARY KEY, v TEXT);");

  {
    sqlite::Statement st(db, "INSERT INTO kv (k, v) VALUES (?, ?);");
    st.BindText(1, "a");
    st.BindOptionalText(2, std::nullopt);
    st.Run("insert kv");
  }

  bool threw = false;
  try {
    sqlite::Statement st(db, "INSERT INTO kv (k, v) VALUES (?, ?);");
    st.BindText(1, "a");
    st.BindText(2, "again");
    st.Run("insert kv");
  } catch (const util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  sqlite::Statement select(db, "SELECT v FROM kv WHERE k = ?;");
  select.BindText(1, "a");
  assert(select.Step("select kv"));
  assert(!select.ColOptionalText(0).has_value());
  assert(!select.Step("select kv"));

  threw = false;
  try {
    sqlite::Statement bad(db, "SELECT nope FROM missing;");
  } catch (const util::StoreError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnreadableMetadataIsDropped() {
  const auto ctx  = CallContext::Background();
  const auto path = FreshDb("metadata");

  sqlite::SqliteStore store({.path = path.string()});
  store.Initialize(ctx, "test:model:3");

  auto note = MakeNote("n1");
  note.metadata.emplace();
  (*note.metadata->mutable_fields())["k"].set_string_value("v");
  store.AddNote(ctx, note, {1, 0, 0});

  {
    sqlite::SqliteDB raw(path.string());
    raw.Exec("UPDATE notes SET metadata = '{broken' WHERE id = 'n1';");
  }

  auto fetched = store.Get(ctx, "n1");
  assert(fetched.text == "text of n1");
  assert(!fetched.metadata.has_value());
}

void TestCountNotesAndThreshold() {
  const auto ctx = CallContext::Background();

  sqlite::SqliteStore store({.path = FreshDb("count").string(), .note_count_warning_threshold = 2});
  bool threw = false;
  try {
    store.CountNotes(ctx);
  } catch (const util::NotInitialized&) {
    threw = true;
  }
  assert(threw);

  store.Initialize(ctx, "test:model:3");
  for (const char* id : {"a", "b", "c"}) {
    store.AddNote(ctx, MakeNote(id), {1, 0, 0});
  }
  store.AddNote(ctx, MakeNote("a"), {0, 1, 0});
  assert(store.CountNotes(ctx) == 3);

  store.Delete(ctx, "b");
  assert(store.CountNotes(ctx) == 2);
}

} // namespace

int main() {
  TestTranslate();
  TestThrowIfError();
  TestStatementReportsSqlErrors();
  TestUnreadableMetadataIsDropped();
  TestCountNotesAndThreshold();

  std::cout << "engram_unit_sqlite_store: pass\n";
  return 0;
}
