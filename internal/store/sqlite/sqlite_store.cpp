#include "sqlite_store.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/store/scoring.hpp"
#include "internal/store/sqlite/embedding_codec.hpp"
#include "internal/store/sqlite/result.hpp"
#include "internal/store/sqlite/schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace engram::store::sqlite {

namespace {

constexpr const char* kNoteColumns = "id, project_id, group_id, title, text, tags, source, created_at, metadata";

std::string NoteSelect(const char* tail, bool with_embedding) {
  std::string sql = "SELECT ";
  sql += kNoteColumns;
  if (with_embedding) {
    sql += ", embedding";
  }
  sql += " FROM notes ";
  sql += tail;
  return sql;
}

std::optional<std::string> MetadataToJson(const model::Note& note) {
  if (!note.metadata) {
    return std::nullopt;
  }
  return util::ToJson(*note.metadata);
}

// Columns in kNoteColumns order.
model::Note ReadNote(const Statement& st) {
  model::Note note;
  note.id         = st.ColText(0);
  note.project_id = st.ColText(1);
  note.group_id   = st.ColText(2);
  note.title      = st.ColOptionalText(3);
  note.text       = st.ColText(4);
  note.tags       = util::TagsFromJson(st.ColText(5));
  note.source     = st.ColOptionalText(6);
  note.created_at = st.ColOptionalText(7);

  auto metadata = st.ColOptionalText(8);
  if (metadata && !metadata->empty()) {
    google::protobuf::Struct parsed;
    try {
      util::FromJson(*metadata, &parsed);
      note.metadata = std::move(parsed);
    } catch (const util::StoreError& e) {
      ENGRAM_LOG_WARN("dropping unreadable note metadata",
                      {observability::StringField("id", note.id), observability::StringField("error", e.what())});
    }
  }
  return note;
}

model::GlobalConfig ReadGlobal(const Statement& st) {
  model::GlobalConfig config;
  config.id         = st.ColText(0);
  config.project_id = st.ColText(1);
  config.key        = st.ColText(2);

  auto value = st.ColOptionalText(3);
  if (value && !value->empty()) {
    util::FromJson(*value, &config.value);
  } else {
    config.value.set_null_value(google::protobuf::NULL_VALUE);
  }
  config.updated_at = st.ColOptionalText(4);
  return config;
}

util::TimePoint ParseStoredTime(const std::string& text) {
  auto tp = util::ParseRfc3339(text);
  return tp ? *tp : util::TimePoint{};
}

model::Group ReadGroup(const Statement& st) {
  model::Group group;
  group.id          = st.ColText(0);
  group.project_id  = st.ColText(1);
  group.group_key   = st.ColText(2);
  group.title       = st.ColText(3);
  group.description = st.ColText(4);
  group.created_at  = ParseStoredTime(st.ColText(5));
  group.updated_at  = ParseStoredTime(st.ColText(6));
  return group;
}

constexpr const char* kGroupColumns = "id, project_id, group_key, title, description, created_at, updated_at";

} // namespace

SqliteStore::SqliteStore(SqliteStoreOptions options)
    : options_(std::move(options)), db_(std::make_unique<SqliteDB>(options_.path)) {
  ENGRAM_LOG_INFO("sqlite store opened", {observability::StringField("path", options_.path)});
}

void SqliteStore::EnsureReady(const CallContext& ctx, const char* operation) const {
  ctx.ThrowIfCancelled(operation);
  if (!initialized_ || !db_) {
    throw util::NotInitialized(std::string(operation) + ": store not initialized");
  }
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void SqliteStore::Initialize(const CallContext& ctx, const std::string& ns) {
  ctx.ThrowIfCancelled("initialize");
  if (ns.empty()) {
    throw util::InvalidArgument("initialize: namespace must not be empty");
  }

  std::unique_lock lock(mutex_);
  if (!db_) {
    throw util::NotInitialized("initialize: store closed");
  }
  if (initialized_) {
    if (namespace_ != ns) {
      throw util::InvalidArgument("initialize: already initialized with namespace " + namespace_);
    }
    return;
  }

  for (const char* statement : kSchema) {
    db_->Exec(statement);
  }

  namespace_    = ns;
  initialized_  = true;
  count_warned_ = false;
  ENGRAM_LOG_INFO("store initialized", {observability::StringField("backend", "sqlite"),
                                        observability::StringField("namespace", ns),
                                        observability::StringField("path", options_.path)});
}

void SqliteStore::Close() {
  std::unique_lock lock(mutex_);
  db_.reset();
  initialized_ = false;
}

// ------------------------------------------------------------
// Notes
// ------------------------------------------------------------

std::uint64_t SqliteStore::CountNotesLocked() const {
  Statement st(*db_, "SELECT COUNT(*) FROM notes WHERE namespace = ?;");
  st.BindText(1, namespace_);
  st.Step("count notes");
  return static_cast<std::uint64_t>(st.ColInt64(0));
}

std::uint64_t SqliteStore::CountNotes(const CallContext& ctx) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "count notes");
  return CountNotesLocked();
}

void SqliteStore::MaybeWarnNoteCount() {
  if (count_warned_ || options_.note_count_warning_threshold == 0) {
    return;
  }
  const auto count = CountNotesLocked();
  if (count >= options_.note_count_warning_threshold) {
    count_warned_ = true;
    ENGRAM_LOG_WARN("note count exceeded threshold",
                    {observability::StringField("namespace", namespace_),
                     observability::IntField("count", static_cast<std::int64_t>(count)),
                     observability::IntField("threshold",
                                             static_cast<std::int64_t>(options_.note_count_warning_threshold)),
                     observability::StringField("recommendation", "consider the qdrant backend for larger stores")});
  }
}

model::Note SqliteStore::AddNote(const CallContext& ctx, const model::Note& note, const Embedding& embedding) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "add note");

  auto stored = WithCreatedAt(note);

  Statement st(*db_,
               "INSERT INTO notes (id, namespace, project_id, group_id, title, text, tags, source, created_at, "
               "metadata, embedding) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
               "ON CONFLICT(namespace, id) DO UPDATE SET project_id = excluded.project_id, "
               "group_id = excluded.group_id, title = excluded.title, text = excluded.text, tags = excluded.tags, "
               "source = excluded.source, created_at = excluded.created_at, metadata = excluded.metadata, "
               "embedding = excluded.embedding;");
  st.BindText(1, stored.id);
  st.BindText(2, namespace_);
  st.BindText(3, stored.project_id);
  st.BindText(4, stored.group_id);
  st.BindOptionalText(5, stored.title);
  st.BindText(6, stored.text);
  st.BindText(7, util::TagsToJson(stored.tags));
  st.BindOptionalText(8, stored.source);
  st.BindOptionalText(9, stored.created_at);
  st.BindOptionalText(10, MetadataToJson(stored));
  st.BindBlob(11, EncodeEmbedding(embedding));
  st.Run("add note");

  MaybeWarnNoteCount();
  return stored;
}

model::Note SqliteStore::Get(const CallContext& ctx, const std::string& id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get note");

  Statement st(*db_, NoteSelect("WHERE namespace = ? AND id = ?;", false).c_str());
  st.BindText(1, namespace_);
  st.BindText(2, id);
  if (!st.Step("get note")) {
    throw util::NotFound("get note: " + id);
  }
  return ReadNote(st);
}

model::Note SqliteStore::Update(const CallContext& ctx, const model::Note& note, const Embedding& embedding) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "update note");

  auto stored = WithCreatedAt(note);

  Statement st(*db_,
               "UPDATE notes SET project_id = ?, group_id = ?, title = ?, text = ?, tags = ?, source = ?, "
               "created_at = ?, metadata = ?, embedding = ? WHERE namespace = ? AND id = ?;");
  st.BindText(1, stored.project_id);
  st.BindText(2, stored.group_id);
  st.BindOptionalText(3, stored.title);
  st.BindText(4, stored.text);
  st.BindText(5, util::TagsToJson(stored.tags));
  st.BindOptionalText(6, stored.source);
  st.BindOptionalText(7, stored.created_at);
  st.BindOptionalText(8, MetadataToJson(stored));
  st.BindBlob(9, EncodeEmbedding(embedding));
  st.BindText(10, namespace_);
  st.BindText(11, stored.id);
  st.Run("update note");

  if (sqlite3_changes(db_->Handle()) == 0) {
    throw util::NotFound("update note: " + note.id);
  }
  return stored;
}

void SqliteStore::Delete(const CallContext& ctx, const std::string& id) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "delete note");

  Statement st(*db_, "DELETE FROM notes WHERE namespace = ? AND id = ?;");
  st.BindText(1, namespace_);
  st.BindText(2, id);
  st.Run("delete note");

  if (sqlite3_changes(db_->Handle()) == 0) {
    throw util::NotFound("delete note: " + id);
  }
}

std::vector<SearchResult> SqliteStore::Search(const CallContext& ctx, const Embedding& query,
                                              const SearchOptions& opts) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "search");
  ValidateSearchOptions(opts);

  Statement st(*db_, NoteSelect("WHERE namespace = ? AND project_id = ?;", true).c_str());
  st.BindText(1, namespace_);
  st.BindText(2, opts.project_id);

  std::vector<SearchResult> results;
  while (st.Step("search")) {
    auto note = ReadNote(st);
    if (!MatchesScope(note, opts.project_id, opts.group_id, opts.tags)) {
      continue;
    }
    if (!InTimeRange(note, opts.since, opts.until)) {
      continue;
    }
    const auto stored = DecodeEmbedding(st.ColBlob(9));
    const auto score  = ScoreFromDistance(CosineDistance(query, stored));
    results.push_back(SearchResult{std::move(note), score});
  }

  RankAndTruncate(results, opts.top_k);
  return results;
}

std::vector<model::Note> SqliteStore::ListRecent(const CallContext& ctx, const ListOptions& opts) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "list recent");
  ValidateListOptions(opts);

  Statement st(*db_, NoteSelect("WHERE namespace = ? AND project_id = ?;", false).c_str());
  st.BindText(1, namespace_);
  st.BindText(2, opts.project_id);

  std::vector<model::Note> notes;
  while (st.Step("list recent")) {
    auto note = ReadNote(st);
    if (MatchesScope(note, opts.project_id, opts.group_id, opts.tags)) {
      notes.push_back(std::move(note));
    }
  }

  SortByRecency(notes, opts.limit);
  return notes;
}

// ------------------------------------------------------------
// Global config
// ------------------------------------------------------------

model::GlobalConfig SqliteStore::UpsertGlobal(const CallContext& ctx, const model::GlobalConfig& config) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "upsert global");

  model::GlobalConfig stored = config;
  stored.id                  = model::GlobalConfigId(config.project_id, config.key);
  if (!stored.updated_at || stored.updated_at->empty()) {
    stored.updated_at = util::NowRfc3339();
  }

  Statement st(*db_,
               "INSERT INTO global_configs (id, namespace, project_id, key, value, updated_at) "
               "VALUES (?, ?, ?, ?, ?, ?) "
               "ON CONFLICT(namespace, project_id, key) DO UPDATE SET "
               "id = excluded.id, value = excluded.value, updated_at = excluded.updated_at;");
  st.BindText(1, stored.id);
  st.BindText(2, namespace_);
  st.BindText(3, stored.project_id);
  st.BindText(4, stored.key);
  st.BindText(5, util::ToJson(stored.value));
  st.BindOptionalText(6, stored.updated_at);
  st.Run("upsert global");
  return stored;
}

std::optional<model::GlobalConfig> SqliteStore::GetGlobal(const CallContext& ctx, const std::string& project_id,
                                                          const std::string& key) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get global");

  Statement st(*db_,
               "SELECT id, project_id, key, value, updated_at FROM global_configs "
               "WHERE namespace = ? AND project_id = ? AND key = ?;");
  st.BindText(1, namespace_);
  st.BindText(2, project_id);
  st.BindText(3, key);
  if (!st.Step("get global")) {
    return std::nullopt;
  }
  return ReadGlobal(st);
}

model::GlobalConfig SqliteStore::GetGlobalById(const CallContext& ctx, const std::string& id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get global by id");

  Statement st(*db_,
               "SELECT id, project_id, key, value, updated_at FROM global_configs WHERE namespace = ? AND id = ?;");
  st.BindText(1, namespace_);
  st.BindText(2, id);
  if (!st.Step("get global by id")) {
    throw util::NotFound("get global by id: " + id);
  }
  return ReadGlobal(st);
}

void SqliteStore::DeleteGlobalById(const CallContext& ctx, const std::string& id) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "delete global by id");

  Statement st(*db_, "DELETE FROM global_configs WHERE namespace = ? AND id = ?;");
  st.BindText(1, namespace_);
  st.BindText(2, id);
  st.Run("delete global by id");

  if (sqlite3_changes(db_->Handle()) == 0) {
    throw util::NotFound("delete global by id: " + id);
  }
}

// ------------------------------------------------------------
// Groups
// ------------------------------------------------------------

void SqliteStore::AddGroup(const CallContext& ctx, const model::Group& group) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "add group");

  auto stored = WithGroupTimestamps(group);

  Statement st(*db_,
               "INSERT INTO groups (id, namespace, project_id, group_key, title, description, created_at, updated_at) "
               "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
  st.BindText(1, stored.id);
  st.BindText(2, namespace_);
  st.BindText(3, stored.project_id);
  st.BindText(4, stored.group_key);
  st.BindText(5, stored.title);
  st.BindText(6, stored.description);
  st.BindText(7, util::FormatRfc3339(stored.created_at));
  st.BindText(8, util::FormatRfc3339(stored.updated_at));
  st.Run("add group");
}

model::Group SqliteStore::GetGroup(const CallContext& ctx, const std::string& id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get group");

  const std::string sql = std::string("SELECT ") + kGroupColumns + " FROM groups WHERE namespace = ? AND id = ?;";
  Statement         st(*db_, sql.c_str());
  st.BindText(1, namespace_);
  st.BindText(2, id);
  if (!st.Step("get group")) {
    throw util::NotFound("get group: " + id);
  }
  return ReadGroup(st);
}

model::Group SqliteStore::GetGroupByKey(const CallContext& ctx, const std::string& project_id,
                                        const std::string& group_key) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get group by key");

  const std::string sql = std::string("SELECT ") + kGroupColumns +
                          " FROM groups WHERE namespace = ? AND project_id = ? AND group_key = ?;";
  Statement st(*db_, sql.c_str());
  st.BindText(1, namespace_);
  st.BindText(2, project_id);
  st.BindText(3, group_key);
  if (!st.Step("get group by key")) {
    throw util::NotFound("get group by key: " + group_key);
  }
  return ReadGroup(st);
}

void SqliteStore::UpdateGroup(const CallContext& ctx, const model::Group& group) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "update group");

  model::Group updated      = group;
  const bool   keep_created = updated.created_at == util::TimePoint{};
  if (updated.updated_at == util::TimePoint{}) {
    updated.updated_at = util::Now();
  }
  updated = WithGroupTimestamps(updated);

  Statement st(*db_,
               "UPDATE groups SET project_id = ?, group_key = ?, title = ?, description = ?, "
               "created_at = COALESCE(?, created_at), updated_at = ? WHERE namespace = ? AND id = ?;");
  st.BindText(1, updated.project_id);
  st.BindText(2, updated.group_key);
  st.BindText(3, updated.title);
  st.BindText(4, updated.description);
  st.BindOptionalText(5, keep_created ? std::nullopt : std::optional(util::FormatRfc3339(updated.created_at)));
  st.BindText(6, util::FormatRfc3339(updated.updated_at));
  st.BindText(7, namespace_);
  st.BindText(8, updated.id);
  st.Run("update group");

  if (sqlite3_changes(db_->Handle()) == 0) {
    throw util::NotFound("update group: " + group.id);
  }
}

void SqliteStore::DeleteGroup(const CallContext& ctx, const std::string& id) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "delete group");

  Statement st(*db_, "DELETE FROM groups WHERE namespace = ? AND id = ?;");
  st.BindText(1, namespace_);
  st.BindText(2, id);
  st.Run("delete group");

  if (sqlite3_changes(db_->Handle()) == 0) {
    throw util::NotFound("delete group: " + id);
  }
}

std::vector<model::Group> SqliteStore::ListGroups(const CallContext& ctx, const std::string& project_id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "list groups");

  const std::string sql = std::string("SELECT ") + kGroupColumns +
                          " FROM groups WHERE namespace = ? AND project_id = ?;";
  Statement st(*db_, sql.c_str());
  st.BindText(1, namespace_);
  st.BindText(2, project_id);

  std::vector<model::Group> groups;
  while (st.Step("list groups")) {
    groups.push_back(ReadGroup(st));
  }
  SortGroups(groups);
  return groups;
}

} // namespace engram::store::sqlite
