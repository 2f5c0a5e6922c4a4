#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/store.hpp"

namespace engram::store::sqlite {

struct SqliteStoreOptions {
  std::string   path;
  std::uint64_t note_count_warning_threshold = 5000;
};

/*
  Embedded SQL backend.

  One database file holds every namespace; rows are partitioned by a
  namespace column. Embeddings are stored as little-endian float32 blobs
  and Search is a full scan of the project's rows with cosine scoring in
  process.

  All API access is serialized behind one reader/writer lock; scans hold
  the read lock for their whole duration.
*/
class SqliteStore final : public Store {
 public:
  // Opens (creating if needed) the database file. Throws
  // util::ConnectionFailed when it cannot be opened.
  explicit SqliteStore(SqliteStoreOptions options);

  void Initialize(const CallContext& ctx, const std::string& ns) override;
  void Close() override;

  model::Note AddNote(const CallContext& ctx, const model::Note& note, const Embedding& embedding) override;
  model::Note Get(const CallContext& ctx, const std::string& id) override;
  model::Note Update(const CallContext& ctx, const model::Note& note, const Embedding& embedding) override;
  void        Delete(const CallContext& ctx, const std::string& id) override;

  std::vector<SearchResult> Search(const CallContext& ctx, const Embedding& query, const SearchOptions& opts) override;
  std::vector<model::Note>  ListRecent(const CallContext& ctx, const ListOptions& opts) override;

  model::GlobalConfig                UpsertGlobal(const CallContext& ctx, const model::GlobalConfig& config) override;
  std::optional<model::GlobalConfig> GetGlobal(const CallContext& ctx, const std::string& project_id,
                                               const std::string& key) override;
  model::GlobalConfig                GetGlobalById(const CallContext& ctx, const std::string& id) override;
  void                               DeleteGlobalById(const CallContext& ctx, const std::string& id) override;

  void                      AddGroup(const CallContext& ctx, const model::Group& group) override;
  model::Group              GetGroup(const CallContext& ctx, const std::string& id) override;
  model::Group              GetGroupByKey(const CallContext& ctx, const std::string& project_id,
                                          const std::string& group_key) override;
  void                      UpdateGroup(const CallContext& ctx, const model::Group& group) override;
  void                      DeleteGroup(const CallContext& ctx, const std::string& id) override;
  std::vector<model::Group> ListGroups(const CallContext& ctx, const std::string& project_id) override;

  // Notes stored under the current namespace.
  std::uint64_t CountNotes(const CallContext& ctx);

 private:
  // Caller holds mutex_.
  void          EnsureReady(const CallContext& ctx, const char* operation) const;
  std::uint64_t CountNotesLocked() const;
  void          MaybeWarnNoteCount();

  SqliteStoreOptions options_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<SqliteDB> db_;

  bool        initialized_ = false;
  bool        count_warned_ = false;
  std::string namespace_;
};

} // namespace engram::store::sqlite
