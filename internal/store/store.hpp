#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/global_config.hpp"
#include "internal/model/group.hpp"
#include "internal/model/note.hpp"
#include "internal/store/call_context.hpp"
#include "internal/store/types.hpp"

namespace engram::store {

/*
  Store contract.

  Implemented by the memory, sqlite and qdrant backends, which must behave
  identically for the same inputs.

  GUARANTEES:

  - Initialize(ns) is idempotent for the same ns and never clears data.
  - Every other call before Initialize (or after Close) throws
    util::NotInitialized.
  - Single-entity misses throw util::NotFound.
  - Writes fill createdAt/updatedAt with "now" when absent.
  - Search and ListRecent never return notes from another project.
  - Equal scores are ordered by note id ascending.
  - All methods are safe to call concurrently.

  Errors other than the util:: sentinels are util::StoreError carrying the
  failing operation's name. Backends never retry.
*/

class Store {
 public:
  virtual ~Store() = default;

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  virtual void Initialize(const CallContext& ctx, const std::string& ns) = 0;

  // Safe to call more than once.
  virtual void Close() = 0;

  // ---------------------------------------------------------------------
  // Notes
  // ---------------------------------------------------------------------

  // Duplicate ids overwrite. Returns the stored form.
  virtual model::Note AddNote(const CallContext& ctx, const model::Note& note, const Embedding& embedding) = 0;

  virtual model::Note Get(const CallContext& ctx, const std::string& id) = 0;

  // Replaces the note wholesale. Returns the stored form.
  virtual model::Note Update(const CallContext& ctx, const model::Note& note, const Embedding& embedding) = 0;

  virtual void Delete(const CallContext& ctx, const std::string& id) = 0;

  virtual std::vector<SearchResult> Search(const CallContext& ctx, const Embedding& query, const SearchOptions& opts) = 0;

  // Newest first; notes without a usable createdAt sort last.
  virtual std::vector<model::Note> ListRecent(const CallContext& ctx, const ListOptions& opts) = 0;

  // ---------------------------------------------------------------------
  // Global config
  // ---------------------------------------------------------------------

  virtual model::GlobalConfig UpsertGlobal(const CallContext& ctx, const model::GlobalConfig& config) = 0;

  virtual std::optional<model::GlobalConfig> GetGlobal(const CallContext& ctx, const std::string& project_id,
                                                       const std::string& key) = 0;

  virtual model::GlobalConfig GetGlobalById(const CallContext& ctx, const std::string& id) = 0;

  // Administrative path.
  virtual void DeleteGlobalById(const CallContext& ctx, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Groups
  // ---------------------------------------------------------------------

  // Throws util::AlreadyExists when (project_id, group_key) or id is taken.
  virtual void AddGroup(const CallContext& ctx, const model::Group& group) = 0;

  virtual model::Group GetGroup(const CallContext& ctx, const std::string& id) = 0;

  virtual model::Group GetGroupByKey(const CallContext& ctx, const std::string& project_id,
                                     const std::string& group_key) = 0;

  virtual void UpdateGroup(const CallContext& ctx, const model::Group& group) = 0;

  virtual void DeleteGroup(const CallContext& ctx, const std::string& id) = 0;

  // Ordered by createdAt ascending, then groupKey.
  virtual std::vector<model::Group> ListGroups(const CallContext& ctx, const std::string& project_id) = 0;
};

} // namespace engram::store
