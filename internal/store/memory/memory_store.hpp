#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/store/store.hpp"

namespace engram::store::memory {

/*
  In-memory reference backend.

  Brute-force cosine scan over every note. Holds deep copies, so callers
  may mutate what they passed in or got back. Contents are discarded on
  Close. Used by tests and as the behavioral reference for the other
  backends.
*/
class MemoryStore final : public Store {
 public:
  MemoryStore() = default;

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

 private:
  struct NoteEntry {
    model::Note note;
    Embedding   embedding;
  };

  // Caller holds mutex_.
  void EnsureReady(const CallContext& ctx, const char* operation) const;
  bool GroupKeyTaken(const std::string& project_id, const std::string& group_key, const std::string& except_id) const;

  mutable std::shared_mutex mutex_;

  bool        initialized_ = false;
  std::string namespace_;

  std::unordered_map<std::string, NoteEntry>  notes_;
  std::map<std::string, model::GlobalConfig>  globals_;  // keyed by derived id
  std::unordered_map<std::string, model::Group> groups_;
};

} // namespace engram::store::memory
