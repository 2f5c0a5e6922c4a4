#include "memory_store.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/store/scoring.hpp"
#include "internal/util/errors.hpp"

namespace engram::store::memory {

void MemoryStore::EnsureReady(const CallContext& ctx, const char* operation) const {
  ctx.ThrowIfCancelled(operation);
  if (!initialized_) {
    throw util::NotInitialized(std::string(operation) + ": store not initialized");
  }
}

bool MemoryStore::GroupKeyTaken(const std::string& project_id, const std::string& group_key,
                                const std::string& except_id) const {
  return std::any_of(groups_.begin(), groups_.end(), [&](const auto& entry) {
    const auto& group = entry.second;
    return group.id != except_id && group.project_id == project_id && group.group_key == group_key;
  });
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void MemoryStore::Initialize(const CallContext& ctx, const std::string& ns) {
  ctx.ThrowIfCancelled("initialize");
  if (ns.empty()) {
    throw util::InvalidArgument("initialize: namespace must not be empty");
  }

  std::unique_lock lock(mutex_);
  if (initialized_) {
    if (namespace_ != ns) {
      throw util::InvalidArgument("initialize: already initialized with namespace " + namespace_);
    }
    return;
  }

  namespace_   = ns;
  initialized_ = true;
  ENGRAM_LOG_INFO("store initialized", {observability::StringField("backend", "memory"),
                                        observability::StringField("namespace", ns)});
}

void MemoryStore::Close() {
  std::unique_lock lock(mutex_);
  notes_.clear();
  globals_.clear();
  groups_.clear();
  namespace_.clear();
  initialized_ = false;
}

// ------------------------------------------------------------
// Notes
// ------------------------------------------------------------

model::Note MemoryStore::AddNote(const CallContext& ctx, const model::Note& note, const Embedding& embedding) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "add note");

  auto stored       = WithCreatedAt(note);
  notes_[stored.id] = NoteEntry{stored, embedding};
  return stored;
}

model::Note MemoryStore::Get(const CallContext& ctx, const std::string& id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get note");

  auto it = notes_.find(id);
  if (it == notes_.end()) {
    throw util::NotFound("get note: " + id);
  }
  return it->second.note;
}

model::Note MemoryStore::Update(const CallContext& ctx, const model::Note& note, const Embedding& embedding) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "update note");

  auto it = notes_.find(note.id);
  if (it == notes_.end()) {
    throw util::NotFound("update note: " + note.id);
  }

  auto stored = WithCreatedAt(note);
  it->second  = NoteEntry{stored, embedding};
  return stored;
}

void MemoryStore::Delete(const CallContext& ctx, const std::string& id) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "delete note");

  if (notes_.erase(id) == 0) {
    throw util::NotFound("delete note: " + id);
  }
}

std::vector<SearchResult> MemoryStore::Search(const CallContext& ctx, const Embedding& query,
                                              const SearchOptions& opts) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "search");
  ValidateSearchOptions(opts);

  std::vector<SearchResult> results;
  for (const auto& [id, entry] : notes_) {
    if (!MatchesScope(entry.note, opts.project_id, opts.group_id, opts.tags)) {
      continue;
    }
    if (!InTimeRange(entry.note, opts.since, opts.until)) {
      continue;
    }
    results.push_back(SearchResult{entry.note, ScoreFromDistance(CosineDistance(query, entry.embedding))});
  }

  RankAndTruncate(results, opts.top_k);
  return results;
}

std::vector<model::Note> MemoryStore::ListRecent(const CallContext& ctx, const ListOptions& opts) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "list recent");
  ValidateListOptions(opts);

  std::vector<model::Note> notes;
  for (const auto& [id, entry] : notes_) {
    if (MatchesScope(entry.note, opts.project_id, opts.group_id, opts.tags)) {
      notes.push_back(entry.note);
    }
  }

  SortByRecency(notes, opts.limit);
  return notes;
}

// ------------------------------------------------------------
// Global config
// ------------------------------------------------------------

model::GlobalConfig MemoryStore::UpsertGlobal(const CallContext& ctx, const model::GlobalConfig& config) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "upsert global");

  model::GlobalConfig stored = config;
  stored.id                  = model::GlobalConfigId(config.project_id, config.key);
  if (!stored.updated_at || stored.updated_at->empty()) {
    stored.updated_at = util::NowRfc3339();
  }

  globals_[stored.id] = stored;
  return stored;
}

std::optional<model::GlobalConfig> MemoryStore::GetGlobal(const CallContext& ctx, const std::string& project_id,
                                                          const std::string& key) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get global");

  auto it = globals_.find(model::GlobalConfigId(project_id, key));
  if (it == globals_.end()) {
    return std::nullopt;
  }
  return it->second;
}

model::GlobalConfig MemoryStore::GetGlobalById(const CallContext& ctx, const std::string& id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get global by id");

  auto it = globals_.find(id);
  if (it == globals_.end()) {
    throw util::NotFound("get global by id: " + id);
  }
  return it->second;
}

void MemoryStore::DeleteGlobalById(const CallContext& ctx, const std::string& id) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "delete global by id");

  if (globals_.erase(id) == 0) {
    throw util::NotFound("delete global by id: " + id);
  }
}

// ------------------------------------------------------------
// Groups
// ------------------------------------------------------------

void MemoryStore::AddGroup(const CallContext& ctx, const model::Group& group) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "add group");

  if (groups_.contains(group.id)) {
    throw util::AlreadyExists("add group: id " + group.id);
  }
  if (GroupKeyTaken(group.project_id, group.group_key, group.id)) {
    throw util::AlreadyExists("add group: key " + group.group_key);
  }

  auto stored = WithGroupTimestamps(group);
  groups_.emplace(stored.id, stored);
}

model::Group MemoryStore::GetGroup(const CallContext& ctx, const std::string& id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get group");

  auto it = groups_.find(id);
  if (it == groups_.end()) {
    throw util::NotFound("get group: " + id);
  }
  return it->second;
}

model::Group MemoryStore::GetGroupByKey(const CallContext& ctx, const std::string& project_id,
                                        const std::string& group_key) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "get group by key");

  for (const auto& [id, group] : groups_) {
    if (group.project_id == project_id && group.group_key == group_key) {
      return group;
    }
  }
  throw util::NotFound("get group by key: " + group_key);
}

void MemoryStore::UpdateGroup(const CallContext& ctx, const model::Group& group) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "update group");

  auto it = groups_.find(group.id);
  if (it == groups_.end()) {
    throw util::NotFound("update group: " + group.id);
  }
  if (GroupKeyTaken(group.project_id, group.group_key, group.id)) {
    throw util::AlreadyExists("update group: key " + group.group_key);
  }

  model::Group updated = group;
  if (updated.created_at == util::TimePoint{}) {
    updated.created_at = it->second.created_at;
  }
  if (updated.updated_at == util::TimePoint{}) {
    updated.updated_at = util::Now();
  }
  it->second = WithGroupTimestamps(updated);
}

void MemoryStore::DeleteGroup(const CallContext& ctx, const std::string& id) {
  std::unique_lock lock(mutex_);
  EnsureReady(ctx, "delete group");

  if (groups_.erase(id) == 0) {
    throw util::NotFound("delete group: " + id);
  }
}

std::vector<model::Group> MemoryStore::ListGroups(const CallContext& ctx, const std::string& project_id) {
  std::shared_lock lock(mutex_);
  EnsureReady(ctx, "list groups");

  std::vector<model::Group> out;
  for (const auto& [id, group] : groups_) {
    if (group.project_id == project_id) {
      out.push_back(group);
    }
  }
  SortGroups(out);
  return out;
}

} // namespace engram::store::memory
