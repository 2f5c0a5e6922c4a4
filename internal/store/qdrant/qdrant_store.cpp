#include "qdrant_store.hpp"

#include <algorithm>
#include <limits>
#include <mutex>

#include "internal/config/namespace.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/qdrant/filter_builder.hpp"
#include "internal/store/qdrant/payload_codec.hpp"
#include "internal/store/scoring.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace engram::store::qdrant {

namespace {

constexpr std::uint32_t kScrollAll = std::numeric_limits<std::uint32_t>::max();

const std::vector<float> kPlaceholderVector = {1.0f};

::qdrant::PointStruct MakePoint(const std::string& id, const std::vector<float>& vector, Payload payload) {
  ::qdrant::PointStruct point;
  point.mutable_id()->set_num(util::Sha256Prefix64(id));
  point.mutable_vectors()->mutable_vector()->mutable_data()->Add(vector.begin(), vector.end());
  *point.mutable_payload() = std::move(payload);
  return point;
}

void WarnSkipped(const char* operation, const ::qdrant::PointId& id) {
  ENGRAM_LOG_WARN("skipping undecodable point",
                  {observability::StringField("operation", operation),
                   observability::StringField("point_id", std::to_string(id.num()))});
}

double ScoreFromSimilarity(float similarity) {
  return std::clamp((static_cast<double>(similarity) + 1.0) / 2.0, 0.0, 1.0);
}

} // namespace

QdrantStore::QdrantStore(QdrantStoreOptions options, std::shared_ptr<::grpc::Channel> channel)
    : options_(std::move(options)), client_(std::move(channel)) {}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

QdrantStore::CollectionNames QdrantStore::EnsureReady(const CallContext& ctx, const char* operation) const {
  ctx.ThrowIfCancelled(operation);
  std::shared_lock lock(mutex_);
  if (!initialized_) {
    throw util::NotInitialized(std::string(operation) + ": store not initialized");
  }
  return names_;
}

void QdrantStore::EnsureCollection(const CallContext& ctx, const std::string& name, std::uint64_t dim) const {
  if (client_.CollectionExists(ctx, name)) {
    return;
  }
  try {
    client_.CreateCollection(ctx, name, dim);
  } catch (const util::AlreadyExists&) {
    // Another client created it between the check and the create.
    if (client_.CollectionExists(ctx, name)) {
      return;
    }
    throw;
  } catch (const util::InvalidArgument&) {
    // The service reports a duplicate create as a bad request.
    if (client_.CollectionExists(ctx, name)) {
      return;
    }
    throw;
  }
  ENGRAM_LOG_INFO("collection created", {observability::StringField("collection", name),
                                         observability::IntField("dim", static_cast<std::int64_t>(dim))});
}

void QdrantStore::Initialize(const CallContext& ctx, const std::string& ns) {
  ctx.ThrowIfCancelled("initialize");
  if (ns.empty()) {
    throw util::InvalidArgument("initialize: namespace must not be empty");
  }

  {
    std::shared_lock lock(mutex_);
    if (initialized_) {
      if (namespace_ != ns) {
        throw util::InvalidArgument("initialize: already initialized with namespace " + namespace_);
      }
      return;
    }
  }

  client_.HealthCheck(options_.connect_timeout);

  CollectionNames names;
  names.notes   = config::SanitizeNamespace(ns);
  names.globals = names.notes + "_global_configs";
  names.groups  = names.notes + "_groups";
  names.dim     = config::VectorDimOrDefault(ns);

  EnsureCollection(ctx, names.notes, names.dim);
  EnsureCollection(ctx, names.globals, kPlaceholderVector.size());
  EnsureCollection(ctx, names.groups, kPlaceholderVector.size());

  std::unique_lock lock(mutex_);
  if (initialized_ && namespace_ != ns) {
    throw util::InvalidArgument("initialize: already initialized with namespace " + namespace_);
  }
  namespace_   = ns;
  names_       = names;
  initialized_ = true;
  ENGRAM_LOG_INFO("store initialized", {observability::StringField("backend", "qdrant"),
                                        observability::StringField("namespace", ns),
                                        observability::StringField("collection", names.notes)});
}

void QdrantStore::Close() {
  std::unique_lock lock(mutex_);
  initialized_ = false;
}

// ------------------------------------------------------------
// Notes
// ------------------------------------------------------------

std::optional<model::Note> QdrantStore::FetchNote(const CallContext& ctx, const CollectionNames& names,
                                                  const std::string& id) const {
  for (const auto& point : client_.Get(ctx, names.notes, util::Sha256Prefix64(id), true)) {
    if (auto note = NoteFromPayload(point.payload(), &id)) {
      return note;
    }
  }
  return std::nullopt;
}

model::Note QdrantStore::AddNote(const CallContext& ctx, const model::Note& note, const Embedding& embedding) {
  const auto names  = EnsureReady(ctx, "add note");
  auto       stored = WithCreatedAt(note);

  client_.Upsert(ctx, names.notes, MakePoint(stored.id, embedding, NotePayload(stored)));
  return stored;
}

model::Note QdrantStore::Get(const CallContext& ctx, const std::string& id) {
  const auto names = EnsureReady(ctx, "get note");

  auto note = FetchNote(ctx, names, id);
  if (!note) {
    throw util::NotFound("get note: " + id);
  }
  return *note;
}

model::Note QdrantStore::Update(const CallContext& ctx, const model::Note& note, const Embedding& embedding) {
  const auto names = EnsureReady(ctx, "update note");

  if (!FetchNote(ctx, names, note.id)) {
    throw util::NotFound("update note: " + note.id);
  }

  auto stored = WithCreatedAt(note);
  client_.Upsert(ctx, names.notes, MakePoint(stored.id, embedding, NotePayload(stored)));
  return stored;
}

void QdrantStore::Delete(const CallContext& ctx, const std::string& id) {
  const auto names = EnsureReady(ctx, "delete note");

  if (!FetchNote(ctx, names, id)) {
    throw util::NotFound("delete note: " + id);
  }
  client_.DeletePoint(ctx, names.notes, util::Sha256Prefix64(id));
}

std::vector<SearchResult> QdrantStore::Search(const CallContext& ctx, const Embedding& query,
                                              const SearchOptions& opts) {
  const auto names = EnsureReady(ctx, "search");
  ValidateSearchOptions(opts);

  const auto filter = NoteFilter(opts.project_id, opts.group_id, opts.tags, opts.since, opts.until);
  std::vector<SearchResult> results;

  // The service cannot score this query; every match has distance 2.
  if (!IsComparableQuery(query, names.dim)) {
    for (const auto& point : client_.Scroll(ctx, names.notes, filter, kScrollAll)) {
      if (auto note = NoteFromPayload(point.payload())) {
        results.push_back(SearchResult{std::move(*note), 0.0});
      } else {
        WarnSkipped("search", point.id());
      }
    }
    RankAndTruncate(results, opts.top_k);
    return results;
  }

  // Widen the request until top_k decodable notes are in hand and no score
  // tie straddles the top_k boundary, so ties resolve by id exactly as the
  // local backends do.
  const auto                     top_k = static_cast<std::size_t>(opts.top_k);
  std::uint64_t                  limit = top_k + 1;
  std::vector<::qdrant::PointId> skipped;
  while (true) {
    const auto points = client_.Search(ctx, names.notes, query, filter, limit);

    results.clear();
    skipped.clear();
    for (const auto& point : points) {
      if (auto note = NoteFromPayload(point.payload())) {
        results.push_back(SearchResult{std::move(*note), ScoreFromSimilarity(point.score())});
      } else {
        skipped.push_back(point.id());
      }
    }

    if (points.size() < limit) {
      break;
    }
    if (results.size() > top_k && results[top_k].score != results[top_k - 1].score) {
      break;
    }
    limit *= 2;
  }

  for (const auto& id : skipped) {
    WarnSkipped("search", id);
  }

  RankAndTruncate(results, opts.top_k);
  return results;
}

std::vector<model::Note> QdrantStore::ListRecent(const CallContext& ctx, const ListOptions& opts) {
  const auto names = EnsureReady(ctx, "list recent");
  ValidateListOptions(opts);

  // Scroll order is unspecified; fetch a generous window and order locally.
  const auto fetch = static_cast<std::uint32_t>(std::min<std::uint64_t>(
      std::max<std::uint64_t>(static_cast<std::uint64_t>(opts.limit) * 10, options_.list_fetch_floor), kScrollAll));

  std::vector<model::Note> notes;
  for (const auto& point : client_.Scroll(ctx, names.notes, NoteFilter(opts.project_id, opts.group_id, opts.tags),
                                          fetch)) {
    if (auto note = NoteFromPayload(point.payload())) {
      notes.push_back(std::move(*note));
    } else {
      WarnSkipped("list recent", point.id());
    }
  }

  SortByRecency(notes, opts.limit);
  return notes;
}

// ------------------------------------------------------------
// Global config
// ------------------------------------------------------------

model::GlobalConfig QdrantStore::UpsertGlobal(const CallContext& ctx, const model::GlobalConfig& config) {
  const auto names = EnsureReady(ctx, "upsert global");

  model::GlobalConfig stored = config;
  stored.id                  = model::GlobalConfigId(config.project_id, config.key);
  if (!stored.updated_at || stored.updated_at->empty()) {
    stored.updated_at = util::NowRfc3339();
  }

  client_.Upsert(ctx, names.globals, MakePoint(stored.id, kPlaceholderVector, GlobalConfigPayload(stored)));
  return stored;
}

std::optional<model::GlobalConfig> QdrantStore::GetGlobal(const CallContext& ctx, const std::string& project_id,
                                                          const std::string& key) {
  const auto names = EnsureReady(ctx, "get global");

  const auto filter = KeywordFilter({{field::kProjectId, project_id},
                                     {field::kKey, key},
                                     {field::kType, std::string(kTypeGlobalConfig)}});
  for (const auto& point : client_.Scroll(ctx, names.globals, filter, 1)) {
    if (auto config = GlobalConfigFromPayload(point.payload())) {
      return config;
    }
    WarnSkipped("get global", point.id());
  }
  return std::nullopt;
}

model::GlobalConfig QdrantStore::GetGlobalById(const CallContext& ctx, const std::string& id) {
  const auto names = EnsureReady(ctx, "get global by id");

  for (const auto& point : client_.Get(ctx, names.globals, util::Sha256Prefix64(id), true)) {
    if (auto config = GlobalConfigFromPayload(point.payload(), &id)) {
      return *config;
    }
  }
  throw util::NotFound("get global by id: " + id);
}

void QdrantStore::DeleteGlobalById(const CallContext& ctx, const std::string& id) {
  const auto names = EnsureReady(ctx, "delete global by id");

  bool found = false;
  for (const auto& point : client_.Get(ctx, names.globals, util::Sha256Prefix64(id), true)) {
    found = found || GlobalConfigFromPayload(point.payload(), &id).has_value();
  }
  if (!found) {
    throw util::NotFound("delete global by id: " + id);
  }
  client_.DeletePoint(ctx, names.globals, util::Sha256Prefix64(id));
}

// ------------------------------------------------------------
// Groups
// ------------------------------------------------------------

std::optional<model::Group> QdrantStore::FetchGroup(const CallContext& ctx, const CollectionNames& names,
                                                    const std::string& id) const {
  for (const auto& point : client_.Get(ctx, names.groups, util::Sha256Prefix64(id), true)) {
    if (auto group = GroupFromPayload(point.payload(), &id)) {
      return group;
    }
  }
  return std::nullopt;
}

std::optional<model::Group> QdrantStore::FindGroupByKey(const CallContext& ctx, const CollectionNames& names,
                                                        const std::string& project_id,
                                                        const std::string& group_key) const {
  const auto filter = KeywordFilter({{field::kProjectId, project_id},
                                     {field::kGroupKey, group_key},
                                     {field::kType, std::string(kTypeGroup)}});
  for (const auto& point : client_.Scroll(ctx, names.groups, filter, 1)) {
    if (auto group = GroupFromPayload(point.payload())) {
      return group;
    }
    WarnSkipped("get group by key", point.id());
  }
  return std::nullopt;
}

void QdrantStore::AddGroup(const CallContext& ctx, const model::Group& group) {
  const auto names = EnsureReady(ctx, "add group");

  if (FetchGroup(ctx, names, group.id)) {
    throw util::AlreadyExists("add group: id " + group.id);
  }
  if (FindGroupByKey(ctx, names, group.project_id, group.group_key)) {
    throw util::AlreadyExists("add group: key " + group.group_key);
  }

  auto stored = WithGroupTimestamps(group);
  client_.Upsert(ctx, names.groups, MakePoint(stored.id, kPlaceholderVector, GroupPayload(stored)));
}

model::Group QdrantStore::GetGroup(const CallContext& ctx, const std::string& id) {
  const auto names = EnsureReady(ctx, "get group");

  auto group = FetchGroup(ctx, names, id);
  if (!group) {
    throw util::NotFound("get group: " + id);
  }
  return *group;
}

model::Group QdrantStore::GetGroupByKey(const CallContext& ctx, const std::string& project_id,
                                        const std::string& group_key) {
  const auto names = EnsureReady(ctx, "get group by key");

  auto group = FindGroupByKey(ctx, names, project_id, group_key);
  if (!group) {
    throw util::NotFound("get group by key: " + group_key);
  }
  return *group;
}

void QdrantStore::UpdateGroup(const CallContext& ctx, const model::Group& group) {
  const auto names = EnsureReady(ctx, "update group");

  auto existing = FetchGroup(ctx, names, group.id);
  if (!existing) {
    throw util::NotFound("update group: " + group.id);
  }
  if (auto holder = FindGroupByKey(ctx, names, group.project_id, group.group_key); holder && holder->id != group.id) {
    throw util::AlreadyExists("update group: key " + group.group_key);
  }

  model::Group updated = group;
  if (updated.created_at == util::TimePoint{}) {
    updated.created_at = existing->created_at;
  }
  if (updated.updated_at == util::TimePoint{}) {
    updated.updated_at = util::Now();
  }
  updated = WithGroupTimestamps(updated);
  client_.Upsert(ctx, names.groups, MakePoint(updated.id, kPlaceholderVector, GroupPayload(updated)));
}

void QdrantStore::DeleteGroup(const CallContext& ctx, const std::string& id) {
  const auto names = EnsureReady(ctx, "delete group");

  if (!FetchGroup(ctx, names, id)) {
    throw util::NotFound("delete group: " + id);
  }
  client_.DeletePoint(ctx, names.groups, util::Sha256Prefix64(id));
}

std::vector<model::Group> QdrantStore::ListGroups(const CallContext& ctx, const std::string& project_id) {
  const auto names = EnsureReady(ctx, "list groups");

  const auto filter = KeywordFilter({{field::kProjectId, project_id}, {field::kType, std::string(kTypeGroup)}});

  std::vector<model::Group> groups;
  for (const auto& point : client_.Scroll(ctx, names.groups, filter, kScrollAll)) {
    if (auto group = GroupFromPayload(point.payload())) {
      groups.push_back(std::move(*group));
    } else {
      WarnSkipped("list groups", point.id());
    }
  }
  SortGroups(groups);
  return groups;
}

} // namespace engram::store::qdrant
