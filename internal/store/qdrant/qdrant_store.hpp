#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/store/qdrant/qdrant_client.hpp"
#include "internal/store/store.hpp"

namespace engram::store::qdrant {

struct QdrantStoreOptions {
  std::string               url = "http://localhost:6334";
  std::chrono::milliseconds connect_timeout{5000};
  std::uint32_t             list_fetch_floor = 1000;
};

/*
  Remote vector-database backend.

  One collection per namespace (':' replaced by '_') sized from the
  namespace dim, plus "<collection>_global_configs" and
  "<collection>_groups" holding 1-d placeholder vectors. Point ids are the
  first 8 bytes of SHA-256(string id); the string id lives in the payload
  and is checked on every fetch.

  No client-side data lock: the service owns consistency. Only the
  initialized state is guarded.
*/
class QdrantStore final : public Store {
 public:
  QdrantStore(QdrantStoreOptions options, std::shared_ptr<::grpc::Channel> channel);

  // Health-checks the service (util::ConnectionFailed on failure) and
  // creates any missing collection.
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
  struct CollectionNames {
    std::string   notes;
    std::string   globals;
    std::string   groups;
    std::uint32_t dim = 0;
  };

  CollectionNames EnsureReady(const CallContext& ctx, const char* operation) const;
  void            EnsureCollection(const CallContext& ctx, const std::string& name, std::uint64_t dim) const;

  std::optional<model::Note>  FetchNote(const CallContext& ctx, const CollectionNames& names,
                                        const std::string& id) const;
  std::optional<model::Group> FetchGroup(const CallContext& ctx, const CollectionNames& names,
                                         const std::string& id) const;
  std::optional<model::Group> FindGroupByKey(const CallContext& ctx, const CollectionNames& names,
                                             const std::string& project_id, const std::string& group_key) const;

  QdrantStoreOptions options_;
  QdrantClient       client_;

  mutable std::shared_mutex mutex_;
  bool                      initialized_ = false;
  std::string               namespace_;
  CollectionNames           names_;
};

} // namespace engram::store::qdrant
