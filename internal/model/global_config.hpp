#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace engram::model {

inline constexpr std::string_view kGlobalKeyPrefix = "global.";

inline constexpr std::string_view kGlobalKeyEmbedderProvider   = "global.memory.embedder.provider";
inline constexpr std::string_view kGlobalKeyEmbedderModel      = "global.memory.embedder.model";
inline constexpr std::string_view kGlobalKeyGroupDefaults      = "global.memory.groupDefaults";
inline constexpr std::string_view kGlobalKeyProjectConventions = "global.project.conventions";

/*
  Per-project key/value setting.

  Keyed by (project_id, key); last write wins. The store derives id from
  project_id + key on upsert and ignores whatever the caller supplied.
*/
struct GlobalConfig {
  std::string id;
  std::string project_id;
  std::string key;

  google::protobuf::Value value;

  std::optional<std::string> updated_at;  // set by the store on every upsert

  void Validate() const;
};

void ValidateGlobalKey(const std::string& key);

std::string GlobalConfigId(const std::string& project_id, const std::string& key);

} // namespace engram::model
