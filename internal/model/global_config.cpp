#include "global_config.hpp"

#include "internal/util/errors.hpp"

namespace engram::model {

namespace {

bool IsGlobalKeyChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

} // namespace

void ValidateGlobalKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidArgument("key must not be empty");
  }
  if (key.rfind(kGlobalKeyPrefix, 0) != 0) {
    throw util::InvalidArgument("key must have 'global.' prefix, got \"" + key + "\"");
  }
  if (key.size() <= kGlobalKeyPrefix.size()) {
    throw util::InvalidArgument("key must have content after 'global.' prefix, got \"" + key + "\"");
  }
  for (std::size_t i = kGlobalKeyPrefix.size(); i < key.size(); ++i) {
    if (!IsGlobalKeyChar(key[i])) {
      throw util::InvalidArgument("key must match ^global\\.[a-zA-Z0-9._-]+$, got \"" + key + "\"");
    }
  }
}

void GlobalConfig::Validate() const {
  ValidateGlobalKey(key);
}

std::string GlobalConfigId(const std::string& project_id, const std::string& key) {
  return "global:" + project_id + ":" + key;
}

} // namespace engram::model
