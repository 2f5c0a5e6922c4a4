#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "config/config.pb.h"

namespace engram::config {

inline constexpr const char* kDefaultProvider = "openai";
inline constexpr const char* kDefaultModel    = "text-embedding-3-small";
inline constexpr const char* kApiKeyEnv       = "OPENAI_API_KEY";

/*
  Owns the persisted RuntimeConfig.

  Load() falls back to defaults when the file does not exist. Save()
  writes JSON (which the YAML loader reads back) through a temp file and
  rename, so readers never see a partial file. All methods are
  thread-safe.
*/
class ConfigManager {
 public:
  // Empty config_path means DefaultConfigPath().
  explicit ConfigManager(std::string config_path = {});

  static engram::runtime::config::RuntimeConfig DefaultConfig(const std::string& config_path,
                                                              const std::string& data_dir);

  void Load();
  void Save() const;

  engram::runtime::config::RuntimeConfig Config() const;

  const std::string& ConfigPath() const {
    return config_path_;
  }

  // Replaces only the non-empty fields of embedder.
  void UpdateEmbedder(const engram::runtime::config::EmbedderConfig& embedder);

  // Records a discovered embedding dimension and saves.
  void UpdateDim(std::uint32_t dim);

  // "provider:model:dim" for the current embedder.
  std::string Namespace() const;

  // OPENAI_API_KEY when set, else the configured key.
  std::string ApiKey() const;

 private:
  void SaveLocked() const;

  std::string config_path_;

  mutable std::mutex                     mutex_;
  engram::runtime::config::RuntimeConfig config_;
};

} // namespace engram::config
