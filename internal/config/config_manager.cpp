#include "config_manager.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "internal/config/config_loader.hpp"
#include "internal/config/namespace.hpp"
#include "internal/config/project_path.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace engram::config {

namespace fs = std::filesystem;

using engram::runtime::config::EmbedderConfig;
using engram::runtime::config::RuntimeConfig;

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(config_path.empty() ? DefaultConfigPath() : std::move(config_path)),
      config_(DefaultConfig(config_path_, DefaultDataDir())) {}

RuntimeConfig ConfigManager::DefaultConfig(const std::string& config_path, const std::string& data_dir) {
  RuntimeConfig config;

  auto* embedder = config.mutable_embedder();
  embedder->set_provider(kDefaultProvider);
  embedder->set_model(kDefaultModel);
  embedder->set_dim(0);

  config.mutable_store()->mutable_sqlite()->set_path((fs::path(data_dir) / "memory.db").string());

  config.mutable_paths()->set_config_path(config_path);
  config.mutable_paths()->set_data_dir(data_dir);
  return config;
}

void ConfigManager::Load() {
  std::lock_guard lock(mutex_);

  std::error_code ec;
  if (!fs::exists(config_path_, ec)) {
    ENGRAM_LOG_INFO("config file not found, using defaults", {observability::StringField("path", config_path_)});
    return;
  }

  config_ = ConfigLoader::LoadFromYaml(config_path_);
  ENGRAM_LOG_INFO("config loaded", {observability::StringField("path", config_path_),
                                    observability::StringField("provider", config_.embedder().provider()),
                                    observability::BoolField("dim_known", config_.embedder().dim() != 0)});
}

void ConfigManager::Save() const {
  std::lock_guard lock(mutex_);
  SaveLocked();
}

void ConfigManager::SaveLocked() const {
  const fs::path target(config_path_);

  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw util::StoreError("create config directory " + target.parent_path().string() + ": " + ec.message());
    }
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(config_, &json, options);
  if (!status.ok()) {
    throw util::StoreError("serialize config: " + std::string(status.message()));
  }

  const fs::path tmp = target.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << json;
    out.close();
    if (!out) {
      fs::remove(tmp, ec);
      throw util::StoreError("write config " + tmp.string());
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    const auto message = ec.message();
    fs::remove(tmp, ec);
    throw util::StoreError("rename config into place " + target.string() + ": " + message);
  }
}

RuntimeConfig ConfigManager::Config() const {
  std::lock_guard lock(mutex_);
  return config_;
}

void ConfigManager::UpdateEmbedder(const EmbedderConfig& embedder) {
  std::lock_guard lock(mutex_);

  auto* current = config_.mutable_embedder();
  if (!embedder.provider().empty()) {
    current->set_provider(embedder.provider());
  }
  if (!embedder.model().empty()) {
    current->set_model(embedder.model());
  }
  if (embedder.dim() != 0) {
    current->set_dim(embedder.dim());
  }
  if (!embedder.base_url().empty()) {
    current->set_base_url(embedder.base_url());
  }
  if (!embedder.api_key().empty()) {
    current->set_api_key(embedder.api_key());
  }
}

void ConfigManager::UpdateDim(std::uint32_t dim) {
  std::lock_guard lock(mutex_);
  config_.mutable_embedder()->set_dim(dim);
  SaveLocked();
  ENGRAM_LOG_INFO("embedding dimension saved", {observability::IntField("dim", dim),
                                                observability::StringField("path", config_path_)});
}

std::string ConfigManager::Namespace() const {
  std::lock_guard lock(mutex_);
  const auto&     embedder = config_.embedder();
  return GenerateNamespace(embedder.provider(), embedder.model(), embedder.dim());
}

std::string ConfigManager::ApiKey() const {
  if (const char* key = std::getenv(kApiKeyEnv); key != nullptr && *key != '\0') {
    return key;
  }
  std::lock_guard lock(mutex_);
  return config_.embedder().api_key();
}

} // namespace engram::config
