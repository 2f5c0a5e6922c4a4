#include "factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <filesystem>
#include <system_error>

#include "internal/config/project_path.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/store/qdrant/qdrant_client.hpp"
#include "internal/store/qdrant/qdrant_store.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#include "internal/util/errors.hpp"

namespace engram::factory {

namespace {

constexpr std::uint64_t kDefaultNoteCountWarning = 5000;
constexpr std::uint32_t kDefaultConnectTimeoutMs = 5000;
constexpr std::uint32_t kDefaultListFetchFloor   = 1000;
constexpr const char*   kDefaultQdrantUrl        = "http://localhost:6334";

std::unique_ptr<store::Store> BuildSqliteStore(const engram::runtime::config::RuntimeConfig& config) {
  const auto& sqlite = config.store().sqlite();

  store::sqlite::SqliteStoreOptions options;
  options.path = sqlite.path();
  if (options.path.empty()) {
    auto data_dir = config.paths().data_dir().empty() ? config::DefaultDataDir() : config.paths().data_dir();
    options.path  = (std::filesystem::path(data_dir) / "memory.db").string();
  }
  options.path = config::ExpandTilde(options.path);
  options.note_count_warning_threshold =
      sqlite.note_count_warning_threshold() == 0 ? kDefaultNoteCountWarning : sqlite.note_count_warning_threshold();

  const auto parent = std::filesystem::path(options.path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::ConnectionFailed("create data directory " + parent.string() + ": " + ec.message());
    }
  }

  return std::make_unique<store::sqlite::SqliteStore>(std::move(options));
}

std::unique_ptr<store::Store> BuildQdrantStore(const engram::runtime::config::RuntimeConfig& config) {
  const auto& qdrant = config.store().qdrant();

  store::qdrant::QdrantStoreOptions options;
  options.url = qdrant.url().empty() ? kDefaultQdrantUrl : qdrant.url();
  options.connect_timeout =
      std::chrono::milliseconds(qdrant.connect_timeout_ms() == 0 ? kDefaultConnectTimeoutMs : qdrant.connect_timeout_ms());
  options.list_fetch_floor = qdrant.list_fetch_floor() == 0 ? kDefaultListFetchFloor : qdrant.list_fetch_floor();

  const auto target  = store::qdrant::QdrantClient::GrpcTarget(options.url);
  auto       channel = ::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials());
  ENGRAM_LOG_INFO("qdrant channel created", {observability::StringField("target", target)});

  return std::make_unique<store::qdrant::QdrantStore>(std::move(options), std::move(channel));
}

} // namespace

std::unique_ptr<store::Store> BuildStore(const engram::runtime::config::RuntimeConfig& config) {
  observability::InitializeLogging(config.logging());

  switch (config.store().backend_case()) {
    case engram::runtime::config::StoreConfig::kMemory:
      return std::make_unique<store::memory::MemoryStore>();
    case engram::runtime::config::StoreConfig::kQdrant:
      return BuildQdrantStore(config);
    case engram::runtime::config::StoreConfig::kSqlite:
    case engram::runtime::config::StoreConfig::BACKEND_NOT_SET:
      return BuildSqliteStore(config);
  }
  throw util::InvalidArgument("unknown store backend");
}

std::shared_ptr<embedding::DimensionTracker> TrackDimension(std::shared_ptr<embedding::Embedder> embedder,
                                                            config::ConfigManager&               manager) {
  return std::make_shared<embedding::DimensionTracker>(
      std::move(embedder), [&manager](std::size_t dim) { manager.UpdateDim(static_cast<std::uint32_t>(dim)); });
}

} // namespace engram::factory
