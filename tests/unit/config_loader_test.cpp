#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using engram::config::ConfigLoader;
using engram::runtime::config::StoreConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "engram_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(embedder:
  provider: ollama
  model: nomic-embed-text
  dim: 768
  base_url: "http://localhost:11434"
store:
  qdrant:
    url: "http://qdrant:6333"
    connect_timeout_ms: 2500
    list_fetch_floor: 200
logging:
  level: debug
paths:
  data_dir: "/var/lib/engram"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.embedder().provider() == "ollama");
  assert(config.embedder().model() == "nomic-embed-text");
  assert(config.embedder().dim() == 768);
  assert(config.embedder().base_url() == "http://localhost:11434");
  assert(config.store().backend_case() == StoreConfig::kQdrant);
  assert(config.store().qdrant().url() == "http://qdrant:6333");
  assert(config.store().qdrant().connect_timeout_ms() == 2500);
  assert(config.store().qdrant().list_fetch_floor() == 200);
  assert(config.logging().level() == "debug");
  assert(config.paths().data_dir() == "/var/lib/engram");
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::ParseYaml(R"(embedder:
  model: "1536"
  api_key: 'true'
store:
  sqlite:
    path: "C:\\memory\\\"quoted\"\\db.sqlite"
    note_count_warning_threshold: 100
)");

  assert(config.embedder().model() == "1536");
  assert(config.embedder().api_key() == "true");
  assert(config.store().sqlite().path() == "C:\\memory\\\"quoted\"\\db.sqlite");
  assert(config.store().sqlite().note_count_warning_threshold() == 100);
}

void TestEmptyMemoryBackend() {
  auto config = ConfigLoader::ParseYaml("store:\n  memory: {}\n");
  assert(config.store().backend_case() == StoreConfig::kMemory);

  auto empty = ConfigLoader::ParseYaml("");
  assert(!empty.has_store());
  assert(empty.embedder().provider().empty());
}

void TestJsonDocumentLoads() {
  const auto path = WriteYaml("as_json", R"({
  "embedder": {"provider": "openai", "model": "text-embedding-3-small", "dim": 1536},
  "store": {"sqlite": {"path": "/tmp/memory.db", "noteCountWarningThreshold": "5000"}}
})");

  auto config = ConfigLoader::LoadFromYaml(path.string());
  assert(config.embedder().dim() == 1536);
  assert(config.store().sqlite().path() == "/tmp/memory.db");
  assert(config.store().sqlite().note_count_warning_threshold() == 5000);
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::ParseYaml("embedder:\n  provider: openai\nunknown_field: 123\n");
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedInputIsRejected() {
  for (const std::string text : {"- just\n- a list\n", "embedder: [unterminated\n", "embedder:\n  dim: lots\n"}) {
    bool threw = false;
    try {
      (void)ConfigLoader::ParseYaml(text);
    } catch (const engram::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/engram/config.yaml");
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestQuotedScalarsStayStrings();
  TestEmptyMemoryBackend();
  TestJsonDocumentLoads();
  TestUnknownFieldsAreRejected();
  TestMalformedInputIsRejected();

  std::cout << "engram_unit_config_loader: pass\n";
  return 0;
}
