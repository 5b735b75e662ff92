#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using kag::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "kag_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnvironment() {
  for (const char* name : {"KAG_BIND_ADDRESS", "KAG_DATABASE_PATH", "KAG_SESSION_TIMEOUT", "KAG_KV_CACHE_CLEANUP_INTERVAL",
                           "KAG_KV_CACHE_TOKEN_LIMIT", "KAG_BUILD_TIMEOUT_MS", "KAG_CHUNK_SIZE", "KAG_CHUNK_OVERLAP", "KAG_MODEL_PATH"}) {
    unsetenv(name);
  }
}

bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyFileYieldsDefaults() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.sessions().timeout_seconds() == 86400);
  assert(config.sessions().sweep_interval_seconds() == 3600);
  assert(config.context_cache().max_context_tokens() == 8192);
  assert(config.context_cache().build_timeout_ms() == 0);
  assert(config.ingestion().chunk_size() == 512);
  assert(config.ingestion().chunk_overlap() == 128);
  assert(config.engine().deterministic());
  assert(config.engine().max_new_tokens() == 1);
  assert(config.build_workers().threads() == 2);
}

void TestFileValuesAreKept() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "C:\\kag\\\"quoted\"\\db.sqlite"
sessions:
  timeout_seconds: 600
  sweep_interval_seconds: 30
context_cache:
  max_context_tokens: 0
  build_timeout_ms: 2500
ingestion:
  chunk_size: 100
engine:
  model: "llama-3"
  deterministic: false
  max_new_tokens: 4
build_workers:
  threads: 3
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "C:\\kag\\\"quoted\"\\db.sqlite");
  assert(config.sessions().timeout_seconds() == 600);
  assert(config.sessions().sweep_interval_seconds() == 30);
  // explicit zero means no budget
  assert(config.context_cache().max_context_tokens() == 0);
  assert(config.context_cache().build_timeout_ms() == 2500);
  assert(config.ingestion().chunk_size() == 100);
  assert(config.ingestion().chunk_overlap() == 25);
  assert(config.engine().model() == "llama-3");
  assert(!config.engine().deterministic());
  assert(config.engine().max_new_tokens() == 4);
  assert(config.build_workers().threads() == 3);
  assert(config.logging().level() == "debug");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  const bool threw = Throws([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); });
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOverlapMustBeSmallerThanChunk() {
  const auto yaml_path = WriteYaml("bad_overlap",
                                   R"(ingestion:
  chunk_size: 64
  chunk_overlap: 64
)");

  assert(Throws([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestEnvironmentOverridesFile() {
  setenv("KAG_SESSION_TIMEOUT", "60", 1);
  setenv("KAG_KV_CACHE_CLEANUP_INTERVAL", "5", 1);
  setenv("KAG_KV_CACHE_TOKEN_LIMIT", "1000", 1);
  setenv("KAG_BUILD_TIMEOUT_MS", "750", 1);
  setenv("KAG_CHUNK_SIZE", "256", 1);
  setenv("KAG_CHUNK_OVERLAP", "32", 1);
  setenv("KAG_DATABASE_PATH", "/tmp/kag-env.sqlite", 1);
  setenv("KAG_MODEL_PATH", "/models/m.gguf", 1);
  setenv("KAG_BIND_ADDRESS", "0.0.0.0:9999", 1);

  const auto config = ConfigLoader::LoadDefault();
  ClearEnvironment();

  assert(config.sessions().timeout_seconds() == 60);
  assert(config.sessions().sweep_interval_seconds() == 5);
  assert(config.context_cache().max_context_tokens() == 1000);
  assert(config.context_cache().build_timeout_ms() == 750);
  assert(config.ingestion().chunk_size() == 256);
  assert(config.ingestion().chunk_overlap() == 32);
  assert(config.database().sqlite().path() == "/tmp/kag-env.sqlite");
  assert(config.engine().model() == "/models/m.gguf");
  assert(config.server().bind_address() == "0.0.0.0:9999");
}

void TestInvalidEnvironmentValueIsRejected() {
  setenv("KAG_SESSION_TIMEOUT", "soon", 1);
  const bool threw = Throws([] { (void)ConfigLoader::LoadDefault(); });
  ClearEnvironment();
  assert(threw);

  setenv("KAG_SESSION_TIMEOUT", "0", 1);
  const bool zero_threw = Throws([] { (void)ConfigLoader::LoadDefault(); });
  ClearEnvironment();
  assert(zero_threw);
}

void TestMissingFileIsReported() {
  assert(Throws([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/kag.yaml"); }));
}

} // namespace

int main() {
  ClearEnvironment();

  TestEmptyFileYieldsDefaults();
  TestFileValuesAreKept();
  TestUnknownFieldsAreRejected();
  TestOverlapMustBeSmallerThanChunk();
  TestEnvironmentOverridesFile();
  TestInvalidEnvironmentValueIsRejected();
  TestMissingFileIsReported();

  std::cout << "kag_unit_config_loader: pass\n";
  return 0;
}
