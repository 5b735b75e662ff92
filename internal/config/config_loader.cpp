#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace kag::config {

using kag::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress        = "0.0.0.0:50061";
constexpr uint64_t    kDefaultSessionTimeoutSec  = 86400;
constexpr uint64_t    kDefaultSweepIntervalSec   = 3600;
constexpr uint32_t    kDefaultMaxContextTokens   = 8192;
constexpr uint32_t    kDefaultChunkSize          = 512;
constexpr uint32_t    kDefaultChunkOverlap       = 128;
constexpr uint32_t    kDefaultMaxNewTokens       = 1;
constexpr uint32_t    kDefaultBuildWorkerThreads = 2;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

std::optional<std::string> EnvString(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<uint64_t> EnvUnsigned(const char* name) {
  auto raw = EnvString(name);
  if (!raw) {
    return std::nullopt;
  }

  char*      endptr = nullptr;
  const auto parsed = std::strtoull(raw->c_str(), &endptr, 10);
  if (!endptr || *endptr != '\0' || raw->front() == '-') {
    throw std::runtime_error(std::string("Invalid configuration: ") + name + " must be an unsigned integer, got '" + *raw + "'");
  }
  return parsed;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document is a valid "all defaults" config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  ApplyEnvironment(&config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadDefault() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  ApplyEnvironment(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config->database().backend_case() == kag::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }

  auto* sessions = config->mutable_sessions();
  if (sessions->timeout_seconds() == 0) sessions->set_timeout_seconds(kDefaultSessionTimeoutSec);
  if (sessions->sweep_interval_seconds() == 0) sessions->set_sweep_interval_seconds(kDefaultSweepIntervalSec);

  if (!config->context_cache().has_max_context_tokens()) {
    config->mutable_context_cache()->set_max_context_tokens(kDefaultMaxContextTokens);
  }

  auto* ingestion = config->mutable_ingestion();
  if (ingestion->chunk_size() == 0) ingestion->set_chunk_size(kDefaultChunkSize);
  if (!ingestion->has_chunk_overlap()) {
    // keep the default overlap valid for small explicit chunk sizes
    ingestion->set_chunk_overlap(ingestion->chunk_size() > kDefaultChunkOverlap ? kDefaultChunkOverlap : ingestion->chunk_size() / 4);
  }

  auto* engine = config->mutable_engine();
  if (!engine->has_deterministic()) engine->set_deterministic(true);
  if (engine->max_new_tokens() == 0) engine->set_max_new_tokens(kDefaultMaxNewTokens);

  if (config->build_workers().threads() == 0) {
    config->mutable_build_workers()->set_threads(kDefaultBuildWorkerThreads);
  }
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig* config) {
  if (auto bind = EnvString("KAG_BIND_ADDRESS")) {
    config->mutable_server()->set_bind_address(*bind);
  }
  if (auto path = EnvString("KAG_DATABASE_PATH")) {
    config->mutable_database()->mutable_sqlite()->set_path(*path);
  }
  if (auto timeout = EnvUnsigned("KAG_SESSION_TIMEOUT")) {
    config->mutable_sessions()->set_timeout_seconds(*timeout);
  }
  if (auto interval = EnvUnsigned("KAG_KV_CACHE_CLEANUP_INTERVAL")) {
    config->mutable_sessions()->set_sweep_interval_seconds(*interval);
  }
  if (auto tokens = EnvUnsigned("KAG_KV_CACHE_TOKEN_LIMIT")) {
    config->mutable_context_cache()->set_max_context_tokens(static_cast<uint32_t>(*tokens));
  }
  if (auto build_timeout = EnvUnsigned("KAG_BUILD_TIMEOUT_MS")) {
    config->mutable_context_cache()->set_build_timeout_ms(*build_timeout);
  }
  if (auto chunk_size = EnvUnsigned("KAG_CHUNK_SIZE")) {
    config->mutable_ingestion()->set_chunk_size(static_cast<uint32_t>(*chunk_size));
  }
  if (auto chunk_overlap = EnvUnsigned("KAG_CHUNK_OVERLAP")) {
    config->mutable_ingestion()->set_chunk_overlap(static_cast<uint32_t>(*chunk_overlap));
  }
  if (auto model = EnvString("KAG_MODEL_PATH")) {
    config->mutable_engine()->set_model(*model);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.ingestion().chunk_size() == 0) {
    throw std::runtime_error("Invalid configuration: ingestion.chunk_size must be positive");
  }
  if (config.ingestion().chunk_overlap() >= config.ingestion().chunk_size()) {
    throw std::runtime_error("Invalid configuration: ingestion.chunk_overlap must be smaller than ingestion.chunk_size");
  }
  if (config.sessions().timeout_seconds() == 0) {
    throw std::runtime_error("Invalid configuration: sessions.timeout_seconds must be positive");
  }
  if (config.sessions().sweep_interval_seconds() == 0) {
    throw std::runtime_error("Invalid configuration: sessions.sweep_interval_seconds must be positive");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
}

} // namespace kag::config
