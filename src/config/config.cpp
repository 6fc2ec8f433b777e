/**
 * @file config.cpp
 * @brief Configuration parser implementation with JSON Schema validation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_schema_embedded.h"  // Auto-generated embedded schema
#include "graph/cypher_builder.h"

namespace graphvault::config {

using graphvault::utils::Error;
using graphvault::utils::ErrorCode;
using graphvault::utils::Expected;
using graphvault::utils::MakeError;
using graphvault::utils::MakeUnexpected;

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;

// Tag yaml-cpp gives quoted scalars
constexpr const char* kYamlQuotedTag = "!";

/**
 * @brief Convert YAML node to JSON object recursively
 *
 * Plain scalars are typed by JSON rules (42, 0.5, true); quoted scalars stay strings.
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      const auto& text = node.Scalar();
      if (node.Tag() == kYamlQuotedTag) {
        return text;
      }
      json typed = json::parse(text, nullptr, false);
      if (typed.is_discarded() || typed.is_object() || typed.is_array()) {
        return text;
      }
      return typed;
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

Expected<std::string, Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, "Failed to open configuration file: " + path,
                                    "Example config: examples/config.yaml"));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string content = buffer.str();
  if (content.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration file is empty: " + path));
  }
  return content;
}

/**
 * @brief Detect file format based on extension
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class FileFormat { kYaml, kJson, kUnknown };

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FileFormat DetectFileFormat(const std::string& path) {
  if (EndsWith(path, ".json")) {
    return FileFormat::kJson;
  }
  if (EndsWith(path, ".yaml") || EndsWith(path, ".yml")) {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

StoreConfig ParseStoreConfig(const json& json_obj) {
  StoreConfig config;
  if (json_obj.contains("uri")) {
    config.uri = json_obj["uri"].get<std::string>();
  }
  if (json_obj.contains("database")) {
    config.database = json_obj["database"].get<std::string>();
  }
  if (json_obj.contains("user")) {
    config.user = json_obj["user"].get<std::string>();
  }
  if (json_obj.contains("password")) {
    config.password = json_obj["password"].get<std::string>();
  }
  if (json_obj.contains("timeout_ms")) {
    config.timeout_ms = json_obj["timeout_ms"].get<int>();
  }
  return config;
}

BackupConfig ParseBackupConfig(const json& json_obj) {
  BackupConfig config;
  if (json_obj.contains("dir")) {
    config.dir = json_obj["dir"].get<std::string>();
  }
  if (json_obj.contains("max_retained")) {
    config.max_retained = json_obj["max_retained"].get<int>();
  }
  if (json_obj.contains("file_prefix")) {
    config.file_prefix = json_obj["file_prefix"].get<std::string>();
  }
  if (json_obj.contains("index_filename")) {
    config.index_filename = json_obj["index_filename"].get<std::string>();
  }
  return config;
}

AutoBackupConfig ParseAutoBackupConfig(const json& json_obj) {
  AutoBackupConfig config;
  if (json_obj.contains("min_new_nodes")) {
    config.min_new_nodes = json_obj["min_new_nodes"].get<int64_t>();
  }
  if (json_obj.contains("min_new_relationships")) {
    config.min_new_relationships = json_obj["min_new_relationships"].get<int64_t>();
  }
  if (json_obj.contains("percent_growth")) {
    config.percent_growth = json_obj["percent_growth"].get<double>();
  }
  return config;
}

RestoreConfig ParseRestoreConfig(const json& json_obj) {
  RestoreConfig config;
  if (json_obj.contains("natural_key")) {
    config.natural_key = json_obj["natural_key"].get<std::string>();
  }
  if (json_obj.contains("preserve_labels")) {
    config.preserve_labels = json_obj["preserve_labels"].get<std::vector<std::string>>();
  }
  return config;
}

LoggingConfig ParseLoggingConfig(const json& json_obj) {
  LoggingConfig config;
  if (json_obj.contains("level")) {
    config.level = json_obj["level"].get<std::string>();
  }
  if (json_obj.contains("file")) {
    config.file = json_obj["file"].get<std::string>();
  }
  return config;
}

Config ParseConfigFromJson(const json& root) {
  Config config;
  if (root.contains("store")) {
    config.store = ParseStoreConfig(root["store"]);
  }
  if (root.contains("backup")) {
    config.backup = ParseBackupConfig(root["backup"]);
  }
  if (root.contains("auto_backup")) {
    config.auto_backup = ParseAutoBackupConfig(root["auto_backup"]);
  }
  if (root.contains("restore")) {
    config.restore = ParseRestoreConfig(root["restore"]);
  }
  if (root.contains("logging")) {
    config.logging = ParseLoggingConfig(root["logging"]);
  }
  return config;
}

/**
 * @brief Checks the schema cannot express (or a custom schema may have dropped)
 */
Expected<void, Error> ValidateSemantics(const Config& config) {
  if (config.backup.max_retained < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue,
                                    "backup.max_retained must be at least 1 (got " +
                                        std::to_string(config.backup.max_retained) + ")"));
  }
  if (config.auto_backup.min_new_nodes < 0 || config.auto_backup.min_new_relationships < 0 ||
      config.auto_backup.percent_growth < 0.0) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "auto_backup thresholds must not be negative"));
  }
  if (!graph::cypher::IsValidIdentifier(config.restore.natural_key)) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue,
                                    "restore.natural_key is not a valid property name: '" +
                                        config.restore.natural_key + "'"));
  }
  for (const auto& label : config.restore.preserve_labels) {
    if (!graph::cypher::IsValidIdentifier(label)) {
      return MakeUnexpected(
          MakeError(ErrorCode::kConfigInvalidValue, "restore.preserve_labels contains an invalid label: '" + label + "'"));
    }
  }
  if (config.backup.dir.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigMissingRequired, "backup.dir must not be empty"));
  }
  return {};
}

Expected<std::string, Error> LoadSchemaString(const std::string& schema_path) {
  if (schema_path.empty()) {
    return std::string();
  }
  auto schema = ReadFileToString(schema_path);
  if (!schema) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, schema.error().message()));
  }
  return schema;
}

Expected<Config, Error> LoadConfigJson(const std::string& path, const std::string& schema_path) {
  auto config_str = ReadFileToString(path);
  if (!config_str) {
    return MakeUnexpected(config_str.error());
  }
  auto schema_str = LoadSchemaString(schema_path);
  if (!schema_str) {
    return MakeUnexpected(schema_str.error());
  }
  auto config = ParseConfig(*config_str, *schema_str);
  if (!config) {
    return MakeUnexpected(MakeError(config.error().code(), config.error().message(), path));
  }
  return config;
}

Expected<Config, Error> LoadConfigYaml(const std::string& path, const std::string& schema_path) {
  json json_root;
  try {
    YAML::Node yaml_root = YAML::LoadFile(path);
    json_root = YamlToJson(yaml_root);
  } catch (const YAML::BadFile&) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, "Failed to open configuration file: " + path,
                                    "Example config: examples/config.yaml"));
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error in configuration file: " << path << ": " << e.msg;
    if (e.mark.line >= 0) {
      err_msg << " (line " << (e.mark.line + 1) << ", column " << (e.mark.column + 1) << ")";
    }
    return MakeUnexpected(MakeError(ErrorCode::kConfigYamlError, err_msg.str()));
  }

  if (json_root.is_null()) {
    json_root = json::object();
  }
  auto schema_str = LoadSchemaString(schema_path);
  if (!schema_str) {
    return MakeUnexpected(schema_str.error());
  }
  auto config = ParseConfig(json_root.dump(), *schema_str);
  if (!config) {
    return MakeUnexpected(MakeError(config.error().code(), config.error().message(), path));
  }
  return config;
}

Expected<Config, Error> LoadConfigByFormat(const std::string& path, const std::string& schema_path) {
  switch (DetectFileFormat(path)) {
    case FileFormat::kJson:
      spdlog::debug("Detected JSON format for config file: {}", path);
      return LoadConfigJson(path, schema_path);

    case FileFormat::kYaml:
      spdlog::debug("Detected YAML format for config file: {}", path);
      return LoadConfigYaml(path, schema_path);

    case FileFormat::kUnknown:
    default: {
      // Try YAML first, then JSON
      spdlog::debug("Unknown file format, trying YAML first: {}", path);
      auto config = LoadConfigYaml(path, schema_path);
      if (!config && config.error().code() == ErrorCode::kConfigYamlError) {
        spdlog::debug("YAML parsing failed, trying JSON: {}", path);
        return LoadConfigJson(path, schema_path);
      }
      return config;
    }
  }
}

}  // namespace

Expected<void, Error> ValidateConfigJson(const std::string& config_json_str, const std::string& schema_json_str) {
  json config_json = json::parse(config_json_str, nullptr, false);
  if (config_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, "Configuration is not valid JSON"));
  }

  // Use embedded schema if no custom schema provided
  std::string schema_to_use = schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str;
  json schema_json = json::parse(schema_to_use, nullptr, false);
  if (schema_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, "Configuration schema is not valid JSON"));
  }

  json_validator validator;
  try {
    validator.set_root_schema(schema_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, std::string("Invalid schema: ") + e.what()));
  }

  try {
    validator.validate(config_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigValidationError, std::string("Configuration validation failed: ") + e.what()));
  }
  spdlog::debug("Configuration validation passed");
  return {};
}

Expected<Config, Error> ParseConfig(const std::string& config_json_str, const std::string& schema_json_str) {
  auto valid = ValidateConfigJson(config_json_str, schema_json_str);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }

  Config config;
  try {
    config = ParseConfigFromJson(json::parse(config_json_str));
  } catch (const json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, std::string("Invalid configuration value: ") + e.what()));
  }

  ApplyEnvironmentOverrides(config);

  auto semantic = ValidateSemantics(config);
  if (!semantic) {
    return MakeUnexpected(semantic.error());
  }
  return config;
}

void ApplyEnvironmentOverrides(Config& config) {
  if (const char* uri = std::getenv(kEnvStoreUri); uri != nullptr && *uri != '\0') {
    config.store.uri = uri;
    spdlog::debug("store.uri overridden by {}", kEnvStoreUri);
  }
  if (const char* user = std::getenv(kEnvStoreUser); user != nullptr && *user != '\0') {
    config.store.user = user;
    spdlog::debug("store.user overridden by {}", kEnvStoreUser);
  }
  if (const char* password = std::getenv(kEnvStorePassword); password != nullptr && *password != '\0') {
    config.store.password = password;
  }
}

Expected<Config, Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  auto config = LoadConfigByFormat(path, schema_path);
  if (config) {
    spdlog::info("Configuration loaded successfully from {}", path);
    spdlog::info("  Store: {}@{} (database {})", config->store.user, config->store.uri, config->store.database);
    spdlog::info("  Snapshots: {} (keep {})", config->backup.dir, config->backup.max_retained);
  }
  return config;
}

}  // namespace graphvault::config
