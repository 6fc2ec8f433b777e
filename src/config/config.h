/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::config {

// Default values for configuration
namespace defaults {

// Graph store defaults
constexpr const char* kStoreUri = "http://localhost:7474";
constexpr const char* kStoreDatabase = "neo4j";
constexpr const char* kStoreUser = "neo4j";
constexpr int kStoreTimeoutMs = 30000;

// Snapshot defaults
constexpr const char* kBackupDir = "neo4j/fullbackup";
constexpr int kMaxRetained = 1;  // Only the most recent snapshot
constexpr const char* kFilePrefix = "graph_snapshot_";
constexpr const char* kIndexFilename = "backup_metadata.json";

// Auto-backup thresholds
constexpr int64_t kMinNewNodes = 50;
constexpr int64_t kMinNewRelationships = 100;
constexpr double kPercentGrowth = 0.10;

// Restore defaults
constexpr const char* kNaturalKey = "name";

}  // namespace defaults

// Environment variables overriding the store section
constexpr const char* kEnvStoreUri = "NEO4J_URI";
constexpr const char* kEnvStoreUser = "NEO4J_USERNAME";
constexpr const char* kEnvStorePassword = "NEO4J_PASSWORD";

/**
 * @brief Graph store connection configuration
 */
struct StoreConfig {
  std::string uri = defaults::kStoreUri;
  std::string database = defaults::kStoreDatabase;
  std::string user = defaults::kStoreUser;
  std::string password;
  int timeout_ms = defaults::kStoreTimeoutMs;
};

/**
 * @brief Snapshot directory and retention
 */
struct BackupConfig {
  std::string dir = defaults::kBackupDir;
  int max_retained = defaults::kMaxRetained;
  std::string file_prefix = defaults::kFilePrefix;
  std::string index_filename = defaults::kIndexFilename;
};

/**
 * @brief Thresholds for the auto command
 */
struct AutoBackupConfig {
  int64_t min_new_nodes = defaults::kMinNewNodes;
  int64_t min_new_relationships = defaults::kMinNewRelationships;
  double percent_growth = defaults::kPercentGrowth;
};

/**
 * @brief Restore behavior
 */
struct RestoreConfig {
  std::string natural_key = defaults::kNaturalKey;
  std::vector<std::string> preserve_labels;  ///< Default for selective-restore without -p
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";
  std::string file;  ///< Log file path (empty = stderr)
};

/**
 * @brief Root configuration
 */
struct Config {
  StoreConfig store;
  BackupConfig backup;
  AutoBackupConfig auto_backup;
  RestoreConfig restore;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML or JSON file
 *
 * Detects the format from the extension (.yaml, .yml, .json); unknown
 * extensions are tried as YAML, then JSON. The document is validated against
 * the embedded JSON Schema (or schema_path if given), then environment
 * overrides are applied.
 *
 * @param path Path to configuration file
 * @param schema_path Optional path to a JSON Schema file replacing the embedded one
 * @return Expected<Config, Error> with configuration or error
 */
graphvault::utils::Expected<Config, graphvault::utils::Error> LoadConfig(const std::string& path,
                                                                         const std::string& schema_path = "");

/**
 * @brief Parse and validate an already-loaded JSON document
 */
graphvault::utils::Expected<Config, graphvault::utils::Error> ParseConfig(const std::string& config_json_str,
                                                                          const std::string& schema_json_str = "");

/**
 * @brief Validate JSON configuration against schema
 *
 * @param config_json_str JSON configuration string
 * @param schema_json_str JSON Schema string (empty = embedded schema)
 * @return Expected<void, Error> with success or validation error
 */
graphvault::utils::Expected<void, graphvault::utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                                               const std::string& schema_json_str);

/**
 * @brief Override store settings from NEO4J_URI / NEO4J_USERNAME / NEO4J_PASSWORD
 */
void ApplyEnvironmentOverrides(Config& config);

}  // namespace graphvault::config
