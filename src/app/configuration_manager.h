/**
 * @file configuration_manager.h
 * @brief Configuration manager for loading and validating configuration files
 */

#ifndef GRAPHVAULT_APP_CONFIGURATION_MANAGER_H_
#define GRAPHVAULT_APP_CONFIGURATION_MANAGER_H_

#include <memory>
#include <string>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::app {

// Import Expected from utils namespace
using graphvault::utils::Error;
using graphvault::utils::Expected;

/**
 * @brief Configuration manager
 *
 * Responsibilities:
 * - Load configuration from file (YAML/JSON)
 * - Validate against schema
 * - Apply logging configuration
 * - Provide read-only access to configuration
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager and load configuration
   * @param config_file Path to configuration file
   * @param schema_file Optional schema file path (empty = use built-in)
   * @return Expected with manager instance or error
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file,
                                                                       const std::string& schema_file = "");

  ~ConfigurationManager() = default;

  // Non-copyable, non-movable (owns configuration state)
  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  /**
   * @brief Get current configuration (read-only)
   */
  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Apply logging configuration
   * @return Expected with void or error
   *
   * Side effects:
   * - Sets spdlog log level (debug/info/warn/error)
   * - Sends logs to the configured file, or to stderr so command output on
   *   stdout stays clean
   * - Creates log directory if needed
   */
  Expected<void, Error> ApplyLoggingConfig();

  /**
   * @brief Get config file path
   */
  const std::string& GetConfigFilePath() const { return config_file_; }

 private:
  ConfigurationManager(std::string config_file, config::Config initial_config);

  std::string config_file_;
  config::Config config_;
};

}  // namespace graphvault::app

#endif  // GRAPHVAULT_APP_CONFIGURATION_MANAGER_H_
