/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

namespace graphvault::app {

namespace {
constexpr const char* kLoggerName = "graphvault";
}  // namespace

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file,
                                                                                    const std::string& schema_file) {
  auto config_result = config::LoadConfig(config_file, schema_file);
  if (!config_result) {
    return graphvault::utils::MakeUnexpected(config_result.error());
  }

  auto manager =
      std::unique_ptr<ConfigurationManager>(new ConfigurationManager(config_file, std::move(*config_result)));
  return manager;
}

ConfigurationManager::ConfigurationManager(std::string config_file, config::Config initial_config)
    : config_file_(std::move(config_file)), config_(std::move(initial_config)) {}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Configure log output (file or stderr) BEFORE setting level
  try {
    spdlog::drop(kLoggerName);
    if (!config_.logging.file.empty()) {
      // Ensure log directory exists
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }
      spdlog::set_default_logger(spdlog::basic_logger_mt(kLoggerName, config_.logging.file));
    } else {
      spdlog::set_default_logger(spdlog::stderr_color_mt(kLoggerName));
    }
  } catch (const spdlog::spdlog_ex& ex) {
    return graphvault::utils::MakeUnexpected(graphvault::utils::MakeError(
        graphvault::utils::ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
  } catch (const std::exception& ex) {
    return graphvault::utils::MakeUnexpected(graphvault::utils::MakeError(
        graphvault::utils::ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
  }

  // Apply logging level (must be AFTER setting default logger)
  if (config_.logging.level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (config_.logging.level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (config_.logging.level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (config_.logging.level == "error") {
    spdlog::set_level(spdlog::level::err);
  }

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }
  return {};
}

}  // namespace graphvault::app
