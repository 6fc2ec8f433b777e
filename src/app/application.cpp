/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <iostream>

#include "app/command_runner.h"
#include "app/operation_lock.h"
#include "utils/structured_log.h"
#include "version.h"

namespace graphvault::app {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  // Step 1: Parse command-line arguments
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return utils::MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);

  // Handle help and version early (before loading config)
  if (args.show_help) {
    CommandLineParser::PrintHelp(argc > 0 ? argv[0] : "graphvault");  // NOLINT
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  if (args.show_version) {
    CommandLineParser::PrintVersion();
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  // Step 2: Load configuration
  auto config_mgr = ConfigurationManager::Create(args.config_file, args.schema_file);
  if (!config_mgr) {
    return utils::MakeUnexpected(config_mgr.error());
  }

  return std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

// Members are released in reverse order: the manager before the store it borrows
Application::~Application() = default;

int Application::Run() {
  int special_exit_code = HandleSpecialModes();
  if (special_exit_code >= 0) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    utils::StructuredLog()
        .Event("application_error")
        .Field("type", "logging_config_failed")
        .Field("phase", "startup")
        .Field("error", logging_result.error().to_string())
        .Error();
    return kExitFailure;
  }

  spdlog::debug("{} running command '{}'", Version::FullString(), CommandToString(args_.command));

  auto init_result = Initialize();
  if (!init_result) {
    utils::StructuredLog()
        .Event("application_error")
        .Field("type", "initialization_failed")
        .Field("phase", "startup")
        .Field("error", init_result.error().to_string())
        .Error();
    return kExitFailure;
  }

  std::unique_ptr<OperationLock> lock;
  if (RequiresLock(args_.command)) {
    const auto& backup_config = config_manager_->GetConfig().backup;
    auto lock_result = OperationLock::Acquire(std::filesystem::path(backup_config.dir) / OperationLock::kLockFileName);
    if (!lock_result) {
      utils::StructuredLog()
          .Event("application_error")
          .Field("type", "operation_locked")
          .Field("phase", "lock")
          .Field("command", CommandToString(args_.command))
          .Field("error", lock_result.error().to_string())
          .Error();
      std::cerr << "Error: " << lock_result.error().message() << "\n";
      return kExitFailure;
    }
    lock = std::move(*lock_result);
  }

  CommandRunner runner(*backup_manager_, config_manager_->GetConfig(), std::cin, std::cout);
  return runner.Run(args_);
}

Expected<void, Error> Application::Initialize() {
  const auto& config = config_manager_->GetConfig();

  graph::Neo4jHttpStore::Config store_config;
  store_config.uri = config.store.uri;
  store_config.database = config.store.database;
  store_config.user = config.store.user;
  store_config.password = config.store.password;
  store_config.timeout_ms = config.store.timeout_ms;
  store_ = std::make_unique<graph::Neo4jHttpStore>(std::move(store_config));

  storage::RetentionManager::Options retention;
  retention.dir = config.backup.dir;
  retention.max_retained = static_cast<size_t>(config.backup.max_retained);
  retention.file_prefix = config.backup.file_prefix;
  retention.index_filename = config.backup.index_filename;

  backup::RestoreOptions restore_options;
  restore_options.natural_key = config.restore.natural_key;

  backup_manager_ = std::make_unique<backup::BackupManager>(*store_, std::move(retention), std::move(restore_options));

  spdlog::debug("Graph store: {}, snapshot directory: {}", store_->Describe(), config.backup.dir);
  return {};
}

int Application::HandleSpecialModes() const {
  // Help and version are printed in Create()
  if (args_.show_help || args_.show_version) {
    return kExitSuccess;
  }
  return -1;
}

bool Application::RequiresLock(Command command) {
  switch (command) {
    case Command::kCreate:
    case Command::kInit:
    case Command::kAuto:
    case Command::kRestore:
    case Command::kSelectiveRestore:
      return true;
    default:
      return false;
  }
}

}  // namespace graphvault::app
