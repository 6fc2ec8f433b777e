/**
 * @file command_runner.h
 * @brief Executes one parsed CLI command against a BackupManager
 */

#ifndef GRAPHVAULT_APP_COMMAND_RUNNER_H_
#define GRAPHVAULT_APP_COMMAND_RUNNER_H_

#include <iosfwd>
#include <string>

#include "app/command_line_parser.h"
#include "backup/backup_manager.h"
#include "config/config.h"

namespace graphvault::app {

// Process exit codes
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 2;  // Restore declined at the confirmation prompt

/**
 * @brief Runs commands and prints their results
 *
 * Human-readable results go to the output stream; diagnostics go to the
 * logger. Restore commands read a confirmation line from the input stream
 * unless --yes was given.
 */
class CommandRunner {
 public:
  CommandRunner(backup::BackupManager& manager, const config::Config& config, std::istream& input,
                std::ostream& output);

  /**
   * @brief Execute the command
   * @return Process exit code
   */
  int Run(const CommandLineArgs& args);

 private:
  backup::BackupManager& manager_;
  const config::Config& config_;
  std::istream& input_;
  std::ostream& output_;

  int RunCreate(const std::string& reason);
  int RunAuto();
  int RunRestore(const CommandLineArgs& args);
  int RunSelectiveRestore(const CommandLineArgs& args);
  int RunList(bool detailed);
  int RunInfo(const std::string& snapshot_id);

  /**
   * @brief Ask the user to type YES
   */
  bool Confirm(const std::string& warning);

  void PrintReport(const backup::RestoreReport& report);
};

}  // namespace graphvault::app

#endif  // GRAPHVAULT_APP_COMMAND_RUNNER_H_
