/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef GRAPHVAULT_APP_COMMAND_LINE_PARSER_H_
#define GRAPHVAULT_APP_COMMAND_LINE_PARSER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::app {

// Import Expected from utils namespace
using graphvault::utils::Error;
using graphvault::utils::Expected;

/**
 * @brief Operation selected on the command line
 */
enum class Command : uint8_t {
  kNone,
  kCreate,
  kInit,
  kAuto,
  kRestore,
  kSelectiveRestore,
  kList,
  kInfo,
};

/**
 * @brief Command name as typed by the user
 */
const char* CommandToString(Command command);

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  std::string config_file;
  std::string schema_file;  ///< Optional JSON Schema file path
  Command command = Command::kNone;
  std::string reason;                         ///< create: -r (empty = default reason)
  std::optional<std::string> snapshot_id;     ///< restore/selective-restore/info: timestamp or file name
  std::optional<std::vector<std::string>> preserve_labels;  ///< selective-restore: -p
  bool assume_yes = false;                    ///< Skip the restore confirmation prompt
  bool detailed = false;                      ///< list: --detailed
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Command-line argument parser
 *
 * Syntax: graphvault -c <config> <command> [options]
 *
 * Commands: create (alias backup), init, auto, restore, selective-restore,
 * list, info. Options may appear before or after the command.
 */
class CommandLineParser {
 public:
  /**
   * @brief Parse command line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with parsed arguments or error
   *
   * Supported options:
   * - -c, --config <file>: Configuration file path (required)
   * - -s, --schema <file>: Use custom JSON Schema
   * - -r, --reason <text>: Reason stored with the snapshot (create)
   * - -f, --file <id>: Snapshot timestamp or file name (restore, selective-restore, info)
   * - -p, --preserve <L1,L2>: Labels to keep untouched (selective-restore)
   * - -y, --yes: Do not ask for confirmation (restore, selective-restore)
   * - --detailed: Show counts and sizes (list)
   * - -h, --help: Show help message
   * - -v, --version: Show version information
   *
   * @note Help and version flags take precedence (set show_help/show_version flags)
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  /**
   * @brief Print help message to stdout
   * @param program_name Program name (argv[0])
   */
  static void PrintHelp(const char* program_name);

  /**
   * @brief Print version information to stdout
   */
  static void PrintVersion();

 private:
  // Private constructor (utility class - all static methods)
  CommandLineParser() = default;
};

}  // namespace graphvault::app

#endif  // GRAPHVAULT_APP_COMMAND_LINE_PARSER_H_
