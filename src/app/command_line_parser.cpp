/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <iostream>
#include <sstream>

#include "graph/cypher_builder.h"
#include "version.h"

namespace graphvault::app {

using graphvault::utils::ErrorCode;
using graphvault::utils::MakeError;
using graphvault::utils::MakeUnexpected;

namespace {

/**
 * @brief Check if argument matches short or long option
 * @param arg Command-line argument
 * @param short_opt Short option (e.g., "-c")
 * @param long_opt Long option (e.g., "--config")
 * @return True if argument matches either option
 */
bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

Command ParseCommand(const std::string& name) {
  if (name == "create" || name == "backup") {
    return Command::kCreate;
  }
  if (name == "init") {
    return Command::kInit;
  }
  if (name == "auto") {
    return Command::kAuto;
  }
  if (name == "restore") {
    return Command::kRestore;
  }
  if (name == "selective-restore") {
    return Command::kSelectiveRestore;
  }
  if (name == "list") {
    return Command::kList;
  }
  if (name == "info") {
    return Command::kInfo;
  }
  return Command::kNone;
}

/**
 * @brief Split "A, B,C" into labels; every label must be a valid identifier
 */
Expected<std::vector<std::string>, Error> ParseLabelList(const std::string& text) {
  std::vector<std::string> labels;
  std::stringstream stream(text);
  std::string item;
  while (std::getline(stream, item, ',')) {
    const auto first = item.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    const auto last = item.find_last_not_of(" \t");
    std::string label = item.substr(first, last - first + 1);
    if (!graph::cypher::IsValidIdentifier(label)) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid label in --preserve: '" + label + "'"));
    }
    labels.push_back(std::move(label));
  }
  return labels;
}

Error OptionNotAllowed(const std::string& option, Command command) {
  return MakeError(ErrorCode::kInvalidArgument,
                   option + " is not valid for the '" + std::string(CommandToString(command)) + "' command");
}

/**
 * @brief Reject options that do not apply to the selected command
 */
Expected<void, Error> ValidateForCommand(const CommandLineArgs& args, bool reason_given) {
  const bool is_restore = args.command == Command::kRestore || args.command == Command::kSelectiveRestore;
  if (reason_given && args.command != Command::kCreate) {
    return MakeUnexpected(OptionNotAllowed("--reason", args.command));
  }
  if (args.snapshot_id && !is_restore && args.command != Command::kInfo) {
    return MakeUnexpected(OptionNotAllowed("--file", args.command));
  }
  if (args.preserve_labels && args.command != Command::kSelectiveRestore) {
    return MakeUnexpected(OptionNotAllowed("--preserve", args.command));
  }
  if (args.assume_yes && !is_restore) {
    return MakeUnexpected(OptionNotAllowed("--yes", args.command));
  }
  if (args.detailed && args.command != Command::kList) {
    return MakeUnexpected(OptionNotAllowed("--detailed", args.command));
  }
  if (args.command == Command::kInfo && !args.snapshot_id) {
    return MakeUnexpected(MakeError(ErrorCode::kCliMissingArgument, "info requires a snapshot id (info <id>)"));
  }
  return {};
}

}  // namespace

const char* CommandToString(Command command) {
  switch (command) {
    case Command::kNone:
      return "none";
    case Command::kCreate:
      return "create";
    case Command::kInit:
      return "init";
    case Command::kAuto:
      return "auto";
    case Command::kRestore:
      return "restore";
    case Command::kSelectiveRestore:
      return "selective-restore";
    case Command::kList:
      return "list";
    case Command::kInfo:
      return "info";
  }
  return "unknown";
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid argument count (argc < 1)"));
  }

  // Handle help and version flags first (early exit)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
      return args;  // Early return - no further parsing needed
    }
    if (arg == "-v" || arg == "--version") {
      args.show_version = true;
      return args;  // Early return - no further parsing needed
    }
  }

  if (argc < 2) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No arguments provided. Use --help for usage."));
  }

  bool reason_given = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    // Options taking a value
    auto next_value = [&](const char* option) -> Expected<std::string, Error> {
      if (i + 1 >= argc) {
        return MakeUnexpected(MakeError(ErrorCode::kCliMissingArgument, std::string(option) + " requires an argument"));
      }
      return std::string(argv[++i]);
    };

    if (MatchesOption(arg, "-c", "--config")) {
      auto value = next_value("--config");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.config_file = *value;
    } else if (MatchesOption(arg, "-s", "--schema")) {
      auto value = next_value("--schema");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.schema_file = *value;
    } else if (MatchesOption(arg, "-r", "--reason")) {
      auto value = next_value("--reason");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.reason = *value;
      reason_given = true;
    } else if (MatchesOption(arg, "-f", "--file")) {
      auto value = next_value("--file");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.snapshot_id = *value;
    } else if (MatchesOption(arg, "-p", "--preserve")) {
      auto value = next_value("--preserve");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      auto labels = ParseLabelList(*value);
      if (!labels) {
        return MakeUnexpected(labels.error());
      }
      args.preserve_labels = std::move(*labels);
    } else if (MatchesOption(arg, "-y", "--yes")) {
      args.assume_yes = true;
    } else if (arg == "--detailed") {
      args.detailed = true;
    } else if (!arg.empty() && arg[0] == '-') {
      // Unknown option
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown option: " + arg));
    } else if (args.command == Command::kNone) {
      args.command = ParseCommand(arg);
      if (args.command == Command::kNone) {
        return MakeUnexpected(MakeError(ErrorCode::kCliUnknownCommand, "Unknown command: " + arg));
      }
    } else if (args.command == Command::kInfo && !args.snapshot_id) {
      // info <id>
      args.snapshot_id = arg;
    } else {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unexpected positional argument: " + arg));
    }
  }

  if (args.config_file.empty()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kCliMissingArgument, "Configuration file path required (-c). Use --help for usage."));
  }
  if (args.command == Command::kNone) {
    return MakeUnexpected(MakeError(ErrorCode::kCliMissingArgument, "No command given. Use --help for usage."));
  }

  auto valid = ValidateForCommand(args, reason_given);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }

  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " -c <config.yaml|config.json> <command> [OPTIONS]\n";
  std::cout << "\n";
  std::cout << "Commands:\n";
  std::cout << "  create [-r <reason>]           Create a full snapshot (alias: backup)\n";
  std::cout << "  init                           Create the initial snapshot for distribution\n";
  std::cout << "  auto                           Create a snapshot only if the graph grew significantly\n";
  std::cout << "  restore [-f <id>] [-y]         Replace the whole graph with a snapshot (latest by default)\n";
  std::cout << "  selective-restore [-f <id>] [-p <L1,L2>] [-y]\n";
  std::cout << "                                 Merge a snapshot, keeping nodes with the given labels\n";
  std::cout << "  list [--detailed]              List snapshots, newest first\n";
  std::cout << "  info <id>                      Show one snapshot (timestamp or file name)\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -s, --schema <schema.json>     Use custom JSON Schema (optional)\n";
  std::cout << "  -r, --reason <text>            Reason stored with the snapshot\n";
  std::cout << "  -f, --file <id>                Snapshot timestamp or file name\n";
  std::cout << "  -p, --preserve <L1,L2>         Labels to preserve during selective restore\n";
  std::cout << "  -y, --yes                      Do not ask for confirmation\n";
  std::cout << "      --detailed                 Show counts and file sizes in list\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Environment:\n";
  std::cout << "  NEO4J_URI, NEO4J_USERNAME, NEO4J_PASSWORD override the store section.\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace graphvault::app
