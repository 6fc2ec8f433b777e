/**
 * @file command_runner.cpp
 * @brief Executes one parsed CLI command against a BackupManager
 */

#include "app/command_runner.h"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <vector>

#include "utils/structured_log.h"

namespace graphvault::app {

namespace {

constexpr const char* kDefaultReason = "Manual backup";
constexpr const char* kInitReason = "Initial backup for application distribution";
constexpr const char* kConfirmationWord = "YES";

std::string Join(const std::vector<std::string>& items, const char* separator) {
  std::ostringstream joined;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      joined << separator;
    }
    joined << items[i];
  }
  return joined.str();
}

std::string SnapshotLabel(const std::optional<std::string>& snapshot_id) {
  return snapshot_id ? *snapshot_id : std::string("the latest snapshot");
}

void LogCommandError(const char* command, const utils::Error& error) {
  graphvault::utils::StructuredLog()
      .Event("command_failed")
      .Field("command", command)
      .Field("code", static_cast<int64_t>(error.code()))
      .Field("error", error.message())
      .Error();
}

}  // namespace

CommandRunner::CommandRunner(backup::BackupManager& manager, const config::Config& config, std::istream& input,
                             std::ostream& output)
    : manager_(manager), config_(config), input_(input), output_(output) {}

int CommandRunner::Run(const CommandLineArgs& args) {
  switch (args.command) {
    case Command::kCreate:
      return RunCreate(args.reason.empty() ? kDefaultReason : args.reason);
    case Command::kInit:
      return RunCreate(kInitReason);
    case Command::kAuto:
      return RunAuto();
    case Command::kRestore:
      return RunRestore(args);
    case Command::kSelectiveRestore:
      return RunSelectiveRestore(args);
    case Command::kList:
      return RunList(args.detailed);
    case Command::kInfo:
      return RunInfo(args.snapshot_id.value_or(""));
    case Command::kNone:
    default:
      output_ << "No command given. Use --help for usage.\n";
      return kExitFailure;
  }
}

int CommandRunner::RunCreate(const std::string& reason) {
  auto result = manager_.Create(reason);
  if (!result) {
    LogCommandError("create", result.error());
    output_ << "Backup failed: " << result.error().message() << "\n";
    return kExitFailure;
  }
  output_ << "Backup completed: " << result->path.string() << " (" << result->metadata.node_count << " nodes, "
          << result->metadata.relationship_count << " relationships)\n";
  return kExitSuccess;
}

int CommandRunner::RunAuto() {
  backup::ChangeThresholds thresholds;
  thresholds.min_new_nodes = static_cast<uint64_t>(config_.auto_backup.min_new_nodes);
  thresholds.min_new_relationships = static_cast<uint64_t>(config_.auto_backup.min_new_relationships);
  thresholds.percent_growth = config_.auto_backup.percent_growth;

  auto created = manager_.AutoCreate(thresholds);
  if (!created) {
    LogCommandError("auto", created.error());
    output_ << "Auto-backup failed: " << created.error().message() << "\n";
    return kExitFailure;
  }
  if (*created) {
    output_ << "Auto-backup created due to significant changes\n";
  } else {
    output_ << "No backup needed: no significant changes detected\n";
  }
  return kExitSuccess;
}

bool CommandRunner::Confirm(const std::string& warning) {
  output_ << warning << "\n";
  output_ << "Type '" << kConfirmationWord << "' to proceed: " << std::flush;
  std::string answer;
  if (!std::getline(input_, answer)) {
    return false;
  }
  return answer == kConfirmationWord;
}

void CommandRunner::PrintReport(const backup::RestoreReport& report) {
  output_ << "  Snapshot:               " << report.snapshot << "\n";
  output_ << "  Nodes restored:         " << report.nodes_restored << "\n";
  if (report.nodes_preserved > 0) {
    output_ << "  Nodes preserved:        " << report.nodes_preserved << "\n";
  }
  output_ << "  Node failures:          " << report.node_failures << "\n";
  output_ << "  Relationships restored: " << report.relationships_restored << "\n";
  output_ << "  Relationships skipped:  " << report.relationships_skipped << "\n";
  output_ << "  Relationship failures:  " << report.relationship_failures << "\n";
}

int CommandRunner::RunRestore(const CommandLineArgs& args) {
  if (!args.assume_yes &&
      !Confirm("This will DELETE all existing graph data and replace it with " + SnapshotLabel(args.snapshot_id) +
               ".")) {
    output_ << "Restore cancelled\n";
    return kExitCancelled;
  }

  auto report = manager_.Restore(args.snapshot_id);
  if (!report) {
    LogCommandError("restore", report.error());
    output_ << "Restore failed: " << report.error().message() << "\n";
    return kExitFailure;
  }
  output_ << "Restore completed\n";
  PrintReport(*report);
  return kExitSuccess;
}

int CommandRunner::RunSelectiveRestore(const CommandLineArgs& args) {
  const std::vector<std::string> labels = args.preserve_labels.value_or(config_.restore.preserve_labels);
  const std::set<std::string> preserve(labels.begin(), labels.end());

  if (!args.assume_yes && !Confirm("This will merge " + SnapshotLabel(args.snapshot_id) +
                                   " into the graph, preserving nodes labeled [" + Join(labels, ", ") + "].")) {
    output_ << "Selective restore cancelled\n";
    return kExitCancelled;
  }

  auto report = manager_.SelectiveRestore(args.snapshot_id, preserve);
  if (!report) {
    LogCommandError("selective-restore", report.error());
    output_ << "Selective restore failed: " << report.error().message() << "\n";
    return kExitFailure;
  }
  output_ << "Selective restore completed\n";
  PrintReport(*report);
  return kExitSuccess;
}

int CommandRunner::RunList(bool detailed) {
  auto snapshots = manager_.List();
  if (!snapshots) {
    LogCommandError("list", snapshots.error());
    output_ << "Failed to list backups: " << snapshots.error().message() << "\n";
    return kExitFailure;
  }
  if (snapshots->empty()) {
    output_ << "No backups found\n";
    return kExitSuccess;
  }

  output_ << "Available backups:\n";
  for (const auto& snapshot : *snapshots) {
    output_ << "  " << snapshot.filename << " - " << (snapshot.created_at.empty() ? "Unknown" : snapshot.created_at)
            << " - " << (snapshot.reason.empty() ? "No reason" : snapshot.reason) << "\n";
    if (detailed) {
      output_ << "      nodes: " << snapshot.node_count << ", relationships: " << snapshot.relationship_count
              << ", size: " << snapshot.file_size_bytes << " bytes, schema: " << snapshot.schema_version << "\n";
    }
  }
  return kExitSuccess;
}

int CommandRunner::RunInfo(const std::string& snapshot_id) {
  auto info = manager_.Info(snapshot_id);
  if (!info) {
    output_ << "Backup not found: " << snapshot_id << "\n";
    return kExitFailure;
  }
  output_ << "Backup info: " << info->filename << "\n";
  output_ << "  timestamp: " << info->timestamp << "\n";
  output_ << "  created_at: " << info->created_at << "\n";
  output_ << "  reason: " << info->reason << "\n";
  output_ << "  node_count: " << info->node_count << "\n";
  output_ << "  relationship_count: " << info->relationship_count << "\n";
  output_ << "  schema_version: " << info->schema_version << "\n";
  output_ << "  backup_type: " << info->backup_type << "\n";
  output_ << "  file_size: " << info->file_size_bytes << "\n";
  return kExitSuccess;
}

}  // namespace graphvault::app
