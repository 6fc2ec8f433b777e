/**
 * @file backup_manager.h
 * @brief Caller-facing backup operations (create, auto, restore, list, info)
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "backup/change_detector.h"
#include "backup/restorer.h"
#include "graph/graph_store_interface.h"
#include "storage/retention_manager.h"
#include "storage/snapshot_metadata.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::backup {

/**
 * @brief Result of a successful create
 */
struct CreateResult {
  storage::SnapshotMetadata metadata;
  std::filesystem::path path;
};

/**
 * @brief Ties the store, the snapshot directory and the restorer together
 *
 * Single-writer: callers serialize operations (the CLI holds an
 * OperationLock). The store is borrowed and must outlive the manager.
 */
class BackupManager {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  /**
   * @param clock Time source for snapshot timestamps (system clock if empty)
   */
  BackupManager(graph::IGraphStore& store, storage::RetentionManager::Options retention,
                RestoreOptions restore_options = RestoreOptions(), Clock clock = Clock());

  // Non-copyable and non-movable (holds a store reference)
  BackupManager(const BackupManager&) = delete;
  BackupManager& operator=(const BackupManager&) = delete;
  BackupManager(BackupManager&&) = delete;
  BackupManager& operator=(BackupManager&&) = delete;

  ~BackupManager() = default;

  /**
   * @brief Extract the graph, write a snapshot and apply retention
   * @param reason Free text stored in the metadata
   */
  utils::Expected<CreateResult, utils::Error> Create(const std::string& reason);

  /**
   * @brief Create a snapshot only if the graph grew past the thresholds
   * @return true if a snapshot was created
   */
  utils::Expected<bool, utils::Error> AutoCreate(const ChangeThresholds& thresholds);

  /**
   * @brief Full restore from a snapshot (latest if no id)
   */
  utils::Expected<RestoreReport, utils::Error> Restore(const std::optional<std::string>& snapshot_id);

  /**
   * @brief Selective restore keeping nodes with any of preserve_labels untouched
   */
  utils::Expected<RestoreReport, utils::Error> SelectiveRestore(const std::optional<std::string>& snapshot_id,
                                                                const std::set<std::string>& preserve_labels);

  /**
   * @brief All snapshots, newest first
   */
  utils::Expected<std::vector<storage::SnapshotMetadata>, utils::Error> List() const;

  /**
   * @brief Metadata of one snapshot by timestamp or file name
   */
  std::optional<storage::SnapshotMetadata> Info(const std::string& snapshot_id) const;

  [[nodiscard]] const storage::RetentionManager& GetRetentionManager() const { return retention_; }

 private:
  graph::IGraphStore& store_;
  storage::RetentionManager retention_;
  RestoreOptions restore_options_;
  Clock clock_;

  utils::Expected<std::filesystem::path, utils::Error> ResolveSnapshot(
      const std::optional<std::string>& snapshot_id) const;
};

}  // namespace graphvault::backup
