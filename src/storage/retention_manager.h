/**
 * @file retention_manager.h
 * @brief Snapshot index bookkeeping and retention cap
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "storage/snapshot_metadata.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::storage {

/**
 * @brief Outcome of recording a new snapshot
 */
struct RetentionOutcome {
  std::vector<std::string> evicted;  // Timestamps of snapshots beyond the cap
  size_t cleanup_failures = 0;       // Evicted files that could not be deleted
};

/**
 * @brief Maintains the snapshot index and enforces the retention cap
 *
 * The index file lives in the snapshot directory and lists retained
 * snapshots newest first. Files found in the directory but missing from
 * the index are still listed and count toward the cap; index entries whose
 * file has disappeared are not.
 */
class RetentionManager {
 public:
  struct Options {
    std::filesystem::path dir;
    size_t max_retained = 1;
    std::string file_prefix;
    std::string index_filename;
  };

  explicit RetentionManager(Options options);

  /**
   * @brief Add a snapshot to the index, evicting the oldest beyond the cap
   *
   * Every snapshot file in the directory is a candidate for eviction,
   * whether or not the index knows about it. The index is rewritten
   * atomically before evicted files are deleted, so
   * a crash never leaves the index pointing at a deleted file. A failed
   * deletion is logged and counted but does not fail the call.
   *
   * @return kSnapshotIndexError if the index cannot be written
   */
  utils::Expected<RetentionOutcome, utils::Error> Record(const SnapshotMetadata& metadata);

  /**
   * @brief All snapshots, newest first
   */
  [[nodiscard]] std::vector<SnapshotMetadata> List() const;

  /**
   * @brief Newest snapshot, if any
   */
  [[nodiscard]] std::optional<SnapshotMetadata> Latest() const;

  /**
   * @brief Look up a snapshot by timestamp or file name
   *
   * The reported file size is the file's current size on disk.
   */
  [[nodiscard]] std::optional<SnapshotMetadata> Info(const std::string& id) const;

  /**
   * @brief Resolve a timestamp or file name to a path inside the snapshot directory
   * @return kSnapshotUnsafePath if id contains a path separator or ".."
   */
  [[nodiscard]] utils::Expected<std::filesystem::path, utils::Error> PathFor(const std::string& id) const;

  [[nodiscard]] std::filesystem::path IndexPath() const { return options_.dir / options_.index_filename; }

  [[nodiscard]] const Options& GetOptions() const { return options_; }

 private:
  Options options_;

  /**
   * @brief Read the index; a missing or unreadable index is empty
   */
  [[nodiscard]] std::vector<SnapshotMetadata> LoadIndex() const;

  [[nodiscard]] utils::Expected<void, utils::Error> SaveIndex(const std::vector<SnapshotMetadata>& entries) const;

  [[nodiscard]] bool IsSnapshotFileName(const std::string& filename) const;

  [[nodiscard]] std::string FileNameOf(const SnapshotMetadata& metadata) const;
};

}  // namespace graphvault::storage
