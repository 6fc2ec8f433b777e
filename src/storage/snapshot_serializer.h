/**
 * @file snapshot_serializer.h
 * @brief Snapshot document read/write
 */

#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

#include "graph/graph_types.h"
#include "storage/snapshot_metadata.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::storage {

/**
 * @brief A snapshot read back from disk
 */
struct LoadedSnapshot {
  SnapshotMetadata metadata;
  graph::GraphSnapshotPayload payload;
};

/**
 * @brief "<prefix><timestamp>.json"
 */
std::string SnapshotFileName(const std::string& prefix, const std::string& timestamp);

/**
 * @brief Build the snapshot document
 */
nlohmann::json SnapshotToJson(const SnapshotMetadata& metadata, const graph::GraphSnapshotPayload& payload);

/**
 * @brief Decode a snapshot document (current or legacy layout)
 * @return kSnapshotParseError on any structural problem
 */
utils::Expected<LoadedSnapshot, utils::Error> SnapshotFromJson(const nlohmann::json& document);

/**
 * @brief Write a snapshot atomically
 *
 * Either the complete document is at path afterwards or nothing new is.
 *
 * @return kSnapshotWriteError / kSnapshotUnsafePath on failure
 */
utils::Expected<void, utils::Error> WriteSnapshot(const std::filesystem::path& path, const SnapshotMetadata& metadata,
                                                  const graph::GraphSnapshotPayload& payload);

/**
 * @brief Read and decode a snapshot file
 * @return kSnapshotNotFound if missing, kSnapshotParseError if malformed
 */
utils::Expected<LoadedSnapshot, utils::Error> ReadSnapshot(const std::filesystem::path& path);

/**
 * @brief Read only the metadata section of a snapshot file
 *
 * Still validates the top-level document structure, so a file that
 * ReadSnapshot would reject as structurally broken is rejected here too.
 */
utils::Expected<SnapshotMetadata, utils::Error> ReadSnapshotMetadata(const std::filesystem::path& path);

}  // namespace graphvault::storage
