/**
 * @file snapshot_metadata.h
 * @brief Snapshot metadata and its JSON form
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::storage {

/**
 * @brief Descriptive metadata of one snapshot
 *
 * The timestamp is the snapshot's identity and file name key.
 */
struct SnapshotMetadata {
  std::string timestamp;       // "YYYYMMDD_HHMMSS_ffffff", sortable
  std::string created_at;      // ISO-8601 instant
  std::string reason;          // Free text
  uint64_t node_count = 0;
  uint64_t relationship_count = 0;
  std::string schema_version;  // Document layout version
  std::string backup_type;     // Always "full"
  uint64_t file_size_bytes = 0;
  std::string filename;        // Derived; not stored inside the snapshot body
};

/**
 * @brief Serialize metadata
 * @param include_file_fields Emit "filename" and "file_size" (index entries only)
 */
nlohmann::json MetadataToJson(const SnapshotMetadata& metadata, bool include_file_fields);

/**
 * @brief Parse metadata (accepts legacy "datetime"/"version" keys)
 * @return kSnapshotParseError if not an object or "timestamp" is missing
 */
utils::Expected<SnapshotMetadata, utils::Error> MetadataFromJson(const nlohmann::json& object);

}  // namespace graphvault::storage
