/**
 * @file snapshot_format.h
 * @brief Snapshot document layout and naming constants
 *
 * Snapshot document (one JSON file per snapshot):
 * {
 *   "metadata": { "timestamp": "20250623_190459_000123", "created_at": "...", "reason": "...",
 *                 "node_count": 2, "relationship_count": 1, "schema_version": "2.0.0",
 *                 "backup_type": "full" },
 *   "data": {
 *     "nodes":         [ {"id": "4:ab:0", "labels": ["User"], "properties": {...}} ],
 *     "relationships": [ {"id": "5:ab:0", "type": "PLACED", "start_id": "4:ab:0",
 *                         "end_id": "4:ab:1", "properties": {...}} ],
 *     "statistics":    { "node_count": 2, "relationship_count": 1, "label_counts": {...} }
 *   }
 * }
 *
 * Legacy documents (schema "1.0.0") flatten properties next to "_id"/"_labels"
 * (nodes) and "_id"/"_type"/"_start_id"/"_end_id" (relationships); they are
 * accepted on read.
 *
 * Index document: { "backups": [ <metadata + "filename" + "file_size">, ... ] }
 */

#pragma once

namespace graphvault::storage::snapshot_format {

// Schema version we write
constexpr const char* kCurrentSchemaVersion = "2.0.0";

// Schema version of flattened legacy documents
constexpr const char* kLegacySchemaVersion = "1.0.0";

constexpr const char* kBackupTypeFull = "full";

constexpr const char* kDefaultFilePrefix = "graph_snapshot_";
constexpr const char* kFileExtension = ".json";
constexpr const char* kTempSuffix = ".tmp";
constexpr const char* kDefaultIndexFilename = "backup_metadata.json";

// Top-level keys
constexpr const char* kMetadataKey = "metadata";
constexpr const char* kDataKey = "data";
constexpr const char* kNodesKey = "nodes";
constexpr const char* kRelationshipsKey = "relationships";
constexpr const char* kStatisticsKey = "statistics";
constexpr const char* kIndexBackupsKey = "backups";

}  // namespace graphvault::storage::snapshot_format
