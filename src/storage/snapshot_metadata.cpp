/**
 * @file snapshot_metadata.cpp
 * @brief Snapshot metadata JSON form
 */

#include "storage/snapshot_metadata.h"

namespace graphvault::storage {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

std::string StringOr(const json& object, const char* key, const char* legacy_key, const std::string& fallback) {
  if (object.contains(key) && object[key].is_string()) {
    return object[key].get<std::string>();
  }
  if (legacy_key != nullptr && object.contains(legacy_key) && object[legacy_key].is_string()) {
    return object[legacy_key].get<std::string>();
  }
  return fallback;
}

uint64_t CountOr(const json& object, const char* key) {
  if (object.contains(key) && object[key].is_number_unsigned()) {
    return object[key].get<uint64_t>();
  }
  if (object.contains(key) && object[key].is_number_integer() && object[key].get<int64_t>() >= 0) {
    return static_cast<uint64_t>(object[key].get<int64_t>());
  }
  return 0;
}

}  // namespace

json MetadataToJson(const SnapshotMetadata& metadata, bool include_file_fields) {
  json object = {{"timestamp", metadata.timestamp},
                 {"created_at", metadata.created_at},
                 {"reason", metadata.reason},
                 {"node_count", metadata.node_count},
                 {"relationship_count", metadata.relationship_count},
                 {"schema_version", metadata.schema_version},
                 {"backup_type", metadata.backup_type}};
  if (include_file_fields) {
    object["filename"] = metadata.filename;
    object["file_size"] = metadata.file_size_bytes;
  }
  return object;
}

utils::Expected<SnapshotMetadata, utils::Error> MetadataFromJson(const json& object) {
  if (!object.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotParseError, "Snapshot metadata must be a JSON object"));
  }
  if (!object.contains("timestamp") || !object["timestamp"].is_string() ||
      object["timestamp"].get<std::string>().empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotParseError, "Snapshot metadata is missing 'timestamp'"));
  }

  SnapshotMetadata metadata;
  metadata.timestamp = object["timestamp"].get<std::string>();
  metadata.created_at = StringOr(object, "created_at", "datetime", "");
  metadata.reason = StringOr(object, "reason", nullptr, "");
  metadata.node_count = CountOr(object, "node_count");
  metadata.relationship_count = CountOr(object, "relationship_count");
  metadata.schema_version = StringOr(object, "schema_version", "version", "");
  metadata.backup_type = StringOr(object, "backup_type", nullptr, "full");
  metadata.file_size_bytes = CountOr(object, "file_size");
  metadata.filename = StringOr(object, "filename", nullptr, "");
  return metadata;
}

}  // namespace graphvault::storage
