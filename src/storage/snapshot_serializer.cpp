/**
 * @file snapshot_serializer.cpp
 * @brief Snapshot document read/write
 */

#include "storage/snapshot_serializer.h"

#include <spdlog/spdlog.h>

#include <set>
#include <utility>

#include "graph/property_codec.h"
#include "storage/atomic_file.h"
#include "storage/snapshot_format.h"

namespace graphvault::storage {

using json = nlohmann::json;
using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

// Keys of the flattened legacy layout
constexpr const char* kLegacyId = "_id";
constexpr const char* kLegacyLabels = "_labels";
constexpr const char* kLegacyType = "_type";
constexpr const char* kLegacyStartId = "_start_id";
constexpr const char* kLegacyEndId = "_end_id";

Error ParseError(const std::string& message) {
  return MakeError(ErrorCode::kSnapshotParseError, message);
}

/**
 * @brief Identifiers may be stored as strings or as integers (legacy)
 */
Expected<std::string, Error> IdFromJson(const json& object, const char* key, const std::string& where) {
  if (!object.contains(key)) {
    return MakeUnexpected(ParseError(where + ": missing '" + key + "'"));
  }
  const auto& value = object[key];
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return value.dump();
  }
  return MakeUnexpected(ParseError(where + ": '" + key + "' must be a string or integer"));
}

Expected<std::vector<std::string>, Error> LabelsFromJson(const json& value, const std::string& where) {
  if (!value.is_array() || value.empty()) {
    return MakeUnexpected(ParseError(where + ": labels must be a non-empty array"));
  }
  std::vector<std::string> labels;
  labels.reserve(value.size());
  for (const auto& label : value) {
    if (!label.is_string()) {
      return MakeUnexpected(ParseError(where + ": labels must be strings"));
    }
    labels.push_back(label.get<std::string>());
  }
  return labels;
}

Expected<graph::PropertyMap, Error> PropertiesFromJson(const json& value, const std::string& where) {
  auto properties = graph::PropertyMapFromJson(value);
  if (!properties) {
    return MakeUnexpected(ParseError(where + ": " + properties.error().message()));
  }
  return std::move(*properties);
}

/**
 * @brief Collect every key except the reserved ones into a property object
 */
json StripReserved(const json& object, const std::set<std::string>& reserved) {
  json properties = json::object();
  for (const auto& [key, value] : object.items()) {
    if (reserved.count(key) == 0) {
      properties[key] = value;
    }
  }
  return properties;
}

Expected<graph::NodeRecord, Error> NodeFromJson(const json& object, size_t index) {
  const std::string where = "node[" + std::to_string(index) + "]";
  if (!object.is_object()) {
    return MakeUnexpected(ParseError(where + ": must be an object"));
  }

  const bool legacy = !object.contains("labels") && object.contains(kLegacyLabels);
  graph::NodeRecord node;

  auto id = IdFromJson(object, legacy ? kLegacyId : "id", where);
  if (!id) {
    return MakeUnexpected(id.error());
  }
  node.legacy_id = std::move(*id);

  auto labels = LabelsFromJson(legacy ? object[kLegacyLabels] : object.value("labels", json()), where);
  if (!labels) {
    return MakeUnexpected(labels.error());
  }
  node.labels = std::move(*labels);

  json properties_json = legacy ? StripReserved(object, {kLegacyId, kLegacyLabels}) : object.value("properties", json());
  auto properties = PropertiesFromJson(properties_json, where);
  if (!properties) {
    return MakeUnexpected(properties.error());
  }
  node.properties = std::move(*properties);
  return node;
}

Expected<graph::RelationshipRecord, Error> RelationshipFromJson(const json& object, size_t index) {
  const std::string where = "relationship[" + std::to_string(index) + "]";
  if (!object.is_object()) {
    return MakeUnexpected(ParseError(where + ": must be an object"));
  }

  const bool legacy = !object.contains("type") && object.contains(kLegacyType);
  graph::RelationshipRecord relationship;

  auto id = IdFromJson(object, legacy ? kLegacyId : "id", where);
  if (!id) {
    return MakeUnexpected(id.error());
  }
  relationship.legacy_id = std::move(*id);

  const char* type_key = legacy ? kLegacyType : "type";
  if (!object.contains(type_key) || !object[type_key].is_string() || object[type_key].get<std::string>().empty()) {
    return MakeUnexpected(ParseError(where + ": type must be a non-empty string"));
  }
  relationship.type = object[type_key].get<std::string>();

  auto start_id = IdFromJson(object, legacy ? kLegacyStartId : "start_id", where);
  if (!start_id) {
    return MakeUnexpected(start_id.error());
  }
  relationship.start_legacy_id = std::move(*start_id);

  auto end_id = IdFromJson(object, legacy ? kLegacyEndId : "end_id", where);
  if (!end_id) {
    return MakeUnexpected(end_id.error());
  }
  relationship.end_legacy_id = std::move(*end_id);

  json properties_json = legacy ? StripReserved(object, {kLegacyId, kLegacyType, kLegacyStartId, kLegacyEndId})
                                : object.value("properties", json());
  auto properties = PropertiesFromJson(properties_json, where);
  if (!properties) {
    return MakeUnexpected(properties.error());
  }
  relationship.properties = std::move(*properties);
  return relationship;
}

Expected<uint64_t, Error> CountFromJson(const json& value, const std::string& field) {
  if (!value.is_number_integer()) {
    return MakeUnexpected(ParseError("statistics." + field + " must be an integer"));
  }
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.get<int64_t>() < 0) {
    return MakeUnexpected(ParseError("statistics." + field + " must not be negative"));
  }
  return static_cast<uint64_t>(value.get<int64_t>());
}

Expected<graph::GraphStatistics, Error> StatisticsFromJson(const json& object) {
  if (!object.is_object()) {
    return MakeUnexpected(ParseError("statistics must be an object"));
  }
  graph::GraphStatistics statistics;
  if (object.contains("node_count") && object["node_count"].is_number_integer()) {
    auto count = CountFromJson(object["node_count"], "node_count");
    if (!count) {
      return MakeUnexpected(count.error());
    }
    statistics.node_count = *count;
  }
  if (object.contains("relationship_count") && object["relationship_count"].is_number_integer()) {
    auto count = CountFromJson(object["relationship_count"], "relationship_count");
    if (!count) {
      return MakeUnexpected(count.error());
    }
    statistics.relationship_count = *count;
  }
  if (object.contains("label_counts") && object["label_counts"].is_object()) {
    std::map<std::string, uint64_t> label_counts;
    for (const auto& [label, value] : object["label_counts"].items()) {
      auto count = CountFromJson(value, "label_counts." + label);
      if (!count) {
        return MakeUnexpected(count.error());
      }
      label_counts[label] = *count;
    }
    statistics.label_counts = std::move(label_counts);
  }
  return statistics;
}

/**
 * @brief Check the required top-level keys of a snapshot document
 */
Expected<void, Error> ValidateDocumentShape(const json& document) {
  if (!document.is_object()) {
    return MakeUnexpected(ParseError("Snapshot document must be a JSON object"));
  }
  if (!document.contains(snapshot_format::kMetadataKey) || !document[snapshot_format::kMetadataKey].is_object()) {
    return MakeUnexpected(ParseError("Snapshot document is missing 'metadata'"));
  }
  if (!document.contains(snapshot_format::kDataKey) || !document[snapshot_format::kDataKey].is_object()) {
    return MakeUnexpected(ParseError("Snapshot document is missing 'data'"));
  }
  const auto& data = document[snapshot_format::kDataKey];
  for (const char* key : {snapshot_format::kNodesKey, snapshot_format::kRelationshipsKey}) {
    if (!data.contains(key) || !data[key].is_array()) {
      return MakeUnexpected(ParseError(std::string("Snapshot document is missing 'data.") + key + "'"));
    }
  }
  if (!data.contains(snapshot_format::kStatisticsKey)) {
    return MakeUnexpected(ParseError("Snapshot document is missing 'data.statistics'"));
  }
  return {};
}

Expected<json, Error> ParseDocument(const std::filesystem::path& path) {
  auto content = ReadWholeFile(path);
  if (!content) {
    return MakeUnexpected(content.error());
  }
  json document = json::parse(*content, nullptr, false);
  if (document.is_discarded()) {
    return MakeUnexpected(ParseError("Invalid JSON in snapshot file: " + path.string()));
  }
  return document;
}

}  // namespace

std::string SnapshotFileName(const std::string& prefix, const std::string& timestamp) {
  return prefix + timestamp + snapshot_format::kFileExtension;
}

json SnapshotToJson(const SnapshotMetadata& metadata, const graph::GraphSnapshotPayload& payload) {
  json nodes = json::array();
  for (const auto& node : payload.nodes) {
    nodes.push_back({{"id", node.legacy_id},
                     {"labels", node.labels},
                     {"properties", graph::PropertyMapToJson(node.properties)}});
  }

  json relationships = json::array();
  for (const auto& relationship : payload.relationships) {
    relationships.push_back({{"id", relationship.legacy_id},
                             {"type", relationship.type},
                             {"start_id", relationship.start_legacy_id},
                             {"end_id", relationship.end_legacy_id},
                             {"properties", graph::PropertyMapToJson(relationship.properties)}});
  }

  json statistics = {{"node_count", payload.statistics.node_count},
                     {"relationship_count", payload.statistics.relationship_count}};
  if (payload.statistics.label_counts) {
    statistics["label_counts"] = *payload.statistics.label_counts;
  }

  return {{snapshot_format::kMetadataKey, MetadataToJson(metadata, false)},
          {snapshot_format::kDataKey,
           {{snapshot_format::kNodesKey, std::move(nodes)},
            {snapshot_format::kRelationshipsKey, std::move(relationships)},
            {snapshot_format::kStatisticsKey, std::move(statistics)}}}};
}

Expected<LoadedSnapshot, Error> SnapshotFromJson(const json& document) {
  auto shape = ValidateDocumentShape(document);
  if (!shape) {
    return MakeUnexpected(shape.error());
  }

  LoadedSnapshot snapshot;
  auto metadata = MetadataFromJson(document[snapshot_format::kMetadataKey]);
  if (!metadata) {
    return MakeUnexpected(metadata.error());
  }
  snapshot.metadata = std::move(*metadata);

  const auto& data = document[snapshot_format::kDataKey];

  const auto& nodes = data[snapshot_format::kNodesKey];
  snapshot.payload.nodes.reserve(nodes.size());
  for (size_t i = 0; i < nodes.size(); ++i) {
    auto node = NodeFromJson(nodes[i], i);
    if (!node) {
      return MakeUnexpected(node.error());
    }
    snapshot.payload.nodes.push_back(std::move(*node));
  }

  const auto& relationships = data[snapshot_format::kRelationshipsKey];
  snapshot.payload.relationships.reserve(relationships.size());
  for (size_t i = 0; i < relationships.size(); ++i) {
    auto relationship = RelationshipFromJson(relationships[i], i);
    if (!relationship) {
      return MakeUnexpected(relationship.error());
    }
    snapshot.payload.relationships.push_back(std::move(*relationship));
  }

  auto statistics = StatisticsFromJson(data[snapshot_format::kStatisticsKey]);
  if (!statistics) {
    return MakeUnexpected(statistics.error());
  }
  snapshot.payload.statistics = std::move(*statistics);

  // Older documents carry counts only in statistics
  if (snapshot.metadata.node_count == 0) {
    snapshot.metadata.node_count = snapshot.payload.statistics.node_count;
  }
  if (snapshot.metadata.relationship_count == 0) {
    snapshot.metadata.relationship_count = snapshot.payload.statistics.relationship_count;
  }
  if (snapshot.metadata.schema_version.empty()) {
    snapshot.metadata.schema_version = snapshot_format::kLegacySchemaVersion;
  }
  return snapshot;
}

Expected<void, Error> WriteSnapshot(const std::filesystem::path& path, const SnapshotMetadata& metadata,
                                    const graph::GraphSnapshotPayload& payload) {
  std::string content;
  try {
    content = SnapshotToJson(metadata, payload).dump(2);
  } catch (const json::exception& e) {
    // Invalid UTF-8 in a string property
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotWriteError, std::string("Failed to encode snapshot: ") + e.what()));
  }

  auto written = WriteFileAtomically(path, content);
  if (!written) {
    return MakeUnexpected(written.error());
  }
  spdlog::debug("Snapshot written: {} ({} bytes)", path.string(), content.size());
  return {};
}

Expected<LoadedSnapshot, Error> ReadSnapshot(const std::filesystem::path& path) {
  auto document = ParseDocument(path);
  if (!document) {
    return MakeUnexpected(document.error());
  }
  auto snapshot = SnapshotFromJson(*document);
  if (!snapshot) {
    return MakeUnexpected(MakeError(snapshot.error().code(), snapshot.error().message(), path.string()));
  }
  return std::move(*snapshot);
}

Expected<SnapshotMetadata, Error> ReadSnapshotMetadata(const std::filesystem::path& path) {
  auto document = ParseDocument(path);
  if (!document) {
    return MakeUnexpected(document.error());
  }
  auto shape = ValidateDocumentShape(*document);
  if (!shape) {
    return MakeUnexpected(MakeError(shape.error().code(), shape.error().message(), path.string()));
  }
  auto metadata = MetadataFromJson((*document)[snapshot_format::kMetadataKey]);
  if (!metadata) {
    return MakeUnexpected(metadata.error());
  }
  if (metadata->schema_version.empty()) {
    metadata->schema_version = snapshot_format::kLegacySchemaVersion;
  }
  return std::move(*metadata);
}

}  // namespace graphvault::storage
