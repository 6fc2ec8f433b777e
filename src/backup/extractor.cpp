/**
 * @file extractor.cpp
 * @brief Reads the whole graph out of the store
 */

#include "backup/extractor.h"

#include <spdlog/spdlog.h>

#include <map>
#include <string>
#include <utility>

#include "graph/cypher_builder.h"
#include "graph/property_codec.h"
#include "utils/structured_log.h"

namespace graphvault::backup {

using json = nlohmann::json;
using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Store errors keep their code when fatal; anything else becomes kExtractionFailed
 */
Error WrapStoreError(const Error& error, const std::string& what) {
  if (utils::IsConnectionError(error)) {
    return error;
  }
  return MakeError(ErrorCode::kExtractionFailed, what + ": " + error.message(), error.context());
}

Error RowError(const std::string& what, size_t row) {
  return MakeError(ErrorCode::kExtractionFailed, what + " (row " + std::to_string(row) + ")");
}

/**
 * @brief Element ids are strings; older servers return integer ids
 */
bool ReadId(const json& row, const char* column, std::string& out) {
  if (!row.contains(column)) {
    return false;
  }
  const auto& value = row[column];
  if (value.is_string()) {
    out = value.get<std::string>();
    return true;
  }
  if (value.is_number_integer()) {
    out = value.dump();
    return true;
  }
  return false;
}

uint64_t ReadCount(const json& row) {
  if (row.contains(graph::cypher::kCountColumn) && row[graph::cypher::kCountColumn].is_number_integer()) {
    auto count = row[graph::cypher::kCountColumn].get<int64_t>();
    return count > 0 ? static_cast<uint64_t>(count) : 0;
  }
  return 0;
}

Expected<graph::NodeRecord, Error> NodeFromRow(const json& row, size_t index) {
  graph::NodeRecord node;
  if (!ReadId(row, graph::cypher::kNodeIdColumn, node.legacy_id)) {
    return MakeUnexpected(RowError("Node row without identifier", index));
  }

  if (!row.contains(graph::cypher::kLabelsColumn) || !row[graph::cypher::kLabelsColumn].is_array()) {
    return MakeUnexpected(RowError("Node row without label list", index));
  }
  for (const auto& label : row[graph::cypher::kLabelsColumn]) {
    if (!label.is_string()) {
      return MakeUnexpected(RowError("Node label is not a string", index));
    }
    node.labels.push_back(label.get<std::string>());
  }
  if (node.labels.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kExtractionFailed,
                                    "Node " + node.legacy_id + " has no labels and cannot be restored"));
  }

  auto properties = graph::PropertyMapFromJson(row.value(graph::cypher::kPropsColumn, json()));
  if (!properties) {
    return MakeUnexpected(MakeError(properties.error().code(),
                                    "Node " + node.legacy_id + ": " + properties.error().message()));
  }
  node.properties = std::move(*properties);
  return node;
}

Expected<graph::RelationshipRecord, Error> RelationshipFromRow(const json& row, size_t index) {
  graph::RelationshipRecord relationship;
  if (!ReadId(row, graph::cypher::kRelIdColumn, relationship.legacy_id) ||
      !ReadId(row, graph::cypher::kStartIdColumn, relationship.start_legacy_id) ||
      !ReadId(row, graph::cypher::kEndIdColumn, relationship.end_legacy_id)) {
    return MakeUnexpected(RowError("Relationship row without identifiers", index));
  }

  if (!row.contains(graph::cypher::kRelTypeColumn) || !row[graph::cypher::kRelTypeColumn].is_string()) {
    return MakeUnexpected(RowError("Relationship row without type", index));
  }
  relationship.type = row[graph::cypher::kRelTypeColumn].get<std::string>();

  auto properties = graph::PropertyMapFromJson(row.value(graph::cypher::kPropsColumn, json()));
  if (!properties) {
    return MakeUnexpected(MakeError(properties.error().code(), "Relationship " + relationship.legacy_id + ": " +
                                                                   properties.error().message()));
  }
  relationship.properties = std::move(*properties);
  return relationship;
}

}  // namespace

Expected<graph::GraphSnapshotPayload, Error> ExtractAll(graph::IGraphStore& store) {
  auto connected = graph::EnsureConnected(store);
  if (!connected) {
    return MakeUnexpected(connected.error());
  }

  graph::GraphSnapshotPayload payload;
  std::map<std::string, uint64_t> label_counts;

  auto node_rows = store.ExecuteQuery(graph::cypher::MatchAllNodes(), json::object());
  if (!node_rows) {
    return MakeUnexpected(WrapStoreError(node_rows.error(), "Failed to read nodes"));
  }
  payload.nodes.reserve(node_rows->size());
  for (size_t i = 0; i < node_rows->size(); ++i) {
    auto node = NodeFromRow((*node_rows)[i], i);
    if (!node) {
      return MakeUnexpected(node.error());
    }
    for (const auto& label : node->labels) {
      ++label_counts[label];
    }
    payload.nodes.push_back(std::move(*node));
  }

  auto relationship_rows = store.ExecuteQuery(graph::cypher::MatchAllRelationships(), json::object());
  if (!relationship_rows) {
    return MakeUnexpected(WrapStoreError(relationship_rows.error(), "Failed to read relationships"));
  }
  payload.relationships.reserve(relationship_rows->size());
  for (size_t i = 0; i < relationship_rows->size(); ++i) {
    auto relationship = RelationshipFromRow((*relationship_rows)[i], i);
    if (!relationship) {
      return MakeUnexpected(relationship.error());
    }
    payload.relationships.push_back(std::move(*relationship));
  }

  payload.statistics.node_count = payload.nodes.size();
  payload.statistics.relationship_count = payload.relationships.size();
  payload.statistics.label_counts = std::move(label_counts);

  utils::StructuredLog()
      .Event("graph_extracted")
      .Field("store", store.Describe())
      .Field("nodes", payload.statistics.node_count)
      .Field("relationships", payload.statistics.relationship_count)
      .Info();
  return payload;
}

Expected<graph::GraphStatistics, Error> CollectStatistics(graph::IGraphStore& store) {
  auto connected = graph::EnsureConnected(store);
  if (!connected) {
    return MakeUnexpected(connected.error());
  }

  graph::GraphStatistics statistics;

  auto node_count = store.ExecuteQuery(graph::cypher::CountNodes(), json::object());
  if (!node_count) {
    return MakeUnexpected(WrapStoreError(node_count.error(), "Failed to count nodes"));
  }
  if (!node_count->empty()) {
    statistics.node_count = ReadCount(node_count->front());
  }

  auto relationship_count = store.ExecuteQuery(graph::cypher::CountRelationships(), json::object());
  if (!relationship_count) {
    return MakeUnexpected(WrapStoreError(relationship_count.error(), "Failed to count relationships"));
  }
  if (!relationship_count->empty()) {
    statistics.relationship_count = ReadCount(relationship_count->front());
  }

  auto label_rows = store.ExecuteQuery(graph::cypher::CountNodesByLabel(), json::object());
  if (!label_rows) {
    return MakeUnexpected(WrapStoreError(label_rows.error(), "Failed to count labels"));
  }
  std::map<std::string, uint64_t> label_counts;
  for (const auto& row : *label_rows) {
    if (row.contains(graph::cypher::kLabelColumn) && row[graph::cypher::kLabelColumn].is_string()) {
      label_counts[row[graph::cypher::kLabelColumn].get<std::string>()] = ReadCount(row);
    }
  }
  statistics.label_counts = std::move(label_counts);

  spdlog::debug("Graph statistics: {} nodes, {} relationships", statistics.node_count, statistics.relationship_count);
  return statistics;
}

}  // namespace graphvault::backup
