/**
 * @file restorer.cpp
 * @brief Rebuilds the graph from a snapshot (full replace or selective merge)
 */

#include "backup/restorer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "graph/cypher_builder.h"
#include "graph/property_codec.h"
#include "storage/snapshot_serializer.h"
#include "utils/structured_log.h"

namespace graphvault::backup {

using json = nlohmann::json;
using utils::Error;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

// Progress is logged every this many records
constexpr uint64_t kProgressInterval = 1000;

bool HasPreservedLabel(const graph::NodeRecord& node, const std::set<std::string>& preserve_labels) {
  return std::any_of(node.labels.begin(), node.labels.end(),
                     [&preserve_labels](const std::string& label) { return preserve_labels.count(label) > 0; });
}

/**
 * @brief Extract the created/merged node id from a statement result
 */
bool ReadNewId(const std::vector<graph::Record>& rows, std::string& out) {
  if (rows.empty() || !rows.front().contains(graph::cypher::kNewIdColumn)) {
    return false;
  }
  const auto& value = rows.front()[graph::cypher::kNewIdColumn];
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

}  // namespace

const char* RestorePhaseToString(RestorePhase phase) {
  switch (phase) {
    case RestorePhase::kIdle:
      return "idle";
    case RestorePhase::kValidating:
      return "validating";
    case RestorePhase::kClearing:
      return "clearing";
    case RestorePhase::kCreatingNodes:
      return "creating_nodes";
    case RestorePhase::kCreatingRelationships:
      return "creating_relationships";
    case RestorePhase::kDone:
      return "done";
    case RestorePhase::kFailed:
      return "failed";
  }
  return "unknown";
}

Restorer::Restorer(graph::IGraphStore& store, RestoreOptions options) : store_(store), options_(std::move(options)) {}

Expected<RestoreReport, Error> Restorer::RestoreFull(const std::filesystem::path& snapshot_path) {
  return Run(snapshot_path, false, {});
}

Expected<RestoreReport, Error> Restorer::RestoreSelective(const std::filesystem::path& snapshot_path,
                                                          const std::set<std::string>& preserve_labels) {
  return Run(snapshot_path, true, preserve_labels);
}

Error Restorer::Abort(const Error& cause, const RestoreReport& report) {
  const RestorePhase failed_in = phase_;
  phase_ = RestorePhase::kFailed;

  utils::StructuredLog()
      .Event("restore_aborted")
      .Field("snapshot", report.snapshot)
      .Field("phase", RestorePhaseToString(failed_in))
      .Field("nodes_restored", report.nodes_restored)
      .Field("relationships_restored", report.relationships_restored)
      .Field("error", cause.message())
      .Error();

  std::string snapshot = report.snapshot.empty() ? std::string("(unknown)") : report.snapshot;
  return MakeError(cause.code(),
                   "Restore of snapshot " + snapshot + " failed during " + RestorePhaseToString(failed_in) + ": " +
                       cause.message(),
                   cause.context());
}

Expected<RestoreReport, Error> Restorer::Run(const std::filesystem::path& snapshot_path, bool selective,
                                             const std::set<std::string>& preserve_labels) {
  RestoreReport report;
  remapper_.Clear();

  // Validating
  phase_ = RestorePhase::kValidating;
  auto snapshot = storage::ReadSnapshot(snapshot_path);
  if (!snapshot) {
    report.snapshot = snapshot_path.filename().string();
    return MakeUnexpected(Abort(snapshot.error(), report));
  }
  report.snapshot = snapshot->metadata.timestamp;
  const auto& payload = snapshot->payload;

  auto connected = graph::EnsureConnected(store_);
  if (!connected) {
    return MakeUnexpected(Abort(connected.error(), report));
  }

  spdlog::info("Restoring snapshot {} ({} mode): {} nodes, {} relationships", report.snapshot,
               selective ? "selective" : "full", payload.nodes.size(), payload.relationships.size());

  // Clearing
  if (!selective) {
    phase_ = RestorePhase::kClearing;
    auto cleared = store_.ExecuteWrite(graph::cypher::DetachDeleteAll(), json::object());
    if (!cleared) {
      return MakeUnexpected(Abort(cleared.error(), report));
    }
    spdlog::info("Cleared store: {} nodes, {} relationships deleted", cleared->nodes_deleted,
                 cleared->relationships_deleted);
  }

  Error fatal;

  // CreatingNodes
  phase_ = RestorePhase::kCreatingNodes;
  uint64_t processed = 0;
  for (const auto& node : payload.nodes) {
    if (selective && HasPreservedLabel(node, preserve_labels)) {
      ++report.nodes_preserved;
    } else if (!RestoreNode(node, selective, report, fatal)) {
      return MakeUnexpected(Abort(fatal, report));
    }
    if (++processed % kProgressInterval == 0) {
      spdlog::info("Processed {}/{} nodes", processed, payload.nodes.size());
    }
  }

  // CreatingRelationships
  phase_ = RestorePhase::kCreatingRelationships;
  processed = 0;
  for (const auto& relationship : payload.relationships) {
    if (!RestoreRelationship(relationship, selective, report, fatal)) {
      return MakeUnexpected(Abort(fatal, report));
    }
    if (++processed % kProgressInterval == 0) {
      spdlog::info("Processed {}/{} relationships", processed, payload.relationships.size());
    }
  }

  phase_ = RestorePhase::kDone;
  report.phase = phase_;
  remapper_.Clear();

  utils::StructuredLog()
      .Event("restore_completed")
      .Field("snapshot", report.snapshot)
      .Field("mode", selective ? "selective" : "full")
      .Field("nodes_restored", report.nodes_restored)
      .Field("nodes_preserved", report.nodes_preserved)
      .Field("node_failures", report.node_failures)
      .Field("relationships_restored", report.relationships_restored)
      .Field("relationships_skipped", report.relationships_skipped)
      .Field("relationship_failures", report.relationship_failures)
      .Info();
  return report;
}

bool Restorer::RestoreNode(const graph::NodeRecord& node, bool selective, RestoreReport& report, Error& fatal) {
  const char* phase = RestorePhaseToString(phase_);

  if (remapper_.Contains(node.legacy_id)) {
    ++report.node_failures;
    utils::LogRecordFailure(phase, node.legacy_id, "duplicate node identifier in snapshot");
    return true;
  }

  json params = {{graph::cypher::kPropsParam, graph::PropertyMapToJson(node.properties)}};

  auto key = node.properties.find(options_.natural_key);
  const bool merge = selective && key != node.properties.end();
  if (merge) {
    params[graph::cypher::kKeyParam] = graph::PropertyValueToJson(key->second);
  }

  auto query = merge ? graph::cypher::MergeNodeOnKey(node.labels, options_.natural_key)
                     : graph::cypher::CreateNode(node.labels);
  if (!query) {
    ++report.node_failures;
    utils::LogRecordFailure(phase, node.legacy_id, query.error().message());
    return true;
  }

  auto rows = store_.ExecuteQuery(*query, params);
  if (!rows) {
    if (utils::IsConnectionError(rows.error())) {
      fatal = rows.error();
      return false;
    }
    ++report.node_failures;
    utils::LogRecordFailure(phase, node.legacy_id, rows.error().message());
    return true;
  }

  std::string new_id;
  if (!ReadNewId(*rows, new_id)) {
    ++report.node_failures;
    utils::LogRecordFailure(phase, node.legacy_id, "store returned no identifier for the node");
    return true;
  }

  if (!remapper_.Register(node.legacy_id, new_id)) {
    // Two snapshot nodes resolved to the same store node (same natural key)
    ++report.node_failures;
    utils::LogRecordFailure(phase, node.legacy_id, "node merged onto an already restored node " + new_id);
    return true;
  }

  ++report.nodes_restored;
  return true;
}

bool Restorer::RestoreRelationship(const graph::RelationshipRecord& relationship, bool selective,
                                   RestoreReport& report, Error& fatal) {
  const char* phase = RestorePhaseToString(phase_);

  auto start_id = remapper_.Resolve(relationship.start_legacy_id);
  auto end_id = remapper_.Resolve(relationship.end_legacy_id);
  if (!start_id || !end_id) {
    ++report.relationships_skipped;
    spdlog::warn("Skipping relationship {} ({}): endpoint {} was not restored", relationship.legacy_id,
                 relationship.type, start_id ? relationship.end_legacy_id : relationship.start_legacy_id);
    return true;
  }

  auto query = selective ? graph::cypher::MergeRelationship(relationship.type)
                         : graph::cypher::CreateRelationship(relationship.type);
  if (!query) {
    ++report.relationship_failures;
    utils::LogRecordFailure(phase, relationship.legacy_id, query.error().message());
    return true;
  }

  json params = {{graph::cypher::kPropsParam, graph::PropertyMapToJson(relationship.properties)},
                 {graph::cypher::kStartIdParam, *start_id},
                 {graph::cypher::kEndIdParam, *end_id}};

  auto summary = store_.ExecuteWrite(*query, params);
  if (!summary) {
    if (utils::IsConnectionError(summary.error())) {
      fatal = summary.error();
      return false;
    }
    ++report.relationship_failures;
    utils::LogRecordFailure(phase, relationship.legacy_id, summary.error().message());
    return true;
  }

  // MERGE of an existing relationship legitimately creates nothing
  if (!selective && summary->relationships_created == 0) {
    ++report.relationship_failures;
    utils::LogRecordFailure(phase, relationship.legacy_id, "store did not create the relationship");
    return true;
  }

  ++report.relationships_restored;
  return true;
}

}  // namespace graphvault::backup
