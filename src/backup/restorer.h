/**
 * @file restorer.h
 * @brief Rebuilds the graph from a snapshot (full replace or selective merge)
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

#include "backup/identity_remapper.h"
#include "graph/graph_store_interface.h"
#include "graph/graph_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::backup {

/**
 * @brief Restore state machine
 *
 * Idle -> Validating -> Clearing -> CreatingNodes -> CreatingRelationships -> Done
 * Any fatal error moves to Failed. Selective restore skips Clearing.
 */
enum class RestorePhase : uint8_t {
  kIdle,
  kValidating,
  kClearing,
  kCreatingNodes,
  kCreatingRelationships,
  kDone,
  kFailed,
};

const char* RestorePhaseToString(RestorePhase phase);

/**
 * @brief Counters of a completed restore
 */
struct RestoreReport {
  std::string snapshot;  // Snapshot timestamp
  uint64_t nodes_restored = 0;
  uint64_t nodes_preserved = 0;  // Selective restore only
  uint64_t node_failures = 0;
  uint64_t relationships_restored = 0;
  uint64_t relationships_skipped = 0;  // Endpoint not restored in this pass
  uint64_t relationship_failures = 0;
  RestorePhase phase = RestorePhase::kIdle;
};

struct RestoreOptions {
  std::string natural_key = "name";  // Property used to upsert in selective restore
};

/**
 * @brief Restores snapshots into a graph store
 *
 * Per-record failures (invalid label, statement rejected by the store,
 * conflicting identifiers) are logged and counted; only losing the store
 * connection aborts a pass. A full restore that aborts after Clearing leaves
 * the store partially populated; the snapshot file is never modified.
 */
class Restorer {
 public:
  explicit Restorer(graph::IGraphStore& store, RestoreOptions options = RestoreOptions());

  /**
   * @brief Delete everything in the store, then recreate the snapshot's graph
   * @return kSnapshotNotFound / kSnapshotParseError from Validating,
   *         the store error if Clearing fails or the connection is lost
   */
  utils::Expected<RestoreReport, utils::Error> RestoreFull(const std::filesystem::path& snapshot_path);

  /**
   * @brief Upsert the snapshot's nodes except those carrying a preserved label
   *
   * Nodes with the natural key are merged on (labels, key); nodes without it
   * are created on every run. Relationships are merged on (type, start, end).
   */
  utils::Expected<RestoreReport, utils::Error> RestoreSelective(const std::filesystem::path& snapshot_path,
                                                                const std::set<std::string>& preserve_labels);

  [[nodiscard]] RestorePhase GetPhase() const { return phase_; }

 private:
  graph::IGraphStore& store_;
  RestoreOptions options_;
  IdentityRemapper remapper_;
  RestorePhase phase_ = RestorePhase::kIdle;

  utils::Expected<RestoreReport, utils::Error> Run(const std::filesystem::path& snapshot_path, bool selective,
                                                   const std::set<std::string>& preserve_labels);

  /**
   * @brief Create or merge one node
   * @return false with fatal set if the pass must abort
   */
  bool RestoreNode(const graph::NodeRecord& node, bool selective, RestoreReport& report, utils::Error& fatal);

  bool RestoreRelationship(const graph::RelationshipRecord& relationship, bool selective, RestoreReport& report,
                           utils::Error& fatal);

  utils::Error Abort(const utils::Error& cause, const RestoreReport& report);
};

}  // namespace graphvault::backup
