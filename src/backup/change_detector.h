/**
 * @file change_detector.h
 * @brief Decides whether the graph changed enough to warrant a new snapshot
 */

#pragma once

#include <cstdint>
#include <optional>

#include "graph/graph_types.h"

namespace graphvault::backup {

/**
 * @brief Growth thresholds for automatic snapshots
 */
struct ChangeThresholds {
  uint64_t min_new_nodes = 50;           // Absolute node growth
  uint64_t min_new_relationships = 100;  // Absolute relationship growth
  double percent_growth = 0.10;          // Relative growth (0.10 = 10%)
};

/**
 * @brief Snapshot decision from current and last-snapshot counts
 *
 * - No previous snapshot: always true
 * - True when node or relationship growth reaches the absolute threshold
 * - True when growth relative to a non-zero previous count reaches percent_growth
 * - Shrinkage never triggers
 *
 * Deterministic and free of side effects.
 */
bool ShouldBackup(const graph::GraphStatistics& current, const std::optional<graph::GraphStatistics>& last,
                  const ChangeThresholds& thresholds);

}  // namespace graphvault::backup
