/**
 * @file change_detector.cpp
 * @brief Snapshot decision from before/after counts
 */

#include "backup/change_detector.h"

namespace graphvault::backup {

namespace {

/**
 * @brief Growth check for one counter; shrinkage is never significant
 */
bool GrewSignificantly(uint64_t current, uint64_t previous, uint64_t min_absolute, double percent_growth) {
  if (current < previous) {
    return false;
  }
  const uint64_t delta = current - previous;
  if (delta >= min_absolute) {
    return true;
  }
  if (previous > 0) {
    const double ratio = static_cast<double>(delta) / static_cast<double>(previous);
    return ratio >= percent_growth;
  }
  return false;
}

}  // namespace

bool ShouldBackup(const graph::GraphStatistics& current, const std::optional<graph::GraphStatistics>& last,
                  const ChangeThresholds& thresholds) {
  if (!last.has_value()) {
    return true;
  }
  return GrewSignificantly(current.node_count, last->node_count, thresholds.min_new_nodes,
                           thresholds.percent_growth) ||
         GrewSignificantly(current.relationship_count, last->relationship_count, thresholds.min_new_relationships,
                           thresholds.percent_growth);
}

}  // namespace graphvault::backup
