/**
 * @file graph_types.h
 * @brief Property graph data model shared by extraction, snapshots and restore
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace graphvault::graph {

/**
 * @brief Temporal property value (ISO-8601 text)
 *
 * Kept distinct from plain strings so a snapshot can tell the store
 * which properties were temporal at extraction time.
 */
struct Timestamp {
  std::string iso8601;

  bool operator==(const Timestamp& other) const { return iso8601 == other.iso8601; }
  bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

/**
 * @brief Scalar property value
 */
using ScalarValue = std::variant<std::string, int64_t, double, bool, Timestamp>;

/**
 * @brief Homogeneous or mixed list of scalars (nested lists are not representable)
 */
using ScalarList = std::vector<ScalarValue>;

/**
 * @brief Property value: a scalar or a list of scalars
 *
 * Nested maps are not representable, mirroring what the store accepts as property values.
 */
using PropertyValue = std::variant<std::string, int64_t, double, bool, Timestamp, ScalarList>;

/**
 * @brief Property map (ordered for deterministic serialization)
 */
using PropertyMap = std::map<std::string, PropertyValue>;

/**
 * @brief A node as extracted from the store
 */
struct NodeRecord {
  std::string legacy_id;            // Store-assigned identifier at extraction time
  std::vector<std::string> labels;  // Never empty
  PropertyMap properties;
};

/**
 * @brief A directed, typed relationship as extracted from the store
 */
struct RelationshipRecord {
  std::string legacy_id;
  std::string type;
  std::string start_legacy_id;
  std::string end_legacy_id;
  PropertyMap properties;
};

/**
 * @brief Summary statistics of a graph
 */
struct GraphStatistics {
  uint64_t node_count = 0;
  uint64_t relationship_count = 0;
  std::optional<std::map<std::string, uint64_t>> label_counts;
};

/**
 * @brief Complete in-memory export of a graph
 */
struct GraphSnapshotPayload {
  std::vector<NodeRecord> nodes;
  std::vector<RelationshipRecord> relationships;
  GraphStatistics statistics;
};

}  // namespace graphvault::graph
