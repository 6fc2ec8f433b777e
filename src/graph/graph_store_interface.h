/**
 * @file graph_store_interface.h
 * @brief Abstract interface for the property-graph store
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::graph {

/// One result row, keyed by column name
using Record = nlohmann::json;

/// Bound query parameters (JSON object)
using Params = nlohmann::json;

/**
 * @brief Counters reported by a write statement
 */
struct WriteSummary {
  uint64_t nodes_created = 0;
  uint64_t nodes_deleted = 0;
  uint64_t relationships_created = 0;
  uint64_t relationships_deleted = 0;
  uint64_t properties_set = 0;
};

/**
 * @brief Abstract interface for the graph store
 *
 * The engine receives the store by reference; there is no process-wide handle.
 * Implementations report an unreachable or dropped store with
 * kGraphStoreConnectionFailed / kGraphStoreConnectionLost so callers can tell
 * fatal conditions from per-statement failures (kGraphStoreQueryFailed).
 */
class IGraphStore {
 public:
  virtual ~IGraphStore() = default;

  /**
   * @brief Connect to the store
   * @return true if connection successful
   */
  virtual bool Connect() = 0;

  /**
   * @brief Check if the store is connected
   */
  virtual bool IsConnected() const = 0;

  /**
   * @brief Run a statement that returns rows
   * @param query Query text (labels/types already validated and interpolated)
   * @param params Bound parameters
   */
  virtual utils::Expected<std::vector<Record>, utils::Error> ExecuteQuery(const std::string& query,
                                                                          const Params& params) = 0;

  /**
   * @brief Run a statement for its side effects
   * @return Counters of what the statement changed
   */
  virtual utils::Expected<WriteSummary, utils::Error> ExecuteWrite(const std::string& query,
                                                                   const Params& params) = 0;

  /**
   * @brief Short description for logs (e.g. endpoint URI)
   */
  virtual std::string Describe() const = 0;
};

/**
 * @brief Connect the store if it is not connected yet
 * @return kGraphStoreConnectionFailed if the store cannot be reached
 */
inline utils::Expected<void, utils::Error> EnsureConnected(IGraphStore& store) {
  if (store.IsConnected() || store.Connect()) {
    return {};
  }
  return utils::MakeUnexpected(
      utils::MakeError(utils::ErrorCode::kGraphStoreConnectionFailed, "Cannot connect to graph store", store.Describe()));
}

}  // namespace graphvault::graph
