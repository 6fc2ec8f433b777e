/**
 * @file extractor.h
 * @brief Reads the whole graph out of the store
 */

#pragma once

#include "graph/graph_store_interface.h"
#include "graph/graph_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::backup {

/**
 * @brief Read every node and relationship into a payload
 *
 * Statistics (including per-label counts) are computed from the result sets
 * so they always agree with the payload. All-or-nothing: a malformed row or
 * an unsupported property value fails the whole extraction.
 *
 * @return kGraphStoreConnectionFailed/Lost if the store is unreachable,
 *         kExtractionFailed otherwise
 */
utils::Expected<graph::GraphSnapshotPayload, utils::Error> ExtractAll(graph::IGraphStore& store);

/**
 * @brief Current counts via count queries (no full scan)
 */
utils::Expected<graph::GraphStatistics, utils::Error> CollectStatistics(graph::IGraphStore& store);

}  // namespace graphvault::backup
