/**
 * @file time_format.h
 * @brief Timestamp formatting for snapshot identities and metadata
 */

#pragma once

#include <chrono>
#include <string>

namespace graphvault::utils {

/**
 * @brief Format a snapshot identity timestamp
 *
 * Format: "YYYYMMDD_HHMMSS_ffffff" in UTC with microseconds, so that
 * lexicographic and chronological ordering coincide.
 */
std::string FormatSnapshotTimestamp(std::chrono::system_clock::time_point time_point);

/**
 * @brief Format an ISO-8601 UTC instant ("YYYY-MM-DDTHH:MM:SS.ffffffZ")
 */
std::string FormatIso8601(std::chrono::system_clock::time_point time_point);

}  // namespace graphvault::utils
