/**
 * @file property_codec.h
 * @brief JSON encoding of property values
 *
 * Scalars map to JSON scalars. Timestamps are tagged objects:
 *   {"$timestamp": "2025-06-23T19:04:59.000000Z"}
 * Any other JSON object, null, or nested array in a property position is rejected.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "graph/graph_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::graph {

using utils::Error;
using utils::Expected;

// Key of the tagged timestamp object
constexpr const char* kTimestampTag = "$timestamp";

nlohmann::json PropertyValueToJson(const PropertyValue& value);

/**
 * @brief Decode a property value
 * @param value JSON value
 * @param key Property name (for error messages)
 * @return PropertyValue or kSnapshotUnsupportedValue
 */
Expected<PropertyValue, Error> PropertyValueFromJson(const nlohmann::json& value, const std::string& key = "");

nlohmann::json PropertyMapToJson(const PropertyMap& properties);

/**
 * @brief Decode a JSON object into a property map
 * @return PropertyMap, or kSnapshotUnsupportedValue naming the offending key
 */
Expected<PropertyMap, Error> PropertyMapFromJson(const nlohmann::json& object);

}  // namespace graphvault::graph
