/**
 * @file cypher_builder.h
 * @brief Construction of every query the engine sends to the store
 *
 * Labels, relationship types and property keys cannot be bound as query
 * parameters, so they are interpolated into the query text. Every such
 * identifier passes IsValidIdentifier() first; values always travel as
 * bound parameters.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::graph::cypher {

using utils::Error;
using utils::Expected;

// Parameter names
constexpr const char* kPropsParam = "props";
constexpr const char* kKeyParam = "key";
constexpr const char* kStartIdParam = "start_id";
constexpr const char* kEndIdParam = "end_id";

// Result columns
constexpr const char* kPropsColumn = "props";
constexpr const char* kLabelsColumn = "labels";
constexpr const char* kNodeIdColumn = "node_id";
constexpr const char* kRelTypeColumn = "rel_type";
constexpr const char* kRelIdColumn = "rel_id";
constexpr const char* kStartIdColumn = "start_id";
constexpr const char* kEndIdColumn = "end_id";
constexpr const char* kNewIdColumn = "new_id";
constexpr const char* kCountColumn = "count";
constexpr const char* kLabelColumn = "label";

/**
 * @brief Check an identifier against ^[A-Za-z_][A-Za-z0-9_]*$
 */
bool IsValidIdentifier(std::string_view identifier);

/**
 * @brief Validate an identifier
 * @param identifier Label, relationship type or property key
 * @param kind What the identifier is (for the error message)
 * @return kCypherInvalidIdentifier if it fails the allow-list
 */
Expected<void, Error> ValidateIdentifier(std::string_view identifier, const char* kind);

/**
 * @brief Build ":A:B" from a label list
 * @return kCypherEmptyLabelSet if empty, kCypherInvalidIdentifier if any label is rejected
 */
Expected<std::string, Error> LabelExpression(const std::vector<std::string>& labels);

// Read queries
std::string MatchAllNodes();
std::string MatchAllRelationships();
std::string CountNodes();
std::string CountRelationships();
std::string CountNodesByLabel();

// Write queries
std::string DetachDeleteAll();

/**
 * @brief CREATE a node with the given labels, properties from $props; returns new_id
 */
Expected<std::string, Error> CreateNode(const std::vector<std::string>& labels);

/**
 * @brief MERGE a node on (labels, key_property = $key), overwrite properties from $props; returns new_id
 */
Expected<std::string, Error> MergeNodeOnKey(const std::vector<std::string>& labels, const std::string& key_property);

/**
 * @brief CREATE a relationship between $start_id and $end_id with properties from $props
 */
Expected<std::string, Error> CreateRelationship(const std::string& type);

/**
 * @brief MERGE a relationship keyed on (type, $start_id, $end_id), overwrite properties from $props
 */
Expected<std::string, Error> MergeRelationship(const std::string& type);

}  // namespace graphvault::graph::cypher
