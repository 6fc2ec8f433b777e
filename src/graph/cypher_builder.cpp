/**
 * @file cypher_builder.cpp
 * @brief Query construction with validated identifier interpolation
 */

#include "graph/cypher_builder.h"

#include <sstream>

namespace graphvault::graph::cypher {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

bool IsIdentifierStart(char chr) {
  return (chr >= 'A' && chr <= 'Z') || (chr >= 'a' && chr <= 'z') || chr == '_';
}

bool IsIdentifierPart(char chr) {
  return IsIdentifierStart(chr) || (chr >= '0' && chr <= '9');
}

std::string RelationshipStatement(const char* verb, const std::string& type) {
  std::ostringstream query;
  query << "MATCH (a), (b) WHERE elementId(a) = $" << kStartIdParam << " AND elementId(b) = $" << kEndIdParam << " "
        << verb << " (a)-[r:" << type << "]->(b) SET r = $" << kPropsParam;
  return query.str();
}

}  // namespace

bool IsValidIdentifier(std::string_view identifier) {
  if (identifier.empty() || !IsIdentifierStart(identifier.front())) {
    return false;
  }
  for (char chr : identifier) {
    if (!IsIdentifierPart(chr)) {
      return false;
    }
  }
  return true;
}

Expected<void, Error> ValidateIdentifier(std::string_view identifier, const char* kind) {
  if (!IsValidIdentifier(identifier)) {
    return MakeUnexpected(MakeError(ErrorCode::kCypherInvalidIdentifier,
                                    std::string("Invalid ") + kind + " '" + std::string(identifier) +
                                        "' (allowed: letters, digits, underscore; must not start with a digit)"));
  }
  return {};
}

Expected<std::string, Error> LabelExpression(const std::vector<std::string>& labels) {
  if (labels.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kCypherEmptyLabelSet, "Node has no labels"));
  }
  std::string expression;
  for (const auto& label : labels) {
    auto valid = ValidateIdentifier(label, "label");
    if (!valid) {
      return MakeUnexpected(valid.error());
    }
    expression += ":" + label;
  }
  return expression;
}

std::string MatchAllNodes() {
  std::ostringstream query;
  query << "MATCH (n) RETURN properties(n) AS " << kPropsColumn << ", labels(n) AS " << kLabelsColumn
        << ", elementId(n) AS " << kNodeIdColumn;
  return query.str();
}

std::string MatchAllRelationships() {
  std::ostringstream query;
  query << "MATCH (a)-[r]->(b) RETURN properties(r) AS " << kPropsColumn << ", type(r) AS " << kRelTypeColumn
        << ", elementId(r) AS " << kRelIdColumn << ", elementId(a) AS " << kStartIdColumn << ", elementId(b) AS "
        << kEndIdColumn;
  return query.str();
}

std::string CountNodes() {
  return std::string("MATCH (n) RETURN count(n) AS ") + kCountColumn;
}

std::string CountRelationships() {
  return std::string("MATCH ()-[r]->() RETURN count(r) AS ") + kCountColumn;
}

std::string CountNodesByLabel() {
  std::ostringstream query;
  query << "MATCH (n) UNWIND labels(n) AS " << kLabelColumn << " RETURN " << kLabelColumn << ", count(*) AS "
        << kCountColumn;
  return query.str();
}

std::string DetachDeleteAll() {
  return "MATCH (n) DETACH DELETE n";
}

Expected<std::string, Error> CreateNode(const std::vector<std::string>& labels) {
  auto label_expr = LabelExpression(labels);
  if (!label_expr) {
    return MakeUnexpected(label_expr.error());
  }
  std::ostringstream query;
  query << "CREATE (n" << *label_expr << ") SET n = $" << kPropsParam << " RETURN elementId(n) AS " << kNewIdColumn;
  return query.str();
}

Expected<std::string, Error> MergeNodeOnKey(const std::vector<std::string>& labels, const std::string& key_property) {
  auto label_expr = LabelExpression(labels);
  if (!label_expr) {
    return MakeUnexpected(label_expr.error());
  }
  auto valid_key = ValidateIdentifier(key_property, "property key");
  if (!valid_key) {
    return MakeUnexpected(valid_key.error());
  }
  std::ostringstream query;
  query << "MERGE (n" << *label_expr << " {" << key_property << ": $" << kKeyParam << "}) SET n = $" << kPropsParam
        << " RETURN elementId(n) AS " << kNewIdColumn;
  return query.str();
}

Expected<std::string, Error> CreateRelationship(const std::string& type) {
  auto valid = ValidateIdentifier(type, "relationship type");
  if (!valid) {
    return MakeUnexpected(valid.error());
  }
  return RelationshipStatement("CREATE", type);
}

Expected<std::string, Error> MergeRelationship(const std::string& type) {
  auto valid = ValidateIdentifier(type, "relationship type");
  if (!valid) {
    return MakeUnexpected(valid.error());
  }
  return RelationshipStatement("MERGE", type);
}

}  // namespace graphvault::graph::cypher
