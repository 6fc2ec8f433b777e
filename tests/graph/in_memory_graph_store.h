/**
 * @file in_memory_graph_store.h
 * @brief In-memory IGraphStore that understands the statements the engine issues
 */

#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "graph/cypher_builder.h"
#include "graph/graph_store_interface.h"

namespace graphvault {
namespace graph {
namespace testing {

/**
 * @brief Fake store keeping nodes and relationships in memory
 *
 * Recognizes exactly the statement shapes produced by cypher_builder and
 * rejects anything else with kGraphStoreQueryFailed. Element ids are
 * "n<k>" / "r<k>" and are never reused, so a restored node always gets a
 * different id than the node it was extracted from.
 */
class InMemoryGraphStore : public IGraphStore {
 public:
  struct Node {
    std::string id;
    std::vector<std::string> labels;
    nlohmann::json properties = nlohmann::json::object();
  };

  struct Relationship {
    std::string id;
    std::string type;
    std::string start_id;
    std::string end_id;
    nlohmann::json properties = nlohmann::json::object();
  };

  // ========== Test setup ==========

  std::string AddNode(std::vector<std::string> labels, nlohmann::json properties = nlohmann::json::object()) {
    Node node;
    node.id = "n" + std::to_string(next_node_id_++);
    node.labels = std::move(labels);
    node.properties = std::move(properties);
    nodes_.push_back(node);
    return node.id;
  }

  std::string AddRelationship(const std::string& type, const std::string& start_id, const std::string& end_id,
                              nlohmann::json properties = nlohmann::json::object()) {
    Relationship relationship;
    relationship.id = "r" + std::to_string(next_relationship_id_++);
    relationship.type = type;
    relationship.start_id = start_id;
    relationship.end_id = end_id;
    relationship.properties = std::move(properties);
    relationships_.push_back(relationship);
    return relationship.id;
  }

  /**
   * @brief Make Connect() fail
   */
  void SetReachable(bool reachable) {
    reachable_ = reachable;
    if (!reachable) {
      connected_ = false;
    }
  }

  /**
   * @brief Drop the connection after the given number of further statements
   */
  void DisconnectAfter(size_t statements) { statements_until_disconnect_ = statements; }

  /**
   * @brief Reject node statements whose properties have key == value
   */
  void RejectNodesWhere(const std::string& key, nlohmann::json value) {
    reject_key_ = key;
    reject_value_ = std::move(value);
  }

  // ========== Inspection ==========

  const std::vector<Node>& Nodes() const { return nodes_; }
  const std::vector<Relationship>& Relationships() const { return relationships_; }
  const std::vector<std::string>& ExecutedStatements() const { return executed_; }

  std::vector<Node> NodesWithLabel(const std::string& label) const {
    std::vector<Node> result;
    for (const auto& node : nodes_) {
      if (HasLabel(node, label)) {
        result.push_back(node);
      }
    }
    return result;
  }

  std::optional<Node> FindNode(const std::string& label, const std::string& key, const nlohmann::json& value) const {
    for (const auto& node : nodes_) {
      if (HasLabel(node, label) && node.properties.contains(key) && node.properties[key] == value) {
        return node;
      }
    }
    return std::nullopt;
  }

  const Node* NodeById(const std::string& id) const {
    auto found = std::find_if(nodes_.begin(), nodes_.end(), [&id](const Node& node) { return node.id == id; });
    return found == nodes_.end() ? nullptr : &*found;
  }

  // ========== IGraphStore ==========

  bool Connect() override {
    connected_ = reachable_;
    return connected_;
  }

  bool IsConnected() const override { return connected_; }

  utils::Expected<std::vector<Record>, utils::Error> ExecuteQuery(const std::string& query,
                                                                  const Params& params) override {
    auto admitted = Admit(query);
    if (!admitted) {
      return utils::MakeUnexpected(admitted.error());
    }

    if (query == cypher::MatchAllNodes()) {
      std::vector<Record> rows;
      for (const auto& node : nodes_) {
        rows.push_back({{cypher::kPropsColumn, node.properties},
                        {cypher::kLabelsColumn, node.labels},
                        {cypher::kNodeIdColumn, node.id}});
      }
      return rows;
    }
    if (query == cypher::MatchAllRelationships()) {
      std::vector<Record> rows;
      for (const auto& relationship : relationships_) {
        rows.push_back({{cypher::kPropsColumn, relationship.properties},
                        {cypher::kRelTypeColumn, relationship.type},
                        {cypher::kRelIdColumn, relationship.id},
                        {cypher::kStartIdColumn, relationship.start_id},
                        {cypher::kEndIdColumn, relationship.end_id}});
      }
      return rows;
    }
    if (query == cypher::CountNodes()) {
      return std::vector<Record>{Record{{cypher::kCountColumn, nodes_.size()}}};
    }
    if (query == cypher::CountRelationships()) {
      return std::vector<Record>{Record{{cypher::kCountColumn, relationships_.size()}}};
    }
    if (query == cypher::CountNodesByLabel()) {
      std::map<std::string, uint64_t> counts;
      for (const auto& node : nodes_) {
        for (const auto& label : node.labels) {
          ++counts[label];
        }
      }
      std::vector<Record> rows;
      for (const auto& [label, count] : counts) {
        rows.push_back({{cypher::kLabelColumn, label}, {cypher::kCountColumn, count}});
      }
      return rows;
    }

    static const std::regex kCreateNode(R"(^CREATE \(n((?::\w+)+)\) SET n = \$props RETURN elementId\(n\) AS new_id$)");
    static const std::regex kMergeNode(
        R"(^MERGE \(n((?::\w+)+) \{(\w+): \$key\}\) SET n = \$props RETURN elementId\(n\) AS new_id$)");
    std::smatch match;
    if (std::regex_match(query, match, kCreateNode)) {
      if (IsRejected(params)) {
        return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGraphStoreQueryFailed, "Constraint violation"));
      }
      auto id = AddNode(SplitLabels(match[1].str()), params.at(cypher::kPropsParam));
      return std::vector<Record>{Record{{cypher::kNewIdColumn, id}}};
    }
    if (std::regex_match(query, match, kMergeNode)) {
      if (IsRejected(params)) {
        return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGraphStoreQueryFailed, "Constraint violation"));
      }
      auto labels = SplitLabels(match[1].str());
      const std::string key = match[2].str();
      const auto& key_value = params.at(cypher::kKeyParam);
      for (auto& node : nodes_) {
        if (HasAllLabels(node, labels) && node.properties.contains(key) && node.properties[key] == key_value) {
          node.properties = params.at(cypher::kPropsParam);
          return std::vector<Record>{Record{{cypher::kNewIdColumn, node.id}}};
        }
      }
      auto id = AddNode(labels, params.at(cypher::kPropsParam));
      return std::vector<Record>{Record{{cypher::kNewIdColumn, id}}};
    }

    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGraphStoreQueryFailed, "Unsupported query", query));
  }

  utils::Expected<WriteSummary, utils::Error> ExecuteWrite(const std::string& query, const Params& params) override {
    auto admitted = Admit(query);
    if (!admitted) {
      return utils::MakeUnexpected(admitted.error());
    }

    WriteSummary summary;
    if (query == cypher::DetachDeleteAll()) {
      summary.nodes_deleted = nodes_.size();
      summary.relationships_deleted = relationships_.size();
      nodes_.clear();
      relationships_.clear();
      return summary;
    }

    static const std::regex kRelationship(
        R"(^MATCH \(a\), \(b\) WHERE elementId\(a\) = \$start_id AND elementId\(b\) = \$end_id (CREATE|MERGE) )"
        R"(\(a\)-\[r:(\w+)\]->\(b\) SET r = \$props$)");
    std::smatch match;
    if (std::regex_match(query, match, kRelationship)) {
      const bool merge = match[1].str() == "MERGE";
      const std::string type = match[2].str();
      const auto start_id = params.at(cypher::kStartIdParam).get<std::string>();
      const auto end_id = params.at(cypher::kEndIdParam).get<std::string>();
      if (NodeById(start_id) == nullptr || NodeById(end_id) == nullptr) {
        return summary;  // MATCH found nothing
      }
      if (merge) {
        for (auto& relationship : relationships_) {
          if (relationship.type == type && relationship.start_id == start_id && relationship.end_id == end_id) {
            relationship.properties = params.at(cypher::kPropsParam);
            summary.properties_set = relationship.properties.size();
            return summary;
          }
        }
      }
      AddRelationship(type, start_id, end_id, params.at(cypher::kPropsParam));
      summary.relationships_created = 1;
      summary.properties_set = params.at(cypher::kPropsParam).size();
      return summary;
    }

    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGraphStoreQueryFailed, "Unsupported query", query));
  }

  std::string Describe() const override { return "memory://test"; }

 private:
  std::vector<Node> nodes_;
  std::vector<Relationship> relationships_;
  std::vector<std::string> executed_;
  size_t next_node_id_ = 0;
  size_t next_relationship_id_ = 0;
  bool reachable_ = true;
  bool connected_ = false;
  std::optional<size_t> statements_until_disconnect_;
  std::string reject_key_;
  nlohmann::json reject_value_;

  utils::Expected<void, utils::Error> Admit(const std::string& query) {
    if (!connected_) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGraphStoreConnectionLost, "Not connected"));
    }
    if (statements_until_disconnect_) {
      if (*statements_until_disconnect_ == 0) {
        connected_ = false;
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kGraphStoreConnectionLost, "Connection reset by peer"));
      }
      --*statements_until_disconnect_;
    }
    executed_.push_back(query);
    return {};
  }

  bool IsRejected(const Params& params) const {
    if (reject_key_.empty()) {
      return false;
    }
    const auto& props = params.at(cypher::kPropsParam);
    return props.contains(reject_key_) && props[reject_key_] == reject_value_;
  }

  static bool HasLabel(const Node& node, const std::string& label) {
    return std::find(node.labels.begin(), node.labels.end(), label) != node.labels.end();
  }

  static bool HasAllLabels(const Node& node, const std::vector<std::string>& labels) {
    return std::all_of(labels.begin(), labels.end(), [&node](const std::string& label) { return HasLabel(node, label); });
  }

  static std::vector<std::string> SplitLabels(const std::string& expression) {
    std::vector<std::string> labels;
    size_t pos = 0;
    while (pos < expression.size()) {
      size_t next = expression.find(':', pos + 1);
      labels.push_back(expression.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1));
      pos = next == std::string::npos ? expression.size() : next;
    }
    return labels;
  }
};

}  // namespace testing
}  // namespace graph
}  // namespace graphvault
