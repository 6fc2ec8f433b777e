/**
 * @file neo4j_http_store.h
 * @brief IGraphStore implementation over the Neo4j HTTP transactional API
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "graph/graph_store_interface.h"

namespace httplib {
class Client;
}  // namespace httplib

namespace graphvault::graph {

/**
 * @brief Neo4j store reached through POST /db/<database>/tx/commit
 *
 * Each statement runs in its own auto-committed transaction. Timestamp
 * parameters are sent as ISO-8601 strings since the HTTP API has no
 * temporal parameter type.
 */
class Neo4jHttpStore : public IGraphStore {
 public:
  /**
   * @brief Connection configuration
   */
  // NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers) - Default Neo4j settings
  struct Config {
    std::string uri = "http://localhost:7474";
    std::string database = "neo4j";
    std::string user = "neo4j";
    std::string password;
    int timeout_ms = 30000;
  };
  // NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

  explicit Neo4jHttpStore(Config config);
  ~Neo4jHttpStore() override;

  // Non-copyable, non-movable (owns the HTTP client)
  Neo4jHttpStore(const Neo4jHttpStore&) = delete;
  Neo4jHttpStore& operator=(const Neo4jHttpStore&) = delete;
  Neo4jHttpStore(Neo4jHttpStore&&) = delete;
  Neo4jHttpStore& operator=(Neo4jHttpStore&&) = delete;

  bool Connect() override;
  bool IsConnected() const override { return connected_; }

  utils::Expected<std::vector<Record>, utils::Error> ExecuteQuery(const std::string& query,
                                                                  const Params& params) override;
  utils::Expected<WriteSummary, utils::Error> ExecuteWrite(const std::string& query, const Params& params) override;

  std::string Describe() const override { return config_.uri + "/db/" + config_.database; }

  /**
   * @brief Get last error message
   */
  const std::string& GetLastError() const { return last_error_; }

 private:
  struct StatementResult {
    std::vector<Record> rows;
    WriteSummary summary;
  };

  utils::Expected<StatementResult, utils::Error> Run(const std::string& query, const Params& params);

  Config config_;
  std::unique_ptr<httplib::Client> client_;
  bool connected_ = false;
  std::string last_error_;
};

/**
 * @brief Replace tagged timestamps ({"$timestamp": "..."}) with their ISO-8601 text
 */
Params FlattenTimestampsForHttp(const Params& params);

}  // namespace graphvault::graph
