/**
 * @file neo4j_http_store_test.cpp
 * @brief Neo4jHttpStore tests against an in-process HTTP endpoint
 */

#include "graph/neo4j_http_store.h"

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using json = nlohmann::json;
using graphvault::utils::ErrorCode;

namespace graphvault {
namespace graph {

/**
 * @brief Serves POST /db/neo4j/tx/commit with a scripted response
 */
class Neo4jHttpStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_.Post("/db/neo4j/tx/commit", [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard<std::mutex> lock(mutex_);
      auto body = json::parse(req.body);
      const auto& statement = body["statements"][0];
      statements_.push_back(statement);
      authorization_ = req.get_header_value("Authorization");

      // Connection probe always succeeds unless auth is being rejected
      if (statement["statement"] == "RETURN 1 AS ok" && status_ == 200) {
        res.set_content(R"({"results":[{"columns":["ok"],"data":[{"row":[1]}]}],"errors":[]})", "application/json");
        return;
      }
      res.status = status_;
      res.set_content(response_.dump(), "application/json");
    });

    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    for (int i = 0; i < 100 && !server_.is_running(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  Neo4jHttpStore::Config MakeConfig() const {
    Neo4jHttpStore::Config config;
    config.uri = "http://127.0.0.1:" + std::to_string(port_);
    config.user = "neo4j";
    config.password = "secret";
    config.timeout_ms = 2000;
    return config;
  }

  void Respond(int status, json response) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
    response_ = std::move(response);
  }

  json LastStatement() {
    std::lock_guard<std::mutex> lock(mutex_);
    return statements_.empty() ? json() : statements_.back();
  }

  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;

  std::mutex mutex_;
  int status_ = 200;
  json response_ = json::object();
  std::vector<json> statements_;
  std::string authorization_;
};

TEST_F(Neo4jHttpStoreTest, ConnectProbesWithBasicAuth) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());
  EXPECT_TRUE(store.IsConnected());
  EXPECT_EQ(LastStatement()["statement"], "RETURN 1 AS ok");

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(authorization_.rfind("Basic ", 0), 0U);
}

TEST_F(Neo4jHttpStoreTest, QueryRowsAreKeyedByColumn) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());

  Respond(200, json::parse(R"({"results":[{"columns":["props","labels","node_id"],
      "data":[{"row":[{"name":"Alice"},["User"],"4:abc:0"]},{"row":[{},["Order"],"4:abc:1"]}]}],"errors":[]})"));

  auto rows = store.ExecuteQuery("MATCH (n) RETURN n", json::object());
  ASSERT_TRUE(rows) << rows.error().to_string();
  ASSERT_EQ(rows->size(), 2U);
  EXPECT_EQ((*rows)[0]["props"]["name"], "Alice");
  EXPECT_EQ((*rows)[0]["labels"][0], "User");
  EXPECT_EQ((*rows)[1]["node_id"], "4:abc:1");
}

TEST_F(Neo4jHttpStoreTest, WriteReportsCounters) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());

  Respond(200, json::parse(R"({"results":[{"columns":[],"data":[],
      "stats":{"nodes_deleted":3,"relationship_deleted":2,"relationships_created":1,"properties_set":4}}],"errors":[]})"));

  auto summary = store.ExecuteWrite("MATCH (n) DETACH DELETE n", json::object());
  ASSERT_TRUE(summary) << summary.error().to_string();
  EXPECT_EQ(summary->nodes_deleted, 3U);
  EXPECT_EQ(summary->relationships_deleted, 2U);
  EXPECT_EQ(summary->relationships_created, 1U);
  EXPECT_EQ(summary->properties_set, 4U);
}

TEST_F(Neo4jHttpStoreTest, ParametersAreSentWithTimestampsFlattened) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());
  Respond(200, json::parse(R"({"results":[{"columns":[],"data":[]}],"errors":[]})"));

  json params = {{"props", {{"name", "Alice"}, {"joined", {{"$timestamp", "2024-01-01T00:00:00Z"}}}}}};
  ASSERT_TRUE(store.ExecuteWrite("CREATE (n:User) SET n = $props", params));

  auto sent = LastStatement();
  EXPECT_EQ(sent["parameters"]["props"]["name"], "Alice");
  EXPECT_EQ(sent["parameters"]["props"]["joined"], "2024-01-01T00:00:00Z");
  EXPECT_TRUE(sent["includeStats"].get<bool>());
}

TEST_F(Neo4jHttpStoreTest, StatementErrorIsQueryFailure) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());
  Respond(200, json::parse(
                   R"({"results":[],"errors":[{"code":"Neo.ClientError.Statement.SyntaxError","message":"bad"}]})"));

  auto rows = store.ExecuteQuery("MATCH (n RETURN n", json::object());
  ASSERT_FALSE(rows);
  EXPECT_EQ(rows.error().code(), ErrorCode::kGraphStoreQueryFailed);
  EXPECT_NE(rows.error().message().find("SyntaxError"), std::string::npos);
  EXPECT_TRUE(store.IsConnected());
}

TEST_F(Neo4jHttpStoreTest, SecurityErrorIsAuthFailure) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());
  Respond(200, json::parse(
                   R"({"results":[],"errors":[{"code":"Neo.ClientError.Security.Forbidden","message":"no"}]})"));

  auto rows = store.ExecuteQuery("MATCH (n) RETURN n", json::object());
  ASSERT_FALSE(rows);
  EXPECT_EQ(rows.error().code(), ErrorCode::kGraphStoreAuthFailed);
}

TEST_F(Neo4jHttpStoreTest, UnauthorizedProbeFailsConnect) {
  Respond(401, json::object());
  Neo4jHttpStore store(MakeConfig());
  EXPECT_FALSE(store.Connect());
  EXPECT_FALSE(store.IsConnected());
  EXPECT_NE(store.GetLastError().find("401"), std::string::npos);
}

TEST_F(Neo4jHttpStoreTest, MalformedBodyIsInvalidResponse) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());
  Respond(200, json("not an object"));

  auto rows = store.ExecuteQuery("MATCH (n) RETURN n", json::object());
  ASSERT_FALSE(rows);
  EXPECT_EQ(rows.error().code(), ErrorCode::kGraphStoreInvalidResponse);
}

TEST_F(Neo4jHttpStoreTest, QueryBeforeConnectIsConnectionLost) {
  Neo4jHttpStore store(MakeConfig());
  auto rows = store.ExecuteQuery("RETURN 1", json::object());
  ASSERT_FALSE(rows);
  EXPECT_EQ(rows.error().code(), ErrorCode::kGraphStoreConnectionLost);
}

TEST_F(Neo4jHttpStoreTest, ServerGoneIsConnectionLost) {
  Neo4jHttpStore store(MakeConfig());
  ASSERT_TRUE(store.Connect());

  server_.stop();
  thread_.join();

  auto rows = store.ExecuteQuery("MATCH (n) RETURN n", json::object());
  ASSERT_FALSE(rows);
  EXPECT_EQ(rows.error().code(), ErrorCode::kGraphStoreConnectionLost);
  EXPECT_FALSE(store.IsConnected());
  EXPECT_TRUE(IsConnectionError(rows.error()));
}

TEST(FlattenTimestampsTest, LeavesOtherObjectsAlone) {
  json params = {{"props", {{"tags", json::array({{{"$timestamp", "t1"}}, "plain"})}, {"$timestamp", 5}}}};
  auto flattened = FlattenTimestampsForHttp(params);
  EXPECT_EQ(flattened["props"]["tags"][0], "t1");
  EXPECT_EQ(flattened["props"]["tags"][1], "plain");
  EXPECT_EQ(flattened["props"]["$timestamp"], 5);
}

TEST(Neo4jHttpStoreDescribeTest, DescribesEndpointAndDatabase) {
  Neo4jHttpStore::Config config;
  config.uri = "http://graph:7474";
  config.database = "sales";
  Neo4jHttpStore store(config);
  EXPECT_EQ(store.Describe(), "http://graph:7474/db/sales");
}

}  // namespace graph
}  // namespace graphvault
