/**
 * @file structured_log_test.cpp
 * @brief Tests for structured logging utilities
 */

#include "utils/structured_log.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <sstream>

using namespace graphvault::utils;

/**
 * @brief Test fixture for structured logging tests
 *
 * Captures log output to a stringstream for verification.
 */
class StructuredLogTest : public ::testing::Test {
 protected:
  std::ostringstream log_stream_;
  std::shared_ptr<spdlog::logger> original_logger_;

  void SetUp() override {
    original_logger_ = spdlog::default_logger();

    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_stream_);
    auto logger = std::make_shared<spdlog::logger>("test", sink);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
  }

  void TearDown() override { spdlog::set_default_logger(original_logger_); }

  std::string GetLogOutput() {
    spdlog::default_logger()->flush();
    return log_stream_.str();
  }
};

TEST_F(StructuredLogTest, EventOnly) {
  StructuredLog().Event("snapshot_created").Info();

  std::string output = GetLogOutput();
  EXPECT_NE(output.find("\"event\":\"snapshot_created\""), std::string::npos);
  EXPECT_EQ(output.find("\"message\""), std::string::npos);
}

TEST_F(StructuredLogTest, EventAndMessage) {
  StructuredLog().Event("restore_completed").Message("Restore finished").Info();

  std::string output = GetLogOutput();
  EXPECT_NE(output.find("\"message\":\"Restore finished\""), std::string::npos);
}

TEST_F(StructuredLogTest, TypedFields) {
  StructuredLog()
      .Event("graph_extracted")
      .Field("store", std::string("http://localhost:7474/db/neo4j"))
      .Field("nodes", static_cast<uint64_t>(1200))
      .Field("delta", static_cast<int64_t>(-3))
      .Field("growth", 0.25)
      .Field("selective", true)
      .Info();

  std::string output = GetLogOutput();
  EXPECT_NE(output.find("\"store\":\"http://localhost:7474/db/neo4j\""), std::string::npos);
  EXPECT_NE(output.find("\"nodes\":1200"), std::string::npos);
  EXPECT_NE(output.find("\"delta\":-3"), std::string::npos);
  EXPECT_NE(output.find("\"growth\":0.25"), std::string::npos);
  EXPECT_NE(output.find("\"selective\":true"), std::string::npos);
}

TEST_F(StructuredLogTest, JSONEscaping) {
  StructuredLog().Event("test").Field("reason", "line1\nline2 \"quoted\" back\\slash").Info();

  std::string output = GetLogOutput();
  EXPECT_NE(output.find(R"(line1\nline2 \"quoted\" back\\slash)"), std::string::npos);
}

TEST_F(StructuredLogTest, FieldsKeepInsertionOrderAfterEvent) {
  std::string line = StructuredLog().Field("zeta", "z").Field("alpha", "a").Event("ordered").Message("m").Build();
  EXPECT_EQ(line, R"({"event":"ordered","message":"m","zeta":"z","alpha":"a"})");
}

TEST_F(StructuredLogTest, InvalidUtf8IsReplacedNotThrown) {
  std::string bad = "abc";
  bad.push_back(static_cast<char>(0xff));
  std::string line;
  EXPECT_NO_THROW(line = StructuredLog().Event("bytes").Field("raw", bad).Build());
  EXPECT_NE(line.find("\"raw\":\"abc"), std::string::npos);
  EXPECT_TRUE(nlohmann::json::accept(line));
}

TEST_F(StructuredLogTest, Levels) {
  StructuredLog().Event("e1").Error();
  StructuredLog().Event("w1").Warn();
  StructuredLog().Event("c1").Critical();

  std::string output = GetLogOutput();
  EXPECT_NE(output.find("error {\"event\":\"e1\"}"), std::string::npos);
  EXPECT_NE(output.find("warning {\"event\":\"w1\"}"), std::string::npos);
  EXPECT_NE(output.find("critical {\"event\":\"c1\"}"), std::string::npos);
}

TEST_F(StructuredLogTest, GraphStoreErrorHelper) {
  LogGraphStoreError("connect", "http://db:7474", "connection refused");

  std::string output = GetLogOutput();
  EXPECT_NE(output.find("\"event\":\"graph_store_error\""), std::string::npos);
  EXPECT_NE(output.find("\"uri\":\"http://db:7474\""), std::string::npos);
  EXPECT_NE(output.find("\"error\":\"connection refused\""), std::string::npos);
}

TEST_F(StructuredLogTest, StorageErrorHelper) {
  LogStorageError("write", "/backups/graph_snapshot_1.json", "No space left on device");

  std::string output = GetLogOutput();
  EXPECT_NE(output.find("\"event\":\"storage_error\""), std::string::npos);
  EXPECT_NE(output.find("\"filepath\":\"/backups/graph_snapshot_1.json\""), std::string::npos);
}

TEST_F(StructuredLogTest, LongQueryTruncation) {
  std::string query = "MATCH (n) WHERE " + std::string(500, 'x');
  LogQueryError(query, "syntax error");

  std::string output = GetLogOutput();
  EXPECT_NE(output.find("\"event\":\"graph_query_error\""), std::string::npos);
  EXPECT_EQ(output.find(std::string(300, 'x')), std::string::npos);
}

TEST_F(StructuredLogTest, RecordFailureIsWarning) {
  LogRecordFailure("creating_nodes", "42", "constraint violation");

  std::string output = GetLogOutput();
  EXPECT_EQ(output.rfind("warning ", 0), 0U);
  EXPECT_NE(output.find("\"legacy_id\":\"42\""), std::string::npos);
  EXPECT_NE(output.find("\"phase\":\"creating_nodes\""), std::string::npos);
}
