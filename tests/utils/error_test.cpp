/**
 * @file error_test.cpp
 * @brief Unit tests for Error class and error codes
 */

#include "utils/error.h"

#include <gtest/gtest.h>

using namespace graphvault::utils;

// ========== Test ErrorCode enum ==========

TEST(ErrorCodeTest, ErrorCodeValues) {
  EXPECT_EQ(static_cast<int>(ErrorCode::kSuccess), 0);
  EXPECT_EQ(static_cast<int>(ErrorCode::kUnknown), 1);
  EXPECT_EQ(static_cast<int>(ErrorCode::kConfigFileNotFound), 1000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kGraphStoreConnectionFailed), 2000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kCypherInvalidIdentifier), 3000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kSnapshotNotFound), 5000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kExtractionFailed), 6000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kCliUnknownCommand), 7000);
}

TEST(ErrorCodeTest, ErrorCodeToString) {
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kSuccess), "Success");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kInvalidArgument), "Invalid argument");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kConfigFileNotFound), "Configuration file not found");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kGraphStoreConnectionLost), "Graph store connection lost");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kCypherInvalidIdentifier), "Invalid identifier");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kSnapshotParseError), "Snapshot parse error");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kOperationLocked), "Another operation is in progress");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kCliMissingArgument), "Missing argument");
}

// ========== Test Error class ==========

TEST(ErrorTest, DefaultConstructor) {
  Error error;
  EXPECT_EQ(error.code(), ErrorCode::kSuccess);
  EXPECT_FALSE(error.is_error());
}

TEST(ErrorTest, CodeOnlyConstructor) {
  Error error(ErrorCode::kSnapshotNotFound);
  EXPECT_EQ(error.code(), ErrorCode::kSnapshotNotFound);
  EXPECT_EQ(error.message(), "Snapshot not found");
  EXPECT_TRUE(error.context().empty());
  EXPECT_TRUE(error.is_error());
}

TEST(ErrorTest, CodeMessageAndContext) {
  Error error(ErrorCode::kSnapshotWriteError, "rename failed", "/backups/graph_snapshot_1.json");
  EXPECT_EQ(error.message(), "rename failed");
  EXPECT_EQ(error.context(), "/backups/graph_snapshot_1.json");
}

TEST(ErrorTest, ToStringWithoutContext) {
  Error error(ErrorCode::kInvalidArgument, "bad label");
  EXPECT_EQ(error.to_string(), "[Invalid argument (2)] bad label");
}

TEST(ErrorTest, ToStringWithContext) {
  Error error(ErrorCode::kGraphStoreQueryFailed, "syntax error", "MATCH (n) RETURN n");
  EXPECT_EQ(error.to_string(), "[Graph store query failed (2002)] syntax error (context: MATCH (n) RETURN n)");
}

TEST(ErrorTest, ConversionToString) {
  Error error(ErrorCode::kTimeout, "no response");
  std::string text = error;
  EXPECT_EQ(text, error.to_string());
}

TEST(ErrorTest, WhatReturnsMessage) {
  Error error(ErrorCode::kIOError, "disk full");
  EXPECT_STREQ(error.what(), "disk full");
}

// ========== Test helpers ==========

TEST(ErrorTest, MakeErrorOverloads) {
  EXPECT_EQ(MakeError(ErrorCode::kNotFound).message(), "Not found");
  EXPECT_EQ(MakeError(ErrorCode::kNotFound, "missing").message(), "missing");
  EXPECT_EQ(MakeError(ErrorCode::kNotFound, "missing", "ctx").context(), "ctx");
}

TEST(ErrorTest, MacroAddsFileAndLine) {
  auto error = GRAPHVAULT_ERROR(ErrorCode::kInternalError, "boom");
  EXPECT_EQ(error.code(), ErrorCode::kInternalError);
  EXPECT_NE(error.context().find("error_test.cpp:"), std::string::npos);
}

TEST(ErrorTest, ConnectionErrorsAreClassified) {
  EXPECT_TRUE(IsConnectionError(MakeError(ErrorCode::kGraphStoreConnectionFailed)));
  EXPECT_TRUE(IsConnectionError(MakeError(ErrorCode::kGraphStoreConnectionLost)));
  EXPECT_TRUE(IsConnectionError(MakeError(ErrorCode::kGraphStoreAuthFailed)));
  EXPECT_FALSE(IsConnectionError(MakeError(ErrorCode::kGraphStoreQueryFailed)));
  EXPECT_FALSE(IsConnectionError(MakeError(ErrorCode::kSnapshotParseError)));
}
