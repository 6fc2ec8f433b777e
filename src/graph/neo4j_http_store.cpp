/**
 * @file neo4j_http_store.cpp
 * @brief Neo4j HTTP transactional API client
 */

#include "graph/neo4j_http_store.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "graph/property_codec.h"
#include "utils/structured_log.h"

namespace graphvault::graph {

using json = nlohmann::json;
using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpUnauthorized = 401;
constexpr int kHttpForbidden = 403;
constexpr int kMillisPerSecond = 1000;
constexpr int kMicrosPerMilli = 1000;
constexpr const char* kSecurityErrorPrefix = "Neo.ClientError.Security.";

uint64_t StatOrZero(const json& stats, const char* key) {
  if (stats.contains(key) && stats[key].is_number_integer()) {
    return stats[key].get<uint64_t>();
  }
  return 0;
}

}  // namespace

Params FlattenTimestampsForHttp(const Params& params) {
  if (params.is_object()) {
    if (params.size() == 1 && params.contains(kTimestampTag) && params[kTimestampTag].is_string()) {
      return params[kTimestampTag];
    }
    json flattened = json::object();
    for (const auto& [key, value] : params.items()) {
      flattened[key] = FlattenTimestampsForHttp(value);
    }
    return flattened;
  }
  if (params.is_array()) {
    json flattened = json::array();
    for (const auto& item : params) {
      flattened.push_back(FlattenTimestampsForHttp(item));
    }
    return flattened;
  }
  return params;
}

Neo4jHttpStore::Neo4jHttpStore(Config config) : config_(std::move(config)) {}

Neo4jHttpStore::~Neo4jHttpStore() = default;

bool Neo4jHttpStore::Connect() {
  client_ = std::make_unique<httplib::Client>(config_.uri);
  if (!client_->is_valid()) {
    last_error_ = "Invalid store URI: " + config_.uri;
    utils::LogGraphStoreError("connect", config_.uri, last_error_);
    client_.reset();
    return false;
  }

  const time_t timeout_sec = config_.timeout_ms / kMillisPerSecond;
  const time_t timeout_usec = static_cast<time_t>(config_.timeout_ms % kMillisPerSecond) * kMicrosPerMilli;
  client_->set_connection_timeout(timeout_sec, timeout_usec);
  client_->set_read_timeout(timeout_sec, timeout_usec);
  client_->set_write_timeout(timeout_sec, timeout_usec);
  if (!config_.user.empty()) {
    client_->set_basic_auth(config_.user, config_.password);
  }

  // Probe with a trivial statement so authentication problems surface here
  connected_ = true;
  auto probe = Run("RETURN 1 AS ok", json::object());
  if (!probe) {
    connected_ = false;
    last_error_ = probe.error().message();
    utils::LogGraphStoreError("connect", Describe(), last_error_);
    return false;
  }

  spdlog::info("Connected to graph store at {}", Describe());
  return true;
}

Expected<std::vector<Record>, Error> Neo4jHttpStore::ExecuteQuery(const std::string& query, const Params& params) {
  auto result = Run(query, params);
  if (!result) {
    return MakeUnexpected(result.error());
  }
  return std::move(result->rows);
}

Expected<WriteSummary, Error> Neo4jHttpStore::ExecuteWrite(const std::string& query, const Params& params) {
  auto result = Run(query, params);
  if (!result) {
    return MakeUnexpected(result.error());
  }
  return result->summary;
}

Expected<Neo4jHttpStore::StatementResult, Error> Neo4jHttpStore::Run(const std::string& query, const Params& params) {
  if (!connected_ || !client_) {
    return MakeUnexpected(MakeError(ErrorCode::kGraphStoreConnectionLost, "Not connected to " + Describe()));
  }

  json statement = {{"statement", query},
                    {"parameters", FlattenTimestampsForHttp(params.is_null() ? json::object() : params)},
                    {"includeStats", true},
                    {"resultDataContents", json::array({"row"})}};
  json body = {{"statements", json::array({statement})}};

  httplib::Headers headers = {{"Accept", "application/json"}};
  const std::string path = "/db/" + config_.database + "/tx/commit";

  auto res = client_->Post(path, headers, body.dump(), "application/json");
  if (!res) {
    connected_ = false;
    last_error_ = "HTTP request failed: " + httplib::to_string(res.error());
    utils::LogGraphStoreError("execute", Describe(), last_error_);
    return MakeUnexpected(MakeError(ErrorCode::kGraphStoreConnectionLost, last_error_, Describe()));
  }

  if (res->status == kHttpUnauthorized || res->status == kHttpForbidden) {
    last_error_ = "Authentication rejected (HTTP " + std::to_string(res->status) + ")";
    return MakeUnexpected(MakeError(ErrorCode::kGraphStoreAuthFailed, last_error_, Describe()));
  }
  if (res->status != kHttpOk) {
    last_error_ = "Unexpected HTTP status " + std::to_string(res->status);
    return MakeUnexpected(MakeError(ErrorCode::kGraphStoreQueryFailed, last_error_, Describe()));
  }

  json response;
  try {
    response = json::parse(res->body);
  } catch (const json::parse_error& e) {
    last_error_ = std::string("Malformed response body: ") + e.what();
    return MakeUnexpected(MakeError(ErrorCode::kGraphStoreInvalidResponse, last_error_, Describe()));
  }

  if (response.contains("errors") && response["errors"].is_array() && !response["errors"].empty()) {
    const auto& first = response["errors"][0];
    const std::string code = first.value("code", "");
    const std::string message = first.value("message", "unknown error");
    last_error_ = code + ": " + message;
    utils::LogQueryError(query, last_error_);
    const auto error_code = code.rfind(kSecurityErrorPrefix, 0) == 0 ? ErrorCode::kGraphStoreAuthFailed
                                                                      : ErrorCode::kGraphStoreQueryFailed;
    return MakeUnexpected(MakeError(error_code, last_error_, Describe()));
  }

  if (!response.contains("results") || !response["results"].is_array() || response["results"].empty()) {
    last_error_ = "Response carries no results";
    return MakeUnexpected(MakeError(ErrorCode::kGraphStoreInvalidResponse, last_error_, Describe()));
  }

  const auto& result = response["results"][0];
  StatementResult statement_result;

  const json columns = result.value("columns", json::array());
  for (const auto& entry : result.value("data", json::array())) {
    const auto& row = entry.value("row", json::array());
    if (row.size() != columns.size()) {
      last_error_ = "Row width does not match column count";
      return MakeUnexpected(MakeError(ErrorCode::kGraphStoreInvalidResponse, last_error_, Describe()));
    }
    Record record = json::object();
    for (size_t i = 0; i < columns.size(); ++i) {
      record[columns[i].get<std::string>()] = row[i];
    }
    statement_result.rows.push_back(std::move(record));
  }

  if (result.contains("stats")) {
    const auto& stats = result["stats"];
    statement_result.summary.nodes_created = StatOrZero(stats, "nodes_created");
    statement_result.summary.nodes_deleted = StatOrZero(stats, "nodes_deleted");
    statement_result.summary.relationships_created = StatOrZero(stats, "relationships_created");
    // Neo4j reports this counter in the singular
    statement_result.summary.relationships_deleted = StatOrZero(stats, "relationship_deleted");
    statement_result.summary.properties_set = StatOrZero(stats, "properties_set");
  }

  return statement_result;
}

}  // namespace graphvault::graph
