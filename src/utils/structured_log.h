/**
 * @file structured_log.h
 * @brief JSON-lines event logging on top of spdlog
 */

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace graphvault::utils {

/**
 * @brief One-line JSON log record built field by field
 *
 * Keys appear in the order they were added, after "event" and "message".
 * Numbers and booleans keep their JSON type; strings that are not valid
 * UTF-8 are written with replacement characters instead of throwing.
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("restore_node_failed")
 *   .Field("phase", "creating_nodes")
 *   .Field("legacy_id", node.legacy_id)
 *   .Field("error", error.message())
 *   .Warn();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, std::string_view value) {
    fields_[key] = std::string(value);
    return *this;
  }

  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, double value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, bool value) {
    fields_[key] = value;
    return *this;
  }

  /**
   * @brief Human-readable context, emitted right after the event name
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() const { spdlog::error("{}", Build()); }
  void Warn() const { spdlog::warn("{}", Build()); }
  void Info() const { spdlog::info("{}", Build()); }
  void Critical() const { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the record as compact JSON
   */
  std::string Build() const {
    nlohmann::ordered_json record = nlohmann::ordered_json::object();
    if (!event_.empty()) {
      record["event"] = event_;
    }
    if (!message_.empty()) {
      record["message"] = message_;
    }
    for (const auto& [key, value] : fields_.items()) {
      record[key] = value;
    }
    return record.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  }

 private:
  std::string event_;
  std::string message_;
  nlohmann::ordered_json fields_ = nlohmann::ordered_json::object();
};

/**
 * @brief Log graph store error in structured format
 */
inline void LogGraphStoreError(const std::string& operation, const std::string& uri, const std::string& error_msg) {
  StructuredLog()
      .Event("graph_store_error")
      .Field("operation", operation)
      .Field("uri", uri)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log query error in structured format
 */
inline void LogQueryError(const std::string& query, const std::string& error_msg) {
  // Maximum query length to log (prevent log spam)
  constexpr size_t kMaxQueryLogLength = 200;

  StructuredLog()
      .Event("graph_query_error")
      .Field("query", query.substr(0, kMaxQueryLogLength))
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a single node/relationship that could not be restored (recovered, not fatal)
 */
inline void LogRecordFailure(const std::string& phase, const std::string& legacy_id, const std::string& error_msg) {
  StructuredLog()
      .Event("restore_record_failed")
      .Field("phase", phase)
      .Field("legacy_id", legacy_id)
      .Field("error", error_msg)
      .Warn();
}

}  // namespace graphvault::utils
