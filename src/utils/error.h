/**
 * @file error.h
 * @brief Error codes and Error value type used with Expected<T, Error>
 */

#pragma once

#include <string>
#include <utility>

namespace graphvault::utils {

/**
 * @brief Error codes grouped by module
 *
 * Ranges:
 * - 0-999:     General
 * - 1000-1999: Configuration
 * - 2000-2999: Graph store
 * - 3000-3999: Query construction
 * - 5000-5999: Snapshot storage
 * - 6000-6999: Backup / restore
 * - 7000-7999: Command line
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class ErrorCode : int {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kInternalError = 5,
  kIOError = 6,
  kPermissionDenied = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigMissingRequired = 1003,
  kConfigInvalidValue = 1004,
  kConfigSchemaError = 1005,
  kConfigYamlError = 1006,
  kConfigJsonError = 1007,

  // Graph store
  kGraphStoreConnectionFailed = 2000,
  kGraphStoreConnectionLost = 2001,
  kGraphStoreQueryFailed = 2002,
  kGraphStoreAuthFailed = 2003,
  kGraphStoreInvalidResponse = 2004,
  kGraphStoreTimeout = 2005,

  // Query construction
  kCypherInvalidIdentifier = 3000,
  kCypherEmptyLabelSet = 3001,

  // Snapshot storage
  kSnapshotNotFound = 5000,
  kSnapshotParseError = 5001,
  kSnapshotWriteError = 5002,
  kSnapshotUnsupportedValue = 5003,
  kSnapshotIndexError = 5004,
  kSnapshotUnsafePath = 5005,

  // Backup / restore
  kExtractionFailed = 6000,
  kRestoreRecordFailed = 6001,
  kRestoreAborted = 6002,
  kRetentionCleanupFailed = 6003,
  kOperationLocked = 6004,

  // Command line
  kCliUnknownCommand = 7000,
  kCliMissingArgument = 7001,
};

/**
 * @brief Human-readable name of an error code
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Error value: code + message + optional context
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (context: <context>)"
   */
  [[nodiscard]] std::string to_string() const;

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator std::string() const { return to_string(); }

  [[nodiscard]] const char* what() const { return message_.c_str(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

/**
 * @brief True for the errors that abort a whole operation (store unreachable)
 */
inline bool IsConnectionError(const Error& error) {
  return error.code() == ErrorCode::kGraphStoreConnectionFailed ||
         error.code() == ErrorCode::kGraphStoreConnectionLost || error.code() == ErrorCode::kGraphStoreAuthFailed;
}

}  // namespace graphvault::utils

/**
 * @brief Build an Error with "file:line" context
 */
#define GRAPHVAULT_ERROR(code, message) \
  ::graphvault::utils::MakeError((code), (message), std::string(__FILE__) + ":" + std::to_string(__LINE__))
