/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

#include <sstream>

namespace graphvault::utils {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    // General
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";

    // Configuration
    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigMissingRequired:
      return "Missing required configuration";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigSchemaError:
      return "JSON schema error";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    // Graph store
    case ErrorCode::kGraphStoreConnectionFailed:
      return "Graph store connection failed";
    case ErrorCode::kGraphStoreConnectionLost:
      return "Graph store connection lost";
    case ErrorCode::kGraphStoreQueryFailed:
      return "Graph store query failed";
    case ErrorCode::kGraphStoreAuthFailed:
      return "Graph store authentication failed";
    case ErrorCode::kGraphStoreInvalidResponse:
      return "Invalid graph store response";
    case ErrorCode::kGraphStoreTimeout:
      return "Graph store timeout";

    // Query construction
    case ErrorCode::kCypherInvalidIdentifier:
      return "Invalid identifier";
    case ErrorCode::kCypherEmptyLabelSet:
      return "Empty label set";

    // Snapshot storage
    case ErrorCode::kSnapshotNotFound:
      return "Snapshot not found";
    case ErrorCode::kSnapshotParseError:
      return "Snapshot parse error";
    case ErrorCode::kSnapshotWriteError:
      return "Snapshot write error";
    case ErrorCode::kSnapshotUnsupportedValue:
      return "Unsupported property value";
    case ErrorCode::kSnapshotIndexError:
      return "Snapshot index error";
    case ErrorCode::kSnapshotUnsafePath:
      return "Unsafe snapshot path";

    // Backup / restore
    case ErrorCode::kExtractionFailed:
      return "Extraction failed";
    case ErrorCode::kRestoreRecordFailed:
      return "Record restore failed";
    case ErrorCode::kRestoreAborted:
      return "Restore aborted";
    case ErrorCode::kRetentionCleanupFailed:
      return "Retention cleanup failed";
    case ErrorCode::kOperationLocked:
      return "Another operation is in progress";

    // Command line
    case ErrorCode::kCliUnknownCommand:
      return "Unknown command";
    case ErrorCode::kCliMissingArgument:
      return "Missing argument";

    default:
      return "Unknown error code";
  }
}

std::string Error::to_string() const {
  std::ostringstream oss;
  oss << "[" << ErrorCodeToString(code_) << " (" << static_cast<int>(code_) << ")] " << message_;
  if (!context_.empty()) {
    oss << " (context: " << context_ << ")";
  }
  return oss.str();
}

}  // namespace graphvault::utils
