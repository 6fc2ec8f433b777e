/**
 * @file atomic_file.cpp
 * @brief Crash-safe whole-file writes and reads
 */

#include "storage/atomic_file.h"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "storage/snapshot_format.h"

namespace graphvault::storage {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Write the full buffer to fd, retrying on short writes and EINTR
 */
bool WriteAll(int file_descriptor, const char* data, size_t size) {
  size_t written = 0;
  while (written < size) {
    ssize_t result = write(file_descriptor, data + written, size - written);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<size_t>(result);
  }
  return true;
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code error_code;
  std::filesystem::remove(path, error_code);
  if (error_code) {
    spdlog::warn("Failed to remove temporary file {}: {}", path.string(), error_code.message());
  }
}

}  // namespace

utils::Expected<void, utils::Error> WriteFileAtomically(const std::filesystem::path& path, const std::string& content) {
  std::error_code error_code;
  std::filesystem::path parent_dir = path.parent_path();

  if (!parent_dir.empty() && !std::filesystem::exists(parent_dir, error_code)) {
    if (!std::filesystem::create_directories(parent_dir, error_code) && error_code) {
      return MakeUnexpected(MakeError(ErrorCode::kSnapshotWriteError,
                                      "Failed to create directory: " + parent_dir.string() + " (" +
                                          error_code.message() + ")"));
    }
    spdlog::info("Created snapshot directory: {}", parent_dir.string());
  }

  // The final directory component and the target itself must not be symlinks
  if (!parent_dir.empty() && std::filesystem::is_symlink(parent_dir, error_code)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kSnapshotUnsafePath, "Snapshot directory is a symlink: " + parent_dir.string()));
  }
  if (std::filesystem::is_symlink(path, error_code)) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotUnsafePath, "Target path is a symlink: " + path.string()));
  }

  std::filesystem::path temp_path = path;
  temp_path += snapshot_format::kTempSuffix;

  // A stale temp file from a crashed run is not a symlink we want to follow
  if (std::filesystem::is_symlink(temp_path, error_code)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kSnapshotUnsafePath, "Temporary path is a symlink: " + temp_path.string()));
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg): POSIX open() requires varargs for mode
  int file_descriptor = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW, S_IRUSR | S_IWUSR);
  if (file_descriptor < 0) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotWriteError,
                                    "Failed to create " + temp_path.string() + ": " + std::strerror(errno)));
  }

  if (!WriteAll(file_descriptor, content.data(), content.size())) {
    std::string reason = std::strerror(errno);
    close(file_descriptor);
    RemoveQuietly(temp_path);
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotWriteError, "Failed to write " + temp_path.string() + ": " + reason));
  }

  if (fsync(file_descriptor) != 0) {
    std::string reason = std::strerror(errno);
    close(file_descriptor);
    RemoveQuietly(temp_path);
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotWriteError, "Failed to sync " + temp_path.string() + ": " + reason));
  }

  if (close(file_descriptor) != 0) {
    std::string reason = std::strerror(errno);
    RemoveQuietly(temp_path);
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotWriteError, "Failed to close " + temp_path.string() + ": " + reason));
  }

  std::filesystem::rename(temp_path, path, error_code);
  if (error_code) {
    RemoveQuietly(temp_path);
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotWriteError,
                                    "Failed to rename " + temp_path.string() + " to " + path.string() + ": " +
                                        error_code.message()));
  }

  return {};
}

utils::Expected<std::string, utils::Error> ReadWholeFile(const std::filesystem::path& path) {
  std::error_code error_code;
  if (!std::filesystem::exists(path, error_code)) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotNotFound, "File not found: " + path.string()));
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to open file: " + path.string()));
  }

  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  if (ifs.bad()) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to read file: " + path.string()));
  }
  return buffer.str();
}

}  // namespace graphvault::storage
