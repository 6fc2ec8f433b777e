/**
 * @file operation_lock.cpp
 * @brief Advisory lock serializing mutating CLI invocations
 */

#include "app/operation_lock.h"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace graphvault::app {

using graphvault::utils::ErrorCode;
using graphvault::utils::MakeError;
using graphvault::utils::MakeUnexpected;

namespace {

/**
 * @brief Try to take an exclusive lock without blocking
 * @return 0 on success, errno otherwise
 *
 * flock() locks belong to the open file description, so a second open of the
 * same file conflicts even inside one process.
 */
int TryLock(int file_descriptor) {
  while (true) {
    if (flock(file_descriptor, LOCK_EX | LOCK_NB) == 0) {
      return 0;
    }
    if (errno != EINTR) {
      return errno;
    }
  }
}

}  // namespace

graphvault::utils::Expected<std::unique_ptr<OperationLock>, graphvault::utils::Error> OperationLock::Acquire(
    const std::filesystem::path& lock_path) {
  std::error_code error_code;
  const auto parent_dir = lock_path.parent_path();
  if (!parent_dir.empty() && !std::filesystem::exists(parent_dir, error_code)) {
    std::filesystem::create_directories(parent_dir, error_code);
    if (error_code) {
      return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to create directory " + parent_dir.string() +
                                                               ": " + error_code.message()));
    }
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg): POSIX open() requires varargs for mode
  int file_descriptor = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, S_IRUSR | S_IWUSR);
  if (file_descriptor < 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Failed to open lock file " + lock_path.string() + ": " + std::strerror(errno)));
  }

  int lock_errno = TryLock(file_descriptor);
  if (lock_errno != 0) {
    close(file_descriptor);
    if (lock_errno == EWOULDBLOCK) {
      return MakeUnexpected(MakeError(ErrorCode::kOperationLocked,
                                      "Another graphvault operation is in progress (lock: " + lock_path.string() + ")"));
    }
    return MakeUnexpected(MakeError(ErrorCode::kIOError,
                                    "Failed to lock " + lock_path.string() + ": " + std::strerror(lock_errno)));
  }

  // Record the holder for whoever finds the lock busy
  std::string pid = std::to_string(getpid()) + "\n";
  if (ftruncate(file_descriptor, 0) != 0 || write(file_descriptor, pid.data(), pid.size()) < 0) {
    spdlog::debug("Failed to record pid in lock file {}: {}", lock_path.string(), std::strerror(errno));
  }

  spdlog::debug("Acquired operation lock {}", lock_path.string());
  return std::unique_ptr<OperationLock>(new OperationLock(lock_path, file_descriptor));
}

OperationLock::OperationLock(std::filesystem::path path, int file_descriptor)
    : path_(std::move(path)), fd_(file_descriptor) {}

OperationLock::~OperationLock() {
  if (fd_ >= 0) {
    // Closing the descriptor releases the lock
    close(fd_);
    spdlog::debug("Released operation lock {}", path_.string());
  }
}

}  // namespace graphvault::app
