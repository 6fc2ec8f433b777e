/**
 * @file operation_lock.h
 * @brief Advisory lock serializing mutating CLI invocations
 */

#ifndef GRAPHVAULT_APP_OPERATION_LOCK_H_
#define GRAPHVAULT_APP_OPERATION_LOCK_H_

#include <filesystem>
#include <memory>

#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::app {

/**
 * @brief Exclusive flock() on a file, released on destruction
 *
 * A second process trying to acquire the same lock fails immediately with
 * kOperationLocked instead of waiting. The lock file itself is left in place.
 */
class OperationLock {
 public:
  /**
   * @brief Lock file name inside the snapshot directory
   */
  static constexpr const char* kLockFileName = ".graphvault.lock";

  /**
   * @brief Acquire the lock (non-blocking)
   * @param lock_path Lock file (created if missing)
   * @return kOperationLocked if another process holds it, kIOError on other failures
   */
  static graphvault::utils::Expected<std::unique_ptr<OperationLock>, graphvault::utils::Error> Acquire(
      const std::filesystem::path& lock_path);

  ~OperationLock();

  OperationLock(const OperationLock&) = delete;
  OperationLock& operator=(const OperationLock&) = delete;
  OperationLock(OperationLock&&) = delete;
  OperationLock& operator=(OperationLock&&) = delete;

  const std::filesystem::path& GetPath() const { return path_; }

 private:
  OperationLock(std::filesystem::path path, int file_descriptor);

  std::filesystem::path path_;
  int fd_;
};

}  // namespace graphvault::app

#endif  // GRAPHVAULT_APP_OPERATION_LOCK_H_
