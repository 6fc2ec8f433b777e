/**
 * @file atomic_file.h
 * @brief Crash-safe whole-file writes and reads
 */

#pragma once

#include <filesystem>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::storage {

/**
 * @brief Write content to path so readers see either the old file or the complete new one
 *
 * Writes "<path>.tmp" (created with O_NOFOLLOW, mode 0600), fsyncs it and
 * renames it over path. The temporary file is removed on any failure.
 * Creates the parent directory if needed; refuses symlinked targets.
 *
 * @return kSnapshotWriteError or kSnapshotUnsafePath on failure
 */
utils::Expected<void, utils::Error> WriteFileAtomically(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Read an entire file
 * @return kSnapshotNotFound if the file does not exist, kIOError if it cannot be read
 */
utils::Expected<std::string, utils::Error> ReadWholeFile(const std::filesystem::path& path);

}  // namespace graphvault::storage
