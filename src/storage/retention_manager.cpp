/**
 * @file retention_manager.cpp
 * @brief Snapshot index bookkeeping and retention cap
 */

#include "storage/retention_manager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <utility>

#include "storage/atomic_file.h"
#include "storage/snapshot_format.h"
#include "storage/snapshot_serializer.h"
#include "utils/structured_log.h"

namespace graphvault::storage {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

void SortNewestFirst(std::vector<SnapshotMetadata>& entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const SnapshotMetadata& lhs, const SnapshotMetadata& rhs) { return lhs.timestamp > rhs.timestamp; });
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

uint64_t FileSizeOrZero(const std::filesystem::path& path) {
  std::error_code error_code;
  auto size = std::filesystem::file_size(path, error_code);
  return error_code ? 0 : static_cast<uint64_t>(size);
}

}  // namespace

RetentionManager::RetentionManager(Options options) : options_(std::move(options)) {
  if (options_.max_retained == 0) {
    options_.max_retained = 1;
  }
  if (options_.file_prefix.empty()) {
    options_.file_prefix = snapshot_format::kDefaultFilePrefix;
  }
  if (options_.index_filename.empty()) {
    options_.index_filename = snapshot_format::kDefaultIndexFilename;
  }
}

std::string RetentionManager::FileNameOf(const SnapshotMetadata& metadata) const {
  if (!metadata.filename.empty()) {
    return metadata.filename;
  }
  return SnapshotFileName(options_.file_prefix, metadata.timestamp);
}

bool RetentionManager::IsSnapshotFileName(const std::string& filename) const {
  return filename != options_.index_filename && StartsWith(filename, options_.file_prefix) &&
         EndsWith(filename, snapshot_format::kFileExtension) &&
         filename.size() > options_.file_prefix.size() + std::string(snapshot_format::kFileExtension).size();
}

std::vector<SnapshotMetadata> RetentionManager::LoadIndex() const {
  std::vector<SnapshotMetadata> entries;
  auto content = ReadWholeFile(IndexPath());
  if (!content) {
    if (content.error().code() != ErrorCode::kSnapshotNotFound) {
      spdlog::warn("Failed to read snapshot index {}: {}", IndexPath().string(), content.error().message());
    }
    return entries;
  }

  json document = json::parse(*content, nullptr, false);
  if (document.is_discarded() || !document.is_object() || !document.contains(snapshot_format::kIndexBackupsKey) ||
      !document[snapshot_format::kIndexBackupsKey].is_array()) {
    utils::StructuredLog()
        .Event("snapshot_index_corrupt")
        .Field("path", IndexPath().string())
        .Message("Snapshot index is unreadable, treating it as empty")
        .Warn();
    return entries;
  }

  for (const auto& item : document[snapshot_format::kIndexBackupsKey]) {
    auto metadata = MetadataFromJson(item);
    if (!metadata) {
      spdlog::warn("Skipping malformed snapshot index entry: {}", metadata.error().message());
      continue;
    }
    if (metadata->filename.empty()) {
      metadata->filename = SnapshotFileName(options_.file_prefix, metadata->timestamp);
    }
    entries.push_back(std::move(*metadata));
  }
  SortNewestFirst(entries);
  return entries;
}

utils::Expected<void, utils::Error> RetentionManager::SaveIndex(const std::vector<SnapshotMetadata>& entries) const {
  json backups = json::array();
  for (const auto& entry : entries) {
    backups.push_back(MetadataToJson(entry, true));
  }
  json document = {{snapshot_format::kIndexBackupsKey, std::move(backups)}};

  auto written = WriteFileAtomically(IndexPath(), document.dump(2));
  if (!written) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotIndexError,
                                    "Failed to write snapshot index: " + written.error().message(),
                                    IndexPath().string()));
  }
  return {};
}

utils::Expected<RetentionOutcome, utils::Error> RetentionManager::Record(const SnapshotMetadata& metadata) {
  SnapshotMetadata entry = metadata;
  entry.filename = FileNameOf(metadata);

  // Indexed and unindexed snapshot files both count toward the cap
  std::vector<SnapshotMetadata> entries;
  for (auto& existing : List()) {
    if (existing.timestamp == entry.timestamp || existing.filename == entry.filename) {
      continue;
    }
    entries.push_back(std::move(existing));
  }
  entries.push_back(entry);
  SortNewestFirst(entries);

  RetentionOutcome outcome;
  std::vector<SnapshotMetadata> evicted;
  if (entries.size() > options_.max_retained) {
    evicted.assign(std::make_move_iterator(entries.begin() + static_cast<std::ptrdiff_t>(options_.max_retained)),
                   std::make_move_iterator(entries.end()));
    entries.resize(options_.max_retained);
  }

  auto saved = SaveIndex(entries);
  if (!saved) {
    return MakeUnexpected(saved.error());
  }

  for (const auto& old : evicted) {
    outcome.evicted.push_back(old.timestamp);
    std::filesystem::path old_path = options_.dir / old.filename;
    std::error_code error_code;
    std::filesystem::remove(old_path, error_code);
    if (error_code) {
      ++outcome.cleanup_failures;
      utils::StructuredLog()
          .Event("retention_cleanup_failed")
          .Field("path", old_path.string())
          .Field("error", error_code.message())
          .Warn();
      continue;
    }
    spdlog::info("Removed old snapshot: {}", old.filename);
  }
  return outcome;
}

std::vector<SnapshotMetadata> RetentionManager::List() const {
  std::vector<SnapshotMetadata> entries;
  std::set<std::string> seen;

  for (auto& entry : LoadIndex()) {
    std::filesystem::path path = options_.dir / entry.filename;
    std::error_code error_code;
    if (!std::filesystem::exists(path, error_code)) {
      spdlog::debug("Index entry without file: {}", entry.filename);
      continue;
    }
    entry.file_size_bytes = FileSizeOrZero(path);
    seen.insert(entry.filename);
    entries.push_back(std::move(entry));
  }

  std::error_code error_code;
  if (std::filesystem::is_directory(options_.dir, error_code)) {
    for (const auto& dir_entry : std::filesystem::directory_iterator(options_.dir, error_code)) {
      std::string filename = dir_entry.path().filename().string();
      if (!dir_entry.is_regular_file(error_code) || !IsSnapshotFileName(filename) || seen.count(filename) > 0) {
        continue;
      }
      auto metadata = ReadSnapshotMetadata(dir_entry.path());
      if (!metadata) {
        spdlog::warn("Ignoring unreadable snapshot file {}: {}", filename, metadata.error().message());
        continue;
      }
      metadata->filename = filename;
      metadata->file_size_bytes = FileSizeOrZero(dir_entry.path());
      entries.push_back(std::move(*metadata));
    }
  }

  SortNewestFirst(entries);
  return entries;
}

std::optional<SnapshotMetadata> RetentionManager::Latest() const {
  auto entries = List();
  if (entries.empty()) {
    return std::nullopt;
  }
  return entries.front();
}

utils::Expected<std::filesystem::path, utils::Error> RetentionManager::PathFor(const std::string& id) const {
  if (id.empty() || id.find('/') != std::string::npos || id.find('\\') != std::string::npos ||
      id.find("..") != std::string::npos) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotUnsafePath, "Invalid snapshot identifier: " + id));
  }
  if (EndsWith(id, snapshot_format::kFileExtension)) {
    return options_.dir / id;
  }
  return options_.dir / SnapshotFileName(options_.file_prefix, id);
}

std::optional<SnapshotMetadata> RetentionManager::Info(const std::string& id) const {
  auto path = PathFor(id);
  if (!path) {
    spdlog::warn("{}", path.error().message());
    return std::nullopt;
  }

  std::error_code error_code;
  if (!std::filesystem::is_regular_file(*path, error_code)) {
    return std::nullopt;
  }

  std::string filename = path->filename().string();
  std::optional<SnapshotMetadata> found;
  for (auto& entry : LoadIndex()) {
    if (entry.filename == filename) {
      found = std::move(entry);
      break;
    }
  }

  if (!found) {
    auto metadata = ReadSnapshotMetadata(*path);
    if (!metadata) {
      spdlog::warn("Failed to read snapshot metadata {}: {}", filename, metadata.error().message());
      return std::nullopt;
    }
    found = std::move(*metadata);
    found->filename = filename;
  }

  found->file_size_bytes = FileSizeOrZero(*path);
  return found;
}

}  // namespace graphvault::storage
