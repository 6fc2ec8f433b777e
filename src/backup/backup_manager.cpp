/**
 * @file backup_manager.cpp
 * @brief Caller-facing backup operations
 */

#include "backup/backup_manager.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

#include "backup/extractor.h"
#include "storage/snapshot_format.h"
#include "storage/snapshot_serializer.h"
#include "utils/structured_log.h"
#include "utils/time_format.h"

namespace graphvault::backup {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kAutoBackupReason = "Automatic backup: significant changes detected";

Error ExceptionError(const char* operation, const std::exception& e) {
  return MakeError(ErrorCode::kInternalError, std::string(operation) + " failed: " + e.what());
}

}  // namespace

BackupManager::BackupManager(graph::IGraphStore& store, storage::RetentionManager::Options retention,
                             RestoreOptions restore_options, Clock clock)
    : store_(store),
      retention_(std::move(retention)),
      restore_options_(std::move(restore_options)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

Expected<CreateResult, Error> BackupManager::Create(const std::string& reason) {
  try {
    auto payload = ExtractAll(store_);
    if (!payload) {
      utils::LogGraphStoreError("extract", store_.Describe(), payload.error().message());
      return MakeUnexpected(payload.error());
    }

    const auto now = clock_();
    storage::SnapshotMetadata metadata;
    metadata.timestamp = utils::FormatSnapshotTimestamp(now);
    metadata.created_at = utils::FormatIso8601(now);
    metadata.reason = reason;
    metadata.node_count = payload->statistics.node_count;
    metadata.relationship_count = payload->statistics.relationship_count;
    metadata.schema_version = storage::snapshot_format::kCurrentSchemaVersion;
    metadata.backup_type = storage::snapshot_format::kBackupTypeFull;

    auto path = retention_.PathFor(metadata.timestamp);
    if (!path) {
      return MakeUnexpected(path.error());
    }

    auto written = storage::WriteSnapshot(*path, metadata, *payload);
    if (!written) {
      utils::LogStorageError("write_snapshot", path->string(), written.error().message());
      return MakeUnexpected(written.error());
    }

    std::error_code error_code;
    auto size = std::filesystem::file_size(*path, error_code);
    metadata.file_size_bytes = error_code ? 0 : static_cast<uint64_t>(size);
    metadata.filename = path->filename().string();

    auto recorded = retention_.Record(metadata);
    if (!recorded) {
      // The snapshot file exists and List() still finds it; only the index is stale
      utils::LogStorageError("record_snapshot", retention_.IndexPath().string(), recorded.error().message());
      return MakeUnexpected(recorded.error());
    }

    utils::StructuredLog()
        .Event("snapshot_created")
        .Field("timestamp", metadata.timestamp)
        .Field("path", path->string())
        .Field("reason", reason)
        .Field("nodes", metadata.node_count)
        .Field("relationships", metadata.relationship_count)
        .Field("size_bytes", metadata.file_size_bytes)
        .Field("evicted", static_cast<uint64_t>(recorded->evicted.size()))
        .Info();

    return CreateResult{std::move(metadata), std::move(*path)};
  } catch (const std::exception& e) {
    return MakeUnexpected(ExceptionError("Create", e));
  }
}

Expected<bool, Error> BackupManager::AutoCreate(const ChangeThresholds& thresholds) {
  try {
    auto current = CollectStatistics(store_);
    if (!current) {
      return MakeUnexpected(current.error());
    }

    std::optional<graph::GraphStatistics> last;
    if (auto latest = retention_.Latest()) {
      graph::GraphStatistics previous;
      previous.node_count = latest->node_count;
      previous.relationship_count = latest->relationship_count;
      last = previous;
    }

    if (!ShouldBackup(*current, last, thresholds)) {
      spdlog::info("No significant changes since last snapshot ({} nodes, {} relationships)", current->node_count,
                   current->relationship_count);
      return false;
    }

    auto created = Create(kAutoBackupReason);
    if (!created) {
      return MakeUnexpected(created.error());
    }
    return true;
  } catch (const std::exception& e) {
    return MakeUnexpected(ExceptionError("AutoCreate", e));
  }
}

Expected<std::filesystem::path, Error> BackupManager::ResolveSnapshot(
    const std::optional<std::string>& snapshot_id) const {
  if (snapshot_id.has_value()) {
    return retention_.PathFor(*snapshot_id);
  }
  auto latest = retention_.Latest();
  if (!latest) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotNotFound, "No snapshots found", retention_.GetOptions().dir.string()));
  }
  return retention_.GetOptions().dir / latest->filename;
}

Expected<RestoreReport, Error> BackupManager::Restore(const std::optional<std::string>& snapshot_id) {
  try {
    auto path = ResolveSnapshot(snapshot_id);
    if (!path) {
      return MakeUnexpected(path.error());
    }
    Restorer restorer(store_, restore_options_);
    return restorer.RestoreFull(*path);
  } catch (const std::exception& e) {
    return MakeUnexpected(ExceptionError("Restore", e));
  }
}

Expected<RestoreReport, Error> BackupManager::SelectiveRestore(const std::optional<std::string>& snapshot_id,
                                                               const std::set<std::string>& preserve_labels) {
  try {
    auto path = ResolveSnapshot(snapshot_id);
    if (!path) {
      return MakeUnexpected(path.error());
    }
    Restorer restorer(store_, restore_options_);
    return restorer.RestoreSelective(*path, preserve_labels);
  } catch (const std::exception& e) {
    return MakeUnexpected(ExceptionError("SelectiveRestore", e));
  }
}

Expected<std::vector<storage::SnapshotMetadata>, Error> BackupManager::List() const {
  try {
    return retention_.List();
  } catch (const std::exception& e) {
    return MakeUnexpected(ExceptionError("List", e));
  }
}

std::optional<storage::SnapshotMetadata> BackupManager::Info(const std::string& snapshot_id) const {
  try {
    return retention_.Info(snapshot_id);
  } catch (const std::exception& e) {
    spdlog::error("Info failed: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace graphvault::backup
