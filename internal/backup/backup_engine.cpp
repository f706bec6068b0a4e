#include "backup_engine.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>

#include "internal/backup/backup_paths.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/gzip.hpp"
#include "internal/util/sha256.hpp"

namespace sqlvault::backup {

using observability::IntField;
using observability::StringField;

namespace {

std::chrono::milliseconds Elapsed(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

/*
  Restores the connection's foreign_keys setting when a restore leaves scope,
  whether it committed or failed.
*/
class ForeignKeysGuard {
 public:
  explicit ForeignKeysGuard(db::sqlite::SqliteDB& db) : db_(db), previous_(db.QueryInt64("PRAGMA foreign_keys;") != 0) {
    db_.Exec("PRAGMA foreign_keys=OFF;");
  }

  ~ForeignKeysGuard() {
    try {
      db_.Exec(previous_ ? "PRAGMA foreign_keys=ON;" : "PRAGMA foreign_keys=OFF;");
    } catch (const std::exception& e) {
      SQLVAULT_LOG_WARN("Failed to restore foreign_keys setting", {StringField("error", e.what())});
    }
  }

  ForeignKeysGuard(const ForeignKeysGuard&)            = delete;
  ForeignKeysGuard& operator=(const ForeignKeysGuard&) = delete;

 private:
  db::sqlite::SqliteDB& db_;
  bool                  previous_;
};

} // namespace

BackupEngine::BackupEngine(std::shared_ptr<db::sqlite::SqliteDB> db, BackupConfig config)
    : db_(std::move(db)), config_(std::move(config)), store_(config_.backup_dir), dumper_(db_, config_.exclude_tables, config_.batch_size) {
  if (config_.encryption) {
    SQLVAULT_LOG_WARN("Backup encryption is not supported; artifacts are stored unencrypted");
  }
}

std::pair<std::string, util::TimePoint> BackupEngine::NextBackupId(BackupKind kind) {
  uint64_t millis = util::ToUnixMillis(util::Now());
  if (millis <= last_id_millis_) millis = last_id_millis_ + 1;

  // another process may have written into the same directory this millisecond
  std::error_code ec;
  while (true) {
    const auto id = std::string(ToString(kind)) + "_" + std::to_string(millis);
    if (!std::filesystem::exists(SidecarPath(config_.backup_dir, id), ec) &&
        !std::filesystem::exists(config_.backup_dir / ArtifactFilename(id, config_.compression), ec)) {
      last_id_millis_ = millis;
      return {id, util::FromUnixMillis(millis)};
    }
    ++millis;
  }
}

BackupMetadata BackupEngine::WriteBackup(BackupKind kind, const std::optional<std::string>& description) {
  if (kind == BackupKind::kIncremental) {
    throw util::InvalidConfig("incremental backups are not supported");
  }

  std::filesystem::create_directories(config_.backup_dir);

  const auto [backup_id, created] = NextBackupId(kind);
  const auto created_at           = util::FormatIso8601(created);

  auto dump = dumper_.Dump(kind, created_at);

  std::string bytes = config_.compression ? util::GzipCompress(dump.sql) : std::move(dump.sql);

  BackupMetadata metadata;
  metadata.set_id(backup_id);
  metadata.set_type(std::string(ToString(kind)));
  metadata.set_filename(ArtifactFilename(backup_id, config_.compression));
  metadata.set_created_at(created_at);
  metadata.set_size(static_cast<double>(bytes.size()));
  metadata.set_checksum(util::Sha256Hex(bytes));
  if (description) metadata.set_description(*description);
  for (const auto& table : dump.tables) {
    metadata.add_tables(table);
  }
  metadata.set_record_count(static_cast<double>(dump.record_count));
  metadata.set_compressed(config_.compression);

  util::WriteFileAtomic(ArtifactPath(config_.backup_dir, metadata.filename()), bytes);
  store_.Write(metadata);

  return metadata;
}

BackupResult BackupEngine::CreateBackup(BackupKind kind, std::optional<std::string> description) {
  std::lock_guard lock(operation_mutex_);

  const auto   start = std::chrono::steady_clock::now();
  BackupResult result;

  SQLVAULT_LOG_INFO("Starting backup", {StringField("type", ToString(kind))});

  try {
    result.metadata = WriteBackup(kind, description);
    result.success  = true;
  } catch (const util::InvalidConfig& e) {
    result.error_code = util::ErrorCode::kInvalidConfig;
    result.error      = e.what();
  } catch (const util::IoError& e) {
    result.error_code = util::ErrorCode::kIoError;
    result.error      = e.what();
  } catch (const std::filesystem::filesystem_error& e) {
    result.error_code = util::ErrorCode::kIoError;
    result.error      = e.what();
  } catch (const std::exception& e) {
    result.error_code = util::ErrorCode::kInternal;
    result.error      = e.what();
  }

  result.duration = Elapsed(start);

  if (result.success) {
    const auto& metadata = *result.metadata;
    SQLVAULT_LOG_INFO("Backup created",
                      {StringField("id", metadata.id()), StringField("file", metadata.filename()),
                       StringField("size", util::FormatSize(StoredSize(metadata))), IntField("tables", metadata.tables_size()),
                       IntField("records", static_cast<int64_t>(RecordCount(metadata))),
                       IntField("duration_ms", result.duration.count())});
  } else {
    SQLVAULT_LOG_ERROR("Backup failed", {StringField("code", util::ToString(result.error_code)), StringField("error", result.error),
                                         IntField("duration_ms", result.duration.count())});
  }

  return result;
}

std::vector<BackupMetadata> BackupEngine::ListBackups() const {
  return store_.List();
}

std::optional<BackupMetadata> BackupEngine::FindBackup(const std::string& query) const {
  if (query.empty()) return std::nullopt;

  const auto backups = store_.List();
  for (const auto& metadata : backups) {
    if (metadata.id() == query) return metadata;
  }

  // List() is newest first
  for (const auto& metadata : backups) {
    if (metadata.id().find(query) != std::string::npos || metadata.filename().find(query) != std::string::npos) {
      return metadata;
    }
  }
  return std::nullopt;
}

bool BackupEngine::IsUsable(const BackupMetadata& metadata) const {
  try {
    std::error_code ec;
    return std::filesystem::is_regular_file(ArtifactPath(config_.backup_dir, metadata.filename()), ec);
  } catch (const std::invalid_argument&) {
    return false;
  }
}

RestoreResult BackupEngine::RestoreVerified(const std::string& backup_id) {
  std::optional<BackupMetadata> found;
  for (auto& metadata : store_.List()) {
    if (metadata.id() == backup_id) {
      found = std::move(metadata);
      break;
    }
  }
  if (!found) {
    throw util::NotFound("backup not found: " + backup_id);
  }
  const auto& metadata = *found;

  std::filesystem::path artifact;
  try {
    artifact = ArtifactPath(config_.backup_dir, metadata.filename());
  } catch (const std::invalid_argument& e) {
    throw util::IntegrityError("sidecar names an invalid artifact: " + std::string(e.what()));
  }

  std::string bytes = util::ReadFile(artifact);

  if (bytes.size() != StoredSize(metadata)) {
    throw util::IntegrityError("size mismatch for " + metadata.filename() + ": expected " + std::to_string(StoredSize(metadata)) + ", found " +
                               std::to_string(bytes.size()));
  }
  if (util::Sha256Hex(bytes) != metadata.checksum()) {
    throw util::IntegrityError("checksum mismatch for " + metadata.filename());
  }

  const std::string script = metadata.compressed() ? util::GzipDecompress(bytes) : std::move(bytes);

  const auto body = ExtractDumpBody(script);
  if (!body) {
    throw util::ExecutionError("artifact is not a transactional dump: missing BEGIN TRANSACTION/COMMIT markers");
  }

  try {
    ForeignKeysGuard              foreign_keys(*db_);
    db::sqlite::SqliteTransaction tx(db_);

    try {
      db_->Exec(*body);
      tx.Commit();
    } catch (const std::exception&) {
      tx.Rollback();
      throw;
    }
  } catch (const std::exception& e) {
    throw util::ExecutionError(e.what());
  }

  RestoreResult result;
  result.success = true;
  result.restored_tables.assign(metadata.tables().begin(), metadata.tables().end());
  result.restored_records = RecordCount(metadata);
  return result;
}

RestoreResult BackupEngine::RestoreFromBackup(const std::string& backup_id) {
  std::lock_guard lock(operation_mutex_);

  const auto    start = std::chrono::steady_clock::now();
  RestoreResult result;

  SQLVAULT_LOG_INFO("Starting restore", {StringField("id", backup_id)});

  try {
    result = RestoreVerified(backup_id);
  } catch (const util::NotFound& e) {
    result.error_code = util::ErrorCode::kNotFound;
    result.error      = e.what();
  } catch (const util::IntegrityError& e) {
    result.error_code = util::ErrorCode::kIntegrity;
    result.error      = e.what();
  } catch (const util::IoError& e) {
    result.error_code = util::ErrorCode::kIoError;
    result.error      = e.what();
  } catch (const util::ExecutionError& e) {
    result.error_code = util::ErrorCode::kExecution;
    result.error      = e.what();
  } catch (const std::exception& e) {
    result.error_code = util::ErrorCode::kInternal;
    result.error      = e.what();
  }

  result.duration = Elapsed(start);

  if (result.success) {
    SQLVAULT_LOG_INFO("Restore completed",
                      {StringField("id", backup_id), IntField("tables", static_cast<int64_t>(result.restored_tables.size())),
                       IntField("records", static_cast<int64_t>(result.restored_records)),
                       IntField("duration_ms", result.duration.count())});
  } else {
    SQLVAULT_LOG_ERROR("Restore failed", {StringField("id", backup_id), StringField("code", util::ToString(result.error_code)),
                                          StringField("error", result.error), IntField("duration_ms", result.duration.count())});
  }

  return result;
}

std::vector<CleanupCandidate> BackupEngine::SelectForCleanup(const std::vector<BackupMetadata>& backups, util::TimePoint now) const {
  // a window reaching back past the epoch expires nothing; this also keeps
  // the cutoff arithmetic inside the clock's range
  const auto retention   = std::chrono::hours(24) * static_cast<int64_t>(config_.retention_days);
  const bool age_applies = retention < std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch());
  const auto cutoff      = age_applies ? now - retention : util::TimePoint{};

  std::vector<CleanupCandidate> candidates;
  size_t                        survivors = 0;

  // newest first: survivors beyond max_backups are the oldest ones
  for (const auto& metadata : backups) {
    const auto created = util::ParseIso8601(metadata.created_at());
    if (age_applies && created && *created < cutoff) {
      candidates.push_back({metadata, CleanupReason::kExpired});
      continue;
    }

    if (++survivors > config_.max_backups) {
      candidates.push_back({metadata, CleanupReason::kExcess});
    }
  }
  return candidates;
}

std::vector<CleanupCandidate> BackupEngine::PlanCleanup() const {
  return SelectForCleanup(store_.List(), util::Now());
}

uint64_t BackupEngine::RemoveBackupFiles(const BackupMetadata& metadata) {
  uint64_t freed = 0;

  std::error_code ec;
  const auto      artifact = ArtifactPath(config_.backup_dir, metadata.filename());
  if (std::filesystem::is_regular_file(artifact, ec)) {
    const auto size = std::filesystem::file_size(artifact, ec);
    if (!ec) freed = size;
  }

  std::filesystem::remove(artifact, ec);
  if (ec) {
    throw util::IoError("failed to remove " + artifact.filename().string() + ": " + ec.message());
  }

  store_.Remove(metadata.id());
  return freed;
}

uint64_t BackupEngine::RemoveStrayFiles(uint64_t& freed_space) {
  uint64_t removed = 0;

  std::error_code ec;
  if (!std::filesystem::is_directory(config_.backup_dir, ec)) return 0;

  std::vector<std::filesystem::path> strays;
  for (std::filesystem::directory_iterator it(config_.backup_dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();

    if (EndsWith(name, kTempSuffix)) {
      strays.push_back(it->path());
      continue;
    }

    const auto backup_id = ArtifactIdFromFilename(name);
    if (backup_id.empty()) continue;

    std::filesystem::path sidecar;
    try {
      sidecar = SidecarPath(config_.backup_dir, backup_id);
    } catch (const std::invalid_argument&) {
      continue;
    }

    std::error_code exists_ec;
    if (!std::filesystem::exists(sidecar, exists_ec)) {
      strays.push_back(it->path());
    }
  }

  for (const auto& path : strays) {
    std::error_code size_ec;
    const auto      size = std::filesystem::file_size(path, size_ec);

    std::error_code remove_ec;
    if (!std::filesystem::remove(path, remove_ec) || remove_ec) {
      SQLVAULT_LOG_WARN("Failed to remove stray backup file",
                        {StringField("file", path.filename().string()), StringField("error", remove_ec.message())});
      continue;
    }

    SQLVAULT_LOG_INFO("Removed stray backup file", {StringField("file", path.filename().string())});
    ++removed;
    if (!size_ec) freed_space += size;
  }
  return removed;
}

CleanupResult BackupEngine::CleanupOldBackups() {
  std::lock_guard lock(operation_mutex_);

  CleanupResult result;

  const auto candidates = SelectForCleanup(store_.List(), util::Now());
  for (const auto& candidate : candidates) {
    const auto& metadata = candidate.metadata;
    try {
      result.freed_space += RemoveBackupFiles(metadata);
      ++result.deleted_count;
      SQLVAULT_LOG_INFO("Deleted backup", {StringField("id", metadata.id()), StringField("reason", ToString(candidate.reason))});
    } catch (const util::IoError& e) {
      SQLVAULT_LOG_WARN("Failed to delete backup", {StringField("id", metadata.id()), StringField("error", e.what())});
    } catch (const std::invalid_argument& e) {
      SQLVAULT_LOG_WARN("Skipping backup with invalid sidecar", {StringField("id", metadata.id()), StringField("error", e.what())});
    }
  }

  result.orphans_removed = RemoveStrayFiles(result.freed_space);

  SQLVAULT_LOG_INFO("Cleanup completed",
                    {IntField("deleted", static_cast<int64_t>(result.deleted_count)),
                     IntField("orphans", static_cast<int64_t>(result.orphans_removed)),
                     StringField("freed", util::FormatSize(result.freed_space))});
  return result;
}

bool BackupEngine::DeleteBackup(const std::string& backup_id) {
  std::lock_guard lock(operation_mutex_);

  const auto metadata = store_.Read(backup_id);
  if (!metadata) {
    throw util::NotFound("backup not found: " + backup_id);
  }

  const auto freed = RemoveBackupFiles(*metadata);
  SQLVAULT_LOG_INFO("Deleted backup", {StringField("id", backup_id), StringField("freed", util::FormatSize(freed))});
  return true;
}

} // namespace sqlvault::backup
