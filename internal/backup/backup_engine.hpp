#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/backup/backup_types.hpp"
#include "internal/backup/metadata_store.hpp"
#include "internal/backup/sql_dump.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/time.hpp"

namespace sqlvault::backup {

/*
  BackupEngine

  Produces, verifies, restores and prunes SQL dump artifacts of one SQLite
  database.

  On-disk layout (flat, inside backup_dir):
      {id}.sql | {id}.sql.gz     artifact
      {id}.meta.json             sidecar, written after the artifact

  Invariants:
    - checksum and size describe the exact bytes on disk
    - restore touches the database only after the artifact verified
    - create / restore / cleanup / delete never overlap
*/
class BackupEngine {
 public:
  BackupEngine(std::shared_ptr<db::sqlite::SqliteDB> db, BackupConfig config);

  // Never throws; failures are reported on the result.
  BackupResult CreateBackup(BackupKind kind = BackupKind::kFull, std::optional<std::string> description = std::nullopt);

  std::vector<BackupMetadata> ListBackups() const;

  // Exact id first, then the newest backup whose id or filename contains `query`.
  std::optional<BackupMetadata> FindBackup(const std::string& query) const;

  bool IsUsable(const BackupMetadata& metadata) const;

  // Never throws; failures are reported on the result.
  RestoreResult RestoreFromBackup(const std::string& backup_id);

  CleanupResult                 CleanupOldBackups();
  std::vector<CleanupCandidate> PlanCleanup() const;

  // Throws NotFound for an unknown id.
  bool DeleteBackup(const std::string& backup_id);

  const BackupConfig& Config() const {
    return config_;
  }

 private:
  std::pair<std::string, util::TimePoint> NextBackupId(BackupKind kind);

  BackupMetadata WriteBackup(BackupKind kind, const std::optional<std::string>& description);
  RestoreResult  RestoreVerified(const std::string& backup_id);

  std::vector<CleanupCandidate> SelectForCleanup(const std::vector<BackupMetadata>& backups, util::TimePoint now) const;

  // Freed bytes of the artifact; a missing artifact frees nothing.
  uint64_t RemoveBackupFiles(const BackupMetadata& metadata);
  uint64_t RemoveStrayFiles(uint64_t& freed_space);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  BackupConfig                          config_;
  MetadataStore                         store_;
  SqlDumper                             dumper_;

  std::mutex operation_mutex_;
  uint64_t   last_id_millis_ = 0;
};

} // namespace sqlvault::backup
