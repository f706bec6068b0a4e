#include "internal/backup/backup_engine.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/backup/metadata_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using sqlvault::backup::BackupConfig;
using sqlvault::backup::BackupEngine;
using sqlvault::backup::BackupMetadata;
using sqlvault::backup::CleanupReason;
using sqlvault::backup::MetadataStore;
using sqlvault::db::sqlite::SqliteDB;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "sqlvault_backup_cleanup_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void WriteText(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary);
  out << text;
}

std::unique_ptr<BackupEngine> MakeEngine(const std::filesystem::path& dir, uint32_t retention_days, uint32_t max_backups) {
  BackupConfig config;
  config.backup_dir     = dir;
  config.retention_days = retention_days;
  config.max_backups    = max_backups;
  return std::make_unique<BackupEngine>(std::make_shared<SqliteDB>(":memory:"), config);
}

// Places artifact (unless `with_artifact` is false) and sidecar of a backup `age` old.
BackupMetadata PlaceBackup(const std::filesystem::path& dir, const std::string& id, std::chrono::minutes age, bool with_artifact = true,
                           size_t artifact_size = 100) {
  BackupMetadata metadata;
  metadata.set_id(id);
  metadata.set_type("full");
  metadata.set_filename(id + ".sql");
  metadata.set_created_at(sqlvault::util::FormatIso8601(sqlvault::util::Now() - age));
  metadata.set_size(artifact_size);
  metadata.set_checksum("unused");
  metadata.set_compressed(false);

  if (with_artifact) WriteText(dir / metadata.filename(), std::string(artifact_size, 'x'));
  MetadataStore(dir).Write(metadata);
  return metadata;
}

constexpr std::chrono::hours kDay{24};

void TestExpiredBackupsAreDeleted() {
  const auto dir    = FreshDir("expired");
  auto       engine = MakeEngine(dir, 30, 30);

  PlaceBackup(dir, "full_old", kDay * 40, true, 300);
  PlaceBackup(dir, "full_new", kDay * 1);

  const auto result = engine->CleanupOldBackups();
  assert(result.deleted_count == 1);
  assert(result.freed_space == 300);
  assert(result.orphans_removed == 0);

  assert(!std::filesystem::exists(dir / "full_old.sql"));
  assert(!std::filesystem::exists(dir / "full_old.meta.json"));
  assert(std::filesystem::exists(dir / "full_new.sql"));
  assert(std::filesystem::exists(dir / "full_new.meta.json"));
}

void TestExcessBackupsBeyondMaxAreDeletedOldestFirst() {
  const auto dir    = FreshDir("excess");
  auto       engine = MakeEngine(dir, 30, 3);

  for (int i = 1; i <= 5; ++i) {
    PlaceBackup(dir, "full_" + std::to_string(i), std::chrono::hours(10 - i));
  }

  const auto plan = engine->PlanCleanup();
  assert(plan.size() == 2);
  assert(plan[0].metadata.id() == "full_2");
  assert(plan[1].metadata.id() == "full_1");
  assert(plan[0].reason == CleanupReason::kExcess);

  // planning deletes nothing
  assert(engine->ListBackups().size() == 5);

  const auto result = engine->CleanupOldBackups();
  assert(result.deleted_count == 2);

  const auto remaining = engine->ListBackups();
  assert(remaining.size() == 3);
  assert(remaining[0].id() == "full_5");
  assert(remaining[2].id() == "full_3");
}

void TestAgePassRunsBeforeCountPass() {
  const auto dir    = FreshDir("age_then_count");
  auto       engine = MakeEngine(dir, 7, 2);

  PlaceBackup(dir, "full_a", std::chrono::hours(1));
  PlaceBackup(dir, "full_b", std::chrono::hours(2));
  PlaceBackup(dir, "full_c", std::chrono::hours(3));
  PlaceBackup(dir, "full_d", kDay * 10);

  const auto plan = engine->PlanCleanup();
  assert(plan.size() == 2);
  assert(plan[0].metadata.id() == "full_c");
  assert(plan[0].reason == CleanupReason::kExcess);
  assert(plan[1].metadata.id() == "full_d");
  assert(plan[1].reason == CleanupReason::kExpired);
}

void TestHugeRetentionKeepsEverything() {
  for (const uint32_t retention_days : {200000u, 4294967295u}) {
    const auto dir    = FreshDir("huge_retention_" + std::to_string(retention_days));
    auto       engine = MakeEngine(dir, retention_days, 30);

    PlaceBackup(dir, "full_1000", std::chrono::hours(3));
    PlaceBackup(dir, "full_1001", std::chrono::hours(2));
    PlaceBackup(dir, "full_1002", kDay * 40);

    assert(engine->PlanCleanup().empty());

    const auto result = engine->CleanupOldBackups();
    assert(result.deleted_count == 0);
    assert(engine->ListBackups().size() == 3);
  }
}

void TestMissingArtifactCountsAsDeleted() {
  const auto dir    = FreshDir("missing_artifact");
  auto       engine = MakeEngine(dir, 30, 30);

  PlaceBackup(dir, "full_ghost", kDay * 60, false);

  const auto result = engine->CleanupOldBackups();
  assert(result.deleted_count == 1);
  assert(result.freed_space == 0);
  assert(!std::filesystem::exists(dir / "full_ghost.meta.json"));
}

void TestOrphansAndTempFilesAreRemoved() {
  const auto dir    = FreshDir("orphans");
  auto       engine = MakeEngine(dir, 30, 30);

  PlaceBackup(dir, "full_kept", std::chrono::hours(1));
  WriteText(dir / "full_orphan.sql.gz", std::string(50, 'z'));
  WriteText(dir / "full_crashed.sql.gz.tmp", std::string(25, 'z'));
  WriteText(dir / "README", "not a backup");

  const auto result = engine->CleanupOldBackups();
  assert(result.deleted_count == 0);
  assert(result.orphans_removed == 2);
  assert(result.freed_space == 75);

  assert(std::filesystem::exists(dir / "full_kept.sql"));
  assert(std::filesystem::exists(dir / "README"));
  assert(!std::filesystem::exists(dir / "full_orphan.sql.gz"));
  assert(!std::filesystem::exists(dir / "full_crashed.sql.gz.tmp"));
}

void TestCleanupIsIdempotent() {
  const auto dir    = FreshDir("idempotent");
  auto       engine = MakeEngine(dir, 30, 1);

  PlaceBackup(dir, "full_1", std::chrono::hours(2));
  PlaceBackup(dir, "full_2", std::chrono::hours(1));

  assert(engine->CleanupOldBackups().deleted_count == 1);

  const auto second = engine->CleanupOldBackups();
  assert(second.deleted_count == 0);
  assert(second.freed_space == 0);
  assert(second.orphans_removed == 0);
}

void TestDeleteFindAndUsability() {
  const auto dir    = FreshDir("delete_find");
  auto       engine = MakeEngine(dir, 30, 30);

  const auto older = PlaceBackup(dir, "full_1760842800000", std::chrono::hours(2));
  const auto newer = PlaceBackup(dir, "full_1760846400000", std::chrono::hours(1));
  const auto ghost = PlaceBackup(dir, "schema_1760850000000", std::chrono::minutes(30), false);

  assert(engine->FindBackup("full_1760842800000")->id() == older.id());
  assert(engine->FindBackup("full_")->id() == newer.id());
  assert(engine->FindBackup("42800000.sql")->id() == older.id());
  assert(!engine->FindBackup("nothing-like-this"));

  assert(engine->IsUsable(older));
  assert(!engine->IsUsable(ghost));

  assert(engine->DeleteBackup(older.id()));
  assert(!std::filesystem::exists(dir / older.filename()));
  assert(!std::filesystem::exists(dir / (older.id() + ".meta.json")));

  bool threw = false;
  try {
    engine->DeleteBackup(older.id());
  } catch (const sqlvault::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestExpiredBackupsAreDeleted();
  TestExcessBackupsBeyondMaxAreDeletedOldestFirst();
  TestAgePassRunsBeforeCountPass();
  TestHugeRetentionKeepsEverything();
  TestMissingArtifactCountsAsDeleted();
  TestOrphansAndTempFilesAreRemoved();
  TestCleanupIsIdempotent();
  TestDeleteFindAndUsability();

  std::cout << "sqlvault_unit_backup_cleanup: pass\n";
  return 0;
}
