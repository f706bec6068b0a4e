#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <ratio>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sqlvault::factory {

using observability::StringField;

namespace {

constexpr double kDefaultIntervalHours = 24.0;

} // namespace

backup::BackupConfig ToBackupConfig(const sqlvault::runtime::config::BackupConfig& config) {
  backup::BackupConfig out;

  if (config.has_backup_dir()) out.backup_dir = config.backup_dir();
  if (config.has_max_backups()) out.max_backups = config.max_backups();
  if (config.has_retention_days()) out.retention_days = config.retention_days();
  if (config.has_compression()) out.compression = config.compression();
  if (config.has_encryption()) out.encryption = config.encryption();
  if (config.has_batch_size()) out.batch_size = config.batch_size();

  if (config.exclude_tables_size() > 0) {
    out.exclude_tables.clear();
    out.exclude_tables.insert(config.exclude_tables().begin(), config.exclude_tables().end());
  }
  return out;
}

schedule::ScheduleConfig ToScheduleConfig(const sqlvault::runtime::config::ScheduleConfig& config) {
  schedule::ScheduleConfig out;

  if (!config.type().empty()) {
    auto type = schedule::ParseScheduleType(config.type());
    if (!type) throw util::InvalidConfig("unsupported schedule.type: " + config.type());
    out.type = *type;
  }

  const double hours = config.has_interval_hours() ? config.interval_hours() : kDefaultIntervalHours;
  out.interval       = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double, std::ratio<3600>>(hours));

  out.cron_expression = config.cron_expression();
  if (config.has_enabled()) out.enabled = config.enabled();

  if (!config.backup_type().empty()) {
    auto kind = backup::ParseBackupKind(config.backup_type());
    if (!kind || *kind == backup::BackupKind::kIncremental) {
      throw util::InvalidConfig("unsupported schedule.backup_type: " + config.backup_type());
    }
    out.backup_type = *kind;
  }

  if (!config.description().empty()) out.description = config.description();
  return out;
}

Application Build(const sqlvault::runtime::config::RuntimeConfig& config, schedule::SchedulerOptions options) {
  const auto& db_path = config.database().sqlite().path();
  if (db_path.empty()) {
    throw util::InvalidConfig("database.sqlite.path is required");
  }

  const auto parent = std::filesystem::path(db_path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  Application app;
  app.db        = std::make_shared<db::sqlite::SqliteDB>(db_path);
  app.engine    = std::make_shared<backup::BackupEngine>(app.db, ToBackupConfig(config.backup()));
  app.scheduler = std::make_shared<schedule::BackupScheduler>(app.engine, ToScheduleConfig(config.schedule()), options);

  SQLVAULT_LOG_INFO("Application built",
                    {StringField("database", db_path), StringField("backup_dir", app.engine->Config().backup_dir.string())});
  return app;
}

} // namespace sqlvault::factory
