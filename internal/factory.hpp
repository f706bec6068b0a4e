#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/backup/backup_engine.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/schedule/backup_scheduler.hpp"

namespace sqlvault::factory {

/*
  Application

  Owns all long-lived objects of one process. The scheduler and engine
  share the single database connection.
*/
struct Application {
  std::shared_ptr<db::sqlite::SqliteDB>      db;
  std::shared_ptr<backup::BackupEngine>      engine;
  std::shared_ptr<schedule::BackupScheduler> scheduler;
};

// Unset optional fields take the engine defaults.
backup::BackupConfig     ToBackupConfig(const sqlvault::runtime::config::BackupConfig& config);
schedule::ScheduleConfig ToScheduleConfig(const sqlvault::runtime::config::ScheduleConfig& config);

/*
  Build

  Composition root: opens the database and wires engine and scheduler.
  The scheduler is constructed stopped.
*/
Application Build(const sqlvault::runtime::config::RuntimeConfig& config, schedule::SchedulerOptions options = {});

} // namespace sqlvault::factory
