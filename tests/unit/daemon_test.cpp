#include "internal/runtime/daemon.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

namespace {

using namespace std::chrono_literals;

using sqlvault::runtime::Daemon;
using sqlvault::schedule::BackupScheduler;
using sqlvault::schedule::ScheduleConfig;
using sqlvault::schedule::SchedulerOptions;

std::shared_ptr<BackupScheduler> MakeScheduler(bool enabled) {
  sqlvault::backup::BackupConfig backup;
  backup.backup_dir = std::filesystem::temp_directory_path() / "sqlvault_daemon_tests";

  auto db     = std::make_shared<sqlvault::db::sqlite::SqliteDB>(":memory:");
  auto engine = std::make_shared<sqlvault::backup::BackupEngine>(db, backup);

  ScheduleConfig config;
  config.enabled  = enabled;
  config.interval = 1h;
  return std::make_shared<BackupScheduler>(engine, config, SchedulerOptions{1h, 1h});
}

void TestDevelopmentKeepsSchedulerStopped() {
  auto   scheduler = MakeScheduler(true);
  Daemon daemon("development", scheduler);

  daemon.Start();
  assert(!daemon.AutomaticBackupsEnabled());
  assert(!scheduler->GetStatus().running);
}

void TestProductionEnablesAndStartsScheduler() {
  auto   scheduler = MakeScheduler(false);
  Daemon daemon("production", scheduler);

  daemon.Start();
  assert(daemon.AutomaticBackupsEnabled());

  auto status = scheduler->GetStatus();
  assert(status.running);
  assert(status.config.enabled);
  assert(status.active_timers.size() == 2);

  daemon.Stop();
  assert(!scheduler->GetStatus().running);
}

} // namespace

int main() {
  TestDevelopmentKeepsSchedulerStopped();
  TestProductionEnablesAndStartsScheduler();

  std::cout << "sqlvault_unit_daemon: pass\n";
  return 0;
}
