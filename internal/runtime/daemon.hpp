#pragma once

#include <memory>
#include <string>

#include "internal/schedule/backup_scheduler.hpp"

namespace sqlvault::runtime {

/*
  Process-level owner of the automatic backup lifecycle.

  Only the "production" environment runs scheduled backups; every other
  environment keeps the scheduler stopped.
*/
class Daemon {
public:
  Daemon(std::string environment, std::shared_ptr<schedule::BackupScheduler> scheduler);
  ~Daemon();

  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;

  void Start();
  void Stop();

  bool AutomaticBackupsEnabled() const { return environment_ == "production"; }

private:
  std::string environment_;
  std::shared_ptr<schedule::BackupScheduler> scheduler_;
};

} // namespace sqlvault::runtime
