#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/backup/backup_engine.hpp"
#include "internal/schedule/cron_expression.hpp"
#include "internal/schedule/timer.hpp"

namespace sqlvault::schedule {

enum class ScheduleType { kInterval, kCron, kManual };

std::string_view            ToString(ScheduleType type);
std::optional<ScheduleType> ParseScheduleType(std::string_view text);

struct ScheduleConfig {
  ScheduleType              type = ScheduleType::kInterval;
  std::chrono::milliseconds interval{std::chrono::hours(24)};
  std::string               cron_expression;
  bool                      enabled     = true;
  backup::BackupKind        backup_type = backup::BackupKind::kFull;
  std::string               description = "Automatic scheduled backup";
};

// Partial update; unset fields keep their current value.
struct ScheduleConfigUpdate {
  std::optional<ScheduleType>              type;
  std::optional<std::chrono::milliseconds> interval;
  std::optional<std::string>               cron_expression;
  std::optional<bool>                      enabled;
  std::optional<backup::BackupKind>        backup_type;
  std::optional<std::string>               description;
};

struct SchedulerOptions {
  std::chrono::milliseconds bootstrap_delay{std::chrono::seconds(60)};
  std::chrono::milliseconds cron_poll_interval{std::chrono::seconds(60)};
};

struct SchedulerStatus {
  bool                           running = false;
  ScheduleConfig                 config;
  std::optional<util::TimePoint> next_backup;
  std::vector<std::string>       active_timers;
};

/*
  BackupScheduler

  Drives automatic backups through the engine.

      interval : "interval" (repeating) + "bootstrap" (one shot)
      cron     : "cron" polls the expression every cron_poll_interval
      manual   : no timers

  A scheduled backup that succeeds is followed by retention cleanup.
  Timer callbacks never throw; failures are logged.
*/
class BackupScheduler {
 public:
  BackupScheduler(std::shared_ptr<backup::BackupEngine> engine, ScheduleConfig config, SchedulerOptions options = {});
  ~BackupScheduler();

  BackupScheduler(const BackupScheduler&)            = delete;
  BackupScheduler& operator=(const BackupScheduler&) = delete;

  void Start();
  void Stop();

  void UpdateConfig(const ScheduleConfigUpdate& update);

  ScheduleConfig  GetConfig() const;
  SchedulerStatus GetStatus() const;

  backup::BackupResult ExecuteManualBackup(backup::BackupKind kind = backup::BackupKind::kFull,
                                           std::optional<std::string> description = std::nullopt);

 private:
  // caller holds mutex_
  void StartLocked();

  void StartIntervalSchedule();
  void StartCronSchedule();

  void ExecuteBackup();
  void PollCron(const CronExpression& expr);

  std::shared_ptr<backup::BackupEngine> engine_;
  const SchedulerOptions                options_;

  // guards config_, running_ and timers_; never held while a backup runs
  mutable std::mutex                            mutex_;
  ScheduleConfig                                config_;
  bool                                          running_ = false;
  std::map<std::string, std::unique_ptr<Timer>> timers_;

  std::optional<std::chrono::sys_time<std::chrono::minutes>> last_cron_minute_;
};

} // namespace sqlvault::schedule
