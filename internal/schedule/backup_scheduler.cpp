#include "backup_scheduler.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/bytes.hpp"

namespace sqlvault::schedule {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kIntervalTimer  = "interval";
constexpr const char* kBootstrapTimer = "bootstrap";
constexpr const char* kCronTimer      = "cron";

} // namespace

std::string_view ToString(ScheduleType type) {
  switch (type) {
    case ScheduleType::kInterval:
      return "interval";
    case ScheduleType::kCron:
      return "cron";
    case ScheduleType::kManual:
      return "manual";
  }
  return "manual";
}

std::optional<ScheduleType> ParseScheduleType(std::string_view text) {
  if (text == "interval") return ScheduleType::kInterval;
  if (text == "cron") return ScheduleType::kCron;
  if (text == "manual") return ScheduleType::kManual;
  return std::nullopt;
}

BackupScheduler::BackupScheduler(std::shared_ptr<backup::BackupEngine> engine, ScheduleConfig config, SchedulerOptions options)
    : engine_(std::move(engine)), options_(options), config_(std::move(config)) {
  if (!engine_) {
    throw std::invalid_argument("BackupScheduler requires an engine");
  }
}

BackupScheduler::~BackupScheduler() {
  Stop();
}

void BackupScheduler::Start() {
  std::lock_guard lock(mutex_);
  StartLocked();
}

void BackupScheduler::StartLocked() {
  if (running_) {
    SQLVAULT_LOG_WARN("Backup scheduler is already running");
    return;
  }

  if (!config_.enabled) {
    SQLVAULT_LOG_INFO("Backup scheduler is disabled");
    return;
  }

  running_ = true;
  SQLVAULT_LOG_INFO("Starting backup scheduler", {StringField("type", ToString(config_.type))});

  if (config_.type == ScheduleType::kInterval && config_.interval.count() > 0) {
    StartIntervalSchedule();
  } else if (config_.type == ScheduleType::kCron && !config_.cron_expression.empty()) {
    StartCronSchedule();
  }

  SQLVAULT_LOG_INFO("Backup scheduler started",
                    {StringField("type", ToString(config_.type)), IntField("timers", static_cast<int64_t>(timers_.size()))});
}

void BackupScheduler::StartIntervalSchedule() {
  timers_[kIntervalTimer] = std::make_unique<Timer>(kIntervalTimer, config_.interval, true, [this] { ExecuteBackup(); });

  // first backup shortly after start instead of one full interval later
  timers_[kBootstrapTimer] = std::make_unique<Timer>(kBootstrapTimer, options_.bootstrap_delay, false, [this] { ExecuteBackup(); });

  SQLVAULT_LOG_INFO("Scheduled interval backups", {IntField("interval_ms", config_.interval.count()),
                                                   IntField("bootstrap_ms", options_.bootstrap_delay.count())});
}

void BackupScheduler::StartCronSchedule() {
  const auto expr = CronExpression::Parse(config_.cron_expression);
  if (!expr.IsValid()) {
    SQLVAULT_LOG_WARN("Cron expression has unsupported fields; they never match", {StringField("cron", expr.Text())});
  }

  timers_[kCronTimer] = std::make_unique<Timer>(kCronTimer, options_.cron_poll_interval, true, [this, expr] { PollCron(expr); });

  SQLVAULT_LOG_INFO("Scheduled cron backups", {StringField("cron", expr.Text())});
}

void BackupScheduler::Stop() {
  std::map<std::string, std::unique_ptr<Timer>> timers;
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      SQLVAULT_LOG_DEBUG("Backup scheduler is not running");
      return;
    }
    running_ = false;
    timers.swap(timers_);
    last_cron_minute_.reset();
  }

  // joined outside mutex_: an in-flight callback may still need it
  for (auto& [name, timer] : timers) {
    timer->Cancel();
    SQLVAULT_LOG_DEBUG("Timer stopped", {StringField("timer", name)});
  }

  SQLVAULT_LOG_INFO("Backup scheduler stopped");
}

void BackupScheduler::UpdateConfig(const ScheduleConfigUpdate& update) {
  bool was_running = false;
  {
    std::lock_guard lock(mutex_);
    was_running = running_;
  }

  if (was_running) Stop();

  {
    std::lock_guard lock(mutex_);
    if (update.type) config_.type = *update.type;
    if (update.interval) config_.interval = *update.interval;
    if (update.cron_expression) config_.cron_expression = *update.cron_expression;
    if (update.enabled) config_.enabled = *update.enabled;
    if (update.backup_type) config_.backup_type = *update.backup_type;
    if (update.description) config_.description = *update.description;

    if (was_running && config_.enabled) StartLocked();
  }

  SQLVAULT_LOG_INFO("Backup scheduler configuration updated");
}

ScheduleConfig BackupScheduler::GetConfig() const {
  std::lock_guard lock(mutex_);
  return config_;
}

SchedulerStatus BackupScheduler::GetStatus() const {
  std::lock_guard lock(mutex_);

  SchedulerStatus status;
  status.running = running_;
  status.config  = config_;

  // a fired one-shot (bootstrap) stays registered until Stop but is no longer active
  for (const auto& [name, timer] : timers_) {
    if (timer->NextFireTime()) status.active_timers.push_back(name);
  }

  if (running_ && config_.type == ScheduleType::kInterval) {
    auto it = timers_.find(kIntervalTimer);
    if (it != timers_.end()) status.next_backup = it->second->NextFireTime();
  }
  return status;
}

void BackupScheduler::ExecuteBackup() {
  ScheduleConfig config = GetConfig();

  SQLVAULT_LOG_INFO("Executing scheduled backup", {StringField("type", backup::ToString(config.backup_type))});

  try {
    const auto result = engine_->CreateBackup(config.backup_type, config.description);
    if (!result.success || !result.metadata) {
      SQLVAULT_LOG_ERROR("Scheduled backup failed", {StringField("error", result.error)});
      return;
    }

    SQLVAULT_LOG_INFO("Scheduled backup completed", {StringField("file", result.metadata->filename())});

    const auto cleanup = engine_->CleanupOldBackups();
    if (cleanup.deleted_count > 0) {
      SQLVAULT_LOG_INFO("Old backups removed", {IntField("deleted", static_cast<int64_t>(cleanup.deleted_count)),
                                                StringField("freed", util::FormatSize(cleanup.freed_space))});
    }
  } catch (const std::exception& e) {
    SQLVAULT_LOG_ERROR("Scheduled backup error", {StringField("error", e.what())});
  }
}

void BackupScheduler::PollCron(const CronExpression& expr) {
  const auto now   = util::Now();
  const auto local = util::ToLocalTm(now);
  if (!expr.Matches(local)) return;

  // one run per matching minute even when polled more often
  const auto minute = std::chrono::time_point_cast<std::chrono::minutes>(now);
  {
    std::lock_guard lock(mutex_);
    if (last_cron_minute_ && *last_cron_minute_ == minute) return;
    last_cron_minute_ = minute;
  }

  ExecuteBackup();
}

backup::BackupResult BackupScheduler::ExecuteManualBackup(backup::BackupKind kind, std::optional<std::string> description) {
  SQLVAULT_LOG_INFO("Executing manual backup", {StringField("type", backup::ToString(kind))});

  auto result = engine_->CreateBackup(kind, description.value_or("Manual backup"));
  if (result.success && result.metadata) {
    SQLVAULT_LOG_INFO("Manual backup completed", {StringField("file", result.metadata->filename())});
  } else {
    SQLVAULT_LOG_ERROR("Manual backup failed", {StringField("error", result.error)});
  }
  return result;
}

} // namespace sqlvault::schedule
