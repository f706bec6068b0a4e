#include "daemon.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sqlvault::runtime {

Daemon::Daemon(std::string environment, std::shared_ptr<schedule::BackupScheduler> scheduler)
    : environment_(std::move(environment)), scheduler_(std::move(scheduler)) {
  if (!scheduler_) {
    throw std::invalid_argument("Daemon requires a scheduler");
  }
}

Daemon::~Daemon() {
  Stop();
}

void Daemon::Start() {
  if (!AutomaticBackupsEnabled()) {
    SQLVAULT_LOG_INFO("Automatic backup disabled", {observability::StringField("environment", environment_)});
    return;
  }

  schedule::ScheduleConfigUpdate update;
  update.enabled = true;
  scheduler_->UpdateConfig(update);
  scheduler_->Start();
}

void Daemon::Stop() {
  if (scheduler_->GetStatus().running) scheduler_->Stop();
}

} // namespace sqlvault::runtime
