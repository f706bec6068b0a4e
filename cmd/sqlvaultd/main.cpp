#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/daemon.hpp"

using sqlvault::runtime::Daemon;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: sqlvaultd <config.yaml> OR sqlvaultd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sqlvault::config::ConfigLoader::LoadFromYaml(config_path);

    sqlvault::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = sqlvault::factory::Build(config);

    // ------------------------------------------------------------
    // Start automatic backups
    // ------------------------------------------------------------
    Daemon daemon(config.environment(), app.scheduler);

    // Register signal handlers before starting timers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    daemon.Start();
    SQLVAULT_LOG_INFO("sqlvaultd started", {sqlvault::observability::StringField("environment", config.environment()),
                                            sqlvault::observability::BoolField("scheduler", daemon.AutomaticBackupsEnabled())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SQLVAULT_LOG_INFO("Shutting down sqlvaultd");

    daemon.Stop();
    sqlvault::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SQLVAULT_LOG_ERROR("Fatal error", {sqlvault::observability::StringField("error", e.what())});
    sqlvault::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
