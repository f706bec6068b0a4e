#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <ratio>
#include <string>
#include <vector>

#include "internal/backup/metadata_store.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/numbers.hpp"

using sqlvault::backup::BackupKind;
using sqlvault::backup::BackupMetadata;
using sqlvault::backup::RecordCount;
using sqlvault::backup::StoredSize;
using sqlvault::factory::Application;
using sqlvault::util::FormatSize;

static constexpr const char* kDefaultConfig = "sqlvault.yaml";

static void Usage() {
  std::cout << "Usage:\n"
            << "  sqlvaultctl [--config <file>] create [--type full|schema] [--description <text>]\n"
            << "  sqlvaultctl [--config <file>] list [--limit <n, default 10>] [--format table|json]\n"
            << "  sqlvaultctl [--config <file>] restore <id> [--force]\n"
            << "  sqlvaultctl [--config <file>] delete <id> [--force]\n"
            << "  sqlvaultctl [--config <file>] cleanup [--dry-run]\n"
            << "  sqlvaultctl [--config <file>] status\n";
}

/*
  Flags of one subcommand: `--name value` pairs, bare `--name` switches,
  and positional arguments in order.
*/
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;

  bool Has(const std::string& name) const {
    return options.count(name) > 0;
  }

  std::optional<std::string> Get(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }
};

static Args ParseArgs(int argc, char** argv, int first, const std::vector<std::string>& switches) {
  Args args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      args.positional.push_back(arg);
      continue;
    }

    const auto name = arg.substr(2);
    bool       is_switch = false;
    for (const auto& s : switches) {
      if (s == name) is_switch = true;
    }

    if (is_switch || i + 1 >= argc) {
      args.options[name] = "";
    } else {
      args.options[name] = argv[++i];
    }
  }
  return args;
}

static bool Confirm(const std::string& question) {
  std::cout << question << " [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) return false;
  return answer == "y" || answer == "Y" || answer == "yes";
}

static std::string ShortId(const std::string& id) {
  return id.size() > 8 ? id.substr(id.size() - 8) : id;
}

static void PrintAvailable(const std::vector<BackupMetadata>& backups) {
  if (backups.empty()) return;
  std::cout << "\nAvailable backups:\n";
  for (size_t i = 0; i < backups.size() && i < 5; ++i) {
    std::cout << "  " << ShortId(backups[i].id()) << " - " << backups[i].filename() << "\n";
  }
}

// ------------------------------------------------------------

static int RunCreate(Application& app, const Args& args) {
  BackupKind kind = BackupKind::kFull;
  if (auto type = args.Get("type")) {
    if (*type == "full") {
      kind = BackupKind::kFull;
    } else if (*type == "schema") {
      kind = BackupKind::kSchema;
    } else {
      std::cerr << "unsupported backup type: " << *type << "\n";
      return 1;
    }
  }

  auto result = app.scheduler->ExecuteManualBackup(kind, args.Get("description"));
  if (!result.success || !result.metadata) {
    std::cerr << "backup failed (" << sqlvault::util::ToString(result.error_code) << "): " << result.error << "\n";
    return 2;
  }

  const auto& metadata = *result.metadata;
  std::cout << "id=" << metadata.id() << "\n";
  std::cout << "file=" << metadata.filename() << "\n";
  std::cout << "size=" << FormatSize(StoredSize(metadata)) << "\n";
  std::cout << "tables=" << metadata.tables_size() << "\n";
  std::cout << "records=" << RecordCount(metadata) << "\n";
  std::cout << "checksum=" << metadata.checksum() << "\n";
  std::cout << "duration_ms=" << result.duration.count() << "\n";
  return 0;
}

// ------------------------------------------------------------

constexpr size_t kDefaultListLimit = 10;

static int RunList(Application& app, const Args& args) {
  auto backups = app.engine->ListBackups();

  size_t limit = kDefaultListLimit;
  if (auto value = args.Get("limit")) {
    const auto parsed = sqlvault::util::ParseUint32(*value);
    if (!parsed) {
      std::cerr << "invalid --limit: " << *value << "\n";
      return 1;
    }
    limit = *parsed;
  }
  const size_t available = backups.size();
  if (limit < available) backups.resize(limit);

  const auto format = args.Get("format").value_or("table");
  if (format == "json") {
    std::cout << "[";
    for (size_t i = 0; i < backups.size(); ++i) {
      std::cout << (i ? ",\n" : "\n") << sqlvault::backup::MetadataStore::ToJson(backups[i]);
    }
    std::cout << "]\n";
    return 0;
  }
  if (format != "table") {
    std::cerr << "unsupported format: " << format << "\n";
    return 1;
  }

  if (backups.empty()) {
    std::cout << "no backups\n";
    return 0;
  }

  std::cout << std::left << std::setw(28) << "ID" << std::setw(8) << "TYPE" << std::setw(26) << "CREATED" << std::setw(10) << "SIZE"
            << std::setw(8) << "TABLES" << std::setw(10) << "RECORDS" << std::setw(10) << "STATUS"
            << "DESCRIPTION\n";

  uint64_t total = 0;
  for (const auto& metadata : backups) {
    total += StoredSize(metadata);
    std::cout << std::left << std::setw(28) << metadata.id() << std::setw(8) << metadata.type() << std::setw(26) << metadata.created_at()
              << std::setw(10) << FormatSize(StoredSize(metadata)) << std::setw(8) << metadata.tables_size() << std::setw(10)
              << RecordCount(metadata) << std::setw(10) << (app.engine->IsUsable(metadata) ? "ok" : "missing")
              << (metadata.has_description() ? metadata.description() : "") << "\n";
  }
  std::cout << "\ntotal=" << FormatSize(total) << "\n";
  if (backups.size() < available) {
    std::cout << "showing " << backups.size() << " of " << available << " (use --limit to see more)\n";
  }
  return 0;
}

// ------------------------------------------------------------

static int RunRestore(Application& app, const Args& args) {
  if (args.positional.empty()) {
    Usage();
    return 1;
  }

  const auto query  = args.positional[0];
  const auto backup = app.engine->FindBackup(query);
  if (!backup) {
    std::cerr << "backup not found: " << query << "\n";
    PrintAvailable(app.engine->ListBackups());
    return 1;
  }

  if (!args.Has("force")) {
    std::cout << "Restoring replaces the contents of " << app.db->Path() << " with " << backup->filename() << " (" << backup->created_at()
              << ").\n";
    if (!Confirm("Continue?")) {
      std::cout << "restore cancelled\n";
      return 1;
    }
  }

  auto result = app.engine->RestoreFromBackup(backup->id());
  if (!result.success) {
    std::cerr << "restore failed (" << sqlvault::util::ToString(result.error_code) << "): " << result.error << "\n";
    return 2;
  }

  std::cout << "restored=" << backup->id() << "\n";
  std::cout << "records=" << result.restored_records << "\n";
  std::cout << "duration_ms=" << result.duration.count() << "\n";
  for (const auto& table : result.restored_tables) {
    std::cout << "  " << table << "\n";
  }
  return 0;
}

// ------------------------------------------------------------

static int RunDelete(Application& app, const Args& args) {
  if (args.positional.empty()) {
    Usage();
    return 1;
  }

  const auto backup = app.engine->FindBackup(args.positional[0]);
  if (!backup) {
    std::cerr << "backup not found: " << args.positional[0] << "\n";
    return 1;
  }

  if (!args.Has("force")) {
    std::cout << "file=" << backup->filename() << "\n";
    std::cout << "created=" << backup->created_at() << "\n";
    std::cout << "size=" << FormatSize(StoredSize(*backup)) << "\n";
    if (!Confirm("Delete this backup?")) {
      std::cout << "delete cancelled\n";
      return 1;
    }
  }

  try {
    app.engine->DeleteBackup(backup->id());
  } catch (const sqlvault::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "delete failed: " << e.what() << "\n";
    return 2;
  }

  std::cout << "deleted=" << backup->filename() << "\n";
  return 0;
}

// ------------------------------------------------------------

static int RunCleanup(Application& app, const Args& args) {
  if (args.Has("dry-run")) {
    const auto candidates = app.engine->PlanCleanup();
    if (candidates.empty()) {
      std::cout << "nothing to clean up\n";
      return 0;
    }

    uint64_t total = 0;
    for (const auto& candidate : candidates) {
      total += StoredSize(candidate.metadata);
      std::cout << candidate.metadata.id() << "  " << candidate.metadata.created_at() << "  " << FormatSize(StoredSize(candidate.metadata))
                << "  " << sqlvault::backup::ToString(candidate.reason) << "\n";
    }
    std::cout << "\nwould_delete=" << candidates.size() << "\n";
    std::cout << "would_free=" << FormatSize(total) << "\n";
    return 0;
  }

  const auto result = app.engine->CleanupOldBackups();
  std::cout << "deleted=" << result.deleted_count << "\n";
  std::cout << "orphans_removed=" << result.orphans_removed << "\n";
  std::cout << "freed=" << FormatSize(result.freed_space) << "\n";
  return 0;
}

// ------------------------------------------------------------

static int RunStatus(Application& app) {
  const auto backups = app.engine->ListBackups();

  uint64_t                        total = 0;
  std::map<std::string, uint64_t> by_type;
  for (const auto& metadata : backups) {
    total += StoredSize(metadata);
    ++by_type[metadata.type()];
  }

  std::cout << "backups=" << backups.size() << "\n";
  std::cout << "total_size=" << FormatSize(total) << "\n";
  std::cout << "newest=" << (backups.empty() ? "none" : backups.front().created_at()) << "\n";
  std::cout << "oldest=" << (backups.empty() ? "none" : backups.back().created_at()) << "\n";
  std::cout << "average_size=" << FormatSize(backups.empty() ? 0 : total / backups.size()) << "\n";
  for (const auto& [type, count] : by_type) {
    std::cout << "type." << type << "=" << count << "\n";
  }

  const auto& dir = app.engine->Config().backup_dir;
  std::error_code ec;
  std::cout << "backup_dir=" << dir.string() << (std::filesystem::is_directory(dir, ec) ? "" : " (missing)") << "\n";

  const auto config = app.scheduler->GetConfig();
  std::cout << "schedule.type=" << sqlvault::schedule::ToString(config.type) << "\n";
  std::cout << "schedule.enabled=" << (config.enabled ? "true" : "false") << "\n";
  if (config.type == sqlvault::schedule::ScheduleType::kInterval) {
    std::cout << "schedule.interval_hours=" << std::chrono::duration<double, std::ratio<3600>>(config.interval).count() << "\n";
  } else if (config.type == sqlvault::schedule::ScheduleType::kCron) {
    std::cout << "schedule.cron=" << config.cron_expression << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  std::string config_path = kDefaultConfig;

  int first = 1;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    first       = 3;
  }

  if (first >= argc) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[first];
  const Args        args = ParseArgs(argc, argv, first + 1, {"force", "dry-run"});

  try {
    auto config = sqlvault::config::ConfigLoader::LoadFromYaml(config_path);

    // keep command output readable unless asked otherwise
    if (!std::getenv("SQLVAULT_LOG_LEVEL")) config.mutable_logging()->set_level("warn");
    sqlvault::observability::InitializeLogging(config);

    auto app = sqlvault::factory::Build(config);

    int rc = 1;
    if (cmd == "create") {
      rc = RunCreate(app, args);
    } else if (cmd == "list") {
      rc = RunList(app, args);
    } else if (cmd == "restore") {
      rc = RunRestore(app, args);
    } else if (cmd == "delete") {
      rc = RunDelete(app, args);
    } else if (cmd == "cleanup") {
      rc = RunCleanup(app, args);
    } else if (cmd == "status") {
      rc = RunStatus(app);
    } else {
      Usage();
    }

    sqlvault::observability::ShutdownLogging();
    return rc;
  } catch (const sqlvault::util::InvalidConfig& e) {
    std::cerr << "invalid configuration: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
