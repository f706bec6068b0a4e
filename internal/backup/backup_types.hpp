#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "internal/util/errors.hpp"
#include "sqlvault/backup/v1/metadata.pb.h"

namespace sqlvault::backup {

using BackupMetadata = sqlvault::backup::v1::BackupMetadata;

enum class BackupKind {
  kFull,
  kIncremental, // reserved; the engine does not produce incremental dumps
  kSchema
};

std::string_view           ToString(BackupKind kind);
std::optional<BackupKind>  ParseBackupKind(std::string_view text);

/*
  Engine construction options. Immutable for the lifetime of an engine.
*/
struct BackupConfig {
  std::filesystem::path           backup_dir     = "./backups";
  uint32_t                        max_backups    = 30;
  uint32_t                        retention_days = 30;
  bool                            compression    = true;
  bool                            encryption     = false;
  std::unordered_set<std::string> exclude_tables = {"error_logs"};

  // rows per INSERT statement
  uint32_t batch_size = 100;
};

struct BackupResult {
  bool                          success = false;
  std::optional<BackupMetadata> metadata;
  util::ErrorCode               error_code = util::ErrorCode::kOk;
  std::string                   error;
  std::chrono::milliseconds     duration{0};
};

struct RestoreResult {
  bool                      success = false;
  std::vector<std::string>  restored_tables;
  uint64_t                  restored_records = 0;
  util::ErrorCode           error_code       = util::ErrorCode::kOk;
  std::string               error;
  std::chrono::milliseconds duration{0};
};

struct CleanupResult {
  uint64_t deleted_count   = 0;
  uint64_t freed_space     = 0;
  uint64_t orphans_removed = 0;
};

enum class CleanupReason { kExpired, kExcess };

std::string_view ToString(CleanupReason reason);

struct CleanupCandidate {
  BackupMetadata metadata;
  CleanupReason  reason = CleanupReason::kExpired;
};

} // namespace sqlvault::backup
