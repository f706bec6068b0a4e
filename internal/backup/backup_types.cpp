#include "backup_types.hpp"

namespace sqlvault::backup {

std::string_view ToString(BackupKind kind) {
  switch (kind) {
    case BackupKind::kFull:
      return "full";
    case BackupKind::kIncremental:
      return "incremental";
    case BackupKind::kSchema:
      return "schema";
  }
  return "full";
}

std::optional<BackupKind> ParseBackupKind(std::string_view text) {
  if (text == "full") return BackupKind::kFull;
  if (text == "incremental") return BackupKind::kIncremental;
  if (text == "schema") return BackupKind::kSchema;
  return std::nullopt;
}

std::string_view ToString(CleanupReason reason) {
  return reason == CleanupReason::kExpired ? "expired" : "excess";
}

} // namespace sqlvault::backup
