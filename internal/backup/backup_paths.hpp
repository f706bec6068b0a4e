#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlvault::backup {

inline constexpr std::string_view kSidecarSuffix    = ".meta.json";
inline constexpr std::string_view kPlainSuffix      = ".sql";
inline constexpr std::string_view kCompressedSuffix = ".sql.gz";
inline constexpr std::string_view kTempSuffix       = ".tmp";

inline bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Ids and artifact filenames must stay inside the backup directory.
inline void ValidatePathComponent(std::string_view what, const std::string& value) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

inline void ValidateBackupId(const std::string& backup_id) {
  ValidatePathComponent("backup id", backup_id);
}

inline std::string ArtifactFilename(const std::string& backup_id, bool compressed) {
  ValidateBackupId(backup_id);
  return backup_id + std::string(compressed ? kCompressedSuffix : kPlainSuffix);
}

inline std::filesystem::path SidecarPath(const std::filesystem::path& root, const std::string& backup_id) {
  ValidateBackupId(backup_id);
  return root / (backup_id + std::string(kSidecarSuffix));
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, const std::string& filename) {
  ValidatePathComponent("artifact filename", filename);
  return root / filename;
}

// "full_1700000000000.sql.gz" -> "full_1700000000000"; empty when not an artifact name
inline std::string ArtifactIdFromFilename(std::string_view filename) {
  if (EndsWith(filename, kCompressedSuffix)) return std::string(filename.substr(0, filename.size() - kCompressedSuffix.size()));
  if (EndsWith(filename, kPlainSuffix)) return std::string(filename.substr(0, filename.size() - kPlainSuffix.size()));
  return {};
}

} // namespace sqlvault::backup
