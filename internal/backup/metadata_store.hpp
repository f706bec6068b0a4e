#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/backup/backup_types.hpp"

namespace sqlvault::backup {

// Whole-number accessors for the JSON-number fields of BackupMetadata.
uint64_t StoredSize(const BackupMetadata& metadata);
uint64_t RecordCount(const BackupMetadata& metadata);

/*
  Sidecar persistence: one `{id}.meta.json` per backup, next to its artifact.

  Sidecars are pretty-printed protobuf JSON. They are written once through
  tmp + rename and never modified afterwards.
*/
class MetadataStore {
 public:
  explicit MetadataStore(std::filesystem::path root);

  const std::filesystem::path& Root() const {
    return root_;
  }

  void Write(const BackupMetadata& metadata) const;

  // nullopt when no sidecar exists; throws IntegrityError on an unreadable one
  std::optional<BackupMetadata> Read(const std::string& backup_id) const;

  // Every parseable sidecar, newest first. Bad sidecars are logged and skipped.
  std::vector<BackupMetadata> List() const;

  bool Remove(const std::string& backup_id) const;

  static std::string                   ToJson(const BackupMetadata& metadata);
  // nullopt on malformed JSON or a size/recordCount that is not a whole
  // number in [0, 2^53]
  static std::optional<BackupMetadata> FromJson(const std::string& json);

 private:
  std::filesystem::path root_;
};

} // namespace sqlvault::backup
