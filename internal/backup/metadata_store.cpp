#include "metadata_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/backup/backup_paths.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/time.hpp"

namespace sqlvault::backup {

using observability::StringField;

namespace {

constexpr double kMaxExactCount = 9007199254740992.0; // 2^53

bool IsWholeCount(double value) {
  return std::isfinite(value) && value >= 0.0 && value <= kMaxExactCount && std::floor(value) == value;
}

} // namespace

uint64_t StoredSize(const BackupMetadata& metadata) {
  return IsWholeCount(metadata.size()) ? static_cast<uint64_t>(metadata.size()) : 0;
}

uint64_t RecordCount(const BackupMetadata& metadata) {
  return IsWholeCount(metadata.record_count()) ? static_cast<uint64_t>(metadata.record_count()) : 0;
}

MetadataStore::MetadataStore(std::filesystem::path root) : root_(std::move(root)) {
}

std::string MetadataStore::ToJson(const BackupMetadata& metadata) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(metadata, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode backup metadata: " + std::string(status.message()));
  }
  return json;
}

std::optional<BackupMetadata> MetadataStore::FromJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  BackupMetadata metadata;
  if (!google::protobuf::util::JsonStringToMessage(json, &metadata, options).ok()) {
    return std::nullopt;
  }
  if (!IsWholeCount(metadata.size()) || !IsWholeCount(metadata.record_count())) {
    return std::nullopt;
  }
  return metadata;
}

void MetadataStore::Write(const BackupMetadata& metadata) const {
  std::filesystem::create_directories(root_);
  util::WriteFileAtomic(SidecarPath(root_, metadata.id()), ToJson(metadata));
}

std::optional<BackupMetadata> MetadataStore::Read(const std::string& backup_id) const {
  const auto path = SidecarPath(root_, backup_id);

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return std::nullopt;

  auto metadata = FromJson(util::ReadFile(path));
  if (!metadata) {
    throw util::IntegrityError("unreadable sidecar " + path.filename().string());
  }
  return metadata;
}

std::vector<BackupMetadata> MetadataStore::List() const {
  std::vector<BackupMetadata> backups;

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) return backups;

  std::vector<std::pair<util::TimePoint, BackupMetadata>> entries;

  for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (!EndsWith(name, kSidecarSuffix)) continue;

    std::optional<BackupMetadata> metadata;
    try {
      metadata = FromJson(util::ReadFile(it->path()));
    } catch (const util::IoError& e) {
      SQLVAULT_LOG_WARN("Skipping unreadable sidecar", {StringField("file", name), StringField("error", e.what())});
      continue;
    }

    if (!metadata) {
      SQLVAULT_LOG_WARN("Skipping malformed sidecar", {StringField("file", name)});
      continue;
    }

    const auto created = util::ParseIso8601(metadata->created_at());
    if (!created) {
      SQLVAULT_LOG_WARN("Skipping sidecar with invalid createdAt",
                        {StringField("file", name), StringField("created_at", metadata->created_at())});
      continue;
    }

    entries.emplace_back(*created, std::move(*metadata));
  }

  if (ec) {
    SQLVAULT_LOG_WARN("Backup directory scan stopped early", {StringField("dir", root_.string()), StringField("error", ec.message())});
  }

  std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) return a.first > b.first;
    return a.second.id() > b.second.id();
  });

  backups.reserve(entries.size());
  for (auto& entry : entries) {
    backups.push_back(std::move(entry.second));
  }
  return backups;
}

bool MetadataStore::Remove(const std::string& backup_id) const {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(SidecarPath(root_, backup_id), ec);
  if (ec) {
    throw util::IoError("failed to remove sidecar of " + backup_id + ": " + ec.message());
  }
  return removed;
}

} // namespace sqlvault::backup
