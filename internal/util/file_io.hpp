#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sqlvault::util {

// Whole-file read; throws IoError when the file cannot be opened or read.
std::string ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      write tmp -> flush -> rename

  Readers never observe a partially written file under `path`.
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view data);

} // namespace sqlvault::util
