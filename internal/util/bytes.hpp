#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace sqlvault::util {

// 1536 -> "1.5KB"
inline std::string FormatSize(uint64_t bytes) {
  static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB"};

  double size = static_cast<double>(bytes);
  size_t unit = 0;
  while (size >= 1024.0 && unit < 3) {
    size /= 1024.0;
    ++unit;
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%s", size, kUnits[unit]);
  return buf;
}

} // namespace sqlvault::util
