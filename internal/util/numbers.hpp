#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace sqlvault::util {

// Plain decimal digits only: no sign, no whitespace, no trailing text, fits uint32.
inline std::optional<uint32_t> ParseUint32(std::string_view text) {
  if (text.empty() || text.front() < '0' || text.front() > '9') return std::nullopt;

  uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

} // namespace sqlvault::util
