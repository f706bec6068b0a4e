#pragma once

#include <string>
#include <string_view>

namespace sqlvault::util {

// Lowercase hex SHA-256 digest (64 characters).
std::string Sha256Hex(std::string_view data);

} // namespace sqlvault::util
