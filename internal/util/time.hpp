#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace sqlvault::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t millis);

// 2026-10-19T03:00:00.000Z
std::string FormatIso8601(TimePoint tp);

// Accepts a trailing Z or a +HH:MM / -HH:MM offset; fractional seconds are optional.
std::optional<TimePoint> ParseIso8601(std::string_view text);

// Broken-down local wall-clock time.
std::tm ToLocalTm(TimePoint tp);

} // namespace sqlvault::util
