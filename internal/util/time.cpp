#include "time.hpp"

#include <cctype>
#include <cstdio>

namespace sqlvault::util {

namespace {

bool ReadDigits(std::string_view text, size_t& pos, size_t count, int& out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool Expect(std::string_view text, size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) return false;
  ++pos;
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

std::string FormatIso8601(TimePoint tp) {
  const auto        secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto        millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  const std::time_t t      = Clock::to_time_t(secs);

  std::tm utc{};
  gmtime_r(&t, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buf;
}

std::optional<TimePoint> ParseIso8601(std::string_view text) {
  size_t pos = 0;
  int    year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
      !ReadDigits(text, pos, 2, day) || !Expect(text, pos, 'T') || !ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') ||
      !ReadDigits(text, pos, 2, minute) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, second)) {
    return std::nullopt;
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  std::chrono::nanoseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int64_t scale  = 100000000;
    size_t  digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      fraction += std::chrono::nanoseconds((text[pos] - '0') * scale);
      scale /= 10;
      ++pos;
      ++digits;
    }
    if (digits == 0) return std::nullopt;
  }

  std::chrono::seconds offset{0};
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int off_hours = 0, off_minutes = 0;
    if (!ReadDigits(text, pos, 2, off_hours) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, off_minutes)) {
      return std::nullopt;
    }
    offset = std::chrono::seconds(sign * (off_hours * 3600 + off_minutes * 60));
  } else {
    return std::nullopt;
  }

  if (pos != text.size()) return std::nullopt;

  std::tm utc{};
  utc.tm_year = year - 1900;
  utc.tm_mon  = month - 1;
  utc.tm_mday = day;
  utc.tm_hour = hour;
  utc.tm_min  = minute;
  utc.tm_sec  = second;

  const std::time_t t = timegm(&utc);
  return Clock::from_time_t(t) - offset + std::chrono::duration_cast<Clock::duration>(fraction);
}

std::tm ToLocalTm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);
  return local;
}

} // namespace sqlvault::util
