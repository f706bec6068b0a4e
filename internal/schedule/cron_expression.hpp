#pragma once

#include <array>
#include <ctime>
#include <string>
#include <string_view>

namespace sqlvault::schedule {

/*
  Five-field cron expression: minute hour day-of-month month day-of-week.

  Each field is `*` or a single non-negative integer. Ranges, lists and
  steps are not supported; such a field never matches. An expression with
  fewer than five fields never matches. Day-of-week counts from 0 = Sunday.
*/
class CronExpression {
 public:
  static CronExpression Parse(std::string_view text);

  // Evaluated against broken-down local time.
  bool Matches(const std::tm& local) const;

  // False when any field is unparseable or missing.
  bool IsValid() const {
    return valid_;
  }

  const std::string& Text() const {
    return text_;
  }

 private:
  struct Field {
    bool any   = false;
    bool valid = false;
    int  value = 0;

    bool Matches(int actual) const {
      return any || (valid && value == actual);
    }
  };

  std::string          text_;
  std::array<Field, 5> fields_{};
  bool                 valid_ = false;
};

} // namespace sqlvault::schedule
