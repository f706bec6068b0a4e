#include "internal/schedule/cron_expression.hpp"

#include <cassert>
#include <ctime>
#include <iostream>

namespace {

using sqlvault::schedule::CronExpression;

// Monday 2026-10-19 03:00 local
std::tm MakeTm(int minute, int hour, int mday, int mon, int wday) {
  std::tm tm{};
  tm.tm_min  = minute;
  tm.tm_hour = hour;
  tm.tm_mday = mday;
  tm.tm_mon  = mon - 1;
  tm.tm_wday = wday;
  tm.tm_year = 126;
  return tm;
}

void TestWildcardsAlwaysMatch() {
  auto expr = CronExpression::Parse("* * * * *");
  assert(expr.IsValid());
  assert(expr.Matches(MakeTm(0, 0, 1, 1, 0)));
  assert(expr.Matches(MakeTm(59, 23, 31, 12, 6)));
}

void TestExactFieldsMatchOnlyThatTime() {
  auto expr = CronExpression::Parse("0 3 * * *");
  assert(expr.IsValid());
  assert(expr.Matches(MakeTm(0, 3, 19, 10, 1)));
  assert(!expr.Matches(MakeTm(1, 3, 19, 10, 1)));
  assert(!expr.Matches(MakeTm(0, 4, 19, 10, 1)));
}

void TestMonthIsOneBasedAndWeekdayStartsSunday() {
  auto october = CronExpression::Parse("* * 19 10 *");
  assert(october.Matches(MakeTm(30, 12, 19, 10, 1)));
  assert(!october.Matches(MakeTm(30, 12, 19, 9, 1)));

  auto sunday = CronExpression::Parse("* * * * 0");
  assert(sunday.Matches(MakeTm(0, 0, 18, 10, 0)));
  assert(!sunday.Matches(MakeTm(0, 0, 19, 10, 1)));
}

void TestUnsupportedSyntaxNeverMatches() {
  const char* expressions[] = {"*/5 * * * *", "0 1-5 * * *", "0,30 * * * *", "abc * * * *", "-1 * * * *"};
  for (const char* text : expressions) {
    auto expr = CronExpression::Parse(text);
    assert(!expr.IsValid());
    for (int minute = 0; minute < 60; ++minute) {
      assert(!expr.Matches(MakeTm(minute, 1, 19, 10, 1)));
    }
  }
}

void TestShortExpressionNeverMatches() {
  auto expr = CronExpression::Parse("* * *");
  assert(!expr.IsValid());
  assert(!expr.Matches(MakeTm(0, 0, 1, 1, 0)));

  auto empty = CronExpression::Parse("");
  assert(!empty.Matches(MakeTm(0, 0, 1, 1, 0)));
}

void TestExtraWhitespaceIsTolerated() {
  auto expr = CronExpression::Parse("  15   2 * *  * ");
  assert(expr.IsValid());
  assert(expr.Matches(MakeTm(15, 2, 5, 6, 3)));
  assert(expr.Text() == "  15   2 * *  * ");
}

} // namespace

int main() {
  TestWildcardsAlwaysMatch();
  TestExactFieldsMatchOnlyThatTime();
  TestMonthIsOneBasedAndWeekdayStartsSunday();
  TestUnsupportedSyntaxNeverMatches();
  TestShortExpressionNeverMatches();
  TestExtraWhitespaceIsTolerated();

  std::cout << "sqlvault_unit_cron_expression: pass\n";
  return 0;
}
