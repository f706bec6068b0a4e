#include "internal/util/numbers.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/bytes.hpp"

namespace {

using sqlvault::util::FormatSize;
using sqlvault::util::ParseUint32;

void TestParseUint32AcceptsDecimalDigits() {
  assert(ParseUint32("0") == 0u);
  assert(ParseUint32("10") == 10u);
  assert(ParseUint32("007") == 7u);
  assert(ParseUint32("4294967295") == 4294967295u);
}

void TestParseUint32RejectsSignsAndOverflow() {
  assert(!ParseUint32(""));
  assert(!ParseUint32("-1"));
  assert(!ParseUint32("+1"));
  assert(!ParseUint32(" 1"));
  assert(!ParseUint32("1 "));
  assert(!ParseUint32("10x"));
  assert(!ParseUint32("ten"));
  assert(!ParseUint32("4294967296"));
  assert(!ParseUint32("99999999999999999999999"));
}

void TestFormatSize() {
  assert(FormatSize(0) == "0.0B");
  assert(FormatSize(1536) == "1.5KB");
  assert(FormatSize(5ull * 1024 * 1024) == "5.0MB");
}

} // namespace

int main() {
  TestParseUint32AcceptsDecimalDigits();
  TestParseUint32RejectsSignsAndOverflow();
  TestFormatSize();

  std::cout << "sqlvault_unit_numbers: pass\n";
  return 0;
}
