#include <cassert>

#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/email.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono;
using nove::util::Date;

void TestAddDaysCrossesMonthAndLeapYear() {
  const Date start{year{2024}, month{2}, day{20}};
  assert(nove::util::FormatDate(nove::util::AddDays(start, 14)) == "2024-03-05");
  assert(nove::util::FormatDate(nove::util::AddDays(start, 9)) == "2024-02-29");

  const Date year_end{year{2025}, month{12}, day{25}};
  assert(nove::util::FormatDate(nove::util::AddDays(year_end, 30)) == "2026-01-24");
}

void TestParseDate() {
  auto parsed = nove::util::ParseDate("2025-07-01");
  assert(parsed.has_value());
  assert(nove::util::FormatDate(*parsed) == "2025-07-01");

  assert(!nove::util::ParseDate("2025-02-30").has_value());
  assert(!nove::util::ParseDate("2025-7-01").has_value());
  assert(!nove::util::ParseDate("2025/07/01").has_value());
  assert(!nove::util::ParseDate("").has_value());
  assert(!nove::util::ParseDate("20a5-07-01").has_value());
}

void TestIsoDatesOrderLexically() {
  const auto a = nove::util::FormatDate(Date{year{2025}, month{9}, day{30}});
  const auto b = nove::util::FormatDate(Date{year{2025}, month{10}, day{1}});
  assert(a < b);
}

void TestTimestampFormatting() {
  // 2025-01-02 03:04:05.678 UTC
  const auto tp = nove::util::FromUnixMillis(1735787045678ULL);
  assert(nove::util::FormatTimestamp(tp) == "2025-01-02 03:04:05");
  assert(nove::util::FormatDate(nove::util::ToDate(tp)) == "2025-01-02");
  assert(nove::util::ToUnixMillis(tp) == 1735787045678ULL);
}

void TestEmailHelpers() {
  assert(nove::util::NormalizeEmail("  Foo.Bar@Example.COM \n") == "foo.bar@example.com");
  assert(nove::util::IsValidEmail("a@b.co"));
  assert(nove::util::IsValidEmail("first.last+tag@sub.example.jp"));
  assert(!nove::util::IsValidEmail("no-at-sign"));
  assert(!nove::util::IsValidEmail("a@b"));
  assert(!nove::util::IsValidEmail("a@@b.com"));
  assert(!nove::util::IsValidEmail("@b.com"));
  assert(!nove::util::IsValidEmail("a@b..com"));
  assert(!nove::util::IsValidEmail("a@b.com."));
  assert(!nove::util::IsValidEmail("a b@c.com"));
  assert(nove::util::Trim("\t x \r\n") == "x");
}

} // namespace

int main() {
  TestAddDaysCrossesMonthAndLeapYear();
  TestParseDate();
  TestIsoDatesOrderLexically();
  TestTimestampFormatting();
  TestEmailHelpers();

  std::cout << "nove_unit_time: pass\n";
  return 0;
}
