#include "time.hpp"

#include <fmt/format.h>

#include <charconv>

namespace nove::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

Date ToDate(TimePoint tp) {
  return Date{std::chrono::floor<std::chrono::days>(tp)};
}

Date AddDays(const Date& date, int days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

std::string FormatDate(const Date& date) {
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()));
}

namespace {

bool ParseField(std::string_view text, int& out) {
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

std::optional<Date> ParseDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int year = 0, month = 0, day = 0;
  if (!ParseField(text.substr(0, 4), year) || !ParseField(text.substr(5, 2), month) || !ParseField(text.substr(8, 2), day)) {
    return std::nullopt;
  }

  Date date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}, std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::string FormatTimestamp(TimePoint tp) {
  const auto day  = std::chrono::floor<std::chrono::days>(tp);
  const Date date{day};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(tp - day)};
  return fmt::format("{} {:02}:{:02}:{:02}", FormatDate(date), hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

} // namespace nove::util
