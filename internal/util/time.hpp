#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nove::util {

/*
  Wall clock and license-date helpers.

  All calendar math is done in UTC. Dates are exchanged as ISO
  "YYYY-MM-DD" strings so lexical and calendar order agree.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Calendar day (UTC) containing tp.
Date ToDate(TimePoint tp);

Date AddDays(const Date& date, int days);

std::string FormatDate(const Date& date);

// Strict "YYYY-MM-DD"; nullopt for anything else or an invalid day.
std::optional<Date> ParseDate(std::string_view text);

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string FormatTimestamp(TimePoint tp);

} // namespace nove::util
