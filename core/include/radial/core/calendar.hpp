#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace radial::core {

// Naive wall-clock timestamp. The engine never converts between time zones.
using DateTime = std::chrono::sys_seconds;

constexpr int kSecondsPerDay = 86400;

struct CivilDateTime {
  int year = 1970;
  int month = 0;  // 0..11
  int day = 1;    // 1..31
  int seconds_of_day = 0;
};

// Month overflow (e.g. month 12 or -1) rolls into the adjacent year.
DateTime MakeDateTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
CivilDateTime ToCivil(DateTime value);

int DaysInMonth(int year, int month);
DateTime MonthStart(int year, int month);
// Last second of the month's last day (23:59:59).
DateTime MonthEnd(int year, int month);
int IsoWeeksInYear(int year);

double DaysBetween(DateTime from, DateTime to);

std::string FormatDate(DateTime value);
std::string FormatDateTime(DateTime value);
// Accepts "YYYY-MM-DD" and "YYYY-MM-DD HH:MM" (a 'T' separator works too).
std::optional<DateTime> ParseDateTime(std::string_view text);

}  // namespace radial::core
