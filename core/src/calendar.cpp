#include "radial/core/calendar.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace radial::core {

namespace {

using std::chrono::days;
using std::chrono::sys_days;
using std::chrono::year_month_day;
using std::chrono::year_month_day_last;

// Floor division that also works for negative month offsets.
int floor_div(int value, int divisor) {
  int q = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

bool parse_int(std::string_view text, int* out_value) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, *out_value);
  return ec == std::errc() && ptr == end;
}

}  // namespace

DateTime MakeDateTime(int year, int month, int day, int hour, int minute, int second) {
  const int year_carry = floor_div(month, 12);
  const int normalized_month = month - year_carry * 12;
  const year_month_day first{std::chrono::year{year + year_carry},
                             std::chrono::month{static_cast<unsigned>(normalized_month + 1)},
                             std::chrono::day{1}};
  const sys_days date = sys_days{first} + days{day - 1};
  return DateTime{date} + std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second};
}

CivilDateTime ToCivil(DateTime value) {
  const sys_days date = std::chrono::floor<days>(value);
  const year_month_day ymd{date};
  CivilDateTime out{};
  out.year = static_cast<int>(ymd.year());
  out.month = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
  out.day = static_cast<int>(static_cast<unsigned>(ymd.day()));
  out.seconds_of_day = static_cast<int>((value - DateTime{date}).count());
  return out;
}

int DaysInMonth(int year, int month) {
  const int year_carry = floor_div(month, 12);
  const int normalized_month = month - year_carry * 12;
  const year_month_day_last last{std::chrono::year{year + year_carry},
                                 std::chrono::month_day_last{
                                     std::chrono::month{static_cast<unsigned>(normalized_month + 1)}}};
  return static_cast<int>(static_cast<unsigned>(last.day()));
}

DateTime MonthStart(int year, int month) {
  return MakeDateTime(year, month, 1);
}

DateTime MonthEnd(int year, int month) {
  return MakeDateTime(year, month, DaysInMonth(year, month), 23, 59, 59);
}

int IsoWeeksInYear(int year) {
  // A year has 53 ISO weeks when it starts on a Thursday, or on a Wednesday in leap years.
  const std::chrono::weekday jan1{sys_days{std::chrono::year{year} / std::chrono::January / 1}};
  const unsigned wd = jan1.c_encoding();
  const bool leap = std::chrono::year{year}.is_leap();
  if (wd == 4 || (leap && wd == 3)) {
    return 53;
  }
  return 52;
}

double DaysBetween(DateTime from, DateTime to) {
  return static_cast<double>((to - from).count()) / static_cast<double>(kSecondsPerDay);
}

std::string FormatDate(DateTime value) {
  const CivilDateTime c = ToCivil(value);
  std::ostringstream oss;
  oss << std::setw(4) << std::setfill('0') << c.year << "-" << std::setw(2) << (c.month + 1) << "-"
      << std::setw(2) << c.day;
  return oss.str();
}

std::string FormatDateTime(DateTime value) {
  const CivilDateTime c = ToCivil(value);
  std::ostringstream oss;
  oss << FormatDate(value) << " " << std::setw(2) << std::setfill('0') << (c.seconds_of_day / 3600) << ":"
      << std::setw(2) << ((c.seconds_of_day / 60) % 60);
  return oss.str();
}

std::optional<DateTime> ParseDateTime(std::string_view text) {
  if (text.size() != 10 && text.size() != 16) {
    return std::nullopt;
  }
  if (text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  int year = 0;
  int month = 0;
  int day = 0;
  if (!parse_int(text.substr(0, 4), &year) || !parse_int(text.substr(5, 2), &month) ||
      !parse_int(text.substr(8, 2), &day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month - 1)) {
    return std::nullopt;
  }
  int hour = 0;
  int minute = 0;
  if (text.size() == 16) {
    if ((text[10] != ' ' && text[10] != 'T') || text[13] != ':') {
      return std::nullopt;
    }
    if (!parse_int(text.substr(11, 2), &hour) || !parse_int(text.substr(14, 2), &minute)) {
      return std::nullopt;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
      return std::nullopt;
    }
  }
  return MakeDateTime(year, month - 1, day, hour, minute);
}

}  // namespace radial::core
