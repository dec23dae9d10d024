#include "radial/core/angle_mapper.hpp"

#include <algorithm>
#include <cmath>

#include "radial/core/types.hpp"

namespace radial::core {

namespace {

constexpr double kMonthsPerYear = 12.0;
constexpr double kNominalMonthDays = 30.0;
// Absorbs rounding when an angle that came from AngleOf lands exactly on a unit boundary.
constexpr double kUnitBoundaryEps = 1e-9;

}  // namespace

AngleMapper::AngleMapper(const ViewState& view) : view_(view) {
  if (view_.focused_month.has_value()) {
    const int month = std::clamp(*view_.focused_month, 0, 11);
    view_.focused_month = month;
    focus_start_ = MonthStart(view_.year, month);
    focus_end_ = MonthEnd(view_.year, month);
    focus_days_ = DaysInMonth(view_.year, month);
  }
}

int AngleMapper::unit_count() const {
  return month_focus() ? focus_days_ : static_cast<int>(kMonthsPerYear);
}

double AngleMapper::AngleOf(DateTime value) const {
  if (!month_focus()) {
    const CivilDateTime c = ToCivil(value);
    const double month_float = c.month + c.day / kNominalMonthDays;
    return (month_float / kMonthsPerYear) * kTwoPi - kHalfPi;
  }
  const DateTime clamped = std::clamp(value, focus_start_, focus_end_);
  const CivilDateTime c = ToCivil(clamped);
  const double frac_day = static_cast<double>(c.seconds_of_day) / kSecondsPerDay;
  const double day_float = (c.day - 1) + frac_day;
  const double fraction = std::fmod(day_float / std::max(1, focus_days_), 1.0);
  return fraction * kTwoPi - kHalfPi;
}

DateTime AngleMapper::DateOf(double angle) const {
  const double fraction = std::isfinite(angle) ? normalize_angle(angle + kHalfPi) / kTwoPi : 0.0;

  if (month_focus()) {
    const double day_float = fraction * focus_days_;
    const int day = std::clamp(static_cast<int>(std::floor(day_float + kUnitBoundaryEps)) + 1, 1, focus_days_);
    return MakeDateTime(view_.year, *view_.focused_month, day, kRecoveredDateHour);
  }

  const double month_float = fraction * kMonthsPerYear;
  const int month = std::clamp(static_cast<int>(std::floor(month_float + kUnitBoundaryEps)), 0, 11);
  const double month_frac = std::clamp(month_float - month, 0.0, 1.0);
  const int days_in_month = DaysInMonth(view_.year, month);
  const int day =
      std::clamp(static_cast<int>(std::lround(month_frac * (days_in_month - 1))) + 1, 1, days_in_month);
  return MakeDateTime(view_.year, month, day, kRecoveredDateHour);
}

int AngleMapper::FocusDayOf(DateTime value) const {
  if (!month_focus()) {
    return ToCivil(value).day;
  }
  return ToCivil(std::clamp(value, focus_start_, focus_end_)).day;
}

bool AngleMapper::Displays(const Activity& activity) const {
  if (!activity.start.has_value()) {
    return false;
  }
  if (!month_focus()) {
    return true;
  }
  const DateTime start = *activity.start;
  const DateTime end = activity.end.value_or(start);
  return start <= focus_end_ && end >= focus_start_;
}

std::vector<const Activity*> FilterDisplayActivities(const std::vector<Activity>& activities,
                                                     const AngleMapper& mapper) {
  std::vector<const Activity*> out;
  out.reserve(activities.size());
  for (const Activity& activity : activities) {
    if (mapper.Displays(activity)) {
      out.push_back(&activity);
    }
  }
  return out;
}

}  // namespace radial::core
