#pragma once

#include <vector>

#include "radial/core/calendar.hpp"
#include "radial/core/entities.hpp"

namespace radial::core {

// Hour assigned to dates recovered from an angle.
constexpr int kRecoveredDateHour = 9;

// Bidirectional mapping between calendar time and position on the circle.
//
// Year view: the circle holds the 12 months of `year`; day-of-month advances
// the angle as a fraction of a nominal 30-day month. Month focus: the circle
// holds the days of the focused month and every date is clamped into it first.
class AngleMapper {
 public:
  explicit AngleMapper(const ViewState& view);

  [[nodiscard]] double AngleOf(DateTime value) const;
  // Non-finite angles map to the first unit of the view.
  [[nodiscard]] DateTime DateOf(double angle) const;

  [[nodiscard]] const ViewState& view() const { return view_; }
  [[nodiscard]] bool month_focus() const { return view_.month_focus(); }
  // 12 in year view, the number of days of the focused month otherwise.
  [[nodiscard]] int unit_count() const;
  [[nodiscard]] DateTime focus_start() const { return focus_start_; }
  [[nodiscard]] DateTime focus_end() const { return focus_end_; }
  // Day-of-month the date lands on after clamping into the focused month.
  [[nodiscard]] int FocusDayOf(DateTime value) const;

  // Whether an activity belongs to the current display set.
  [[nodiscard]] bool Displays(const Activity& activity) const;

 private:
  ViewState view_{};
  DateTime focus_start_{};
  DateTime focus_end_{};
  int focus_days_ = 0;
};

std::vector<const Activity*> FilterDisplayActivities(const std::vector<Activity>& activities,
                                                     const AngleMapper& mapper);

}  // namespace radial::core
