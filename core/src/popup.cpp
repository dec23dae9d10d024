#include "radial/core/popup.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace radial::core {

namespace {

constexpr double kPopupOffsetX = 14.0;
constexpr double kPopupOffsetY = 12.0;
constexpr double kPopupBottomMargin = 4.0;

// llround overflows long long beyond this magnitude.
constexpr double kMaxIntegerFormat = 1e15;

std::string format_number(double value) {
  std::ostringstream oss;
  if (std::abs(value) > kMaxIntegerFormat) {
    oss.setf(std::ios::fixed);
    oss.precision(0);
    oss << value;
  } else if (std::abs(value - std::round(value)) < 1e-9) {
    oss << static_cast<long long>(std::llround(value));
  } else {
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << value;
  }
  return oss.str();
}

}  // namespace

PopupSize CompactPopupSize(const RenderGeometry& geometry) {
  return geometry.small ? PopupSize{200.0, 100.0} : PopupSize{220.0, 110.0};
}

PopupSize DetailedPopupSize(const RenderGeometry& geometry) {
  return PopupSize{std::min(340.0, geometry.size - 24.0), std::min(260.0, geometry.size - 24.0)};
}

Vec2d PositionPopupNear(const Vec2d& anchor, const PopupSize& size, double render_size) {
  double px = anchor.x + kPopupOffsetX;
  double py = anchor.y - size.height - kPopupOffsetY;
  if (px + size.width > render_size) {
    px = anchor.x - size.width - kPopupOffsetX;
  }
  if (px < 0.0) {
    px = 0.0;
  }
  if (py < 0.0) {
    py = anchor.y + kPopupOffsetY;
  }
  if (py + size.height > render_size) {
    py = render_size - size.height - kPopupBottomMargin;
  }
  return {px, py};
}

std::vector<PopupRow> DescribeActivity(const Activity& activity, bool detailed) {
  std::vector<PopupRow> rows;
  if (detailed) {
    rows.push_back({"ID", activity.id});
  }
  rows.push_back({"Category", activity.category});
  if (detailed) {
    rows.push_back({"Status", ActivityStatusName(activity.status)});
  }
  if (activity.start.has_value()) {
    rows.push_back({"Start", detailed ? FormatDateTime(*activity.start) : FormatDate(*activity.start)});
  }
  if (activity.end.has_value()) {
    rows.push_back({"End", detailed ? FormatDateTime(*activity.end) : FormatDate(*activity.end)});
  }
  if (!detailed) {
    if (activity.notes.has_value() && !activity.notes->empty()) {
      rows.push_back({"Notes", *activity.notes});
    }
    return rows;
  }
  if (activity.start.has_value() && activity.end.has_value()) {
    const double days = std::max(0.0, std::round(DaysBetween(*activity.start, *activity.end)));
    rows.push_back({"Duration", format_number(days) + " days"});
  }
  rows.push_back({"Budget", "CHF " + format_number(activity.budget)});
  if (activity.expected_leads.has_value()) {
    rows.push_back({"Expected leads", format_number(*activity.expected_leads)});
  }
  if (activity.owner.has_value() && !activity.owner->empty()) {
    rows.push_back({"Owner", *activity.owner});
  }
  if (activity.notes.has_value() && !activity.notes->empty()) {
    rows.push_back({"Notes", *activity.notes});
  }
  return rows;
}

}  // namespace radial::core
