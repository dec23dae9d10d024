#include "radial/core/arc_renderer.hpp"

#include <cmath>
#include <sstream>

namespace radial::core {

namespace {

ArcSegment make_segment(const Vec2d& center, double radius, double start_angle, double end_angle) {
  ArcSegment segment{};
  segment.center = center;
  segment.radius = radius;
  segment.start_angle = start_angle;
  segment.end_angle = end_angle;
  segment.start = polar_point(center, start_angle, radius);
  segment.end = polar_point(center, end_angle, radius);
  segment.large_arc = end_angle - start_angle > kPi;
  return segment;
}

}  // namespace

std::vector<ArcSegment> BuildDurationArc(const Vec2d& center, double radius, double start_angle, double end_angle) {
  // Measured clockwise from the top, where the calendar wraps.
  const double f1 = normalize_angle(start_angle + kHalfPi);
  const double f2 = normalize_angle(end_angle + kHalfPi);
  if (f2 >= f1) {
    return {make_segment(center, radius, f1 - kHalfPi, f2 - kHalfPi)};
  }
  return {
      make_segment(center, radius, f1 - kHalfPi, kTwoPi - kWrapSplitEps - kHalfPi),
      make_segment(center, radius, -kHalfPi, f2 - kHalfPi),
  };
}

std::string ArcPathData(const std::vector<ArcSegment>& segments) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(3);
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const ArcSegment& s = segments[i];
    if (i > 0) {
      oss << " ";
    }
    oss << "M " << s.start.x << " " << s.start.y << " A " << s.radius << " " << s.radius << " 0 "
        << (s.large_arc ? 1 : 0) << " 1 " << s.end.x << " " << s.end.y;
  }
  return oss.str();
}

bool ArcContains(const ArcSegment& segment, double stroke_width, const Vec2d& point) {
  const Vec2d d = point - segment.center;
  if (std::abs(length(d) - segment.radius) > stroke_width / 2.0) {
    return false;
  }
  const double offset = normalize_angle(std::atan2(d.y, d.x) - segment.start_angle);
  return offset <= segment.end_angle - segment.start_angle;
}

}  // namespace radial::core
