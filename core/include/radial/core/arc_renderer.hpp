#pragma once

#include <array>
#include <string>
#include <vector>

#include "radial/core/types.hpp"

namespace radial::core {

// One circular arc, swept clockwise on screen (increasing angle) from start to end.
// end_angle >= start_angle; both are screen angles and may lie outside [0, 2pi).
struct ArcSegment {
  Vec2d center{};
  double radius = 0.0;
  double start_angle = 0.0;
  double end_angle = 0.0;
  Vec2d start{};
  Vec2d end{};
  bool large_arc = false;
};

// Stops the first half of a wrapping arc just short of a full turn.
constexpr double kWrapSplitEps = 1e-4;

// Duration arc from the start angle forward to the end angle. An interval that crosses
// the top of the circle (the calendar wrap point) is returned as two segments.
std::vector<ArcSegment> BuildDurationArc(const Vec2d& center, double radius, double start_angle, double end_angle);

// SVG path data: "M sx sy A r r 0 large 1 ex ey" per segment.
std::string ArcPathData(const std::vector<ArcSegment>& segments);

struct StrokePass {
  double width = 0.0;  // nominal, before stroke scaling
  double opacity = 0.0;
};

// Wide+faint, medium+translucent, thin+opaque.
constexpr std::array<StrokePass, 3> kArcGlowPasses = {
    StrokePass{14.0, 0.08},
    StrokePass{8.0, 0.18},
    StrokePass{3.0, 0.85},
};

// Whether `point` lies on the stroked arc band.
bool ArcContains(const ArcSegment& segment, double stroke_width, const Vec2d& point);

}  // namespace radial::core
