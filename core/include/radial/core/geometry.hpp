#pragma once

#include "radial/core/types.hpp"

namespace radial::core {

constexpr double kMinRenderSize = 240.0;
constexpr double kDefaultRenderSize = 600.0;
constexpr double kSmallRenderSize = 520.0;
constexpr double kTinyRenderSize = 360.0;
// Size at which stroke and font helpers return their nominal value.
constexpr double kBaselineRenderSize = 700.0;

// Scale factors and circle placement derived from the square render surface.
struct RenderGeometry {
  double size = kDefaultRenderSize;
  bool small = false;
  bool tiny = false;
  double scale = 1.0;
  double radius = 0.0;
  Vec2d center{};

  [[nodiscard]] double stroke_width(double nominal) const;
  [[nodiscard]] double font_size(double nominal) const;
  [[nodiscard]] Vec2d point_at(double angle, double r) const { return polar_point(center, angle, r); }
  // atan2 of the pointer relative to the circle center, in (-pi, pi].
  [[nodiscard]] double pointer_angle(const Vec2d& pointer) const;
};

// Non-finite or collapsed sizes fall back to the minimum surface.
RenderGeometry MakeRenderGeometry(double render_size);

// Host sizing rule: follow the container, but never below the minimum or above the requested size.
double FitRenderSize(double max_size, double container_width);

}  // namespace radial::core
