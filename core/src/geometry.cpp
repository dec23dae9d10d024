#include "radial/core/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace radial::core {

double RenderGeometry::stroke_width(double nominal) const {
  return std::max(1.0, nominal * std::max(0.8, scale));
}

double RenderGeometry::font_size(double nominal) const {
  return std::max(8.0, std::round(nominal * std::max(0.85, scale)));
}

double RenderGeometry::pointer_angle(const Vec2d& pointer) const {
  return std::atan2(pointer.y - center.y, pointer.x - center.x);
}

RenderGeometry MakeRenderGeometry(double render_size) {
  RenderGeometry g{};
  g.size = std::isfinite(render_size) ? std::max(kMinRenderSize, render_size) : kMinRenderSize;
  g.small = g.size < kSmallRenderSize;
  g.tiny = g.size < kTinyRenderSize;
  g.scale = g.size / kBaselineRenderSize;
  const double margin = (g.small ? 44.0 : 60.0) * std::max(0.9, g.scale);
  g.radius = std::max(1.0, g.size / 2.0 - margin);
  g.center = {g.size / 2.0, g.size / 2.0};
  return g;
}

double FitRenderSize(double max_size, double container_width) {
  const double width = std::isfinite(container_width) ? std::floor(container_width) : kMinRenderSize;
  const double fitted = std::max(kMinRenderSize, width);
  if (!std::isfinite(max_size)) {
    return fitted;
  }
  return std::min(max_size, fitted);
}

}  // namespace radial::core
