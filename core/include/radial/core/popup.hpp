#pragma once

#include <string>
#include <vector>

#include "radial/core/entities.hpp"
#include "radial/core/geometry.hpp"
#include "radial/core/types.hpp"

namespace radial::core {

struct PopupSize {
  double width = 0.0;
  double height = 0.0;
};

PopupSize CompactPopupSize(const RenderGeometry& geometry);
PopupSize DetailedPopupSize(const RenderGeometry& geometry);

// Above-right of the anchor by default; flips left / below when it would leave the surface.
Vec2d PositionPopupNear(const Vec2d& anchor, const PopupSize& size, double render_size);

struct PopupState {
  ActivityId activity_id{};
  Vec2d position{};
  bool detailed = false;
};

struct PopupRow {
  std::string label{};
  std::string value{};
};

// Rows shown for an activity: a short summary, or every known field when detailed.
std::vector<PopupRow> DescribeActivity(const Activity& activity, bool detailed);

}  // namespace radial::core
