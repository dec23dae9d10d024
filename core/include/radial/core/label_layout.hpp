#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "radial/core/entities.hpp"
#include "radial/core/geometry.hpp"
#include "radial/core/label_policy.hpp"

namespace radial::core {

constexpr std::size_t kMinLabelChars = 6;
constexpr std::size_t kMaxLabelLines = 3;
constexpr std::string_view kEllipsis = "…";

// Length in UTF-8 code points.
std::size_t Utf8Length(std::string_view text);

// Cuts to at most `max_chars` code points, ending in a single ellipsis. Budgets below
// kMinLabelChars are raised to it. Idempotent for a fixed budget.
std::string TruncateLabel(std::string_view text, std::size_t max_chars);

// Greedy word wrap. A word is split mid-word only when it alone exceeds `line_width`;
// text beyond `max_lines` is dropped and the last kept line ends in an ellipsis.
std::vector<std::string> WrapLabel(std::string_view text,
                                   std::size_t line_width,
                                   std::size_t max_lines = kMaxLabelLines);

struct RailSlot {
  double natural_y = 0.0;  // unconstrained top of the label block
  double height = 0.0;
};

struct RailLayout {
  std::vector<double> ys{};  // final tops, same order as the input slots
  double gap = 0.0;
  bool overflow = false;  // slots needed more room than [min_y, max_y] offers
};

// Two-pass relaxation of one gutter rail.
//
// Labels keep their natural order. After relaxation consecutive labels never overlap
// (next.y >= y + height + gap). When the slots fit, every label also ends up inside
// [min_y, max_y]; when they do not, the bounds give way and separation is kept.
RailLayout RelaxRail(const std::vector<RailSlot>& slots, double min_y, double max_y, double gap);

// Preferred gap, shrunk towards `min_gap` when the rail is dense.
double RailGap(const std::vector<RailSlot>& slots, double available, double preferred_gap, double min_gap);

struct LabelCandidate {
  ActivityId activity_id{};
  std::string title{};
  double angle = 0.0;
  Vec2d anchor{};  // activity dot on its ring
  Rgba color{};
  std::optional<int> day{};  // focused-month day shown as prefix in the gutter
  bool selected = false;
};

// Characters that fit between the text origin and the circle edge in reading direction.
std::size_t InlineCharBudget(const RenderGeometry& geometry,
                             const Vec2d& text_origin,
                             TextAnchor anchor,
                             double font_size,
                             std::size_t cap);

// Year view: labels sit next to their dots; truncation is the only overflow defense.
std::vector<LabelItem> LayoutInlineLabels(const std::vector<LabelCandidate>& candidates,
                                          const RenderGeometry& geometry,
                                          LabelMode resolved_mode);

struct GutterLayout {
  std::vector<LabelItem> left{};
  std::vector<LabelItem> right{};
  double font_size = 0.0;
  double line_height = 0.0;
  double min_y = 0.0;
  double max_y = 0.0;
  double gap_left = 0.0;
  double gap_right = 0.0;
};

// Month focus: labels move to two vertical rails beside the circle.
GutterLayout LayoutGutterLabels(const std::vector<LabelCandidate>& candidates, const RenderGeometry& geometry);

}  // namespace radial::core
