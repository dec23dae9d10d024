#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "radial/core/calendar.hpp"
#include "radial/core/types.hpp"

namespace radial::core {

using ActivityId = std::string;

enum class ActivityStatus : std::uint8_t {
  kPlanned = 0,
  kActive = 1,
  kPaused = 2,
  kDone = 3,
  kCancelled = 4,
};

// Caller-owned input record. The engine reads it and emits update requests; it never edits it.
struct Activity {
  ActivityId id{};
  std::string title{};
  std::string category{};
  ActivityStatus status = ActivityStatus::kPlanned;
  double weight = 0.0;
  double budget = 0.0;
  std::optional<double> expected_leads{};
  std::optional<DateTime> start{};
  std::optional<DateTime> end{};
  std::optional<std::string> owner{};
  std::optional<std::string> notes{};
  std::optional<std::string> color{};
};

// Caller-supplied category metadata. `color` is a "#rgb" or "#rrggbb" string.
struct CategorySpec {
  std::string name{};
  std::string color{};
};

struct Ring {
  std::string category_key{};
  std::string name{};
  double radius = 0.0;
  Rgba color{};
};

struct ViewState {
  int year = 1970;
  std::optional<int> focused_month{};  // 0..11; set means month-focus ("loupe") mode

  [[nodiscard]] bool month_focus() const { return focused_month.has_value(); }
};

enum class DragHandle : std::uint8_t {
  kStart = 0,
  kEnd = 1,
};

// One field change requested by the drag controller.
struct ActivityUpdate {
  ActivityId activity_id{};
  DragHandle field = DragHandle::kStart;
  DateTime value{};
};

// Shape of the payload handed to the caller's update callback.
struct ActivityPatch {
  std::optional<DateTime> start{};
  std::optional<DateTime> end{};
};

enum class LabelSide : std::uint8_t {
  kLeft = 0,
  kRight = 1,
};

enum class TextAnchor : std::uint8_t {
  kStart = 0,
  kMiddle = 1,
  kEnd = 2,
};

// Derived label placement. Rebuilt on every recompute, never persisted.
struct LabelItem {
  ActivityId activity_id{};
  Vec2d anchor_point{};
  LabelSide side = LabelSide::kRight;
  std::vector<std::string> text_lines{};
  Rgba color{};
  Vec2d position{};  // text origin; y is the top of the block in the gutter regime
  TextAnchor text_anchor = TextAnchor::kStart;
  double font_size = 10.0;
  double line_height = 12.0;
  double height = 12.0;
  std::vector<Vec2d> leader{};  // anchor -> circle edge -> label, empty for inline labels
  bool selected = false;
};

const char* ActivityStatusName(ActivityStatus status);

}  // namespace radial::core
