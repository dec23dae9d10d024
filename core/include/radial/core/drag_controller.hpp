#pragma once

#include <optional>
#include <variant>

#include "radial/core/angle_mapper.hpp"
#include "radial/core/entities.hpp"
#include "radial/core/geometry.hpp"

namespace radial::core {

struct DragIdle {};

struct DragActive {
  ActivityId activity_id{};
  DragHandle handle = DragHandle::kStart;
  std::optional<DateTime> preview{};  // set by the first pointer move
};

// Idle | Dragging{id, handle}. "Is a drag running" and "which handle" cannot disagree.
using DragState = std::variant<DragIdle, DragActive>;

// Optimistic, uncommitted value shown while the pointer moves.
struct DragPreview {
  ActivityId activity_id{};
  DragHandle handle = DragHandle::kStart;
  DateTime value{};
};

// Turns pointer movement around the circle center into date changes for one handle.
//
// A pointer-down while already dragging replaces the session; hosts feed a single
// pointer stream.
class DragController {
 public:
  void Begin(ActivityId activity_id, DragHandle handle);

  // No-op while idle or for a non-finite pointer.
  std::optional<DragPreview> Move(const Vec2d& pointer, const RenderGeometry& geometry, const AngleMapper& mapper);

  // Always returns to idle and drops the preview before handing out the update.
  // A non-finite pointer ends the drag without an update.
  std::optional<ActivityUpdate> End(const Vec2d& pointer, const RenderGeometry& geometry, const AngleMapper& mapper);

  // Back to idle without an update. Returns whether a session was active.
  bool Cancel();

  [[nodiscard]] bool dragging() const { return std::holds_alternative<DragActive>(state_); }
  [[nodiscard]] const DragActive* active() const { return std::get_if<DragActive>(&state_); }
  [[nodiscard]] std::optional<DragPreview> preview() const;
  [[nodiscard]] const DragState& state() const { return state_; }

 private:
  DragState state_{DragIdle{}};
};

}  // namespace radial::core
