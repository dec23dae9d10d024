#include "radial/core/drag_controller.hpp"

#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

namespace radial::core {

namespace {

const char* handle_name(DragHandle handle) {
  return handle == DragHandle::kStart ? "start" : "end";
}

bool finite_point(const Vec2d& p) {
  return std::isfinite(p.x) && std::isfinite(p.y);
}

}  // namespace

void DragController::Begin(ActivityId activity_id, DragHandle handle) {
  spdlog::debug("drag begin: activity={} handle={}", activity_id, handle_name(handle));
  state_ = DragActive{std::move(activity_id), handle, std::nullopt};
}

std::optional<DragPreview> DragController::Move(const Vec2d& pointer,
                                                const RenderGeometry& geometry,
                                                const AngleMapper& mapper) {
  DragActive* drag = std::get_if<DragActive>(&state_);
  if (drag == nullptr || !finite_point(pointer)) {
    return std::nullopt;
  }
  drag->preview = mapper.DateOf(geometry.pointer_angle(pointer));
  return DragPreview{drag->activity_id, drag->handle, *drag->preview};
}

std::optional<ActivityUpdate> DragController::End(const Vec2d& pointer,
                                                  const RenderGeometry& geometry,
                                                  const AngleMapper& mapper) {
  DragActive* drag = std::get_if<DragActive>(&state_);
  if (drag == nullptr) {
    return std::nullopt;
  }
  if (!finite_point(pointer)) {
    spdlog::warn("drag of {} ended without update: pointer is not finite", drag->activity_id);
    state_ = DragIdle{};
    return std::nullopt;
  }
  ActivityUpdate update{};
  update.activity_id = std::move(drag->activity_id);
  update.field = drag->handle;
  update.value = mapper.DateOf(geometry.pointer_angle(pointer));
  state_ = DragIdle{};
  spdlog::debug("drag commit: activity={} {}={}", update.activity_id, handle_name(update.field),
                FormatDateTime(update.value));
  return update;
}

bool DragController::Cancel() {
  const DragActive* drag = std::get_if<DragActive>(&state_);
  if (drag == nullptr) {
    return false;
  }
  spdlog::debug("drag cancel: activity={}", drag->activity_id);
  state_ = DragIdle{};
  return true;
}

std::optional<DragPreview> DragController::preview() const {
  const DragActive* drag = std::get_if<DragActive>(&state_);
  if (drag == nullptr || !drag->preview.has_value()) {
    return std::nullopt;
  }
  return DragPreview{drag->activity_id, drag->handle, *drag->preview};
}

}  // namespace radial::core
