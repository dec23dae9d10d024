#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "radial/core/angle_mapper.hpp"
#include "radial/core/drag_controller.hpp"
#include "radial/core/entities.hpp"
#include "radial/core/geometry.hpp"
#include "radial/core/label_layout.hpp"
#include "radial/core/label_policy.hpp"
#include "radial/core/popup.hpp"
#include "radial/core/ring_model.hpp"
#include "radial/core/scene.hpp"

namespace radial::core {

constexpr int kMinYear = 1900;
constexpr int kMaxYear = 2200;

template <typename TValue>
struct EditResult {
  bool ok = false;
  TValue value{};
  std::string error{};
};

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
  ActivityId activity_id{};
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
};

struct CircleSettings {
  double render_size = kDefaultRenderSize;
  LabelMode label_mode = LabelMode::kAuto;
  ConnectionMode connection_mode = ConnectionMode::kAuto;
};

// Where one displayed activity sits on the circle.
struct ActivityPlacement {
  const Activity* activity = nullptr;
  std::string ring_key{};
  double ring_radius = 0.0;
  Rgba color{};
  double start_angle = 0.0;
  std::optional<double> end_angle{};
  Vec2d start_point{};
  std::optional<Vec2d> end_point{};
};

// Everything derived from (activities, view state, render size) for one recompute.
// Holds pointers into its own activity copy, so it is move-only.
struct CircleFrame {
  CircleFrame() = default;
  CircleFrame(const CircleFrame&) = delete;
  CircleFrame& operator=(const CircleFrame&) = delete;
  CircleFrame(CircleFrame&&) = default;
  CircleFrame& operator=(CircleFrame&&) = default;

  RenderGeometry geometry{};
  AngleMapper mapper{ViewState{}};
  RingModel rings{};
  std::vector<Activity> effective_activities{};  // drag preview applied
  std::vector<const Activity*> display{};
  std::vector<ActivityPlacement> placements{};
  LabelMode label_mode = LabelMode::kNone;
  ConnectionMode connection_mode = ConnectionMode::kNone;
  std::vector<ActivityId> labeled_ids{};
  std::unordered_set<ActivityId> connection_ids{};
  std::vector<LabelItem> inline_labels{};
  GutterLayout gutter{};

  [[nodiscard]] const ActivityPlacement* find_placement(const ActivityId& id) const;
};

// Radial activity timeline: owns the inputs, the month focus, the popup and the
// single drag session, and re-derives every layout from scratch on request.
class RadialCircle {
 public:
  using ActivityClickHandler = std::function<void(const Activity&)>;
  using ActivityUpdateHandler = std::function<void(const ActivityId&, const ActivityPatch&)>;

  RadialCircle();
  // Years outside kMinYear..kMaxYear are clamped.
  explicit RadialCircle(int year);

  void SetActivities(std::vector<Activity> activities);
  void SetCategories(std::vector<CategorySpec> categories);
  EditResult<bool> SetYear(int year);
  EditResult<bool> UpdateSettings(const CircleSettings& settings);
  void SetNow(DateTime now) { now_ = now; }

  EditResult<bool> FocusMonth(int month);
  void ClearFocus();

  EditResult<bool> SelectActivity(const ActivityId& activity_id);
  void ClosePopup();
  EditResult<bool> ExpandPopup();
  EditResult<bool> CollapsePopup();

  void set_on_activity_click(ActivityClickHandler handler) { on_activity_click_ = std::move(handler); }
  void set_on_activity_update(ActivityUpdateHandler handler) { on_activity_update_ = std::move(handler); }

  // Pointer stream. PointerUp always ends the drag session before the update callback runs,
  // so an exception thrown by the callback leaves the component idle.
  HitResult PointerDown(const Vec2d& point);
  std::optional<DragPreview> PointerMove(const Vec2d& point);
  std::optional<ActivityUpdate> PointerUp(const Vec2d& point);
  // Ends the drag session without notifying the caller, e.g. when the release was a plain click.
  bool CancelDrag();
  HitResult Click(const Vec2d& point);

  [[nodiscard]] HitResult HitTest(const Vec2d& point) const;
  [[nodiscard]] CircleFrame ComputeFrame() const;
  [[nodiscard]] Scene BuildScene() const;
  [[nodiscard]] ValidationResult Validate() const;

  [[nodiscard]] const std::vector<Activity>& activities() const { return activities_; }
  [[nodiscard]] const std::vector<CategorySpec>& categories() const { return categories_; }
  [[nodiscard]] const ViewState& view_state() const { return view_; }
  [[nodiscard]] const CircleSettings& settings() const { return settings_; }
  [[nodiscard]] RenderGeometry geometry() const { return MakeRenderGeometry(settings_.render_size); }
  [[nodiscard]] AngleMapper mapper() const { return AngleMapper(view_); }
  [[nodiscard]] DateTime now() const { return now_; }
  [[nodiscard]] const std::optional<PopupState>& popup() const { return popup_; }
  [[nodiscard]] std::optional<ActivityId> selected_id() const;
  [[nodiscard]] const DragController& drag() const { return drag_; }
  [[nodiscard]] const Activity* find_activity(const ActivityId& activity_id) const;

 private:
  [[nodiscard]] static Scene build_scene(const CircleFrame& frame);
  [[nodiscard]] std::optional<Vec2d> activity_anchor(const ActivityId& activity_id) const;
  void open_popup(const ActivityId& activity_id, bool detailed);

  std::vector<Activity> activities_{};
  std::vector<CategorySpec> categories_{};
  CircleSettings settings_{};
  ViewState view_{};
  DateTime now_{};
  std::optional<PopupState> popup_{};
  DragController drag_{};
  ActivityClickHandler on_activity_click_{};
  ActivityUpdateHandler on_activity_update_{};
};

std::vector<Activity> MakeDemoActivities(int year);

}  // namespace radial::core
