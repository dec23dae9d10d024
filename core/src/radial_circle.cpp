#include "radial/core/radial_circle.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>
#include <string>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace radial::core {

namespace {

int current_year() {
  const auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
  return static_cast<int>(std::chrono::year_month_day{today}.year());
}

void apply_preview(std::vector<Activity>* activities, const DragPreview& preview) {
  for (Activity& activity : *activities) {
    if (activity.id != preview.activity_id) {
      continue;
    }
    if (preview.handle == DragHandle::kStart) {
      activity.start = preview.value;
    } else {
      activity.end = preview.value;
    }
  }
}

}  // namespace

const char* ActivityStatusName(ActivityStatus status) {
  switch (status) {
  case ActivityStatus::kPlanned:
    return "planned";
  case ActivityStatus::kActive:
    return "active";
  case ActivityStatus::kPaused:
    return "paused";
  case ActivityStatus::kDone:
    return "done";
  case ActivityStatus::kCancelled:
    return "cancelled";
  default:
    return "unknown";
  }
}

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

const ActivityPlacement* CircleFrame::find_placement(const ActivityId& id) const {
  for (const ActivityPlacement& placement : placements) {
    if (placement.activity != nullptr && placement.activity->id == id) {
      return &placement;
    }
  }
  return nullptr;
}

RadialCircle::RadialCircle() : RadialCircle(current_year()) {}

RadialCircle::RadialCircle(int year) : now_(std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())) {
  view_.year = std::clamp(year, kMinYear, kMaxYear);
  if (view_.year != year) {
    spdlog::warn("year {} outside {}..{}, using {}", year, kMinYear, kMaxYear, view_.year);
  }
}

void RadialCircle::SetActivities(std::vector<Activity> activities) {
  activities_ = std::move(activities);
  if (popup_.has_value() && find_activity(popup_->activity_id) == nullptr) {
    popup_.reset();
  }
}

void RadialCircle::SetCategories(std::vector<CategorySpec> categories) {
  categories_ = std::move(categories);
}

EditResult<bool> RadialCircle::SetYear(int year) {
  EditResult<bool> result;
  if (year < kMinYear || year > kMaxYear) {
    result.error = "year must be within 1900..2200";
    spdlog::warn("SetYear rejected: {}", year);
    return result;
  }
  view_.year = year;
  result.ok = true;
  result.value = true;
  return result;
}

EditResult<bool> RadialCircle::UpdateSettings(const CircleSettings& settings) {
  EditResult<bool> result;
  if (!std::isfinite(settings.render_size)) {
    result.error = "render size must be finite";
    spdlog::warn("UpdateSettings rejected: non-finite render size");
    return result;
  }
  settings_ = settings;
  settings_.render_size = MakeRenderGeometry(settings.render_size).size;
  result.ok = true;
  result.value = true;
  return result;
}

EditResult<bool> RadialCircle::FocusMonth(int month) {
  EditResult<bool> result;
  if (month < 0 || month > 11) {
    result.error = "month must be within 0..11";
    spdlog::warn("FocusMonth rejected: {}", month);
    return result;
  }
  view_.focused_month = month;
  popup_.reset();
  spdlog::info("month focus: {}-{:02}", view_.year, month + 1);
  result.ok = true;
  result.value = true;
  return result;
}

void RadialCircle::ClearFocus() {
  if (!view_.focused_month.has_value()) {
    return;
  }
  view_.focused_month.reset();
  popup_.reset();
  spdlog::info("month focus cleared");
}

EditResult<bool> RadialCircle::SelectActivity(const ActivityId& activity_id) {
  EditResult<bool> result;
  if (find_activity(activity_id) == nullptr) {
    result.error = "activity does not exist";
    spdlog::warn("SelectActivity rejected: unknown id '{}'", activity_id);
    return result;
  }
  if (!activity_anchor(activity_id).has_value()) {
    result.error = "activity is not displayed";
    return result;
  }
  open_popup(activity_id, false);
  result.ok = true;
  result.value = true;
  return result;
}

void RadialCircle::ClosePopup() {
  popup_.reset();
}

EditResult<bool> RadialCircle::ExpandPopup() {
  EditResult<bool> result;
  if (!popup_.has_value()) {
    result.error = "no popup is open";
    return result;
  }
  open_popup(popup_->activity_id, true);
  result.ok = true;
  result.value = true;
  return result;
}

EditResult<bool> RadialCircle::CollapsePopup() {
  EditResult<bool> result;
  if (!popup_.has_value()) {
    result.error = "no popup is open";
    return result;
  }
  open_popup(popup_->activity_id, false);
  result.ok = true;
  result.value = true;
  return result;
}

std::optional<ActivityId> RadialCircle::selected_id() const {
  if (!popup_.has_value()) {
    return std::nullopt;
  }
  return popup_->activity_id;
}

const Activity* RadialCircle::find_activity(const ActivityId& activity_id) const {
  for (const Activity& activity : activities_) {
    if (activity.id == activity_id) {
      return &activity;
    }
  }
  return nullptr;
}

std::optional<Vec2d> RadialCircle::activity_anchor(const ActivityId& activity_id) const {
  const CircleFrame frame = ComputeFrame();
  const ActivityPlacement* placement = frame.find_placement(activity_id);
  if (placement == nullptr) {
    return std::nullopt;
  }
  return placement->start_point;
}

void RadialCircle::open_popup(const ActivityId& activity_id, bool detailed) {
  const std::optional<Vec2d> anchor = activity_anchor(activity_id);
  if (!anchor.has_value()) {
    popup_.reset();
    return;
  }
  const RenderGeometry geo = geometry();
  const PopupSize size = detailed ? DetailedPopupSize(geo) : CompactPopupSize(geo);
  popup_ = PopupState{activity_id, PositionPopupNear(*anchor, size, geo.size), detailed};
}

CircleFrame RadialCircle::ComputeFrame() const {
  CircleFrame frame;
  frame.geometry = geometry();
  frame.mapper = AngleMapper(view_);
  frame.rings = RingModel::Build(activities_, categories_, frame.geometry.radius);

  frame.effective_activities = activities_;
  if (const std::optional<DragPreview> preview = drag_.preview()) {
    apply_preview(&frame.effective_activities, *preview);
  }
  frame.display = FilterDisplayActivities(frame.effective_activities, frame.mapper);

  LabelDensity density{};
  density.visible_count = frame.display.size();
  density.small = frame.geometry.small;
  density.tiny = frame.geometry.tiny;
  density.month_focus = view_.month_focus();
  frame.label_mode = ResolveLabelMode(settings_.label_mode, density);
  frame.connection_mode = ResolveConnectionMode(settings_.connection_mode, density);

  const std::optional<ActivityId> selected = selected_id();
  frame.labeled_ids = SelectLabeledIds(frame.display, frame.label_mode, density, selected, now_);
  frame.connection_ids = SelectConnectionIds(frame.display, frame.connection_mode, frame.labeled_ids);

  frame.placements.reserve(frame.display.size());
  for (const Activity* activity : frame.display) {
    ActivityPlacement placement{};
    placement.activity = activity;
    placement.ring_key = frame.rings.ResolveKey(activity->category);
    placement.ring_radius = frame.rings.RadiusFor(activity->category);
    placement.color = frame.rings.ColorFor(activity->category);
    placement.start_angle = frame.mapper.AngleOf(*activity->start);
    placement.start_point = frame.geometry.point_at(placement.start_angle, placement.ring_radius);
    if (activity->end.has_value()) {
      placement.end_angle = frame.mapper.AngleOf(*activity->end);
      placement.end_point = frame.geometry.point_at(*placement.end_angle, placement.ring_radius);
    }
    frame.placements.push_back(std::move(placement));
  }

  const std::unordered_set<ActivityId> labeled(frame.labeled_ids.begin(), frame.labeled_ids.end());
  std::vector<LabelCandidate> candidates;
  for (const ActivityPlacement& placement : frame.placements) {
    if (labeled.count(placement.activity->id) == 0) {
      continue;
    }
    LabelCandidate candidate{};
    candidate.activity_id = placement.activity->id;
    candidate.title = placement.activity->title;
    candidate.angle = placement.start_angle;
    candidate.anchor = placement.start_point;
    candidate.color = placement.color;
    candidate.selected = selected.has_value() && *selected == placement.activity->id;
    if (view_.month_focus()) {
      candidate.day = frame.mapper.FocusDayOf(*placement.activity->start);
    }
    candidates.push_back(std::move(candidate));
  }

  if (view_.month_focus()) {
    frame.gutter = LayoutGutterLabels(candidates, frame.geometry);
  } else {
    frame.inline_labels = LayoutInlineLabels(candidates, frame.geometry, frame.label_mode);
  }
  return frame;
}

Scene RadialCircle::BuildScene() const {
  const CircleFrame frame = ComputeFrame();
  return build_scene(frame);
}

HitResult RadialCircle::HitTest(const Vec2d& point) const {
  return core::HitTest(BuildScene(), point);
}

HitResult RadialCircle::PointerDown(const Vec2d& point) {
  const HitResult hit = HitTest(point);
  if (hit.kind == HitKind::kStartHandle) {
    drag_.Begin(hit.activity_id, DragHandle::kStart);
  } else if (hit.kind == HitKind::kEndHandle) {
    drag_.Begin(hit.activity_id, DragHandle::kEnd);
  }
  return hit;
}

std::optional<DragPreview> RadialCircle::PointerMove(const Vec2d& point) {
  return drag_.Move(point, geometry(), mapper());
}

std::optional<ActivityUpdate> RadialCircle::PointerUp(const Vec2d& point) {
  std::optional<ActivityUpdate> update = drag_.End(point, geometry(), mapper());
  if (!update.has_value()) {
    return std::nullopt;
  }
  if (!on_activity_update_) {
    spdlog::warn("activity update for {} dropped: no update handler", update->activity_id);
    return update;
  }
  ActivityPatch patch{};
  if (update->field == DragHandle::kStart) {
    patch.start = update->value;
  } else {
    patch.end = update->value;
  }
  on_activity_update_(update->activity_id, patch);
  return update;
}

bool RadialCircle::CancelDrag() {
  return drag_.Cancel();
}

HitResult RadialCircle::Click(const Vec2d& point) {
  const HitResult hit = HitTest(point);
  spdlog::debug("click at ({:.1f}, {:.1f})", point.x, point.y);
  switch (hit.kind) {
  case HitKind::kActivity:
  case HitKind::kStartHandle:
  case HitKind::kEndHandle: {
    const Activity* activity = find_activity(hit.activity_id);
    if (activity == nullptr) {
      break;
    }
    if (on_activity_click_) {
      on_activity_click_(*activity);
    }
    open_popup(hit.activity_id, false);
    break;
  }
  case HitKind::kMonthLabel: {
    const EditResult<bool> focused = FocusMonth(hit.month);
    if (!focused.ok) {
      spdlog::warn("month label click ignored: {}", focused.error);
    }
    break;
  }
  case HitKind::kCenterLabel:
    ClearFocus();
    break;
  case HitKind::kNone:
  default:
    if (popup_.has_value()) {
      popup_.reset();
    } else {
      ClearFocus();
    }
    break;
  }
  return hit;
}

ValidationResult RadialCircle::Validate() const {
  ValidationResult result;
  const RingModel rings = RingModel::Build(activities_, categories_, geometry().radius);

  std::unordered_set<ActivityId> seen_ids;
  for (const Activity& activity : activities_) {
    if (activity.id.empty()) {
      result.issues.push_back(
          {ValidationSeverity::kError, "ActivityIdEmpty", "Activity has an empty id", activity.id});
    } else if (!seen_ids.insert(activity.id).second) {
      result.issues.push_back(
          {ValidationSeverity::kError, "ActivityIdDuplicate", "Activity id is used more than once", activity.id});
    }
    if (!activity.start.has_value()) {
      result.issues.push_back({ValidationSeverity::kWarning, "ActivityStartMissing",
                               "Activity has no start date and is not placed", activity.id});
    } else if (activity.end.has_value() && *activity.end < *activity.start) {
      result.issues.push_back(
          {ValidationSeverity::kWarning, "ActivityRangeInverted", "Activity ends before it starts", activity.id});
    }
    if (rings.find(NormalizeCategoryKey(activity.category)) == nullptr) {
      result.issues.push_back({ValidationSeverity::kWarning, "ActivityCategoryUnresolved",
                               "Activity category has no ring; shown on the default ring", activity.id});
    }
  }

  if (rings.candidate_count() > kMaxRings) {
    result.issues.push_back({
        ValidationSeverity::kWarning,
        "CategoryOverflow",
        "More than " + std::to_string(kMaxRings) + " categories; extra categories use the default ring",
        ActivityId{},
    });
  }
  for (const CategorySpec& category : categories_) {
    if (!category.color.empty() && !ParseHexColor(category.color).has_value()) {
      result.issues.push_back({ValidationSeverity::kWarning, "CategoryColorInvalid",
                               "Category '" + category.name + "' color '" + category.color + "' is not a hex color",
                               ActivityId{}});
    }
  }
  return result;
}

std::vector<Activity> MakeDemoActivities(int year) {
  struct Row {
    const char* id;
    const char* title;
    const char* category;
    ActivityStatus status;
    double weight;
    double budget;
    double leads;
    int start_month;
    int start_day;
    int end_month;  // -1: point activity
    int end_day;
    const char* owner;
  };
  // Months are 0-based; an end month of 12 lands in January of the next year.
  static constexpr Row kRows[] = {
      {"a01", "Trade fair Basel", "Events", ActivityStatus::kDone, 0.9, 42000.0, 120.0, 2, 15, 2, 18, "Mara"},
      {"a02", "Spring newsletter", "Content", ActivityStatus::kDone, 0.4, 1500.0, 35.0, 3, 2, -1, 0, "Jonas"},
      {"a03", "Search campaign Q2", "Digital", ActivityStatus::kActive, 0.7, 18000.0, 210.0, 3, 1, 5, 28, "Lea"},
      {"a04", "Press release product launch", "PR", ActivityStatus::kPlanned, 0.8, 3000.0, 0.0, 4, 6, -1, 0, "Nico"},
      {"a05", "Partner webinar series", "Partner", ActivityStatus::kActive, 0.6, 6500.0, 80.0, 4, 12, 6, 20, "Mara"},
      {"a06", "Customer case study", "Content", ActivityStatus::kPlanned, 0.5, 4000.0, 25.0, 5, 3, 5, 24, "Jonas"},
      {"a07", "Summer social push", "digital ", ActivityStatus::kPlanned, 0.3, 5000.0, 60.0, 6, 1, 7, 15, "Lea"},
      {"a08", "Industry roundtable", "Events", ActivityStatus::kPlanned, 0.7, 12000.0, 45.0, 8, 9, 8, 9, "Mara"},
      {"a09", "Media briefing", "PR", ActivityStatus::kPaused, 0.4, 800.0, 0.0, 8, 21, -1, 0, "Nico"},
      {"a10", "Reseller onboarding", "Partner", ActivityStatus::kPlanned, 0.5, 9000.0, 40.0, 8, 1, 9, 15, "Sven"},
      {"a11", "Autumn whitepaper", "Content", ActivityStatus::kPlanned, 0.6, 7000.0, 90.0, 9, 5, 9, 26, "Jonas"},
      {"a12", "Retargeting sprint", "Digital", ActivityStatus::kPlanned, 0.5, 8000.0, 150.0, 9, 14, 10, 10, "Lea"},
      {"a13", "Customer conference", "Events", ActivityStatus::kPlanned, 1.0, 65000.0, 300.0, 10, 4, 10, 6, "Mara"},
      {"a14", "Year-end mailing", "Content", ActivityStatus::kPlanned, 0.3, 2500.0, 20.0, 11, 1, -1, 0, "Jonas"},
      {"a15", "Holiday campaign", "Digital", ActivityStatus::kPlanned, 0.6, 11000.0, 130.0, 11, 20, 12, 5, "Lea"},
      {"a16", "Partner awards", "Partner", ActivityStatus::kCancelled, 0.2, 4000.0, 10.0, 0, 25, -1, 0, "Sven"},
  };

  std::vector<Activity> activities;
  activities.reserve(std::size(kRows));
  for (const Row& row : kRows) {
    Activity activity{};
    activity.id = row.id;
    activity.title = row.title;
    activity.category = row.category;
    activity.status = row.status;
    activity.weight = row.weight;
    activity.budget = row.budget;
    if (row.leads > 0.0) {
      activity.expected_leads = row.leads;
    }
    activity.start = MakeDateTime(year, row.start_month, row.start_day, 9);
    if (row.end_month >= 0) {
      activity.end = MakeDateTime(year, row.end_month, row.end_day, 17);
    }
    activity.owner = row.owner;
    activities.push_back(std::move(activity));
  }
  activities[0].notes = "Booth 4.2, bring the new demo units";
  activities[12].notes = "Keynote slots still open";
  return activities;
}

}  // namespace radial::core
