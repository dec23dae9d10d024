#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <fstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "imgui.h"
#include "raylib.h"
#include "raymath.h"
#include "rlImGui.h"
#include "radial/core/radial_circle.hpp"

namespace {

using radial::core::Activity;
using radial::core::ActivityId;
using radial::core::ActivityPatch;
using radial::core::ConnectionMode;
using radial::core::LabelMode;
using radial::core::RadialCircle;

constexpr float kSurfaceMargin = 16.0f;
// Pointer travel below this counts as a click rather than a drag.
constexpr float kClickSlop = 4.0f;
constexpr const char* kSvgExportFile = "radial_timeline.svg";

constexpr std::array<LabelMode, 5> kAllLabelModes = {
    LabelMode::kAuto, LabelMode::kAll, LabelMode::kSmart, LabelMode::kHover, LabelMode::kNone,
};

constexpr std::array<ConnectionMode, 4> kAllConnectionModes = {
    ConnectionMode::kAuto, ConnectionMode::kAll, ConnectionMode::kLabeled, ConnectionMode::kNone,
};

constexpr std::array<const char*, 12> kMonthLabels = {"January", "February", "March",     "April",   "May",      "June",
                                                      "July",    "August",   "September", "October", "November", "December"};

struct ViewerUiState {
  std::vector<Activity> activities{};
  std::vector<std::string> logs{};
  std::string last_error{};
  int year_input = 2025;
  float max_render_size = 640.0f;
  bool fit_to_window = true;
  bool ui_show_workspace = true;
  float ui_workspace_width = 420.0f;
  Vector2 press_position{};
  bool pointer_pressed = false;
};

struct ViewerPersistentSettings {
  int window_width = 1280;
  int window_height = 760;
  int year = 0;  // 0: current year
  float render_size = 640.0f;
  bool fit_to_window = true;
  LabelMode label_mode = LabelMode::kAuto;
  ConnectionMode connection_mode = ConnectionMode::kAuto;
  bool ui_show_workspace = true;
  float ui_workspace_width = 420.0f;
};

constexpr const char* kViewerSettingsFile = "viewer_state.ini";

bool parse_bool(std::string_view value, bool fallback) {
  if (value == "1" || value == "true" || value == "True") {
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    return false;
  }
  return fallback;
}

ViewerPersistentSettings LoadViewerPersistentSettings() {
  ViewerPersistentSettings settings{};
  std::ifstream ifs(kViewerSettingsFile);
  if (!ifs.is_open()) {
    return settings;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = line.substr(0, eq);
    const std::string value = line.substr(eq + 1);
    try {
      if (key == "window_width") {
        settings.window_width = std::max(640, std::stoi(value));
      } else if (key == "window_height") {
        settings.window_height = std::max(480, std::stoi(value));
      } else if (key == "year") {
        settings.year = std::clamp(std::stoi(value), radial::core::kMinYear, radial::core::kMaxYear);
      } else if (key == "render_size") {
        settings.render_size = std::clamp(std::stof(value), 240.0f, 1600.0f);
      } else if (key == "fit_to_window") {
        settings.fit_to_window = parse_bool(value, settings.fit_to_window);
      } else if (key == "label_mode") {
        settings.label_mode = radial::core::ParseLabelMode(value).value_or(settings.label_mode);
      } else if (key == "connection_mode") {
        settings.connection_mode = radial::core::ParseConnectionMode(value).value_or(settings.connection_mode);
      } else if (key == "ui_show_workspace") {
        settings.ui_show_workspace = parse_bool(value, settings.ui_show_workspace);
      } else if (key == "ui_workspace_width") {
        settings.ui_workspace_width = std::clamp(std::stof(value), 300.0f, 900.0f);
      }
    } catch (const std::exception& e) {
      spdlog::warn("{}: ignoring malformed line '{}': {}", kViewerSettingsFile, line, e.what());
    }
  }
  return settings;
}

void SaveViewerPersistentSettings(const ViewerPersistentSettings& settings) {
  std::ofstream ofs(kViewerSettingsFile, std::ios::trunc);
  if (!ofs.is_open()) {
    spdlog::warn("could not write {}", kViewerSettingsFile);
    return;
  }
  ofs << "window_width=" << settings.window_width << "\n";
  ofs << "window_height=" << settings.window_height << "\n";
  ofs << "year=" << settings.year << "\n";
  ofs << "render_size=" << settings.render_size << "\n";
  ofs << "fit_to_window=" << (settings.fit_to_window ? 1 : 0) << "\n";
  ofs << "label_mode=" << radial::core::LabelModeName(settings.label_mode) << "\n";
  ofs << "connection_mode=" << radial::core::ConnectionModeName(settings.connection_mode) << "\n";
  ofs << "ui_show_workspace=" << (settings.ui_show_workspace ? 1 : 0) << "\n";
  ofs << "ui_workspace_width=" << settings.ui_workspace_width << "\n";
}

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  spdlog::info("{}", line);
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > 12) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

void HandleResultError(ViewerUiState& ui_state, const std::string& error, const std::string& fallback_log) {
  if (!error.empty()) {
    ui_state.last_error = error;
  } else {
    ui_state.last_error = fallback_log;
  }
  PushLog(ui_state, fallback_log);
}

const char* SeverityLabel(radial::core::ValidationSeverity severity) {
  switch (severity) {
  case radial::core::ValidationSeverity::kError:
    return "error";
  case radial::core::ValidationSeverity::kWarning:
    return "warning";
  default:
    return "unknown";
  }
}

Vector2 SurfaceOrigin() {
  return {kSurfaceMargin, kSurfaceMargin};
}

Vector2 ToScreen(const radial::core::Vec2d& p) {
  const Vector2 origin = SurfaceOrigin();
  return {origin.x + static_cast<float>(p.x), origin.y + static_cast<float>(p.y)};
}

radial::core::Vec2d FromScreen(Vector2 screen) {
  const Vector2 local = Vector2Subtract(screen, SurfaceOrigin());
  return {local.x, local.y};
}

Color ToRaylib(const radial::core::Rgba& color, double opacity) {
  const double alpha = std::clamp(static_cast<double>(color.a) * opacity, 0.0, 255.0);
  return Color{color.r, color.g, color.b, static_cast<unsigned char>(std::lround(alpha))};
}

float RadToDeg(double angle) {
  return static_cast<float>(angle * 180.0 / radial::core::kPi);
}

int RingSegments(double radius, double sweep) {
  return std::max(8, static_cast<int>(std::ceil(radius * sweep / 4.0)));
}

struct ShapeDrawer {
  void operator()(const radial::core::CircleShape& c) const {
    const Vector2 center = ToScreen(c.center);
    if (c.fill) {
      DrawCircleV(center, static_cast<float>(c.radius), ToRaylib(*c.fill, c.opacity));
    }
    if (c.stroke) {
      const float half = static_cast<float>(c.stroke_width / 2.0);
      const float r = static_cast<float>(c.radius);
      DrawRing(center, std::max(0.0f, r - half), r + half, 0.0f, 360.0f, RingSegments(c.radius, radial::core::kTwoPi),
               ToRaylib(*c.stroke, c.opacity));
    }
  }

  void operator()(const radial::core::LineShape& l) const {
    const Color color = ToRaylib(l.stroke, l.opacity);
    const Vector2 from = ToScreen(l.from);
    const Vector2 to = ToScreen(l.to);
    if (l.dash <= 0.0) {
      DrawLineEx(from, to, static_cast<float>(l.width), color);
      return;
    }
    const float total = Vector2Distance(from, to);
    const float dash = static_cast<float>(l.dash);
    for (float t = 0.0f; t < total; t += 2.0f * dash) {
      const float t_end = std::min(total, t + dash);
      DrawLineEx(Vector2Lerp(from, to, t / total), Vector2Lerp(from, to, t_end / total), static_cast<float>(l.width),
                 color);
    }
  }

  void operator()(const radial::core::PolylineShape& p) const {
    const Color color = ToRaylib(p.stroke, p.opacity);
    for (std::size_t i = 1; i < p.points.size(); ++i) {
      DrawLineEx(ToScreen(p.points[i - 1]), ToScreen(p.points[i]), static_cast<float>(p.width), color);
    }
  }

  void operator()(const radial::core::ArcShape& a) const {
    const Color color = ToRaylib(a.stroke, a.opacity);
    const float half = static_cast<float>(a.width / 2.0);
    for (const radial::core::ArcSegment& s : a.segments) {
      const float r = static_cast<float>(s.radius);
      DrawRing(ToScreen(s.center), std::max(0.0f, r - half), r + half, RadToDeg(s.start_angle), RadToDeg(s.end_angle),
               RingSegments(s.radius, s.end_angle - s.start_angle), color);
      // round caps
      DrawCircleV(ToScreen(s.start), half, color);
      DrawCircleV(ToScreen(s.end), half, color);
    }
  }

  void operator()(const radial::core::TextShape& t) const {
    const int font_size = std::max(1, static_cast<int>(std::lround(t.font_size)));
    const int width = MeasureText(t.text.c_str(), font_size);
    const Vector2 anchor = ToScreen(t.position);
    float x = anchor.x - static_cast<float>(width) / 2.0f;
    if (t.anchor == radial::core::TextAnchor::kStart) {
      x = anchor.x;
    } else if (t.anchor == radial::core::TextAnchor::kEnd) {
      x = anchor.x - static_cast<float>(width);
    }
    const int ix = static_cast<int>(std::lround(x));
    const int iy = static_cast<int>(std::lround(anchor.y - static_cast<float>(font_size) / 2.0f));
    if (t.halo) {
      const Color halo = ToRaylib(*t.halo, 1.0);
      const int o = std::max(1, static_cast<int>(std::lround(t.halo_width / 2.0)));
      DrawText(t.text.c_str(), ix - o, iy, font_size, halo);
      DrawText(t.text.c_str(), ix + o, iy, font_size, halo);
      DrawText(t.text.c_str(), ix, iy - o, font_size, halo);
      DrawText(t.text.c_str(), ix, iy + o, font_size, halo);
    }
    DrawText(t.text.c_str(), ix, iy, font_size, ToRaylib(t.fill, 1.0));
    // Heavier weights get a one-pixel overdraw.
    if (t.weight >= 650) {
      DrawText(t.text.c_str(), ix + 1, iy, font_size, ToRaylib(t.fill, 1.0));
    }
  }
};

void DrawScene(const radial::core::Scene& scene) {
  const ShapeDrawer drawer{};
  for (const radial::core::Shape& shape : scene.shapes) {
    std::visit(drawer, shape);
  }
}

void ResetDemo(RadialCircle& circle, ViewerUiState& ui_state) {
  ui_state.activities = radial::core::MakeDemoActivities(circle.view_state().year);
  circle.SetActivities(ui_state.activities);
  circle.ClosePopup();
  PushLog(ui_state, "[info] demo activities loaded (" + std::to_string(ui_state.activities.size()) + ")");
}

void ApplyActivityPatch(RadialCircle& circle, ViewerUiState& ui_state, const ActivityId& id, const ActivityPatch& patch) {
  auto it = std::find_if(ui_state.activities.begin(), ui_state.activities.end(),
                         [&](const Activity& activity) { return activity.id == id; });
  if (it == ui_state.activities.end()) {
    HandleResultError(ui_state, "activity does not exist", "[drag] update for unknown activity " + id);
    return;
  }
  Activity updated = *it;
  if (patch.start) {
    updated.start = patch.start;
  }
  if (patch.end) {
    updated.end = patch.end;
  }
  if (updated.start && updated.end && *updated.end < *updated.start) {
    HandleResultError(ui_state, "end before start", "[drag] rejected: " + id + " would end before it starts");
    return;
  }
  *it = std::move(updated);
  circle.SetActivities(ui_state.activities);
  const std::string field = patch.start ? "start" : "end";
  const radial::core::DateTime value = patch.start ? *patch.start : *patch.end;
  PushLog(ui_state, "[drag] " + id + " " + field + " -> " + radial::core::FormatDateTime(value));
}

void UpdatePointerInput(RadialCircle& circle, ViewerUiState& ui_state) {
  if (ImGui::GetIO().WantCaptureMouse && !circle.drag().dragging()) {
    ui_state.pointer_pressed = false;
    return;
  }
  const Vector2 mouse = GetMousePosition();
  const radial::core::Vec2d point = FromScreen(mouse);
  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    ui_state.pointer_pressed = true;
    ui_state.press_position = mouse;
    circle.PointerDown(point);
  }
  if (circle.drag().dragging() && IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
    circle.PointerMove(point);
  }
  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
    const bool was_click = ui_state.pointer_pressed && Vector2Distance(ui_state.press_position, mouse) < kClickSlop;
    ui_state.pointer_pressed = false;
    if (!was_click) {
      if (circle.drag().dragging()) {
        circle.PointerUp(point);
      }
    } else {
      // A click on a handle opens the popup and leaves the dates alone.
      circle.CancelDrag();
      const radial::core::HitResult hit = circle.Click(point);
      if (hit.kind == radial::core::HitKind::kMonthLabel) {
        PushLog(ui_state, std::string("[view] focus ") + kMonthLabels[static_cast<std::size_t>(hit.month)]);
      }
    }
  }
}

void DrawPopupWindow(RadialCircle& circle, ViewerUiState& ui_state) {
  if (!circle.popup()) {
    return;
  }
  const radial::core::PopupState popup = *circle.popup();
  const Activity* activity = circle.find_activity(popup.activity_id);
  if (activity == nullptr) {
    circle.ClosePopup();
    return;
  }
  const radial::core::RenderGeometry geometry = circle.geometry();
  const radial::core::PopupSize size =
      popup.detailed ? radial::core::DetailedPopupSize(geometry) : radial::core::CompactPopupSize(geometry);
  const Vector2 position = ToScreen(popup.position);
  ImGui::SetNextWindowPos(ImVec2(position.x, position.y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(static_cast<float>(size.width), static_cast<float>(size.height)), ImGuiCond_Always);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                                 ImGuiWindowFlags_NoSavedSettings;
  if (!ImGui::Begin((activity->title + "###ActivityPopup").c_str(), nullptr, flags)) {
    ImGui::End();
    return;
  }
  for (const radial::core::PopupRow& row : radial::core::DescribeActivity(*activity, popup.detailed)) {
    ImGui::TextDisabled("%s", row.label.c_str());
    ImGui::SameLine(110.0f);
    ImGui::TextWrapped("%s", row.value.c_str());
  }
  if (ImGui::SmallButton(popup.detailed ? "Less" : "Details")) {
    const auto result = popup.detailed ? circle.CollapsePopup() : circle.ExpandPopup();
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "[popup] toggle failed");
    }
  }
  ImGui::SameLine();
  if (ImGui::SmallButton("Close")) {
    circle.ClosePopup();
  }
  ImGui::End();
}

void DrawControls(RadialCircle& circle, ViewerUiState& ui_state) {
  ImGui::Separator();
  ImGui::TextUnformatted("View");
  ImGui::SetNextItemWidth(120.0f);
  if (ImGui::InputInt("Year", &ui_state.year_input)) {
    const auto result = circle.SetYear(ui_state.year_input);
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "[view] year rejected");
    }
  }

  const auto& view = circle.view_state();
  const char* focus_preview = view.focused_month ? kMonthLabels[static_cast<std::size_t>(*view.focused_month)] : "Year";
  if (ImGui::BeginCombo("Focus", focus_preview)) {
    if (ImGui::Selectable("Year", !view.month_focus())) {
      circle.ClearFocus();
    }
    for (int month = 0; month < 12; ++month) {
      if (ImGui::Selectable(kMonthLabels[static_cast<std::size_t>(month)], view.focused_month == month)) {
        const auto result = circle.FocusMonth(month);
        if (!result.ok) {
          HandleResultError(ui_state, result.error, "[view] focus rejected");
        }
      }
    }
    ImGui::EndCombo();
  }

  radial::core::CircleSettings settings = circle.settings();
  bool settings_changed = false;
  if (ImGui::BeginCombo("Labels", radial::core::LabelModeName(settings.label_mode))) {
    for (LabelMode mode : kAllLabelModes) {
      if (ImGui::Selectable(radial::core::LabelModeName(mode), settings.label_mode == mode)) {
        settings.label_mode = mode;
        settings_changed = true;
      }
    }
    ImGui::EndCombo();
  }
  if (ImGui::BeginCombo("Connections", radial::core::ConnectionModeName(settings.connection_mode))) {
    for (ConnectionMode mode : kAllConnectionModes) {
      if (ImGui::Selectable(radial::core::ConnectionModeName(mode), settings.connection_mode == mode)) {
        settings.connection_mode = mode;
        settings_changed = true;
      }
    }
    ImGui::EndCombo();
  }
  ImGui::Checkbox("Fit to window", &ui_state.fit_to_window);
  ImGui::SliderFloat("Max size", &ui_state.max_render_size, 240.0f, 1200.0f, "%.0f px");
  if (settings_changed) {
    const auto result = circle.UpdateSettings(settings);
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "[view] settings rejected");
    } else {
      PushLog(ui_state, std::string("[view] labels=") + radial::core::LabelModeName(settings.label_mode) +
                            " connections=" + radial::core::ConnectionModeName(settings.connection_mode));
    }
  }

  ImGui::Separator();
  ImGui::TextUnformatted("Data");
  if (ImGui::Button("Reset demo")) {
    ResetDemo(circle, ui_state);
  }
  ImGui::SameLine();
  if (ImGui::Button("Export SVG")) {
    std::ofstream ofs(kSvgExportFile, std::ios::trunc);
    if (!ofs.is_open()) {
      HandleResultError(ui_state, "cannot open output file", std::string("[export] failed: ") + kSvgExportFile);
    } else {
      ofs << radial::core::WriteSvg(circle.BuildScene());
      PushLog(ui_state, std::string("[export] wrote ") + kSvgExportFile);
    }
  }
}

void DrawDiagnostics(const RadialCircle& circle, ViewerUiState& ui_state) {
  const radial::core::CircleFrame frame = circle.ComputeFrame();
  ImGui::Separator();
  ImGui::TextUnformatted("Layout");
  ImGui::Text("Activities:%d  Shown:%d  Rings:%d", static_cast<int>(circle.activities().size()),
              static_cast<int>(frame.display.size()), static_cast<int>(frame.rings.rings().size()));
  ImGui::Text("Labels: %s (%d)  Connections: %s", radial::core::LabelModeName(frame.label_mode),
              static_cast<int>(frame.labeled_ids.size()), radial::core::ConnectionModeName(frame.connection_mode));
  ImGui::Text("Size: %.0f  Scale: %.2f  Radius: %.1f", frame.geometry.size, frame.geometry.scale,
              frame.geometry.radius);
  if (frame.mapper.month_focus()) {
    ImGui::Text("Gutter L:%d gap %.1f  R:%d gap %.1f", static_cast<int>(frame.gutter.left.size()),
                frame.gutter.gap_left, static_cast<int>(frame.gutter.right.size()), frame.gutter.gap_right);
  }
  if (const auto preview = circle.drag().preview()) {
    ImGui::Text("Dragging %s %s -> %s", preview->activity_id.c_str(),
                preview->handle == radial::core::DragHandle::kStart ? "start" : "end",
                radial::core::FormatDateTime(preview->value).c_str());
  }

  ImGui::Separator();
  ImGui::TextUnformatted("Validation");
  const radial::core::ValidationResult validation = circle.Validate();
  if (validation.issues.empty()) {
    ImGui::TextDisabled("no issues");
  }
  for (const radial::core::ValidationIssue& issue : validation.issues) {
    ImGui::BulletText("[%s] %s %s: %s", SeverityLabel(issue.severity), issue.code.c_str(), issue.activity_id.c_str(),
                      issue.message.c_str());
  }

  ImGui::Separator();
  ImGui::TextUnformatted("Log");
  if (!ui_state.last_error.empty()) {
    ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.4f, 1.0f), "Last error: %s", ui_state.last_error.c_str());
  }
  for (auto it = ui_state.logs.rbegin(); it != ui_state.logs.rend(); ++it) {
    ImGui::TextUnformatted(it->c_str());
  }
}

void DrawWorkspaceWindow(RadialCircle& circle, ViewerUiState& ui_state) {
  if (!ui_state.ui_show_workspace) {
    return;
  }
  const float w = static_cast<float>(GetScreenWidth());
  const float h = static_cast<float>(GetScreenHeight());
  const float width = std::clamp(ui_state.ui_workspace_width, 300.0f, std::max(300.0f, w - 260.0f));
  ImGui::SetNextWindowPos(ImVec2(w - width - 8.0f, 8.0f), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(width, h - 16.0f), ImGuiCond_Always);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove;
  if (!ImGui::Begin("Workspace", nullptr, flags)) {
    ImGui::End();
    return;
  }
  ui_state.ui_workspace_width = ImGui::GetWindowWidth();
  if (ImGui::BeginTabBar("WorkspaceTabs")) {
    if (ImGui::BeginTabItem("Controls")) {
      DrawControls(circle, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Diagnostics")) {
      DrawDiagnostics(circle, ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

void UpdateRenderSize(RadialCircle& circle, ViewerUiState& ui_state) {
  double size = ui_state.max_render_size;
  if (ui_state.fit_to_window) {
    const float workspace = ui_state.ui_show_workspace ? ui_state.ui_workspace_width + 16.0f : 0.0f;
    const float available_w = static_cast<float>(GetScreenWidth()) - workspace - 2.0f * kSurfaceMargin;
    const float available_h = static_cast<float>(GetScreenHeight()) - 2.0f * kSurfaceMargin;
    size = radial::core::FitRenderSize(ui_state.max_render_size, std::min(available_w, available_h));
  }
  if (std::abs(size - circle.settings().render_size) < 0.5) {
    return;
  }
  radial::core::CircleSettings settings = circle.settings();
  settings.render_size = size;
  const auto result = circle.UpdateSettings(settings);
  if (!result.ok) {
    HandleResultError(ui_state, result.error, "[view] render size rejected");
  }
}

int CurrentYear() {
  const auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
  return static_cast<int>(std::chrono::year_month_day{today}.year());
}

}  // namespace

int main() {
  const ViewerPersistentSettings persisted = LoadViewerPersistentSettings();
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(persisted.window_width, persisted.window_height, "radial timeline viewer");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  RadialCircle circle(persisted.year != 0 ? persisted.year : CurrentYear());
  ViewerUiState ui_state;
  ui_state.year_input = circle.view_state().year;
  ui_state.max_render_size = persisted.render_size;
  ui_state.fit_to_window = persisted.fit_to_window;
  ui_state.ui_show_workspace = persisted.ui_show_workspace;
  ui_state.ui_workspace_width = persisted.ui_workspace_width;
  {
    radial::core::CircleSettings settings{};
    settings.render_size = persisted.render_size;
    settings.label_mode = persisted.label_mode;
    settings.connection_mode = persisted.connection_mode;
    const auto result = circle.UpdateSettings(settings);
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "[info] persisted settings rejected");
    }
  }
  circle.set_on_activity_update(
      [&](const ActivityId& id, const ActivityPatch& patch) { ApplyActivityPatch(circle, ui_state, id, patch); });
  circle.set_on_activity_click(
      [&](const Activity& activity) { PushLog(ui_state, "[click] " + activity.id + " " + activity.title); });

  PushLog(ui_state, "[info] viewer started");
  ResetDemo(circle, ui_state);
  PushLog(ui_state, "[hint] click a month label to focus it, click the center to leave");
  PushLog(ui_state, "[hint] drag a start dot or end ring to reschedule");

  rlImGuiSetup(true);
  ImGui::StyleColorsDark();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;
    style.WindowBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;
  }
  while (!WindowShouldClose()) {
    BeginDrawing();
    ClearBackground(Color{26, 32, 39, 255});

    rlImGuiBegin();
    circle.SetNow(std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
    UpdateRenderSize(circle, ui_state);
    UpdatePointerInput(circle, ui_state);

    DrawScene(circle.BuildScene());

    DrawWorkspaceWindow(circle, ui_state);
    DrawPopupWindow(circle, ui_state);
    rlImGuiEnd();

    EndDrawing();
  }

  rlImGuiShutdown();
  {
    ViewerPersistentSettings out{};
    out.window_width = GetScreenWidth();
    out.window_height = GetScreenHeight();
    out.year = circle.view_state().year;
    out.render_size = ui_state.max_render_size;
    out.fit_to_window = ui_state.fit_to_window;
    out.label_mode = circle.settings().label_mode;
    out.connection_mode = circle.settings().connection_mode;
    out.ui_show_workspace = ui_state.ui_show_workspace;
    out.ui_workspace_width = ui_state.ui_workspace_width;
    SaveViewerPersistentSettings(out);
  }
  CloseWindow();
  return 0;
}
