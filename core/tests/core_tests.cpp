#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "radial/core/radial_circle.hpp"

namespace {

using radial::core::Activity;
using radial::core::ActivityId;
using radial::core::ActivityPatch;
using radial::core::ActivityStatus;
using radial::core::AngleMapper;
using radial::core::CategorySpec;
using radial::core::CircleFrame;
using radial::core::CircleSettings;
using radial::core::ConnectionMode;
using radial::core::DateTime;
using radial::core::HitKind;
using radial::core::HitResult;
using radial::core::LabelDensity;
using radial::core::LabelItem;
using radial::core::LabelMode;
using radial::core::MakeDateTime;
using radial::core::RadialCircle;
using radial::core::RailSlot;
using radial::core::RenderGeometry;
using radial::core::RingModel;
using radial::core::Vec2d;
using radial::core::ViewState;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

bool has_issue_code(const radial::core::ValidationResult& validation, const std::string& code) {
  for (const auto& issue : validation.issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool almost_equal(const Vec2d& a, const Vec2d& b, double eps = 1e-9) {
  return almost_equal(a.x, b.x, eps) && almost_equal(a.y, b.y, eps);
}

bool contains_id(const std::vector<ActivityId>& ids, const ActivityId& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool contains_text(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

Activity make_activity(const std::string& id, const std::string& category, DateTime start) {
  Activity activity{};
  activity.id = id;
  activity.title = "Activity " + id;
  activity.category = category;
  activity.start = start;
  return activity;
}

Activity make_range(const std::string& id, const std::string& category, DateTime start, DateTime end) {
  Activity activity = make_activity(id, category, start);
  activity.end = end;
  return activity;
}

std::vector<Activity> make_many(int count, int year) {
  std::vector<Activity> activities;
  for (int i = 0; i < count; ++i) {
    const std::string id = "act" + std::string(i < 10 ? "0" : "") + std::to_string(i);
    Activity activity = make_activity(id, i % 2 == 0 ? "Events" : "Digital", MakeDateTime(year, i % 12, 1 + i % 27, 9));
    activity.status = i % 3 == 0 ? ActivityStatus::kActive : ActivityStatus::kPlanned;
    activity.budget = 500.0 * i;
    activities.push_back(std::move(activity));
  }
  return activities;
}

// Pointer position that maps to `day` 09:00 of the focused month.
Vec2d focus_pointer_for_day(const RenderGeometry& geometry, int days_in_month, int day) {
  const double fraction = (static_cast<double>(day) - 0.5) / days_in_month;
  return geometry.point_at(fraction * radial::core::kTwoPi - radial::core::kHalfPi, geometry.radius * 0.6);
}

// Intent: the year-view forward formula places mid-March at (2 + 15/30)/12 of the turn, starting at the top.
bool test_year_angle_mid_march() {
  const AngleMapper mapper(ViewState{2025, std::nullopt});
  const double angle = mapper.AngleOf(MakeDateTime(2025, 2, 15));
  const double expected = (2.0 + 15.0 / 30.0) / 12.0 * radial::core::kTwoPi - radial::core::kHalfPi;
  if (!almost_equal(angle, expected, 1e-12)) {
    return false;
  }
  const radial::core::CivilDateTime back = radial::core::ToCivil(mapper.DateOf(angle));
  return back.year == 2025 && back.month == 2 && back.seconds_of_day == radial::core::kRecoveredDateHour * 3600;
}

// Intent: year view round-trips to the month for every day the nominal 30-day month covers.
bool test_year_round_trip_recovers_month() {
  const AngleMapper mapper(ViewState{2024, std::nullopt});
  for (int month = 0; month < 12; ++month) {
    const int days = std::min(29, radial::core::DaysInMonth(2024, month));
    for (int day = 1; day <= days; ++day) {
      const radial::core::CivilDateTime back =
          radial::core::ToCivil(mapper.DateOf(mapper.AngleOf(MakeDateTime(2024, month, day, 14))));
      if (back.year != 2024 || back.month != month) {
        return false;
      }
    }
  }
  return true;
}

// Intent: month focus round-trips every day of the month exactly.
bool test_focus_round_trip_recovers_day() {
  for (int month : {1, 3, 6, 11}) {
    const AngleMapper mapper(ViewState{2024, month});
    const int days = radial::core::DaysInMonth(2024, month);
    for (int day = 1; day <= days; ++day) {
      const DateTime date = MakeDateTime(2024, month, day, radial::core::kRecoveredDateHour);
      if (mapper.DateOf(mapper.AngleOf(date)) != date) {
        return false;
      }
      if (mapper.DateOf(mapper.AngleOf(MakeDateTime(2024, month, day, 0))) != date) {
        return false;
      }
    }
  }
  return true;
}

// Intent: dates outside the focused month are clamped onto its first and last instant.
bool test_focus_clamps_outside_dates() {
  const AngleMapper mapper(ViewState{2025, 4});
  const double before = mapper.AngleOf(MakeDateTime(2025, 1, 10));
  const double after = mapper.AngleOf(MakeDateTime(2025, 8, 10));
  if (!almost_equal(before, -radial::core::kHalfPi)) {
    return false;
  }
  if (after <= radial::core::kPi || after >= 1.5 * radial::core::kPi) {
    return false;
  }
  return mapper.FocusDayOf(MakeDateTime(2025, 1, 10)) == 1 && mapper.FocusDayOf(MakeDateTime(2025, 8, 10)) == 31;
}

// Intent: every angle maps back into the active domain; days stay inside the month.
bool test_inverse_covers_domain() {
  const AngleMapper year_mapper(ViewState{2023, std::nullopt});
  const AngleMapper focus_mapper(ViewState{2023, 1});
  for (int i = -720; i <= 720; ++i) {
    const double angle = static_cast<double>(i) * radial::core::kPi / 360.0;
    const radial::core::CivilDateTime y = radial::core::ToCivil(year_mapper.DateOf(angle));
    if (y.year != 2023 || y.month < 0 || y.month > 11 || y.day < 1 ||
        y.day > radial::core::DaysInMonth(2023, y.month)) {
      return false;
    }
    const radial::core::CivilDateTime f = radial::core::ToCivil(focus_mapper.DateOf(angle));
    if (f.year != 2023 || f.month != 1 || f.day < 1 || f.day > 28) {
      return false;
    }
  }
  // Forward direction: consecutive months advance monotonically around one turn.
  double previous = -10.0;
  for (int month = 0; month < 12; ++month) {
    const double angle = year_mapper.AngleOf(MakeDateTime(2023, month, 1));
    if (angle <= previous || angle < -radial::core::kHalfPi || angle >= 1.5 * radial::core::kPi) {
      return false;
    }
    previous = angle;
  }
  return true;
}

// Intent: in month focus only activities overlapping the month are displayed; undated ones never are.
bool test_display_set_filters_by_focus() {
  std::vector<Activity> activities = {
      make_activity("in", "Events", MakeDateTime(2025, 2, 10)),
      make_activity("out", "Events", MakeDateTime(2025, 4, 10)),
      make_range("span", "Events", MakeDateTime(2025, 1, 20), MakeDateTime(2025, 2, 2)),
      Activity{},
  };
  activities.back().id = "undated";
  const AngleMapper year_mapper(ViewState{2025, std::nullopt});
  const AngleMapper focus_mapper(ViewState{2025, 2});
  const auto year_set = radial::core::FilterDisplayActivities(activities, year_mapper);
  const auto focus_set = radial::core::FilterDisplayActivities(activities, focus_mapper);
  if (year_set.size() != 3) {
    return false;
  }
  return focus_set.size() == 2 && focus_set[0]->id == "in" && focus_set[1]->id == "span";
}

// Intent: rings follow encounter order, dedupe by normalized key and cap at five.
bool test_ring_model_order_cap_and_radii() {
  const std::vector<CategorySpec> categories = {{"Events", "#ff0000"}, {"Digital", ""}, {" events ", "#00ff00"}};
  const std::vector<Activity> activities = {
      make_activity("a", "content", MakeDateTime(2025, 0, 1)),
      make_activity("b", "EVENTS", MakeDateTime(2025, 0, 1)),
      make_activity("c", "PR", MakeDateTime(2025, 0, 1)),
      make_activity("d", "Partner", MakeDateTime(2025, 0, 1)),
      make_activity("e", "Extra", MakeDateTime(2025, 0, 1)),
  };
  const RingModel model = RingModel::Build(activities, categories, 200.0);
  if (model.rings().size() != 5 || model.candidate_count() != 6) {
    return false;
  }
  const std::vector<std::string> expected_keys = {"EVENTS", "DIGITAL", "CONTENT", "PR", "PARTNER"};
  for (std::size_t i = 0; i < expected_keys.size(); ++i) {
    if (model.rings()[i].category_key != expected_keys[i]) {
      return false;
    }
  }
  if (!almost_equal(model.rings().front().radius, 200.0 * 0.82) ||
      !almost_equal(model.rings().back().radius, 200.0 * 0.54) ||
      !almost_equal(model.rings()[2].radius, 200.0 * 0.68)) {
    return false;
  }
  if (model.rings()[0].name != "Events" || model.rings()[2].name != "CONTENT") {
    return false;
  }
  if (!(model.rings()[0].color == radial::core::Rgba{0xff, 0x00, 0x00, 0xff}) ||
      !(model.rings()[1].color == radial::core::kRingPalette[1])) {
    return false;
  }
  // Folded and unknown categories land on the first ring.
  return model.ResolveKey("Extra") == "EVENTS" && almost_equal(model.RadiusFor(""), 200.0 * 0.82) &&
         model.ColorFor("  pr") == radial::core::kRingPalette[3];
}

// Intent: a single category sits on the outer ring; no categories at all fall back to a neutral ring.
bool test_ring_model_single_and_empty() {
  const RingModel single =
      RingModel::Build({make_activity("a", "Events", MakeDateTime(2025, 0, 1))}, {}, 100.0);
  if (single.rings().size() != 1 || !almost_equal(single.rings()[0].radius, 82.0)) {
    return false;
  }
  const RingModel empty = RingModel::Build({}, {}, 100.0);
  return empty.empty() && almost_equal(empty.RadiusFor("Events"), 70.0) &&
         empty.ColorFor("Events") == radial::core::kFallbackRingColor;
}

// Intent: hex colors parse in short, long and alpha form; anything else is rejected.
bool test_hex_color_parsing() {
  const auto short_form = radial::core::ParseHexColor("#fa0");
  const auto long_form = radial::core::ParseHexColor("#3b82f6");
  const auto alpha = radial::core::ParseHexColor("#3b82f680");
  if (!short_form || !(*short_form == radial::core::Rgba{0xff, 0xaa, 0x00, 0xff})) {
    return false;
  }
  if (!long_form || radial::core::FormatHexColor(*long_form) != "#3b82f6" || !alpha || alpha->a != 0x80) {
    return false;
  }
  return !radial::core::ParseHexColor("blue") && !radial::core::ParseHexColor("#12345") &&
         !radial::core::ParseHexColor("#gg0000") && !radial::core::ParseHexColor("");
}

// Intent: auto label mode follows the density thresholds of each regime.
bool test_label_mode_auto_thresholds() {
  const auto resolve = [](std::size_t n, bool small, bool tiny, bool focus) {
    return radial::core::ResolveLabelMode(LabelMode::kAuto, LabelDensity{n, small, tiny, focus});
  };
  if (resolve(12, false, false, false) != LabelMode::kAll || resolve(13, false, false, false) != LabelMode::kSmart ||
      resolve(18, false, false, false) != LabelMode::kSmart || resolve(19, false, false, false) != LabelMode::kHover) {
    return false;
  }
  if (resolve(8, true, false, false) != LabelMode::kAll || resolve(9, true, false, false) != LabelMode::kSmart ||
      resolve(15, true, false, false) != LabelMode::kHover) {
    return false;
  }
  if (resolve(26, false, false, true) != LabelMode::kAll || resolve(27, false, false, true) != LabelMode::kSmart ||
      resolve(20, true, false, true) != LabelMode::kAll || resolve(21, true, false, true) != LabelMode::kSmart) {
    return false;
  }
  if (resolve(1, true, true, false) != LabelMode::kHover || resolve(1, true, true, true) != LabelMode::kHover) {
    return false;
  }
  return radial::core::ResolveLabelMode(LabelMode::kNone, LabelDensity{1, false, false, false}) == LabelMode::kNone;
}

// Intent: auto connection mode is off in focus, full for sparse years, labeled-only for dense years.
bool test_connection_mode_auto() {
  const auto resolve = [](std::size_t n, bool focus) {
    return radial::core::ResolveConnectionMode(ConnectionMode::kAuto, LabelDensity{n, false, false, focus});
  };
  if (resolve(3, true) != ConnectionMode::kNone || resolve(18, false) != ConnectionMode::kAll ||
      resolve(19, false) != ConnectionMode::kLabeled) {
    return false;
  }
  const Activity a = make_activity("a", "Events", MakeDateTime(2025, 0, 1));
  const Activity b = make_activity("b", "Events", MakeDateTime(2025, 1, 1));
  const std::vector<const Activity*> visible = {&a, &b};
  const auto labeled = radial::core::SelectConnectionIds(visible, ConnectionMode::kLabeled, {"b"});
  const auto all = radial::core::SelectConnectionIds(visible, ConnectionMode::kAll, {"b"});
  const auto none = radial::core::SelectConnectionIds(visible, ConnectionMode::kNone, {"b"});
  return labeled.size() == 1 && labeled.count("b") == 1 && all.size() == 2 && none.empty();
}

// Intent: importance adds status boost, capped budget, capped weight and capped duration.
bool test_importance_score() {
  Activity active = make_range("a", "Events", MakeDateTime(2025, 0, 1), MakeDateTime(2025, 0, 11));
  active.status = ActivityStatus::kActive;
  active.budget = 5000.0;
  active.weight = 2.0;
  if (!almost_equal(radial::core::ImportanceScore(active), 1000.0 + 500.0 + 10.0 + 10.0)) {
    return false;
  }
  Activity huge = make_range("b", "Events", MakeDateTime(2025, 0, 1), MakeDateTime(2025, 11, 1));
  huge.status = ActivityStatus::kDone;
  huge.budget = 1e9;
  huge.weight = 1e9;
  if (!almost_equal(radial::core::ImportanceScore(huge), 2000.0 + 300.0 + 120.0)) {
    return false;
  }
  Activity planned = make_activity("c", "Events", MakeDateTime(2025, 0, 1));
  planned.budget = std::nan("");
  return almost_equal(radial::core::ImportanceScore(planned), 250.0);
}

// Intent: smart selection takes the selected id, then ongoing activities, then the highest scores.
bool test_smart_selection_priority() {
  const DateTime now = MakeDateTime(2025, 5, 15, 12);
  std::vector<Activity> activities;
  for (int i = 0; i < 10; ++i) {
    Activity activity = make_activity("x" + std::to_string(i), "Events", MakeDateTime(2025, 0, 1 + i));
    activity.status = ActivityStatus::kDone;
    activity.budget = 10.0 * i;
    activities.push_back(std::move(activity));
  }
  activities[2].start = MakeDateTime(2025, 5, 13);  // point activity two days before now
  activities[4].status = ActivityStatus::kActive;
  activities[7].budget = 50000.0;
  std::vector<const Activity*> visible;
  for (const Activity& activity : activities) {
    visible.push_back(&activity);
  }
  const LabelDensity density{visible.size(), true, false, false};
  const std::vector<ActivityId> ids =
      radial::core::SelectLabeledIds(visible, LabelMode::kSmart, density, ActivityId{"x9"}, now);
  if (ids.size() != 6) {
    return false;
  }
  if (ids[0] != "x9" || ids[1] != "x2" || ids[2] != "x7" || ids[3] != "x4") {
    return false;
  }
  // Hover shows just the selection, none shows nothing, all shows every visible activity.
  const auto hover = radial::core::SelectLabeledIds(visible, LabelMode::kHover, density, ActivityId{"x3"}, now);
  const auto none = radial::core::SelectLabeledIds(visible, LabelMode::kNone, density, ActivityId{"x3"}, now);
  const auto all = radial::core::SelectLabeledIds(visible, LabelMode::kAll, density, std::nullopt, now);
  return hover.size() == 1 && hover[0] == "x3" && none.empty() && all.size() == visible.size();
}

// Intent: a dense small year view keeps labels under the small smart cap and always labels the selection.
bool test_dense_small_view_label_budget() {
  RadialCircle circle(2025);
  circle.SetActivities(make_many(30, 2025));
  CircleSettings settings{};
  settings.render_size = 480.0;
  if (!circle.UpdateSettings(settings).ok) {
    return false;
  }
  if (!circle.SelectActivity("act07").ok) {
    return false;
  }
  const CircleFrame auto_frame = circle.ComputeFrame();
  if (auto_frame.labeled_ids.size() > 6 || !contains_id(auto_frame.labeled_ids, "act07")) {
    return false;
  }
  settings.label_mode = LabelMode::kSmart;
  if (!circle.UpdateSettings(settings).ok) {
    return false;
  }
  const CircleFrame smart_frame = circle.ComputeFrame();
  return smart_frame.label_mode == LabelMode::kSmart && smart_frame.labeled_ids.size() == 6 &&
         smart_frame.labeled_ids.front() == "act07" && smart_frame.inline_labels.size() == 6;
}

// Intent: truncation ends in one ellipsis, respects the minimum budget and is idempotent.
bool test_truncate_label() {
  const std::string once = radial::core::TruncateLabel("Customer conference in Zurich", 10);
  if (once != "Customer…" || radial::core::TruncateLabel(once, 10) != once) {
    return false;
  }
  const std::string tiny = radial::core::TruncateLabel("abcdefghij", 3);
  if (tiny != "abcde…" || radial::core::Utf8Length(tiny) != radial::core::kMinLabelChars) {
    return false;
  }
  const std::string umlaut = radial::core::TruncateLabel("Zürich Messe Frühling", 8);
  if (radial::core::Utf8Length(umlaut) > 8 || radial::core::TruncateLabel(umlaut, 8) != umlaut) {
    return false;
  }
  return radial::core::TruncateLabel("short", 10) == "short";
}

// Intent: wrapping is greedy, hard-breaks only long words and caps lines with an ellipsis.
bool test_wrap_label() {
  const auto capped = radial::core::WrapLabel("Partner webinar series kickoff", 10);
  if (capped != std::vector<std::string>{"Partner", "webinar", "series…"}) {
    return false;
  }
  const auto broken = radial::core::WrapLabel("Supercalifragilistic", 8);
  if (broken != std::vector<std::string>{"Supercal", "ifragili", "stic"}) {
    return false;
  }
  const auto joined = radial::core::WrapLabel("a b c", 10);
  const auto greedy = radial::core::WrapLabel("Trade fair Basel booth", 12);
  return joined == std::vector<std::string>{"a b c"} &&
         greedy == std::vector<std::string>{"Trade fair", "Basel booth"};
}

// Intent: relaxed rails never overlap, keep natural order and stay in bounds whenever labels fit.
bool test_rail_relaxation_properties() {
  std::mt19937 rng(20250315u);
  std::uniform_real_distribution<double> natural(-40.0, 440.0);
  std::uniform_int_distribution<int> lines(1, 3);
  std::uniform_int_distribution<int> count(1, 16);
  constexpr double kMinY = 20.0;
  constexpr double kMaxY = 380.0;
  constexpr double kEps = 1e-9;
  constexpr double kBoundsEps = 1e-6;

  for (int trial = 0; trial < 300; ++trial) {
    std::vector<RailSlot> slots(static_cast<std::size_t>(count(rng)));
    double total = 0.0;
    for (RailSlot& slot : slots) {
      slot.natural_y = natural(rng);
      slot.height = 14.0 * lines(rng);
      total += slot.height;
    }
    const double gap = radial::core::RailGap(slots, kMaxY - kMinY, 6.0, 2.0);
    if (gap < 2.0 - kEps || gap > 6.0 + kEps) {
      return false;
    }
    const radial::core::RailLayout rail = radial::core::RelaxRail(slots, kMinY, kMaxY, gap);
    if (rail.ys.size() != slots.size()) {
      return false;
    }

    std::vector<std::size_t> order(slots.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
      order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return slots[a].natural_y < slots[b].natural_y; });
    for (std::size_t k = 1; k < order.size(); ++k) {
      const std::size_t prev = order[k - 1];
      if (rail.ys[order[k]] < rail.ys[prev] + slots[prev].height + gap - kEps) {
        return false;
      }
    }

    // A dense rail gets gap == slack, so the needed height can sit exactly on the available one.
    const double needed = total + gap * static_cast<double>(slots.size() - 1);
    if ((needed < kMaxY - kMinY - kBoundsEps && rail.overflow) ||
        (needed > kMaxY - kMinY + kBoundsEps && !rail.overflow)) {
      return false;
    }
    if (needed <= kMaxY - kMinY + kBoundsEps) {
      for (std::size_t i = 0; i < slots.size(); ++i) {
        if (rail.ys[i] < kMinY - kBoundsEps || rail.ys[i] + slots[i].height > kMaxY + kBoundsEps) {
          return false;
        }
      }
    }
  }
  return true;
}

// Intent: an overfull rail still terminates and keeps separation, starting at the top bound.
bool test_rail_overflow_keeps_separation() {
  std::vector<RailSlot> slots(40, RailSlot{100.0, 14.0});
  const radial::core::RailLayout rail = radial::core::RelaxRail(slots, 0.0, 200.0, 2.0);
  if (!rail.overflow || !almost_equal(rail.ys.front(), 0.0)) {
    return false;
  }
  for (std::size_t i = 1; i < rail.ys.size(); ++i) {
    if (rail.ys[i] < rail.ys[i - 1] + 16.0 - 1e-9) {
      return false;
    }
  }
  return radial::core::RelaxRail({}, 0.0, 10.0, 2.0).ys.empty();
}

// Intent: month focus moves labels into left/right gutters with day prefixes and three-point leaders.
bool test_gutter_layout_sides() {
  RadialCircle circle(2025);
  circle.SetActivities({
      make_activity("right", "Events", MakeDateTime(2025, 2, 5, 9)),
      make_activity("left", "Events", MakeDateTime(2025, 2, 20, 9)),
  });
  if (!circle.FocusMonth(2).ok || !circle.SelectActivity("left").ok) {
    return false;
  }
  const CircleFrame frame = circle.ComputeFrame();
  if (!frame.inline_labels.empty() || frame.gutter.left.size() != 1 || frame.gutter.right.size() != 1) {
    return false;
  }
  const LabelItem& right = frame.gutter.right.front();
  const LabelItem& left = frame.gutter.left.front();
  const RenderGeometry& geo = frame.geometry;
  if (right.activity_id != "right" || right.text_anchor != radial::core::TextAnchor::kStart ||
      right.position.x <= geo.center.x + geo.radius || right.text_lines.front().rfind("05 · ", 0) != 0) {
    return false;
  }
  if (left.activity_id != "left" || !left.selected || right.selected ||
      left.text_anchor != radial::core::TextAnchor::kEnd || left.position.x >= geo.center.x - geo.radius) {
    return false;
  }
  if (left.leader.size() != 3 || !almost_equal(left.leader.front(), left.anchor_point)) {
    return false;
  }
  return left.position.y >= frame.gutter.min_y && left.position.y + left.height <= frame.gutter.max_y;
}

// Intent: forward arcs are single segments with the right large-arc flag.
bool test_arc_single_segments() {
  const AngleMapper mapper(ViewState{2025, std::nullopt});
  const Vec2d center{300.0, 300.0};
  const auto short_arc = radial::core::BuildDurationArc(center, 100.0, mapper.AngleOf(MakeDateTime(2025, 2, 1)),
                                                        mapper.AngleOf(MakeDateTime(2025, 2, 20)));
  const auto long_arc = radial::core::BuildDurationArc(center, 100.0, mapper.AngleOf(MakeDateTime(2025, 0, 1)),
                                                       mapper.AngleOf(MakeDateTime(2025, 10, 1)));
  if (short_arc.size() != 1 || short_arc[0].large_arc || long_arc.size() != 1 || !long_arc[0].large_arc) {
    return false;
  }
  // March into April crosses the 3 o'clock position without being split.
  const auto across_right = radial::core::BuildDurationArc(center, 100.0, mapper.AngleOf(MakeDateTime(2025, 2, 20)),
                                                           mapper.AngleOf(MakeDateTime(2025, 3, 10)));
  return across_right.size() == 1 && radial::core::ArcContains(across_right[0], 4.0, Vec2d{400.0, 300.0}) &&
         !radial::core::ArcContains(across_right[0], 4.0, Vec2d{200.0, 300.0});
}

// Intent: a December-to-January range is split at the top into two segments.
bool test_arc_year_wrap_splits() {
  const AngleMapper mapper(ViewState{2025, std::nullopt});
  const Vec2d center{300.0, 300.0};
  const auto segments = radial::core::BuildDurationArc(center, 100.0, mapper.AngleOf(MakeDateTime(2025, 11, 20)),
                                                       mapper.AngleOf(MakeDateTime(2026, 0, 5)));
  if (segments.size() != 2 || segments[0].large_arc || segments[1].large_arc) {
    return false;
  }
  const Vec2d top{300.0, 200.0};
  if (!almost_equal(segments[1].start, top, 1e-9) || !almost_equal(segments[0].end, top, 0.1)) {
    return false;
  }
  const std::string path = radial::core::ArcPathData(segments);
  std::size_t moves = 0;
  for (std::size_t pos = path.find("M "); pos != std::string::npos; pos = path.find("M ", pos + 1)) {
    ++moves;
  }
  return moves == 2 && radial::core::ArcContains(segments[1], 4.0, Vec2d{301.0, 200.0});
}

// Intent: dragging the end handle to day 10 emits exactly one end update and leaves no preview.
bool test_drag_end_handle_commit() {
  RadialCircle circle(2025);
  circle.SetActivities({make_range("a1", "Events", MakeDateTime(2025, 2, 3, 9), MakeDateTime(2025, 2, 20, 17))});
  if (!circle.FocusMonth(2).ok) {
    return false;
  }
  int updates = 0;
  ActivityId updated_id;
  ActivityPatch patch;
  circle.set_on_activity_update([&](const ActivityId& id, const ActivityPatch& p) {
    ++updates;
    updated_id = id;
    patch = p;
  });

  Vec2d end_point{};
  {
    const CircleFrame frame = circle.ComputeFrame();
    const radial::core::ActivityPlacement* placement = frame.find_placement("a1");
    if (placement == nullptr || !placement->end_point.has_value()) {
      return false;
    }
    end_point = *placement->end_point;
  }
  const HitResult down = circle.PointerDown(end_point);
  if (down.kind != HitKind::kEndHandle || !circle.drag().dragging()) {
    return false;
  }

  const Vec2d target = focus_pointer_for_day(circle.geometry(), 31, 10);
  const auto preview = circle.PointerMove(target);
  if (!preview || preview->value != MakeDateTime(2025, 2, 10, 9)) {
    return false;
  }
  {
    const CircleFrame frame = circle.ComputeFrame();
    if (frame.effective_activities.front().end != MakeDateTime(2025, 2, 10, 9) ||
        circle.activities().front().end != MakeDateTime(2025, 2, 20, 17)) {
      return false;
    }
  }

  const auto update = circle.PointerUp(target);
  if (!update || updates != 1 || updated_id != "a1") {
    return false;
  }
  if (patch.start.has_value() || patch.end != MakeDateTime(2025, 2, 10, 9)) {
    return false;
  }
  if (circle.drag().dragging() || circle.drag().preview().has_value()) {
    return false;
  }
  // A second release without a drag emits nothing.
  return !circle.PointerUp(target).has_value() && updates == 1;
}

// Intent: a throwing update callback propagates but the drag session is already over.
bool test_drag_throwing_callback_leaves_idle() {
  RadialCircle circle(2025);
  circle.SetActivities({make_activity("a1", "Events", MakeDateTime(2025, 2, 3, 9))});
  if (!circle.FocusMonth(2).ok) {
    return false;
  }
  circle.set_on_activity_update(
      [](const ActivityId&, const ActivityPatch&) { throw std::runtime_error("rejected by caller"); });
  const Vec2d start_point = circle.ComputeFrame().placements.front().start_point;
  if (circle.PointerDown(start_point).kind != HitKind::kStartHandle) {
    return false;
  }
  const Vec2d target = focus_pointer_for_day(circle.geometry(), 31, 12);
  if (!circle.PointerMove(target).has_value()) {
    return false;
  }
  bool threw = false;
  try {
    static_cast<void>(circle.PointerUp(target));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw || circle.drag().dragging() || circle.drag().preview().has_value()) {
    return false;
  }
  // Caller data is untouched, so the next frame still shows the pre-drag start.
  return circle.ComputeFrame().effective_activities.front().start == MakeDateTime(2025, 2, 3, 9);
}

// Intent: pointer-down away from handles does not start a drag.
bool test_pointer_down_off_handle() {
  RadialCircle circle(2025);
  circle.SetActivities({make_activity("a1", "Events", MakeDateTime(2025, 2, 3, 9))});
  const HitResult hit = circle.PointerDown(Vec2d{2.0, 2.0});
  return hit.kind == HitKind::kNone && !circle.drag().dragging() && !circle.PointerMove(Vec2d{10.0, 10.0});
}

// Intent: the popup opens above-right and flips or clamps at each surface edge.
bool test_popup_positioning() {
  const radial::core::PopupSize compact{220.0, 110.0};
  if (!almost_equal(radial::core::PositionPopupNear({100.0, 200.0}, compact, 600.0), Vec2d{114.0, 78.0})) {
    return false;
  }
  if (!almost_equal(radial::core::PositionPopupNear({500.0, 200.0}, compact, 600.0), Vec2d{266.0, 78.0})) {
    return false;
  }
  if (!almost_equal(radial::core::PositionPopupNear({100.0, 50.0}, compact, 600.0), Vec2d{114.0, 62.0})) {
    return false;
  }
  if (!almost_equal(radial::core::PositionPopupNear({100.0, 100.0}, {100.0, 200.0}, 250.0), Vec2d{114.0, 46.0})) {
    return false;
  }
  if (!almost_equal(radial::core::PositionPopupNear({10.0, 300.0}, {600.0, 100.0}, 600.0), Vec2d{0.0, 188.0})) {
    return false;
  }
  const RenderGeometry small = radial::core::MakeRenderGeometry(300.0);
  const radial::core::PopupSize detailed = radial::core::DetailedPopupSize(small);
  const radial::core::PopupSize compact_small = radial::core::CompactPopupSize(small);
  return almost_equal(detailed.width, 276.0) && almost_equal(detailed.height, 260.0) &&
         almost_equal(compact_small.width, 200.0) && almost_equal(compact_small.height, 100.0);
}

// Intent: popup rows summarize compactly and list every field when detailed.
bool test_describe_activity_rows() {
  Activity activity = make_range("a9", "Events", MakeDateTime(2025, 2, 15, 9), MakeDateTime(2025, 2, 18, 9));
  activity.status = ActivityStatus::kActive;
  activity.budget = 42000.0;
  activity.expected_leads = 120.0;
  activity.owner = "Mara";
  activity.notes = "Booth 4.2";
  const auto compact = radial::core::DescribeActivity(activity, false);
  const auto detailed = radial::core::DescribeActivity(activity, true);
  if (compact.size() != 4 || compact[0].label != "Category" || compact[1].value != "2025-03-15" ||
      compact[3].value != "Booth 4.2") {
    return false;
  }
  const auto find_row = [&](const std::string& label) -> std::string {
    for (const auto& row : detailed) {
      if (row.label == label) {
        return row.value;
      }
    }
    return "<missing>";
  };
  return find_row("ID") == "a9" && find_row("Status") == "active" && find_row("Duration") == "3 days" &&
         find_row("Budget") == "CHF 42000" && find_row("Expected leads") == "120" && find_row("Owner") == "Mara" &&
         find_row("Start") == "2025-03-15 09:00";
}

// Intent: collapsed or non-finite render sizes clamp to the minimum surface with legible strokes and fonts.
bool test_degenerate_render_size() {
  const RenderGeometry zero = radial::core::MakeRenderGeometry(0.0);
  const RenderGeometry nan = radial::core::MakeRenderGeometry(std::nan(""));
  if (!almost_equal(zero.size, 240.0) || !almost_equal(nan.size, 240.0) || !zero.small || !zero.tiny) {
    return false;
  }
  if (!almost_equal(zero.radius, 120.0 - 44.0 * 0.9) || zero.stroke_width(1.0) < 1.0 || zero.font_size(6.0) < 8.0) {
    return false;
  }
  if (!almost_equal(radial::core::FitRenderSize(600.0, 300.7), 300.0) ||
      !almost_equal(radial::core::FitRenderSize(600.0, 100.0), 240.0) ||
      !almost_equal(radial::core::FitRenderSize(600.0, 900.0), 600.0)) {
    return false;
  }
  RadialCircle circle(2025);
  CircleSettings settings{};
  settings.render_size = std::nan("");
  if (circle.UpdateSettings(settings).ok) {
    return false;
  }
  settings.render_size = 10.0;
  return circle.UpdateSettings(settings).ok && almost_equal(circle.settings().render_size, 240.0);
}

// Intent: with no activities every derived collection is empty and the circle still draws.
bool test_zero_activities() {
  RadialCircle circle(2025);
  const CircleFrame frame = circle.ComputeFrame();
  if (!frame.display.empty() || !frame.placements.empty() || !frame.labeled_ids.empty() ||
      !frame.inline_labels.empty() || !frame.gutter.left.empty() || !frame.gutter.right.empty() ||
      !frame.connection_ids.empty() || !frame.rings.empty()) {
    return false;
  }
  const radial::core::Scene scene = circle.BuildScene();
  return !scene.shapes.empty() && circle.Validate().issues.empty();
}

// Intent: month labels focus, the center label leaves focus and background clicks close the popup first.
bool test_click_focus_flow() {
  RadialCircle circle(2025);
  const RenderGeometry geo = circle.geometry();
  const double march = 2.0 / 12.0 * radial::core::kTwoPi - radial::core::kHalfPi;
  const HitResult month_hit = circle.Click(geo.point_at(march, geo.radius + 18.0 * geo.scale));
  if (month_hit.kind != HitKind::kMonthLabel || circle.view_state().focused_month != 2) {
    return false;
  }
  if (circle.Click(geo.center).kind != HitKind::kCenterLabel || circle.view_state().month_focus()) {
    return false;
  }
  if (!circle.FocusMonth(5).ok || circle.FocusMonth(12).ok) {
    return false;
  }
  circle.Click(Vec2d{3.0, 3.0});
  return !circle.view_state().month_focus() && !circle.SetYear(1800).ok && circle.SetYear(2026).ok &&
         circle.view_state().year == 2026;
}

// Intent: clicking an activity notifies the caller and opens a compact popup that the background closes.
bool test_click_activity_popup() {
  RadialCircle circle(2025);
  circle.SetActivities({make_activity("a1", "Events", MakeDateTime(2025, 6, 1, 9))});
  ActivityId clicked;
  circle.set_on_activity_click([&](const Activity& activity) { clicked = activity.id; });
  if (!circle.FocusMonth(6).ok) {
    return false;
  }
  const Vec2d dot = circle.ComputeFrame().placements.front().start_point;
  circle.Click(dot);
  if (clicked != "a1" || !circle.popup().has_value() || circle.popup()->detailed || circle.selected_id() != "a1") {
    return false;
  }
  if (!circle.ExpandPopup().ok || !circle.popup()->detailed || !circle.CollapsePopup().ok || circle.popup()->detailed) {
    return false;
  }
  circle.Click(Vec2d{3.0, 3.0});
  if (circle.popup().has_value() || !circle.view_state().month_focus()) {
    return false;
  }
  circle.Click(Vec2d{3.0, 3.0});
  return !circle.view_state().month_focus() && !circle.SelectActivity("missing").ok && !circle.ExpandPopup().ok;
}

// Intent: validation reports id, date, category and color problems with stable codes.
bool test_validation_codes() {
  RadialCircle circle(2025);
  std::vector<Activity> activities = {
      make_activity("", "A", MakeDateTime(2025, 0, 1)),
      make_activity("dup", "B", MakeDateTime(2025, 0, 1)),
      make_activity("dup", "C", MakeDateTime(2025, 0, 1)),
      make_range("inv", "D", MakeDateTime(2025, 5, 1), MakeDateTime(2025, 4, 1)),
      make_activity("e", "E", MakeDateTime(2025, 0, 1)),
      make_activity("f", "F", MakeDateTime(2025, 0, 1)),
      Activity{},
  };
  activities.back().id = "nostart";
  activities.back().category = "A";
  circle.SetActivities(activities);
  circle.SetCategories({{"A", "blue"}});
  const radial::core::ValidationResult result = circle.Validate();
  if (!result.has_errors() || result.ok()) {
    return false;
  }
  for (const char* code : {"ActivityIdEmpty", "ActivityIdDuplicate", "ActivityStartMissing", "ActivityRangeInverted",
                           "ActivityCategoryUnresolved", "CategoryOverflow", "CategoryColorInvalid"}) {
    if (!has_issue_code(result, code)) {
      return false;
    }
  }
  return true;
}

// Intent: the demo data set is valid, fills five rings and contains a year-wrapping range.
bool test_demo_activities() {
  RadialCircle circle(2025);
  circle.SetActivities(radial::core::MakeDemoActivities(2025));
  const radial::core::ValidationResult result = circle.Validate();
  if (!result.issues.empty() || circle.activities().size() < 12) {
    return false;
  }
  const CircleFrame frame = circle.ComputeFrame();
  if (frame.rings.rings().size() != 5 || frame.placements.size() != circle.activities().size()) {
    return false;
  }
  bool has_wrap = false;
  for (const Activity& activity : circle.activities()) {
    if (activity.end.has_value() && radial::core::ToCivil(*activity.end).year == 2026) {
      has_wrap = true;
    }
  }
  return has_wrap;
}

// Intent: SVG export writes a complete document with arcs, escaped text and tagged markers.
bool test_svg_export() {
  RadialCircle circle(2025);
  circle.SetActivities(radial::core::MakeDemoActivities(2025));
  radial::core::Scene scene = circle.BuildScene();
  radial::core::TextShape text{};
  text.text = "R&D <draft>";
  scene.shapes.push_back(text);
  const std::string svg = radial::core::WriteSvg(scene);
  return svg.rfind("<svg", 0) == 0 && contains_text(svg, "</svg>") && contains_text(svg, "<path d=\"M ") &&
         contains_text(svg, "R&amp;D &lt;draft&gt;") && contains_text(svg, "stroke-dasharray") &&
         contains_text(svg, ">2025</text>");
}

// Intent: calendar helpers agree on month lengths, ISO week counts and text round trips.
bool test_calendar_helpers() {
  if (radial::core::IsoWeeksInYear(2020) != 53 || radial::core::IsoWeeksInYear(2025) != 52 ||
      radial::core::IsoWeeksInYear(2026) != 53) {
    return false;
  }
  if (radial::core::DaysInMonth(2024, 1) != 29 || radial::core::DaysInMonth(2025, 1) != 28 ||
      radial::core::DaysInMonth(2025, 11) != 31) {
    return false;
  }
  if (MakeDateTime(2025, 12, 5) != MakeDateTime(2026, 0, 5) || MakeDateTime(2025, -1, 5) != MakeDateTime(2024, 11, 5)) {
    return false;
  }
  if (radial::core::FormatDateTime(MakeDateTime(2025, 2, 15, 9, 30)) != "2025-03-15 09:30" ||
      radial::core::FormatDateTime(radial::core::MonthEnd(2025, 1)) != "2025-02-28 23:59") {
    return false;
  }
  if (radial::core::ParseDateTime("2025-03-15T09:30") != MakeDateTime(2025, 2, 15, 9, 30) ||
      radial::core::ParseDateTime("2025-03-15") != MakeDateTime(2025, 2, 15) ||
      radial::core::ParseDateTime("2025-3-15").has_value()) {
    return false;
  }
  return almost_equal(radial::core::DaysBetween(MakeDateTime(2025, 0, 1), MakeDateTime(2025, 0, 11, 12)), 10.5);
}

// Intent: mode names parse back and unknown names are rejected.
bool test_mode_names() {
  return radial::core::ParseLabelMode("smart") == LabelMode::kSmart &&
         radial::core::ParseLabelMode(radial::core::LabelModeName(LabelMode::kHover)) == LabelMode::kHover &&
         !radial::core::ParseLabelMode("bogus").has_value() &&
         radial::core::ParseConnectionMode("labeled") == ConnectionMode::kLabeled &&
         !radial::core::ParseConnectionMode("").has_value();
}


// Intent: a label running across another activity's marker does not take the pointer from its handle.
bool test_label_over_marker_keeps_handle() {
  RadialCircle circle(2025);
  circle.SetCategories({{"Outer", ""}, {"Inner", ""}});
  Activity outer = make_activity("X", "Outer", MakeDateTime(2025, 3, 1, 9));
  Activity inner = make_activity("A", "Inner", MakeDateTime(2025, 3, 1, 9));
  inner.title = "Annual partner summit with extended keynote programme";
  circle.SetActivities({outer, inner});
  CircleSettings settings{};
  settings.render_size = 600.0;
  settings.label_mode = LabelMode::kAll;
  if (!circle.UpdateSettings(settings).ok) {
    return false;
  }
  Vec2d marker{};
  {
    const CircleFrame frame = circle.ComputeFrame();
    const radial::core::ActivityPlacement* placement = frame.find_placement("X");
    if (placement == nullptr || frame.inline_labels.size() != 2) {
      return false;
    }
    marker = placement->start_point;
  }

  // The inner activity's label is drawn after, and on top of, the outer marker.
  bool covered = false;
  for (const radial::core::Shape& shape : circle.BuildScene().shapes) {
    const auto* text = std::get_if<radial::core::TextShape>(&shape);
    if (text != nullptr && text->text.rfind("Annual", 0) == 0 && radial::core::TextBounds(*text).contains(marker)) {
      covered = true;
    }
  }
  if (!covered) {
    return false;
  }

  const HitResult down = circle.PointerDown(marker);
  if (down.kind != HitKind::kStartHandle || down.activity_id != "X" || !circle.drag().dragging()) {
    return false;
  }
  static_cast<void>(circle.CancelDrag());
  ActivityId clicked;
  circle.set_on_activity_click([&](const Activity& activity) { clicked = activity.id; });
  circle.Click(marker);
  return clicked == "X" && circle.selected_id() == "X";
}

// Intent: handles win over a later activity tag that overlaps them; elsewhere the top-most tag wins.
bool test_hit_test_prefers_handles() {
  radial::core::Scene scene;
  radial::core::CircleShape handle{};
  handle.center = {100.0, 100.0};
  handle.radius = 6.0;
  handle.tag.kind = HitKind::kStartHandle;
  handle.tag.activity_id = "under";
  radial::core::CircleShape halo{};
  halo.center = {108.0, 100.0};
  halo.radius = 11.0;
  halo.tag.kind = HitKind::kActivity;
  halo.tag.activity_id = "over";
  scene.shapes.push_back(handle);
  scene.shapes.push_back(halo);

  const HitResult on_handle = radial::core::HitTest(scene, {100.0, 100.0});
  const HitResult on_halo = radial::core::HitTest(scene, {116.0, 100.0});
  const HitResult outside = radial::core::HitTest(scene, {200.0, 200.0});
  return on_handle.kind == HitKind::kStartHandle && on_handle.activity_id == "under" &&
         on_halo.kind == HitKind::kActivity && on_halo.activity_id == "over" && outside.kind == HitKind::kNone;
}

std::size_t count_ellipses(const std::string& text) {
  const std::string ellipsis(radial::core::kEllipsis);
  std::size_t count = 0;
  for (std::size_t pos = text.find(ellipsis); pos != std::string::npos; pos = text.find(ellipsis, pos + 1)) {
    ++count;
  }
  return count;
}

// Intent: inline labels are cut to the room left before the circle edge and never below six characters.
bool test_inline_label_budget() {
  const RenderGeometry geo = radial::core::MakeRenderGeometry(600.0);
  const std::string title = "Partner webinar series";
  radial::core::LabelCandidate near_edge{};
  near_edge.activity_id = "edge";
  near_edge.title = title;
  near_edge.angle = 0.0;
  near_edge.anchor = geo.point_at(0.0, geo.radius * 0.7);
  radial::core::LabelCandidate near_center = near_edge;
  near_center.activity_id = "center";
  near_center.anchor = geo.point_at(0.0, geo.radius * 0.1);

  const std::vector<LabelItem> items =
      radial::core::LayoutInlineLabels({near_edge, near_center}, geo, LabelMode::kSmart);
  if (items.size() != 2 || items[0].text_lines.size() != 1 || items[1].text_lines.size() != 1) {
    return false;
  }
  const LabelItem& edge = items[0];
  const std::size_t budget =
      radial::core::InlineCharBudget(geo, edge.position, edge.text_anchor, edge.font_size, 26);
  if (budget < radial::core::kMinLabelChars || budget >= radial::core::Utf8Length(title)) {
    return false;
  }
  const std::string& cut = edge.text_lines.front();
  if (cut != radial::core::TruncateLabel(title, budget) || radial::core::Utf8Length(cut) > budget ||
      count_ellipses(cut) != 1 || cut.size() < 3 || cut.compare(cut.size() - 3, 3, "…") != 0) {
    return false;
  }
  if (items[1].text_lines.front() != title) {
    return false;
  }

  // A tiny surface leaves almost no room; the budget floors at six characters on both sides.
  const RenderGeometry tiny = radial::core::MakeRenderGeometry(240.0);
  const double font = tiny.font_size(10.0);
  const Vec2d right_edge{tiny.center.x + tiny.radius, tiny.center.y};
  const Vec2d left_edge{tiny.center.x - tiny.radius, tiny.center.y};
  if (radial::core::InlineCharBudget(tiny, right_edge, radial::core::TextAnchor::kStart, font, 26) !=
          radial::core::kMinLabelChars ||
      radial::core::InlineCharBudget(tiny, left_edge, radial::core::TextAnchor::kEnd, font, 26) !=
          radial::core::kMinLabelChars) {
    return false;
  }
  radial::core::LabelCandidate crowded = near_edge;
  crowded.anchor = tiny.point_at(0.0, tiny.radius * 0.82);
  const std::vector<LabelItem> tiny_items = radial::core::LayoutInlineLabels({crowded}, tiny, LabelMode::kSmart);
  return tiny_items.size() == 1 &&
         radial::core::Utf8Length(tiny_items.front().text_lines.front()) <= radial::core::kMinLabelChars &&
         count_ellipses(tiny_items.front().text_lines.front()) == 1;
}

// Intent: a plain click on a start marker opens the popup without moving the activity.
bool test_click_on_handle_keeps_dates() {
  RadialCircle circle(2025);
  circle.SetActivities({make_activity("a1", "Events", MakeDateTime(2025, 2, 15, 9))});
  int updates = 0;
  circle.set_on_activity_update([&](const ActivityId&, const ActivityPatch&) { ++updates; });
  const Vec2d dot = circle.ComputeFrame().placements.front().start_point;
  if (circle.PointerDown(dot).kind != HitKind::kStartHandle) {
    return false;
  }
  if (!circle.CancelDrag() || circle.drag().dragging() || circle.CancelDrag()) {
    return false;
  }
  circle.Click(dot);
  if (updates != 0 || circle.selected_id() != "a1" || circle.PointerUp(dot).has_value()) {
    return false;
  }
  return circle.ComputeFrame().effective_activities.front().start == MakeDateTime(2025, 2, 15, 9);
}

// Intent: non-finite angles and pointers never yield a date from garbage.
bool test_non_finite_pointer() {
  ViewState year_view{};
  year_view.year = 2025;
  ViewState focus_view = year_view;
  focus_view.focused_month = 2;
  if (AngleMapper(year_view).DateOf(std::nan("")) != MakeDateTime(2025, 0, 1, 9) ||
      AngleMapper(focus_view).DateOf(std::numeric_limits<double>::infinity()) != MakeDateTime(2025, 2, 1, 9)) {
    return false;
  }

  RadialCircle circle(2025);
  circle.SetActivities({make_activity("a1", "Events", MakeDateTime(2025, 2, 3, 9))});
  if (!circle.FocusMonth(2).ok) {
    return false;
  }
  int updates = 0;
  circle.set_on_activity_update([&](const ActivityId&, const ActivityPatch&) { ++updates; });
  const Vec2d start_point = circle.ComputeFrame().placements.front().start_point;
  if (circle.PointerDown(start_point).kind != HitKind::kStartHandle) {
    return false;
  }
  const Vec2d bad{std::nan(""), 10.0};
  if (circle.PointerMove(bad).has_value() || circle.drag().preview().has_value()) {
    return false;
  }
  return !circle.PointerUp(bad).has_value() && updates == 0 && !circle.drag().dragging();
}

// Intent: very large amounts print as plain digits instead of an overflowed integer.
bool test_popup_large_numbers() {
  Activity activity = make_activity("a1", "Events", MakeDateTime(2025, 2, 3, 9));
  const auto budget_row = [&](double budget) -> std::string {
    activity.budget = budget;
    for (const auto& row : radial::core::DescribeActivity(activity, true)) {
      if (row.label == "Budget") {
        return row.value;
      }
    }
    return "<missing>";
  };
  const std::string huge = budget_row(1e30);
  return budget_row(2.5e15) == "CHF 2500000000000000" && huge.rfind("CHF 1000000000000000", 0) == 0 &&
         huge.size() == 4 + 31 && huge.find('-') == std::string::npos && budget_row(1234.0) == "CHF 1234";
}

// Intent: the year given at construction is held to the same range SetYear accepts.
bool test_constructor_clamps_year() {
  return RadialCircle(1800).view_state().year == radial::core::kMinYear &&
         RadialCircle(3000).view_state().year == radial::core::kMaxYear &&
         RadialCircle(2025).view_state().year == 2025;
}
}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Angle_YearMidMarch", "Mid-March lands on the 30-day formula angle", test_year_angle_mid_march},
      {"Angle_YearRoundTrip", "Year view recovers the month", test_year_round_trip_recovers_month},
      {"Angle_FocusRoundTrip", "Month focus recovers the day", test_focus_round_trip_recovers_day},
      {"Angle_FocusClamp", "Outside dates clamp into the focused month", test_focus_clamps_outside_dates},
      {"Angle_InverseCoverage", "Every angle maps into the domain", test_inverse_covers_domain},
      {"Display_FocusFilter", "Focus shows overlapping activities only", test_display_set_filters_by_focus},
      {"Rings_OrderCapRadii", "Rings dedupe, cap at five and interpolate radii", test_ring_model_order_cap_and_radii},
      {"Rings_SingleAndEmpty", "Single ring is outermost, none falls back", test_ring_model_single_and_empty},
      {"Rings_HexColors", "Hex colors parse or are rejected", test_hex_color_parsing},
      {"Labels_AutoThresholds", "Auto label mode follows density thresholds", test_label_mode_auto_thresholds},
      {"Labels_ConnectionAuto", "Auto connection mode and id selection", test_connection_mode_auto},
      {"Labels_ImportanceScore", "Importance score components and caps", test_importance_score},
      {"Labels_SmartPriority", "Smart selection priority order", test_smart_selection_priority},
      {"Labels_DenseSmallBudget", "Dense small view respects label budget", test_dense_small_view_label_budget},
      {"Labels_Truncate", "Truncation is bounded and idempotent", test_truncate_label},
      {"Labels_Wrap", "Wrapping is greedy with capped lines", test_wrap_label},
      {"Rail_Properties", "Relaxed rails keep order, separation and bounds", test_rail_relaxation_properties},
      {"Rail_Overflow", "Overfull rails keep separation", test_rail_overflow_keeps_separation},
      {"Gutter_Sides", "Focus labels go to side gutters", test_gutter_layout_sides},
      {"Arc_SingleSegments", "Forward arcs are single segments", test_arc_single_segments},
      {"Arc_YearWrap", "December to January splits at the top", test_arc_year_wrap_splits},
      {"Drag_EndCommit", "End-handle drag emits one update", test_drag_end_handle_commit},
      {"Drag_ThrowingCallback", "Throwing callback leaves the drag idle", test_drag_throwing_callback_leaves_idle},
      {"Drag_OffHandle", "Pointer-down off a handle does not drag", test_pointer_down_off_handle},
      {"Popup_Positioning", "Popup flips and clamps at the edges", test_popup_positioning},
      {"Popup_Rows", "Popup rows for compact and detailed views", test_describe_activity_rows},
      {"Geometry_Degenerate", "Degenerate sizes clamp to the minimum", test_degenerate_render_size},
      {"Circle_ZeroActivities", "Empty input derives empty collections", test_zero_activities},
      {"Circle_ClickFocus", "Month, center and background clicks drive focus", test_click_focus_flow},
      {"Circle_ClickActivity", "Activity click opens the popup", test_click_activity_popup},
      {"Circle_Validation", "Validation reports every issue code", test_validation_codes},
      {"Circle_DemoData", "Demo data is valid and wraps the year", test_demo_activities},
      {"Scene_SvgExport", "SVG export is complete and escaped", test_svg_export},
      {"Calendar_Helpers", "Calendar helpers and text formats", test_calendar_helpers},
      {"Modes_Names", "Mode names round trip", test_mode_names},
      {"Hit_LabelOverMarker", "Labels never hide another activity's handle", test_label_over_marker_keeps_handle},
      {"Hit_HandlePriority", "Handles win over overlapping activity tags", test_hit_test_prefers_handles},
      {"Labels_InlineBudget", "Inline labels fit the room to the circle edge", test_inline_label_budget},
      {"Circle_ClickHandleKeepsDates", "Clicking a marker does not reschedule", test_click_on_handle_keeps_dates},
      {"Drag_NonFinitePointer", "Non-finite pointers produce no dates", test_non_finite_pointer},
      {"Popup_LargeNumbers", "Huge amounts format without overflow", test_popup_large_numbers},
      {"Circle_ConstructorYear", "Constructor clamps the year", test_constructor_clamps_year},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}
