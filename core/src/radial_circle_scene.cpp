#include "radial/core/radial_circle.hpp"

#include <array>
#include <cstddef>
#include <cstdio>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "radial/core/calendar.hpp"

namespace radial::core {

namespace {

constexpr Rgba kBackgroundFill{0x0a, 0x0f, 0x1e, 0xff};
constexpr Rgba kBackgroundStroke{0x1e, 0x29, 0x3b, 0xff};
constexpr Rgba kMonthTickColor{0x47, 0x55, 0x69, 0xff};
constexpr Rgba kMonthLabelColor{0x94, 0xa3, 0xb8, 0xff};
constexpr Rgba kWeekTickColor{0x33, 0x41, 0x55, 0xff};
constexpr Rgba kWeekLabelColor{0x64, 0x74, 0x8b, 0xff};
constexpr Rgba kMarkerHole{0x0f, 0x17, 0x2a, 0xff};
constexpr Rgba kLabelText{0xe2, 0xe8, 0xf0, 0xff};
constexpr Rgba kSelectedLabelText{0xff, 0xff, 0xff, 0xff};
constexpr Rgba kTextHalo{0x02, 0x06, 0x17, 0xe6};
constexpr Rgba kMonthLabelHalo{0x02, 0x06, 0x17, 0xbf};

constexpr std::array<const char*, 12> kMonthNames = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
constexpr std::array<const char*, 12> kMonthLetters = {"J", "F", "M", "A", "M", "J",
                                                       "J", "A", "S", "O", "N", "D"};

HitTag activity_tag(HitKind kind, const ActivityId& id) {
  HitTag tag{};
  tag.kind = kind;
  tag.activity_id = id;
  return tag;
}

std::string two_digits(int value) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%02d", value);
  return buffer;
}

class SceneBuilder {
 public:
  explicit SceneBuilder(const CircleFrame& frame) : frame_(frame), geo_(frame.geometry) {
    scene_.size = geo_.size;
  }

  Scene Build() {
    add_background();
    add_rings();
    if (frame_.mapper.month_focus()) {
      add_day_ticks();
    } else {
      add_month_ticks();
      add_week_ticks();
    }
    add_connections();

    std::unordered_map<ActivityId, const LabelItem*> inline_by_id;
    for (const LabelItem& item : frame_.inline_labels) {
      inline_by_id.emplace(item.activity_id, &item);
    }
    for (const ActivityPlacement& placement : frame_.placements) {
      add_activity(placement);
      const auto label = inline_by_id.find(placement.activity->id);
      if (label != inline_by_id.end()) {
        add_inline_label(*label->second);
      }
    }
    for (const LabelItem& item : frame_.gutter.left) {
      add_gutter_label(item);
    }
    for (const LabelItem& item : frame_.gutter.right) {
      add_gutter_label(item);
    }
    add_center_label();
    return std::move(scene_);
  }

 private:
  double sw(double nominal) const { return geo_.stroke_width(nominal); }
  double fs(double nominal) const { return geo_.font_size(nominal); }

  void add(Shape shape) { scene_.shapes.push_back(std::move(shape)); }

  void add_background() {
    CircleShape disc{};
    disc.center = geo_.center;
    disc.radius = geo_.radius;
    disc.fill = kBackgroundFill;
    disc.stroke = kBackgroundStroke;
    disc.stroke_width = sw(2.0);
    add(disc);
  }

  void add_rings() {
    for (const Ring& ring : frame_.rings.rings()) {
      CircleShape circle{};
      circle.center = geo_.center;
      circle.radius = ring.radius;
      circle.stroke = ring.color;
      circle.stroke_width = sw(1.5);
      circle.opacity = 0.35;
      add(circle);

      TextShape name{};
      name.position = {geo_.center.x, geo_.center.y - ring.radius - 12.0 * geo_.scale};
      name.text = ring.name;
      name.font_size = fs(11.0);
      name.fill = ring.color;
      name.weight = 600;
      add(name);
    }
  }

  void add_month_ticks() {
    for (int month = 0; month < 12; ++month) {
      const double angle = static_cast<double>(month) / 12.0 * kTwoPi - kHalfPi;
      LineShape tick{};
      tick.from = geo_.point_at(angle, geo_.radius - 10.0 * geo_.scale);
      tick.to = geo_.point_at(angle, geo_.radius);
      tick.stroke = kMonthTickColor;
      tick.width = sw(2.0);
      add(tick);

      TextShape label{};
      label.position = geo_.point_at(angle, geo_.radius + 18.0 * geo_.scale);
      label.text = geo_.tiny ? kMonthLetters[month] : kMonthNames[month];
      label.font_size = fs(12.0);
      label.fill = kMonthLabelColor;
      label.weight = 700;
      label.halo = kMonthLabelHalo;
      label.halo_width = sw(4.0);
      label.tag.kind = HitKind::kMonthLabel;
      label.tag.month = month;
      add(label);
    }
  }

  void add_week_ticks() {
    const int weeks = IsoWeeksInYear(frame_.mapper.view().year);
    const int step = geo_.tiny ? 8 : geo_.small ? 6 : 4;
    for (int week = 1; week <= weeks; ++week) {
      const double angle = static_cast<double>(week) / weeks * kTwoPi - kHalfPi;
      LineShape tick{};
      tick.from = geo_.point_at(angle, geo_.radius - 16.0 * geo_.scale);
      tick.to = geo_.point_at(angle, geo_.radius - 10.0 * geo_.scale);
      tick.stroke = kWeekTickColor;
      tick.width = sw(1.0);
      tick.opacity = 0.6;
      add(tick);

      if (week == 1 || week % step == 1) {
        TextShape label{};
        label.position = geo_.point_at(angle, geo_.radius - 30.0 * geo_.scale);
        label.text = "KW" + two_digits(week);
        label.font_size = fs(9.0);
        label.fill = kWeekLabelColor;
        add(label);
      }
    }
  }

  void add_day_ticks() {
    const int days = frame_.mapper.unit_count();
    for (int day = 1; day <= days; ++day) {
      const double angle = (static_cast<double>(day) - 0.5) / days * kTwoPi - kHalfPi;
      const bool major = day == 1 || day % 7 == 1;
      LineShape tick{};
      tick.from = geo_.point_at(angle, geo_.radius - (major ? 16.0 : 12.0) * geo_.scale);
      tick.to = geo_.point_at(angle, geo_.radius - 6.0 * geo_.scale);
      tick.stroke = kMonthTickColor;
      tick.width = sw(major ? 1.8 : 1.0);
      tick.opacity = major ? 0.9 : 0.55;
      add(tick);

      if (major && !geo_.tiny) {
        TextShape label{};
        label.position = geo_.point_at(angle, geo_.radius + 18.0 * geo_.scale);
        label.text = std::to_string(day);
        label.font_size = fs(10.0);
        label.fill = kMonthLabelColor;
        label.weight = 600;
        label.halo = kMonthLabelHalo;
        label.halo_width = sw(4.0);
        add(label);
      }
    }
  }

  void add_connections() {
    for (const ActivityPlacement& placement : frame_.placements) {
      if (frame_.connection_ids.count(placement.activity->id) == 0) {
        continue;
      }
      LineShape line{};
      line.from = placement.start_point;
      line.to = geo_.point_at(placement.start_angle, geo_.radius);
      line.stroke = placement.color;
      line.width = sw(1.5);
      line.opacity = 0.35;
      line.dash = 3.0;
      add(line);
    }
  }

  void add_cap_dot(const ActivityPlacement& placement, double angle) {
    CircleShape cap{};
    cap.center = geo_.point_at(angle, placement.ring_radius + 10.0 * geo_.scale);
    cap.radius = sw(3.0);
    cap.fill = placement.color;
    cap.opacity = 0.35;
    add(cap);
  }

  void add_activity(const ActivityPlacement& placement) {
    const ActivityId& id = placement.activity->id;
    const bool range = placement.end_angle.has_value();

    if (range) {
      const std::vector<ArcSegment> segments =
          BuildDurationArc(geo_.center, placement.ring_radius, placement.start_angle, *placement.end_angle);
      bool first_pass = true;
      for (const StrokePass& pass : kArcGlowPasses) {
        ArcShape arc{};
        arc.segments = segments;
        arc.stroke = placement.color;
        arc.width = sw(pass.width);
        arc.opacity = pass.opacity;
        if (first_pass) {
          arc.tag = activity_tag(HitKind::kActivity, id);
          first_pass = false;
        }
        add(std::move(arc));
      }
    }

    // start marker
    CircleShape halo{};
    halo.center = placement.start_point;
    halo.radius = sw(11.0);
    halo.fill = placement.color;
    halo.opacity = 0.12;
    halo.tag = activity_tag(HitKind::kActivity, id);
    add(halo);

    CircleShape accent{};
    accent.center = placement.start_point;
    accent.radius = sw(9.0);
    accent.stroke = placement.color;
    accent.stroke_width = sw(1.5);
    accent.opacity = 0.6;
    add(accent);

    CircleShape core_dot{};
    core_dot.center = placement.start_point;
    core_dot.radius = sw(6.0);
    core_dot.fill = placement.color;
    core_dot.stroke = kMarkerHole;
    core_dot.stroke_width = sw(2.0);
    core_dot.tag = activity_tag(HitKind::kStartHandle, id);
    add(core_dot);

    if (!range) {
      return;
    }
    add_cap_dot(placement, placement.start_angle);

    CircleShape end_halo{};
    end_halo.center = *placement.end_point;
    end_halo.radius = sw(11.0);
    end_halo.fill = placement.color;
    end_halo.opacity = 0.1;
    end_halo.tag = activity_tag(HitKind::kActivity, id);
    add(end_halo);

    CircleShape hole{};
    hole.center = *placement.end_point;
    hole.radius = sw(6.0);
    hole.fill = kMarkerHole;
    hole.stroke = placement.color;
    hole.stroke_width = sw(2.0);
    hole.opacity = 0.95;
    hole.tag = activity_tag(HitKind::kEndHandle, id);
    add(hole);

    add_cap_dot(placement, *placement.end_angle);
  }

  void add_inline_label(const LabelItem& item) {
    for (const std::string& line : item.text_lines) {
      TextShape text{};
      text.position = item.position;
      text.text = line;
      text.font_size = item.font_size;
      text.fill = item.selected ? kSelectedLabelText : kLabelText;
      text.anchor = item.text_anchor;
      text.weight = item.selected ? 800 : 600;
      text.halo = kTextHalo;
      text.halo_width = sw(4.0);
      add(std::move(text));
    }
  }

  void add_gutter_label(const LabelItem& item) {
    PolylineShape leader{};
    leader.points = item.leader;
    leader.stroke = item.color;
    leader.width = sw(item.selected ? 2.2 : 1.6);
    leader.opacity = item.selected ? 0.7 : 0.35;
    add(std::move(leader));

    for (std::size_t i = 0; i < item.text_lines.size(); ++i) {
      TextShape text{};
      text.position = {item.position.x, item.position.y + (static_cast<double>(i) + 0.5) * item.line_height};
      text.text = item.text_lines[i];
      text.font_size = item.font_size;
      text.fill = item.selected ? kSelectedLabelText : kLabelText;
      text.anchor = item.text_anchor;
      text.weight = item.selected ? 800 : 650;
      text.halo = kTextHalo;
      text.halo_width = sw(4.0);
      add(std::move(text));
    }
  }

  void add_center_label() {
    const ViewState& view = frame_.mapper.view();
    TextShape center{};
    center.position = geo_.center;
    center.font_size = fs(24.0);
    center.fill = kWeekLabelColor;
    center.weight = 300;
    if (view.focused_month.has_value()) {
      center.text = std::string(kMonthNames[*view.focused_month]) + " " + std::to_string(view.year);
      center.tag.kind = HitKind::kCenterLabel;
    } else {
      center.text = std::to_string(view.year);
    }
    add(std::move(center));
  }

  const CircleFrame& frame_;
  const RenderGeometry& geo_;
  Scene scene_{};
};

}  // namespace

Scene RadialCircle::build_scene(const CircleFrame& frame) {
  return SceneBuilder(frame).Build();
}

}  // namespace radial::core
