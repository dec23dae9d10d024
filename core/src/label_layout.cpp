#include "radial/core/label_layout.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>

#include <spdlog/spdlog.h>

namespace radial::core {

namespace {

// Average glyph advance relative to the font size.
constexpr double kCharWidthFactor = 0.6;
constexpr double kMinRailGap = 2.0;

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

// Byte offset just past the first `count` code points.
std::size_t utf8_prefix_bytes(std::string_view text, std::size_t count) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (!is_continuation_byte(text[i])) {
      if (seen == count) {
        return i;
      }
      ++seen;
    }
  }
  return text.size();
}

std::string trim_right(std::string_view text) {
  std::size_t end = text.size();
  while (end > 0 && (text[end - 1] == ' ' || text[end - 1] == '\t')) {
    --end;
  }
  return std::string(text.substr(0, end));
}

std::vector<std::string_view> split_words(std::string_view text) {
  std::vector<std::string_view> words;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '\n')) {
      ++i;
    }
    const std::size_t begin = i;
    while (i < text.size() && text[i] != ' ' && text[i] != '\t' && text[i] != '\n') {
      ++i;
    }
    if (i > begin) {
      words.push_back(text.substr(begin, i - begin));
    }
  }
  return words;
}

std::string end_with_ellipsis(std::string_view line, std::size_t line_width) {
  std::string kept = Utf8Length(line) >= line_width
                         ? trim_right(line.substr(0, utf8_prefix_bytes(line, line_width - 1)))
                         : trim_right(line);
  kept += kEllipsis;
  return kept;
}

std::string day_prefix(int day) {
  std::ostringstream oss;
  oss << std::setw(2) << std::setfill('0') << day << " · ";
  return oss.str();
}

}  // namespace

std::size_t Utf8Length(std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](char c) { return !is_continuation_byte(c); }));
}

std::string TruncateLabel(std::string_view text, std::size_t max_chars) {
  const std::size_t budget = std::max(max_chars, kMinLabelChars);
  if (Utf8Length(text) <= budget) {
    return std::string(text);
  }
  std::string out = trim_right(text.substr(0, utf8_prefix_bytes(text, budget - 1)));
  out += kEllipsis;
  return out;
}

std::vector<std::string> WrapLabel(std::string_view text, std::size_t line_width, std::size_t max_lines) {
  const std::size_t width = std::max<std::size_t>(line_width, 2);
  const std::size_t cap = std::max<std::size_t>(max_lines, 1);

  std::vector<std::string> lines;
  std::string current;
  std::size_t current_len = 0;
  for (std::string_view word : split_words(text)) {
    const std::size_t word_len = Utf8Length(word);
    if (word_len > width) {
      if (current_len > 0) {
        lines.push_back(std::move(current));
        current.clear();
        current_len = 0;
      }
      std::string_view rest = word;
      while (Utf8Length(rest) > width) {
        const std::size_t cut = utf8_prefix_bytes(rest, width);
        lines.emplace_back(rest.substr(0, cut));
        rest = rest.substr(cut);
      }
      current = std::string(rest);
      current_len = Utf8Length(rest);
      continue;
    }
    if (current_len == 0) {
      current = std::string(word);
      current_len = word_len;
    } else if (current_len + 1 + word_len <= width) {
      current += ' ';
      current += word;
      current_len += 1 + word_len;
    } else {
      lines.push_back(std::move(current));
      current = std::string(word);
      current_len = word_len;
    }
  }
  if (current_len > 0) {
    lines.push_back(std::move(current));
  }

  if (lines.size() > cap) {
    lines.resize(cap);
    lines.back() = end_with_ellipsis(lines.back(), width);
  }
  return lines;
}

double RailGap(const std::vector<RailSlot>& slots, double available, double preferred_gap, double min_gap) {
  if (slots.size() <= 1) {
    return preferred_gap;
  }
  const double total_height = std::accumulate(slots.begin(), slots.end(), 0.0,
                                              [](double sum, const RailSlot& s) { return sum + s.height; });
  const double slack = (available - total_height) / static_cast<double>(slots.size() - 1);
  return std::clamp(slack, min_gap, std::max(min_gap, preferred_gap));
}

RailLayout RelaxRail(const std::vector<RailSlot>& slots, double min_y, double max_y, double gap) {
  RailLayout layout;
  layout.gap = gap;
  layout.ys.resize(slots.size(), 0.0);
  if (slots.empty()) {
    return layout;
  }

  std::vector<std::size_t> order(slots.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) { return slots[a].natural_y < slots[b].natural_y; });

  const std::size_t n = order.size();
  std::vector<double> ys(n);
  std::vector<double> hs(n);
  double needed = gap * static_cast<double>(n - 1);
  for (std::size_t k = 0; k < n; ++k) {
    ys[k] = slots[order[k]].natural_y;
    hs[k] = std::max(0.0, slots[order[k]].height);
    needed += hs[k];
  }
  layout.overflow = needed > (max_y - min_y);

  // Forward: push down below the previous label.
  for (std::size_t k = 1; k < n; ++k) {
    ys[k] = std::max(ys[k], ys[k - 1] + hs[k - 1] + gap);
  }

  // Overflow: lift the whole rail so the last label ends at the bottom bound.
  const double bottom = ys[n - 1] + hs[n - 1];
  if (bottom > max_y) {
    const double delta = bottom - max_y;
    for (double& y : ys) {
      y -= delta;
    }
  }

  // Backward: pull up above the next label.
  for (std::size_t k = n - 1; k-- > 0;) {
    ys[k] = std::min(ys[k], ys[k + 1] - gap - hs[k]);
  }

  // Re-clamp to the top bound; separation wins over the bottom bound.
  ys[0] = std::max(ys[0], min_y);
  for (std::size_t k = 1; k < n; ++k) {
    ys[k] = std::max(ys[k], ys[k - 1] + hs[k - 1] + gap);
  }

  for (std::size_t k = 0; k < n; ++k) {
    layout.ys[order[k]] = ys[k];
  }
  return layout;
}

std::size_t InlineCharBudget(const RenderGeometry& geometry,
                             const Vec2d& text_origin,
                             TextAnchor anchor,
                             double font_size,
                             std::size_t cap) {
  double space = 0.0;
  if (anchor == TextAnchor::kEnd) {
    space = text_origin.x - (geometry.center.x - geometry.radius);
  } else {
    space = (geometry.center.x + geometry.radius) - text_origin.x;
  }
  const double char_width = std::max(1.0, font_size * kCharWidthFactor);
  const double fitting = std::floor(std::max(0.0, space) / char_width);
  const std::size_t chars = fitting >= static_cast<double>(cap) ? cap : static_cast<std::size_t>(fitting);
  return std::max(kMinLabelChars, chars);
}

std::vector<LabelItem> LayoutInlineLabels(const std::vector<LabelCandidate>& candidates,
                                          const RenderGeometry& geometry,
                                          LabelMode resolved_mode) {
  const bool label_all = resolved_mode == LabelMode::kAll;
  const double font_size = geometry.font_size(label_all ? 11.0 : 10.0);
  const std::size_t cap = label_all ? std::numeric_limits<std::size_t>::max() : (geometry.small ? 18u : 26u);
  const double offset = 18.0 * geometry.scale;

  std::vector<LabelItem> items;
  items.reserve(candidates.size());
  for (const LabelCandidate& candidate : candidates) {
    LabelItem item{};
    item.activity_id = candidate.activity_id;
    item.anchor_point = candidate.anchor;
    item.color = candidate.color;
    item.selected = candidate.selected;
    item.font_size = font_size;
    item.line_height = font_size + 3.0;
    item.height = item.line_height;
    const double dir_x = std::cos(candidate.angle);
    item.side = dir_x >= 0.0 ? LabelSide::kRight : LabelSide::kLeft;
    item.text_anchor = dir_x >= 0.0 ? TextAnchor::kStart : TextAnchor::kEnd;
    item.position = polar_point(candidate.anchor, candidate.angle, offset);
    const std::size_t budget = InlineCharBudget(geometry, item.position, item.text_anchor, font_size, cap);
    item.text_lines.push_back(TruncateLabel(candidate.title, budget));
    items.push_back(std::move(item));
  }
  return items;
}

GutterLayout LayoutGutterLabels(const std::vector<LabelCandidate>& candidates, const RenderGeometry& geometry) {
  GutterLayout layout;
  layout.font_size = geometry.font_size(geometry.tiny ? 9.0 : geometry.small ? 10.0 : 11.0);
  layout.line_height = layout.font_size + 3.0;
  const double padding_y = 18.0 * geometry.scale;
  layout.min_y = geometry.center.y - geometry.radius + padding_y;
  layout.max_y = geometry.center.y + geometry.radius - padding_y;
  const double available = std::max(1.0, layout.max_y - layout.min_y);
  const double preferred_gap = std::max(kMinRailGap, 6.0 * geometry.scale);
  const std::size_t wrap_width = geometry.small ? 22 : 28;
  const double edge_radius = geometry.radius + 6.0 * geometry.scale;
  const double rail_offset = geometry.radius + 26.0 * geometry.scale;
  const double leader_inset = 6.0 * geometry.scale;

  const auto build_side = [&](LabelSide side, double* out_gap) {
    std::vector<LabelItem> items;
    std::vector<RailSlot> slots;
    for (const LabelCandidate& candidate : candidates) {
      const LabelSide candidate_side = candidate.anchor.x >= geometry.center.x ? LabelSide::kRight : LabelSide::kLeft;
      if (candidate_side != side) {
        continue;
      }
      LabelItem item{};
      item.activity_id = candidate.activity_id;
      item.anchor_point = candidate.anchor;
      item.side = side;
      item.color = candidate.color;
      item.selected = candidate.selected;
      item.font_size = layout.font_size;
      item.line_height = layout.line_height;
      const std::string text = candidate.day.has_value() ? day_prefix(*candidate.day) + candidate.title : candidate.title;
      item.text_lines = WrapLabel(text, wrap_width, kMaxLabelLines);
      if (item.text_lines.empty()) {
        item.text_lines.emplace_back();
      }
      item.height = static_cast<double>(item.text_lines.size()) * layout.line_height;
      const Vec2d edge = geometry.point_at(candidate.angle, edge_radius);
      item.leader = {candidate.anchor, edge};
      slots.push_back({edge.y - layout.line_height / 2.0, item.height});
      items.push_back(std::move(item));
    }

    *out_gap = RailGap(slots, available, preferred_gap, kMinRailGap);
    const RailLayout rail = RelaxRail(slots, layout.min_y, layout.max_y, *out_gap);
    if (rail.overflow) {
      spdlog::debug("label rail {} overflows: {} labels in {:.1f}px", side == LabelSide::kLeft ? "left" : "right",
                    items.size(), available);
    }

    const double label_x =
        side == LabelSide::kRight ? geometry.center.x + rail_offset : geometry.center.x - rail_offset;
    const double leader_x = side == LabelSide::kRight ? label_x - leader_inset : label_x + leader_inset;
    for (std::size_t i = 0; i < items.size(); ++i) {
      LabelItem& item = items[i];
      item.position = {label_x, rail.ys[i]};
      item.text_anchor = side == LabelSide::kRight ? TextAnchor::kStart : TextAnchor::kEnd;
      item.leader.push_back({leader_x, rail.ys[i] + item.line_height / 2.0});
    }
    std::stable_sort(items.begin(), items.end(),
                     [](const LabelItem& a, const LabelItem& b) { return a.position.y < b.position.y; });
    return items;
  };

  layout.left = build_side(LabelSide::kLeft, &layout.gap_left);
  layout.right = build_side(LabelSide::kRight, &layout.gap_right);
  return layout;
}

}  // namespace radial::core
