#include "radial/core/label_policy.hpp"

#include <algorithm>
#include <cmath>
#include <string_view>

namespace radial::core {

namespace {

constexpr std::size_t kSmartBudgetYearSmall = 6;
constexpr std::size_t kSmartBudgetYear = 10;
constexpr std::size_t kSmartBudgetFocusSmall = 10;
constexpr std::size_t kSmartBudgetFocus = 14;
constexpr std::size_t kConnectAllMaxCount = 18;

double finite_or_zero(double value) {
  return std::isfinite(value) ? value : 0.0;
}

}  // namespace

LabelMode ResolveLabelMode(LabelMode requested, const LabelDensity& density) {
  if (requested != LabelMode::kAuto) {
    return requested;
  }
  if (density.tiny) {
    return LabelMode::kHover;
  }
  const std::size_t n = density.visible_count;
  // Gutter layout in month focus keeps many labels readable.
  if (density.month_focus) {
    return n <= (density.small ? 20u : 26u) ? LabelMode::kAll : LabelMode::kSmart;
  }
  if (n <= (density.small ? 8u : 12u)) {
    return LabelMode::kAll;
  }
  if (n <= (density.small ? 14u : 18u)) {
    return LabelMode::kSmart;
  }
  return LabelMode::kHover;
}

ConnectionMode ResolveConnectionMode(ConnectionMode requested, const LabelDensity& density) {
  if (requested != ConnectionMode::kAuto) {
    return requested;
  }
  if (density.month_focus) {
    return ConnectionMode::kNone;
  }
  if (density.visible_count <= kConnectAllMaxCount) {
    return ConnectionMode::kAll;
  }
  return ConnectionMode::kLabeled;
}

std::size_t SmartLabelBudget(const LabelDensity& density) {
  if (density.month_focus) {
    return density.small ? kSmartBudgetFocusSmall : kSmartBudgetFocus;
  }
  return density.small ? kSmartBudgetYearSmall : kSmartBudgetYear;
}

bool IsOngoing(const Activity& activity, DateTime now) {
  if (!activity.start.has_value()) {
    return false;
  }
  if (activity.end.has_value()) {
    return *activity.start <= now && *activity.end >= now;
  }
  return std::abs(DaysBetween(*activity.start, now)) <= kOngoingWindowDays;
}

double ImportanceScore(const Activity& activity) {
  double status_boost = 0.0;
  if (activity.status == ActivityStatus::kActive) {
    status_boost = 1000.0;
  } else if (activity.status == ActivityStatus::kPlanned) {
    status_boost = 250.0;
  }
  double duration_days = 0.0;
  if (activity.start.has_value() && activity.end.has_value()) {
    duration_days = std::max(0.0, DaysBetween(*activity.start, *activity.end));
  }
  return status_boost + std::min(2000.0, finite_or_zero(activity.budget) / 10.0) +
         std::min(300.0, finite_or_zero(activity.weight) * 5.0) + std::min(120.0, duration_days);
}

std::vector<ActivityId> SelectLabeledIds(const std::vector<const Activity*>& visible,
                                         LabelMode resolved_mode,
                                         const LabelDensity& density,
                                         const std::optional<ActivityId>& selected_id,
                                         DateTime now) {
  std::vector<ActivityId> ids;
  switch (resolved_mode) {
  case LabelMode::kNone:
    return ids;
  case LabelMode::kAll:
    for (const Activity* activity : visible) {
      ids.push_back(activity->id);
    }
    return ids;
  case LabelMode::kHover:
    if (selected_id.has_value()) {
      ids.push_back(*selected_id);
    }
    return ids;
  case LabelMode::kSmart:
  case LabelMode::kAuto:
  default:
    break;
  }

  const std::size_t budget = SmartLabelBudget(density);
  std::unordered_set<ActivityId> taken;
  const auto take = [&](const ActivityId& id) {
    if (ids.size() < budget && taken.insert(id).second) {
      ids.push_back(id);
    }
  };

  if (selected_id.has_value()) {
    take(*selected_id);
  }
  for (const Activity* activity : visible) {
    if (ids.size() >= budget) {
      break;
    }
    if (IsOngoing(*activity, now)) {
      take(activity->id);
    }
  }

  std::vector<std::pair<double, const Activity*>> ranked;
  ranked.reserve(visible.size());
  for (const Activity* activity : visible) {
    ranked.emplace_back(ImportanceScore(*activity), activity);
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.first > b.first; });
  for (const auto& [_, activity] : ranked) {
    if (ids.size() >= budget) {
      break;
    }
    take(activity->id);
  }
  return ids;
}

std::unordered_set<ActivityId> SelectConnectionIds(const std::vector<const Activity*>& visible,
                                                   ConnectionMode resolved_mode,
                                                   const std::vector<ActivityId>& labeled_ids) {
  std::unordered_set<ActivityId> ids;
  switch (resolved_mode) {
  case ConnectionMode::kNone:
    return ids;
  case ConnectionMode::kAll:
    for (const Activity* activity : visible) {
      ids.insert(activity->id);
    }
    return ids;
  case ConnectionMode::kLabeled:
  case ConnectionMode::kAuto:
  default:
    ids.insert(labeled_ids.begin(), labeled_ids.end());
    return ids;
  }
}

const char* LabelModeName(LabelMode mode) {
  switch (mode) {
  case LabelMode::kAuto:
    return "auto";
  case LabelMode::kAll:
    return "all";
  case LabelMode::kSmart:
    return "smart";
  case LabelMode::kHover:
    return "hover";
  case LabelMode::kNone:
    return "none";
  default:
    return "unknown";
  }
}

const char* ConnectionModeName(ConnectionMode mode) {
  switch (mode) {
  case ConnectionMode::kAuto:
    return "auto";
  case ConnectionMode::kAll:
    return "all";
  case ConnectionMode::kLabeled:
    return "labeled";
  case ConnectionMode::kNone:
    return "none";
  default:
    return "unknown";
  }
}

std::optional<LabelMode> ParseLabelMode(std::string_view text) {
  for (LabelMode mode : {LabelMode::kAuto, LabelMode::kAll, LabelMode::kSmart, LabelMode::kHover, LabelMode::kNone}) {
    if (text == LabelModeName(mode)) {
      return mode;
    }
  }
  return std::nullopt;
}

std::optional<ConnectionMode> ParseConnectionMode(std::string_view text) {
  for (ConnectionMode mode :
       {ConnectionMode::kAuto, ConnectionMode::kAll, ConnectionMode::kLabeled, ConnectionMode::kNone}) {
    if (text == ConnectionModeName(mode)) {
      return mode;
    }
  }
  return std::nullopt;
}

}  // namespace radial::core
