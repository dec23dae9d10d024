#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "radial/core/calendar.hpp"
#include "radial/core/entities.hpp"

namespace radial::core {

enum class LabelMode : std::uint8_t {
  kAuto = 0,
  kAll = 1,
  kSmart = 2,
  kHover = 3,
  kNone = 4,
};

enum class ConnectionMode : std::uint8_t {
  kAuto = 0,
  kAll = 1,
  kLabeled = 2,
  kNone = 3,
};

// Inputs of the auto-resolution rules. Resolved once per recompute into a concrete mode.
struct LabelDensity {
  std::size_t visible_count = 0;
  bool small = false;
  bool tiny = false;
  bool month_focus = false;
};

// Point-in-time activities count as ongoing this close to their start.
constexpr double kOngoingWindowDays = 7.0;

LabelMode ResolveLabelMode(LabelMode requested, const LabelDensity& density);
ConnectionMode ResolveConnectionMode(ConnectionMode requested, const LabelDensity& density);

// Number of labels the smart mode may show.
std::size_t SmartLabelBudget(const LabelDensity& density);

bool IsOngoing(const Activity& activity, DateTime now);
double ImportanceScore(const Activity& activity);

// Ids to label, in selection order: selected first, then ongoing, then by descending score.
std::vector<ActivityId> SelectLabeledIds(const std::vector<const Activity*>& visible,
                                         LabelMode resolved_mode,
                                         const LabelDensity& density,
                                         const std::optional<ActivityId>& selected_id,
                                         DateTime now);

std::unordered_set<ActivityId> SelectConnectionIds(const std::vector<const Activity*>& visible,
                                                   ConnectionMode resolved_mode,
                                                   const std::vector<ActivityId>& labeled_ids);

const char* LabelModeName(LabelMode mode);
const char* ConnectionModeName(ConnectionMode mode);
std::optional<LabelMode> ParseLabelMode(std::string_view text);
std::optional<ConnectionMode> ParseConnectionMode(std::string_view text);

}  // namespace radial::core
