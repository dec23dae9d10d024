#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "radial/core/entities.hpp"
#include "radial/core/types.hpp"

namespace radial::core {

constexpr std::size_t kMaxRings = 5;
constexpr double kOuterRingFactor = 0.82;
constexpr double kInnerRingFactor = 0.54;
// Radius factor used when no ring exists at all.
constexpr double kFallbackRingFactor = 0.7;

constexpr std::array<Rgba, 5> kRingPalette = {
    Rgba{0x3b, 0x82, 0xf6, 0xff},  // blue
    Rgba{0xa7, 0x8b, 0xfa, 0xff},  // violet
    Rgba{0x10, 0xb9, 0x81, 0xff},  // emerald
    Rgba{0xf5, 0x9e, 0x0b, 0xff},  // amber
    Rgba{0xef, 0x44, 0x44, 0xff},  // red
};
constexpr Rgba kFallbackRingColor{0x64, 0x74, 0x8b, 0xff};

// Case- and surrounding-whitespace-insensitive key ("  Events " -> "EVENTS").
std::string NormalizeCategoryKey(std::string_view name);

// "#rgb" / "#rrggbb" (optionally "#rrggbbaa"); nullopt for anything else.
std::optional<Rgba> ParseHexColor(std::string_view text);
std::string FormatHexColor(const Rgba& color);

// Concentric rings, one per distinct category, outermost first.
class RingModel {
 public:
  RingModel() = default;

  // Supplied categories come first, then categories seen on activities; both in encounter order.
  static RingModel Build(const std::vector<Activity>& activities,
                         const std::vector<CategorySpec>& categories,
                         double circle_radius);

  [[nodiscard]] const std::vector<Ring>& rings() const { return rings_; }
  [[nodiscard]] bool empty() const { return rings_.empty(); }
  [[nodiscard]] const Ring* find(std::string_view key) const;

  // Unknown or empty categories resolve to the first ring.
  [[nodiscard]] std::string ResolveKey(std::string_view category) const;
  [[nodiscard]] double RadiusFor(std::string_view category) const;
  [[nodiscard]] Rgba ColorFor(std::string_view category) const;
  // Number of distinct non-empty categories offered before the ring cap was applied.
  [[nodiscard]] std::size_t candidate_count() const { return candidate_count_; }

 private:
  std::vector<Ring> rings_{};
  double circle_radius_ = 0.0;
  std::size_t candidate_count_ = 0;
};

}  // namespace radial::core
