#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "radial/core/arc_renderer.hpp"
#include "radial/core/entities.hpp"
#include "radial/core/types.hpp"

namespace radial::core {

enum class HitKind : std::uint8_t {
  kNone = 0,
  kActivity = 1,
  kStartHandle = 2,
  kEndHandle = 3,
  kMonthLabel = 4,
  kCenterLabel = 5,
};

// Marks shapes that react to the pointer. Untagged shapes are decoration only.
struct HitTag {
  HitKind kind = HitKind::kNone;
  ActivityId activity_id{};
  int month = -1;
};

struct CircleShape {
  Vec2d center{};
  double radius = 0.0;
  std::optional<Rgba> fill{};
  std::optional<Rgba> stroke{};
  double stroke_width = 0.0;
  double opacity = 1.0;
  HitTag tag{};
};

struct LineShape {
  Vec2d from{};
  Vec2d to{};
  Rgba stroke{};
  double width = 1.0;
  double opacity = 1.0;
  double dash = 0.0;  // dash and gap length; 0 draws a solid line
};

struct PolylineShape {
  std::vector<Vec2d> points{};
  Rgba stroke{};
  double width = 1.0;
  double opacity = 1.0;
};

struct ArcShape {
  std::vector<ArcSegment> segments{};
  Rgba stroke{};
  double width = 1.0;
  double opacity = 1.0;
  HitTag tag{};
};

// Vertically centered on `position.y`; `anchor` decides the horizontal alignment.
struct TextShape {
  Vec2d position{};
  std::string text{};
  double font_size = 10.0;
  Rgba fill{};
  TextAnchor anchor = TextAnchor::kMiddle;
  int weight = 400;
  std::optional<Rgba> halo{};
  double halo_width = 0.0;
  HitTag tag{};
};

using Shape = std::variant<CircleShape, LineShape, PolylineShape, ArcShape, TextShape>;

// Flat, back-to-front list of shapes for one render surface.
struct Scene {
  double size = 0.0;
  std::vector<Shape> shapes{};
};

struct HitResult {
  HitKind kind = HitKind::kNone;
  ActivityId activity_id{};
  int month = -1;
};

// Estimated text box, using an average glyph advance.
Rectd TextBounds(const TextShape& text);

// Top-most tagged shape under `point`. Start and end handles win over any other tag.
HitResult HitTest(const Scene& scene, const Vec2d& point, double tolerance = 2.0);

// Serializes the scene as a standalone SVG document.
std::string WriteSvg(const Scene& scene);

}  // namespace radial::core
