#include "radial/core/scene.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "radial/core/label_layout.hpp"
#include "radial/core/ring_model.hpp"

namespace radial::core {

namespace {

constexpr double kGlyphAdvance = 0.6;

HitResult to_hit(const HitTag& tag) {
  return HitResult{tag.kind, tag.activity_id, tag.month};
}

bool is_handle(HitKind kind) {
  return kind == HitKind::kStartHandle || kind == HitKind::kEndHandle;
}

// Tag of `shape` when it is tagged and under `point`.
const HitTag* shape_hit(const Shape& shape, const Vec2d& point, double tolerance) {
  if (const auto* circle = std::get_if<CircleShape>(&shape)) {
    if (circle->tag.kind != HitKind::kNone &&
        distance(circle->center, point) <= circle->radius + circle->stroke_width / 2.0 + tolerance) {
      return &circle->tag;
    }
  } else if (const auto* text = std::get_if<TextShape>(&shape)) {
    if (text->tag.kind == HitKind::kNone) {
      return nullptr;
    }
    Rectd box = TextBounds(*text);
    box.x -= tolerance;
    box.y -= tolerance;
    box.width += 2.0 * tolerance;
    box.height += 2.0 * tolerance;
    if (box.contains(point)) {
      return &text->tag;
    }
  } else if (const auto* arc = std::get_if<ArcShape>(&shape)) {
    if (arc->tag.kind == HitKind::kNone) {
      return nullptr;
    }
    for (const ArcSegment& segment : arc->segments) {
      if (ArcContains(segment, arc->width + 2.0 * tolerance, point)) {
        return &arc->tag;
      }
    }
  }
  return nullptr;
}

std::string escape_xml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    default:
      out += c;
      break;
    }
  }
  return out;
}

const char* text_anchor_attr(TextAnchor anchor) {
  switch (anchor) {
  case TextAnchor::kStart:
    return "start";
  case TextAnchor::kEnd:
    return "end";
  case TextAnchor::kMiddle:
  default:
    return "middle";
  }
}

class SvgWriter {
 public:
  explicit SvgWriter(std::ostringstream& out) : out_(out) {}

  void operator()(const CircleShape& c) const {
    out_ << "  <circle cx=\"" << c.center.x << "\" cy=\"" << c.center.y << "\" r=\"" << c.radius << "\"";
    out_ << " fill=\"" << (c.fill ? FormatHexColor(*c.fill) : "none") << "\"";
    if (c.stroke) {
      out_ << " stroke=\"" << FormatHexColor(*c.stroke) << "\" stroke-width=\"" << c.stroke_width << "\"";
    }
    write_opacity(c.opacity);
    out_ << "/>\n";
  }

  void operator()(const LineShape& l) const {
    out_ << "  <line x1=\"" << l.from.x << "\" y1=\"" << l.from.y << "\" x2=\"" << l.to.x << "\" y2=\"" << l.to.y
         << "\" stroke=\"" << FormatHexColor(l.stroke) << "\" stroke-width=\"" << l.width << "\"";
    if (l.dash > 0.0) {
      out_ << " stroke-dasharray=\"" << l.dash << " " << l.dash << "\"";
    }
    write_opacity(l.opacity);
    out_ << "/>\n";
  }

  void operator()(const PolylineShape& p) const {
    out_ << "  <polyline points=\"";
    for (std::size_t i = 0; i < p.points.size(); ++i) {
      out_ << (i > 0 ? " " : "") << p.points[i].x << "," << p.points[i].y;
    }
    out_ << "\" fill=\"none\" stroke=\"" << FormatHexColor(p.stroke) << "\" stroke-width=\"" << p.width << "\"";
    write_opacity(p.opacity);
    out_ << "/>\n";
  }

  void operator()(const ArcShape& a) const {
    out_ << "  <path d=\"" << ArcPathData(a.segments) << "\" fill=\"none\" stroke=\"" << FormatHexColor(a.stroke)
         << "\" stroke-width=\"" << a.width << "\" stroke-linecap=\"round\"";
    write_opacity(a.opacity);
    out_ << "/>\n";
  }

  void operator()(const TextShape& t) const {
    out_ << "  <text x=\"" << t.position.x << "\" y=\"" << t.position.y << "\" font-size=\"" << t.font_size
         << "\" fill=\"" << FormatHexColor(t.fill) << "\" text-anchor=\"" << text_anchor_attr(t.anchor)
         << "\" dominant-baseline=\"middle\" font-weight=\"" << t.weight << "\"";
    if (t.halo) {
      out_ << " style=\"paint-order:stroke;stroke:" << FormatHexColor(*t.halo) << ";stroke-width:" << t.halo_width
           << "\"";
    }
    out_ << ">" << escape_xml(t.text) << "</text>\n";
  }

 private:
  void write_opacity(double opacity) const {
    if (opacity < 1.0) {
      out_ << " opacity=\"" << opacity << "\"";
    }
  }

  std::ostringstream& out_;
};

}  // namespace

Rectd TextBounds(const TextShape& text) {
  const double width = static_cast<double>(Utf8Length(text.text)) * text.font_size * kGlyphAdvance;
  double left = text.position.x - width / 2.0;
  if (text.anchor == TextAnchor::kStart) {
    left = text.position.x;
  } else if (text.anchor == TextAnchor::kEnd) {
    left = text.position.x - width;
  }
  return Rectd{left, text.position.y - text.font_size / 2.0, width, text.font_size};
}

HitResult HitTest(const Scene& scene, const Vec2d& point, double tolerance) {
  const HitTag* top = nullptr;
  for (auto it = scene.shapes.rbegin(); it != scene.shapes.rend(); ++it) {
    const HitTag* tag = shape_hit(*it, point, tolerance);
    if (tag == nullptr) {
      continue;
    }
    if (is_handle(tag->kind)) {
      return to_hit(*tag);
    }
    if (top == nullptr) {
      top = tag;
    }
  }
  return top != nullptr ? to_hit(*top) : HitResult{};
}

std::string WriteSvg(const Scene& scene) {
  std::ostringstream out;
  out << std::setprecision(6);
  out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << scene.size << "\" height=\"" << scene.size
      << "\" viewBox=\"0 0 " << scene.size << " " << scene.size << "\">\n";
  const SvgWriter writer(out);
  for (const Shape& shape : scene.shapes) {
    std::visit(writer, shape);
  }
  out << "</svg>\n";
  return out.str();
}

}  // namespace radial::core
