#pragma once

#include <cmath>
#include <cstdint>

namespace radial::core {

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kHalfPi = 0.5 * kPi;

struct Vec2d {
  double x = 0.0;
  double y = 0.0;
};

inline Vec2d operator+(const Vec2d& a, const Vec2d& b) {
  return {a.x + b.x, a.y + b.y};
}

inline Vec2d operator-(const Vec2d& a, const Vec2d& b) {
  return {a.x - b.x, a.y - b.y};
}

inline Vec2d operator*(const Vec2d& a, double s) {
  return {a.x * s, a.y * s};
}

inline double length(const Vec2d& v) {
  return std::sqrt(v.x * v.x + v.y * v.y);
}

inline double distance(const Vec2d& a, const Vec2d& b) {
  return length(a - b);
}

// Screen space: y grows downwards, angle 0 points right, -pi/2 points up.
inline Vec2d polar_point(const Vec2d& center, double angle, double radius) {
  return {center.x + std::cos(angle) * radius, center.y + std::sin(angle) * radius};
}

// Wraps into [0, 2pi).
inline double normalize_angle(double angle) {
  double out = std::fmod(angle, kTwoPi);
  if (out < 0.0) {
    out += kTwoPi;
  }
  if (out >= kTwoPi) {
    out = 0.0;
  }
  return out;
}

struct Rgba {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 255;

  friend bool operator==(const Rgba&, const Rgba&) = default;
};

struct Rectd {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  [[nodiscard]] bool contains(const Vec2d& p) const {
    return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
  }
};

}  // namespace radial::core
