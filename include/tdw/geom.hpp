#pragma once
#include <algorithm>
#include <cmath>
#include <numbers>

namespace tdw {

// Constant naming convention (kCamelCase)
inline constexpr double kPI = std::numbers::pi_v<double>;
inline constexpr double kDegToRad = kPI / 180.0;

inline double clamp(double x, double lo, double hi) {
  // lo wins when the range is inverted (world smaller than viewport)
  return std::max(lo, std::min(hi, x));
}

struct Vec2 {
  double x{};
  double y{};

  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(double k) const { return {x * k, y * k}; }
  Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
  Vec2& operator-=(const Vec2& o) { x -= o.x; y -= o.y; return *this; }
  Vec2& operator*=(double k) { x *= k; y *= k; return *this; }
  bool operator==(const Vec2&) const = default;

  double length_sq() const { return x*x + y*y; }
  double length() const { return std::sqrt(length_sq()); }

  // Zero vector stays zero.
  Vec2 normalized() const {
    const double len = length();
    if (len <= 0.0) return {};
    return {x / len, y / len};
  }
};

inline Vec2 operator*(double k, const Vec2& v) { return v * k; }

inline double distance(const Vec2& a, const Vec2& b) { return (a - b).length(); }

// Unit vector for a heading in degrees (0 = +x, y grows downwards).
inline Vec2 heading_vector(double heading_deg) {
  const double a = heading_deg * kDegToRad;
  return {std::cos(a), std::sin(a)};
}

// Axis-aligned rectangle, top-left origin.
struct Rect {
  double left{};
  double top{};
  double width{};
  double height{};

  double right() const { return left + width; }
  double bottom() const { return top + height; }
  Vec2 center() const { return {left + width * 0.5, top + height * 0.5}; }

  // Strict: touching edges do not count.
  bool overlaps(const Rect& o) const {
    return left < o.right() && o.left < right() &&
           top < o.bottom() && o.top < bottom();
  }

  bool contains(const Vec2& p) const {
    return p.x >= left && p.x <= right() && p.y >= top && p.y <= bottom();
  }

  static Rect centered_at(const Vec2& c, double w, double h) {
    return Rect{c.x - w * 0.5, c.y - h * 0.5, w, h};
  }
};

} // namespace tdw
