#pragma once
#include <cmath>

namespace seasafe::math {

struct Vec2d {
  double x{0}, y{0};

  constexpr Vec2d() = default;
  constexpr Vec2d(double x_, double y_) : x(x_), y(y_) {}

  Vec2d operator+(const Vec2d& o) const { return {x + o.x, y + o.y}; }
  Vec2d operator-(const Vec2d& o) const { return {x - o.x, y - o.y}; }
  Vec2d operator*(double s) const { return {x * s, y * s}; }
  Vec2d operator/(double s) const { return {x / s, y / s}; }

  Vec2d& operator+=(const Vec2d& o) { x += o.x; y += o.y; return *this; }
  Vec2d& operator-=(const Vec2d& o) { x -= o.x; y -= o.y; return *this; }
  Vec2d& operator*=(double s) { x *= s; y *= s; return *this; }

  bool operator==(const Vec2d& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Vec2d& o) const { return !(*this == o); }

  double lengthSq() const { return x*x + y*y; }
  double length() const { return std::sqrt(x*x + y*y); }

  // Zero vector stays zero.
  Vec2d normalized() const {
    const double l = length();
    if (l <= 1e-12) return {0, 0};
    return {x / l, y / l};
  }
};

inline double dot(const Vec2d& a, const Vec2d& b) { return a.x*b.x + a.y*b.y; }

// z component of the 3D cross product. Negative when `b` lies clockwise of `a`.
inline double cross(const Vec2d& a, const Vec2d& b) { return a.x*b.y - a.y*b.x; }

inline double distance(const Vec2d& a, const Vec2d& b) { return (a - b).length(); }

} // namespace seasafe::math
