#pragma once

#include "seasafe/math/Vec2.h"

#include <algorithm>
#include <cmath>

namespace seasafe::math {

constexpr double kPi = 3.1415926535897932384626433832795;

inline double degToRad(double deg) { return deg * (kPi / 180.0); }
inline double radToDeg(double rad) { return rad * (180.0 / kPi); }

template <class T>
inline T clamp(T v, T lo, T hi) {
  return std::max(lo, std::min(v, hi));
}

// Angles below use the atan2 convention: 0 deg = +x, counter-clockwise positive.

// [0, 360)
inline double wrapDeg360(double deg) {
  double d = std::fmod(deg, 360.0);
  if (d < 0.0) d += 360.0;
  if (d >= 360.0) d -= 360.0;
  return d;
}

// (-180, 180]
inline double wrapDeg180(double deg) {
  double d = wrapDeg360(deg);
  if (d > 180.0) d -= 360.0;
  return d;
}

// Signed shortest rotation from `fromDeg` to `toDeg`, in [-180, 180).
inline double shortestDeltaDeg(double fromDeg, double toDeg) {
  double d = wrapDeg360(toDeg - fromDeg);
  if (d >= 180.0) d -= 360.0;
  return d;
}

// Absolute course difference folded into [0, 180].
inline double headingDifferenceDeg(double aDeg, double bDeg) {
  const double d = std::fabs(std::fmod(aDeg - bDeg, 360.0));
  return (d > 180.0) ? 360.0 - d : d;
}

inline Vec2d headingToUnit(double deg) {
  const double r = degToRad(deg);
  return {std::cos(r), std::sin(r)};
}

// Heading of `v` in [0, 360). Zero vectors map to 0.
inline double unitToHeading(const Vec2d& v) {
  if (v.lengthSq() <= 1e-24) return 0.0;
  return wrapDeg360(radToDeg(std::atan2(v.y, v.x)));
}

} // namespace seasafe::math
