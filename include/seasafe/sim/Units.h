#pragma once

namespace seasafe::sim {

// The plane is measured in nautical miles, speeds in knots and time in seconds.
// Safety zones come from the scenario in meters.

constexpr double kMetersPerNm = 1852.0;
constexpr double kSecondsPerHour = 3600.0;

inline double metersToNm(double m) { return m / kMetersPerNm; }
inline double nmToMeters(double nm) { return nm * kMetersPerNm; }

// Distance covered in `seconds` at `knots`.
inline double knotsToNm(double knots, double seconds) {
  return knots * seconds / kSecondsPerHour;
}

} // namespace seasafe::sim
