#pragma once

#include "seasafe/sim/Vessel.h"

namespace seasafe::sim {

// COLREGS encounter geometry.
//
// Relative bearings here are nautical: measured from the observer's heading,
// positive to starboard (clockwise), wrapped into (-180, 180].
//
// Sectors (observer A looking at B):
//   |q| <= 5 and courses differ by more than 150 deg  -> head-on
//   either vessel more than 22.5 deg abaft the other's beam (|q| > 112.5)
//                                                      -> overtaking
//   otherwise (both within the forward sectors)        -> crossing
// Two vessels that are both stopped give `unknown`.

constexpr double kHeadOnBearingDeg = 5.0;
constexpr double kHeadOnCourseDiffDeg = 150.0;
constexpr double kAbaftBeamDeg = 112.5;

// Course tolerance for the strict overtaker test.
constexpr double kOvertakingCourseToleranceDeg = 20.0;

// Bearing of `target` as seen from `observer`, relative to the observer's heading.
double relativeBearingDeg(const Vessel& observer, const Vessel& target);

// `overtaker` is faster than `target`, comes up from more than 22.5 deg abaft
// the target's beam, and steers within kOvertakingCourseToleranceDeg of it.
bool isOvertaking(const Vessel& overtaker, const Vessel& target);

Scenario classifyEncounter(const Vessel& a, const Vessel& b);

} // namespace seasafe::sim
