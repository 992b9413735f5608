#pragma once

#include "seasafe/math/Vec2.h"
#include "seasafe/sim/Vessel.h"

namespace seasafe::sim {

// Straight-line, constant-heading vessel motion.
//
// Every predictive check in the engine replays advance() on a copy, so a
// prediction is exactly where the vessel will be if nothing changes. In
// particular a vessel on its destination is predicted to stay there.

// Default arrival tolerance (NM).
constexpr double kDefaultArrivalToleranceNm = 0.1;

// Move along the current direction at the current speed for `elapsedSec`.
// If the destination is closer than the distance that would be covered, the
// vessel snaps onto the destination instead of overshooting.
void advance(Vessel& v, double elapsedSec);

bool reachedDestination(const Vessel& v, double toleranceNm = kDefaultArrivalToleranceNm);

// Position after `secondsAhead` at the current heading and speed, replaying
// advance() in chunks of `stepSec` (one chunk when stepSec <= 0). Stops at the
// destination like advance() does and never mutates the vessel.
math::Vec2d predictFuturePosition(const Vessel& v, double secondsAhead, double stepSec = 0.0);

// Apply a heading delta (degrees, wrapped into [0, 360)).
void changeHeading(Vessel& v, double deltaDeg);

// Apply a speed delta (knots, clamped into [0, maxSpeed]).
void changeSpeed(Vessel& v, double deltaKn);

// Direct bearing from the current position to the destination, [0, 360).
// Returns the current heading when already on the destination.
double bearingToDestinationDeg(const Vessel& v);

double distanceToDestinationNm(const Vessel& v);

} // namespace seasafe::sim
