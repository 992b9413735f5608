#include "seasafe/sim/Kinematics.h"

#include "seasafe/math/Math.h"
#include "seasafe/sim/Units.h"

#include <algorithm>

namespace seasafe::sim {

void advance(Vessel& v, double elapsedSec) {
  if (elapsedSec <= 0.0 || v.atDestination()) return;

  const double stepNm = knotsToNm(v.speedKn(), elapsedSec);
  const double remaining = distanceToDestinationNm(v);

  if (remaining < stepNm) {
    v.setPositionNm(v.destinationNm());
    return;
  }
  v.setPositionNm(v.positionNm() + v.direction() * stepNm);
}

bool reachedDestination(const Vessel& v, double toleranceNm) {
  return distanceToDestinationNm(v) <= toleranceNm;
}

math::Vec2d predictFuturePosition(const Vessel& v, double secondsAhead, double stepSec) {
  if (!v.isUnderway() || secondsAhead <= 0.0) return v.positionNm();

  Vessel ghost = v;
  const double chunk = (stepSec > 0.0) ? stepSec : secondsAhead;
  double left = secondsAhead;
  while (left > 1e-9 && !ghost.atDestination()) {
    const double dt = std::min(chunk, left);
    advance(ghost, dt);
    left -= dt;
  }
  return ghost.positionNm();
}

void changeHeading(Vessel& v, double deltaDeg) {
  v.setHeadingDeg(v.headingDeg() + deltaDeg);
}

void changeSpeed(Vessel& v, double deltaKn) {
  v.setSpeedKn(v.speedKn() + deltaKn);
}

double bearingToDestinationDeg(const Vessel& v) {
  const math::Vec2d toDest = v.destinationNm() - v.positionNm();
  if (toDest.length() <= 1e-9) return v.headingDeg();
  return math::unitToHeading(toDest);
}

double distanceToDestinationNm(const Vessel& v) {
  return math::distance(v.destinationNm(), v.positionNm());
}

} // namespace seasafe::sim
