#include "seasafe/sim/EncounterClassifier.h"

#include "seasafe/math/Math.h"

#include <cmath>

namespace seasafe::sim {

double relativeBearingDeg(const Vessel& observer, const Vessel& target) {
  const math::Vec2d los = target.positionNm() - observer.positionNm();
  if (los.lengthSq() <= 1e-24) return 0.0;

  // Absolute bearing is counter-clockwise; flip so starboard is positive.
  const double absolute = math::unitToHeading(los);
  return math::wrapDeg180(observer.headingDeg() - absolute);
}

bool isOvertaking(const Vessel& overtaker, const Vessel& target) {
  if (overtaker.underwaySpeedKn() <= target.underwaySpeedKn()) return false;
  if (std::fabs(relativeBearingDeg(target, overtaker)) <= kAbaftBeamDeg) return false;
  return math::headingDifferenceDeg(overtaker.headingDeg(), target.headingDeg()) <= kOvertakingCourseToleranceDeg;
}

Scenario classifyEncounter(const Vessel& a, const Vessel& b) {
  if (!a.isUnderway() && !b.isUnderway()) return Scenario::Unknown;

  const double qa = relativeBearingDeg(a, b);
  const double qb = relativeBearingDeg(b, a);
  const double courseDiff = math::headingDifferenceDeg(a.headingDeg(), b.headingDeg());

  if (!std::isfinite(qa) || !std::isfinite(qb) || !std::isfinite(courseDiff)) return Scenario::Unknown;

  if (std::fabs(qa) <= kHeadOnBearingDeg && courseDiff > kHeadOnCourseDiffDeg) return Scenario::HeadOn;
  if (std::fabs(qa) > kAbaftBeamDeg || std::fabs(qb) > kAbaftBeamDeg) return Scenario::Overtaking;
  return Scenario::Crossing;
}

} // namespace seasafe::sim
