#include "seasafe/sim/RoleAssigner.h"

#include "seasafe/sim/EncounterClassifier.h"

#include <cmath>

namespace seasafe::sim {

// The vessel further abaft the other's beam is the one coming up from behind.
static bool aIsTrailing(const Vessel& a, const Vessel& b) {
  const double aSeenFromB = std::fabs(relativeBearingDeg(b, a));
  const double bSeenFromA = std::fabs(relativeBearingDeg(a, b));
  if (aSeenFromB != bSeenFromA) return aSeenFromB > bSeenFromA;
  return a.underwaySpeedKn() >= b.underwaySpeedKn();
}

RolePair assignRoles(const Vessel& a, const Vessel& b, Scenario scenario) {
  if (a.isUnderway() != b.isUnderway()) {
    if (a.isUnderway()) return {Role::GiveWay, Role::StandOn};
    return {Role::StandOn, Role::GiveWay};
  }

  switch (scenario) {
    case Scenario::HeadOn:
      return {Role::GiveWay, Role::GiveWay};

    case Scenario::Crossing: {
      // B on A's starboard side: [0, 180).
      const double q = relativeBearingDeg(a, b);
      if (q >= 0.0 && q < 180.0) return {Role::GiveWay, Role::StandOn};
      return {Role::StandOn, Role::GiveWay};
    }

    case Scenario::Overtaking:
      if (isOvertaking(a, b)) return {Role::GiveWay, Role::StandOn};
      if (isOvertaking(b, a)) return {Role::StandOn, Role::GiveWay};
      if (aIsTrailing(a, b)) return {Role::GiveWay, Role::StandOn};
      return {Role::StandOn, Role::GiveWay};

    case Scenario::None:
    case Scenario::Unknown:
      break;
  }
  return {Role::Unknown, Role::Unknown};
}

} // namespace seasafe::sim
