#include "seasafe/sim/Action.h"

#include "seasafe/math/Math.h"
#include "seasafe/sim/Kinematics.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace seasafe::sim {

Action validateAction(const Vessel& v, const Action& a) {
  Action out = a;
  if (v.atDestination()) out.headingDeltaDeg = 0.0;
  out.speedDeltaKn = math::clamp(a.speedDeltaKn, -v.speedKn(), v.maxSpeedKn() - v.speedKn());
  return out;
}

void applyAction(Vessel& v, const Action& a) {
  const Action ok = validateAction(v, a);
  if (std::fabs(ok.headingDeltaDeg) > 1e-6) changeHeading(v, ok.headingDeltaDeg);
  if (std::fabs(ok.speedDeltaKn) > 1e-6) changeSpeed(v, ok.speedDeltaKn);
}

bool isNegligible(const Action& a) {
  return std::fabs(a.headingDeltaDeg) <= kNegligibleDelta && std::fabs(a.speedDeltaKn) <= kNegligibleDelta;
}

std::string describe(const Action& a) {
  std::ostringstream oss;
  oss << "vessel " << a.vesselId << std::fixed << std::setprecision(2)
      << " heading " << std::showpos << a.headingDeltaDeg << " deg"
      << " speed " << a.speedDeltaKn << " kn";
  return oss.str();
}

} // namespace seasafe::sim
