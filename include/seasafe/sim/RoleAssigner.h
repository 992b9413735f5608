#pragma once

#include "seasafe/sim/Vessel.h"

namespace seasafe::sim {

struct RolePair {
  Role a{Role::None};
  Role b{Role::None};
};

// COLREGS duties for an encounter:
//  - head-on:    both give way
//  - crossing:   the vessel with the other on its starboard side gives way
//  - overtaking: the overtaking (faster, trailing) vessel gives way
//  - anything else: unknown for both
// A vessel that is not underway cannot maneuver: it stands on and the vessel
// that is moving gives way, whatever the scenario.
RolePair assignRoles(const Vessel& a, const Vessel& b, Scenario scenario);

} // namespace seasafe::sim
