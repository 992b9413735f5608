#pragma once

#include "seasafe/sim/Vessel.h"

#include <vector>

namespace seasafe::sim {

// Vessels plus the discrete step counter.
//
// Plain value: copying it gives an independent scratch world for what-if
// simulation.
struct WorldState {
  std::vector<Vessel> vessels;
  int timeStep{0};

  // Index of the vessel with `id`, or -1.
  int indexOf(int id) const;

  // Every vessel within `toleranceNm` of its destination.
  bool isGoalState(double toleranceNm) const;
};

} // namespace seasafe::sim
