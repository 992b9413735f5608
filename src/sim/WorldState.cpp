#include "seasafe/sim/WorldState.h"

#include "seasafe/sim/Kinematics.h"

namespace seasafe::sim {

int WorldState::indexOf(int id) const {
  // Ids are assigned in creation order, so try the direct slot first.
  if (id >= 0 && (std::size_t)id < vessels.size() && vessels[(std::size_t)id].id() == id) return id;
  for (std::size_t i = 0; i < vessels.size(); ++i) {
    if (vessels[i].id() == id) return (int)i;
  }
  return -1;
}

bool WorldState::isGoalState(double toleranceNm) const {
  for (const Vessel& v : vessels) {
    if (!reachedDestination(v, toleranceNm)) return false;
  }
  return true;
}

} // namespace seasafe::sim
