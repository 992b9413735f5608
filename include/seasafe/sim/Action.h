#pragma once

#include "seasafe/sim/Vessel.h"

#include <string>
#include <vector>

namespace seasafe::sim {

// A one-shot maneuver for one vessel: produced by a strategy, applied by the
// world before the next advance, then dropped.
struct Action {
  int vesselId{-1};
  double headingDeltaDeg{0.0};
  double speedDeltaKn{0.0};
};

// Flag change requested by a strategy. The world applies these after the
// statuses of the step are committed.
struct AvoidanceCommand {
  enum class Kind : int { Engage = 0, Release = 1 };

  int vesselId{-1};
  Kind kind{Kind::Engage};

  // Engage only: counterpart vessel ids of the triggering encounter(s).
  std::vector<int> counterpartIds;
};

// Clamp the speed delta so the resulting speed stays in [0, maxSpeed]. A vessel
// on its destination keeps its heading.
Action validateAction(const Vessel& v, const Action& a);

// Validate and apply. The caller is responsible for matching ids.
void applyAction(Vessel& v, const Action& a);

// Heading/speed deltas below this are treated as no maneuver.
constexpr double kNegligibleDelta = 1e-3;

bool isNegligible(const Action& a);

std::string describe(const Action& a);

} // namespace seasafe::sim
