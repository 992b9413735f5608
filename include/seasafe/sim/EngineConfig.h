#pragma once

#include <string>

namespace seasafe::core {
class CVarRegistry;
}

namespace seasafe::sim {

// Reactive maneuvers. Turn magnitudes are applied to starboard, which in the
// counter-clockwise heading frame is a negative heading delta.
struct AvoidanceManeuvers {
  double redTurnDeg{20.0};
  double redSpeedDeltaKn{-3.0};
  double orangeTurnDeg{15.0};
};

// Discrete action grid for the backtracking planner.
struct PlannerParams {
  double turnDeg{10.0};
  double speedStepKn{2.0};
};

// Everything the decision engine reads besides the vessels themselves.
struct EngineConfig {
  // Per-vessel exclusion radius. Two vessels conflict below twice this.
  double safetyZoneRadiusNm{200.0 / 1852.0};

  // Pairs further apart than this are not evaluated at all.
  double horizonNm{5.0};

  // Number of forward samples, k = 1..horizonSteps.
  int horizonSteps{0};

  // Simulated seconds per discrete step.
  double stepSec{15.0};

  double arrivalToleranceNm{0.1};

  AvoidanceManeuvers maneuvers{};
  PlannerParams planner{};

  double collisionDistanceNm() const { return 2.0 * safetyZoneRadiusNm; }
};

// Samples needed to cover `horizonNm` at `maxSpeedKn`:
// ceil(horizonNm / (maxSpeedKn * stepSec / 3600)), or 0 without speed.
int deriveHorizonSteps(double horizonNm, double maxSpeedKn, double stepSec);

// Define the simulation cvars (safe to call repeatedly).
void installSimCVars(core::CVarRegistry& reg);

// Build an EngineConfig from the registry. `maxSpeedKn` is the fastest vessel
// of the scenario and only feeds the horizon step derivation.
EngineConfig engineConfigFromCVars(const core::CVarRegistry& reg, double maxSpeedKn);

// Sanity-check a config; returns false with a message for unusable values.
bool validateEngineConfig(const EngineConfig& cfg, std::string* outError = nullptr);

} // namespace seasafe::sim
