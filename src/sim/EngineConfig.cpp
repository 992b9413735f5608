#include "seasafe/sim/EngineConfig.h"

#include "seasafe/core/CVar.h"
#include "seasafe/sim/Units.h"

#include <algorithm>
#include <cmath>

namespace seasafe::sim {

int deriveHorizonSteps(double horizonNm, double maxSpeedKn, double stepSec) {
  if (maxSpeedKn <= 0.0 || stepSec <= 0.0 || horizonNm <= 0.0) return 0;
  const double nmPerStep = knotsToNm(maxSpeedKn, stepSec);
  return (int)std::ceil(horizonNm / nmPerStep);
}

void installSimCVars(core::CVarRegistry& reg) {
  reg.defineFloat("colregs.horizon_nm", 5.0, "Look-ahead distance; farther pairs are not evaluated (NM)");
  reg.defineFloat("colregs.safety_zone_m", 200.0, "Safety zone radius per vessel (m)");
  reg.defineFloat("colregs.red_turn_deg", 20.0, "Starboard turn on immediate danger (deg)");
  reg.defineFloat("colregs.red_speed_delta_kn", -3.0, "Speed change on immediate danger (kn)");
  reg.defineFloat("colregs.orange_turn_deg", 15.0, "Starboard turn for give-way vessels on predicted danger (deg)");

  reg.defineFloat("sim.step_sec", 15.0, "Simulated seconds per step");
  reg.defineFloat("sim.max_speed_kn", 20.0, "Default vessel max speed (kn)");
  reg.defineFloat("sim.arrival_tolerance_nm", 0.1, "Distance at which a vessel has arrived (NM)");
  reg.defineInt("sim.max_steps", 2000, "Step limit for headless runs");
  reg.defineString("sim.strategy", "reactive", "Avoidance strategy: reactive | backtracking");

  reg.defineFloat("planner.turn_deg", 10.0, "Backtracking planner heading step (deg)");
  reg.defineFloat("planner.speed_step_kn", 2.0, "Backtracking planner speed step (kn)");
}

EngineConfig engineConfigFromCVars(const core::CVarRegistry& reg, double maxSpeedKn) {
  EngineConfig cfg{};
  cfg.safetyZoneRadiusNm = metersToNm(reg.getFloat("colregs.safety_zone_m", 200.0));
  cfg.horizonNm = reg.getFloat("colregs.horizon_nm", 5.0);
  cfg.stepSec = reg.getFloat("sim.step_sec", 15.0);
  cfg.arrivalToleranceNm = reg.getFloat("sim.arrival_tolerance_nm", 0.1);
  cfg.horizonSteps = deriveHorizonSteps(cfg.horizonNm, maxSpeedKn, cfg.stepSec);

  cfg.maneuvers.redTurnDeg = reg.getFloat("colregs.red_turn_deg", 20.0);
  cfg.maneuvers.redSpeedDeltaKn = reg.getFloat("colregs.red_speed_delta_kn", -3.0);
  cfg.maneuvers.orangeTurnDeg = reg.getFloat("colregs.orange_turn_deg", 15.0);

  cfg.planner.turnDeg = reg.getFloat("planner.turn_deg", 10.0);
  cfg.planner.speedStepKn = reg.getFloat("planner.speed_step_kn", 2.0);
  return cfg;
}

bool validateEngineConfig(const EngineConfig& cfg, std::string* outError) {
  if (!(cfg.stepSec > 0.0)) {
    if (outError) *outError = "sim.step_sec must be positive";
    return false;
  }
  if (cfg.safetyZoneRadiusNm < 0.0) {
    if (outError) *outError = "colregs.safety_zone_m must not be negative";
    return false;
  }
  if (cfg.horizonNm < 0.0) {
    if (outError) *outError = "colregs.horizon_nm must not be negative";
    return false;
  }
  if (cfg.horizonSteps < 0) {
    if (outError) *outError = "horizon step count must not be negative";
    return false;
  }
  return true;
}

} // namespace seasafe::sim
