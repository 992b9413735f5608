#pragma once

#include "seasafe/sim/Action.h"
#include "seasafe/sim/AvoidanceStrategy.h"
#include "seasafe/sim/EngineConfig.h"
#include "seasafe/sim/WorldState.h"

#include <memory>
#include <vector>

namespace seasafe::sim {

// Per-vessel observation after a step.
struct VesselSnapshot {
  int id{-1};
  math::Vec2d positionNm{0, 0};
  double headingDeg{0.0};
  double speedKn{0.0};
  Status status{Status::Green};
  math::Vec2d destinationNm{0, 0};
  Role role{Role::None};
  Scenario scenario{Scenario::None};
};

// Owns the vessels, the step counter and the decision strategy.
//
// One step():
//   1) apply the actions emitted by the previous step (validated)
//   2) advance every vessel by stepSec
//   3) timeStep += 1
//   4) strategy.decide()
//   5) commit statuses, scenario/role labels, then avoidance commands
//   6) keep the new actions pending for the next step
//
// Step 1 runs before the predictor sees the world, so a maneuver is observed one
// step after it is decided.
class World {
public:
  World(const EngineConfig& cfg, std::unique_ptr<AvoidanceStrategy> strategy);

  // Vessels start at their source, at max speed, heading for the destination.
  // Returns the new vessel id (ids are dense, starting at 0).
  int addVessel(const math::Vec2d& sourceNm, const math::Vec2d& destinationNm, double maxSpeedKn);

  const WorldState& state() const { return state_; }
  const std::vector<Vessel>& vessels() const { return state_.vessels; }
  int timeStep() const { return state_.timeStep; }

  // nullptr for an unknown id.
  Vessel* vessel(int id);
  const Vessel* vessel(int id) const;

  const EngineConfig& config() const { return cfg_; }
  const AvoidanceStrategy& strategy() const { return *strategy_; }

  const StepDecision& lastDecision() const { return lastDecision_; }
  const std::vector<Action>& pendingActions() const { return pending_; }

  void step();

  bool isGoalState() const;

  std::vector<VesselSnapshot> snapshot() const;

private:
  void applyPending();
  void commit(const StepDecision& d);

  EngineConfig cfg_{};
  std::unique_ptr<AvoidanceStrategy> strategy_;

  WorldState state_{};
  StepDecision lastDecision_{};
  std::vector<Action> pending_;
};

} // namespace seasafe::sim
