#pragma once

#include "seasafe/sim/Action.h"
#include "seasafe/sim/CollisionPredictor.h"
#include "seasafe/sim/EngineConfig.h"
#include "seasafe/sim/RoleAssigner.h"
#include "seasafe/sim/WorldState.h"

#include <memory>
#include <string_view>
#include <vector>

namespace seasafe::sim {

// An at-risk pair with its COLREGS labels.
struct Encounter {
  PairAssessment pair{};
  Scenario scenario{Scenario::None};
  RolePair roles{};
};

// Output of one decision step. Indexed by vessel position in WorldState::vessels.
//
// A decision with no statuses is a no-op (fewer than two vessels).
struct StepDecision {
  std::vector<Status> statuses;
  std::vector<Scenario> scenarios;
  std::vector<Role> roles;

  std::vector<PairAssessment> pairs;

  // At-risk pairs only: Red before Orange, then pair order.
  std::vector<Encounter> encounters;

  std::vector<Action> actions;
  std::vector<AvoidanceCommand> commands;

  bool empty() const { return statuses.empty(); }
};

// Predictor + classifier + role assignment over every pair. Fills statuses,
// pairs, encounters and the per-vessel scenario/role labels (a vessel in several
// at-risk pairs takes the labels of its most severe one). No actions.
StepDecision assessWorld(const WorldState& world, const EngineConfig& cfg);

// Pluggable decision policy. Strategies never mutate the world; flag changes
// travel back as AvoidanceCommands.
class AvoidanceStrategy {
public:
  virtual ~AvoidanceStrategy() = default;

  virtual std::string_view name() const = 0;
  virtual StepDecision decide(const WorldState& world, const EngineConfig& cfg) = 0;
};

// "reactive" or "backtracking"; nullptr for anything else.
std::unique_ptr<AvoidanceStrategy> makeStrategy(std::string_view name);

} // namespace seasafe::sim
