#pragma once

#include "seasafe/sim/AvoidanceStrategy.h"

#include <map>
#include <optional>

namespace seasafe::sim {

// -----------------------------------------------------------------------------
// Bounded backtracking planner
// -----------------------------------------------------------------------------
//
// For an Orange give-way vessel whose earliest predicted conflict is at step T,
// try one substituted action at a single earlier step, latest first
// (T-1 down to now), each of the 9 grid actions in index order. Each candidate
// is simulated on a copy of the world through step T with every other vessel
// holding course. The first candidate with no conflict and no non-positive
// speed is committed. Not optimal; an exhausted search commits nothing and the
// vessel is re-evaluated on the next step.
//
// Red pairs get no planner action. A Green vessel with nothing planned steers
// back onto its direct course (same revert as the reactive strategy).

// index = speedIdx * 3 + headingIdx
//   speedIdx:   0 decrease, 1 maintain, 2 increase
//   headingIdx: 0 port,     1 maintain, 2 starboard
constexpr int kPlannerActionCount = 9;
constexpr int kMaintainActionIndex = 4;

struct PlannerManeuver {
  double headingDeltaDeg{0.0};
  double speedDeltaKn{0.0};
};

PlannerManeuver decodePlannerAction(int index, const PlannerParams& params);

// vessel id -> (time step -> action index)
using PlanBook = std::map<int, std::map<int, int>>;

// Earliest absolute time step within the horizon where vessel index `i` comes
// inside the collision distance of any other vessel, assuming everyone holds
// course. nullopt when clear.
std::optional<int> earliestConflictStep(const WorldState& world, int i, const EngineConfig& cfg);

// Simulate `world` (copied) from its current step up to `untilStep`, applying
// `plans` where they have entries. False on any conflict, or when a planned
// action would leave its vessel without positive speed.
bool planAvoidsConflict(const WorldState& world, const PlanBook& plans, int untilStep, const EngineConfig& cfg);

class BacktrackingStrategy final : public AvoidanceStrategy {
public:
  std::string_view name() const override { return "backtracking"; }
  StepDecision decide(const WorldState& world, const EngineConfig& cfg) override;

  const PlanBook& plans() const { return plans_; }

  // Search for and commit a plan for vessel index `i`. Returns true on commit.
  bool planFor(const WorldState& world, int i, const EngineConfig& cfg);

private:
  bool hasPendingPlan(int vesselId, int fromStep) const;

  PlanBook plans_;
};

} // namespace seasafe::sim
