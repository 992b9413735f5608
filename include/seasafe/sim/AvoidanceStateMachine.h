#pragma once

#include "seasafe/sim/AvoidanceStrategy.h"

#include <optional>

namespace seasafe::sim {

// -----------------------------------------------------------------------------
// Reactive avoidance state machine
// -----------------------------------------------------------------------------
//
// Per vessel: Clear <-> Avoiding (Vessel::isAvoiding()).
//
//  Clear -> Avoiding   an at-risk pair where neither vessel was avoiding at the
//                      start of the step.
//                      Red:    both vessels turn starboard and slow down.
//                      Orange: the give-way vessel(s) turn starboard.
//                      A vessel gets at most one maneuver per step.
//  Avoiding -> Avoiding  no new maneuver while any triggering pair is at risk.
//  Avoiding -> Clear   every triggering pair is clear over the full look-ahead
//                      (or out of horizon distance), and so is the direct
//                      course back to the destination. Emits a revert toward
//                      the destination at max speed unless negligible.
//
// Reverts are evaluated first. A vessel avoiding at step start can never be
// re-triggered in the same step, even if another pair trips that step.

// Steer back onto the direct course to the destination at max speed.
// nullopt when both deltas are negligible.
std::optional<Action> revertAction(const Vessel& v);

// Whether the pair (vessel index `i`, vessel id `counterpartId`) is clear in
// `pairs`. A counterpart that no longer exists counts as clear.
bool encounterIsClear(const WorldState& world,
                      const std::vector<PairAssessment>& pairs,
                      int i,
                      int counterpartId);

// Whether vessel index `i`, put back on its direct course at max speed, stays
// clear of every counterpart it is avoiding over the full look-ahead. A
// counterpart that is avoiding too is checked on both its current and its
// revert course.
bool revertCourseIsClear(const WorldState& world, int i, const EngineConfig& cfg);

// Append actions and avoidance commands for an assessed step.
void runAvoidanceStateMachine(const WorldState& world, const EngineConfig& cfg, StepDecision& decision);

class ReactiveColregsStrategy final : public AvoidanceStrategy {
public:
  std::string_view name() const override { return "reactive"; }
  StepDecision decide(const WorldState& world, const EngineConfig& cfg) override;
};

} // namespace seasafe::sim
