#include "seasafe/sim/BacktrackingPlanner.h"

#include "seasafe/core/Log.h"
#include "seasafe/sim/AvoidanceStateMachine.h"
#include "seasafe/sim/Kinematics.h"

#include <iterator>
#include <sstream>

namespace seasafe::sim {

// Speeds at or below this count as stopped for plan validation.
static constexpr double kMinPlannedSpeedKn = 0.01;

PlannerManeuver decodePlannerAction(int index, const PlannerParams& params) {
  PlannerManeuver m{};
  if (index < 0 || index >= kPlannerActionCount) return m;

  const int speedIdx = index / 3;
  const int headingIdx = index % 3;
  m.speedDeltaKn = (double)(speedIdx - 1) * params.speedStepKn;
  // Port is counter-clockwise (positive) in the heading frame.
  m.headingDeltaDeg = (double)(1 - headingIdx) * params.turnDeg;
  return m;
}

std::optional<int> earliestConflictStep(const WorldState& world, int i, const EngineConfig& cfg) {
  const double collisionNm = cfg.collisionDistanceNm();
  std::vector<Vessel> ghosts = world.vessels;
  const Vessel& self = ghosts[(std::size_t)i];

  for (int k = 1; k <= cfg.horizonSteps; ++k) {
    for (Vessel& g : ghosts) advance(g, cfg.stepSec);
    for (std::size_t j = 0; j < ghosts.size(); ++j) {
      if ((int)j == i) continue;
      if (math::distance(self.positionNm(), ghosts[j].positionNm()) < collisionNm) {
        return world.timeStep + k;
      }
    }
  }
  return std::nullopt;
}

static bool anyConflict(const std::vector<Vessel>& vessels, double collisionNm) {
  for (std::size_t i = 0; i < vessels.size(); ++i) {
    for (std::size_t j = i + 1; j < vessels.size(); ++j) {
      if (math::distance(vessels[i].positionNm(), vessels[j].positionNm()) < collisionNm) return true;
    }
  }
  return false;
}

bool planAvoidsConflict(const WorldState& world, const PlanBook& plans, int untilStep, const EngineConfig& cfg) {
  WorldState sim = world;
  const double collisionNm = cfg.collisionDistanceNm();

  for (int t = world.timeStep; t < untilStep; ++t) {
    for (Vessel& v : sim.vessels) {
      const auto vit = plans.find(v.id());
      if (vit == plans.end()) continue;
      const auto sit = vit->second.find(t);
      if (sit == vit->second.end() || sit->second == kMaintainActionIndex) continue;

      const PlannerManeuver m = decodePlannerAction(sit->second, cfg.planner);
      if (v.speedKn() + m.speedDeltaKn <= 0.0) return false;

      changeSpeed(v, m.speedDeltaKn);
      changeHeading(v, m.headingDeltaDeg);
      if (v.speedKn() <= kMinPlannedSpeedKn) return false;
    }

    for (Vessel& v : sim.vessels) advance(v, cfg.stepSec);
    sim.timeStep = t + 1;

    if (anyConflict(sim.vessels, collisionNm)) return false;
  }
  return true;
}

bool BacktrackingStrategy::hasPendingPlan(int vesselId, int fromStep) const {
  const auto it = plans_.find(vesselId);
  if (it == plans_.end()) return false;
  return it->second.lower_bound(fromStep) != it->second.end();
}

bool BacktrackingStrategy::planFor(const WorldState& world, int i, const EngineConfig& cfg) {
  const Vessel& v = world.vessels[(std::size_t)i];
  const auto conflictStep = earliestConflictStep(world, i, cfg);
  if (!conflictStep) {
    SEASAFE_LOG_DEBUG("[planner] vessel " + std::to_string(v.id()) + " has no conflict inside the horizon");
    return false;
  }

  const int now = world.timeStep;
  for (int backStep = *conflictStep - 1; backStep >= now; --backStep) {
    for (int action = 0; action < kPlannerActionCount; ++action) {
      PlanBook candidate = plans_;
      candidate[v.id()][backStep] = action;
      if (!planAvoidsConflict(world, candidate, *conflictStep, cfg)) continue;

      plans_ = std::move(candidate);

      std::ostringstream oss;
      oss << "[planner] t=" << now << " vessel " << v.id() << " commits action " << action
          << " at step " << backStep << " (conflict predicted at step " << *conflictStep << ")";
      SEASAFE_LOG_INFO(oss.str());
      return true;
    }
  }

  std::ostringstream oss;
  oss << "[planner] t=" << now << " vessel " << v.id() << " no single-action fix before step "
      << *conflictStep << ", holding course";
  SEASAFE_LOG_DEBUG(oss.str());
  return false;
}

StepDecision BacktrackingStrategy::decide(const WorldState& world, const EngineConfig& cfg) {
  StepDecision d = assessWorld(world, cfg);
  if (d.empty()) return d;

  const int now = world.timeStep;

  for (const Encounter& e : d.encounters) {
    if (e.pair.status != Status::Red) continue;
    std::ostringstream oss;
    oss << "[planner] t=" << now << " Red " << toString(e.scenario) << " vessels "
        << world.vessels[(std::size_t)e.pair.a].id() << "/" << world.vessels[(std::size_t)e.pair.b].id()
        << " range=" << e.pair.distanceNm << "nm, too late to plan";
    SEASAFE_LOG_WARN(oss.str());
  }

  for (std::size_t i = 0; i < world.vessels.size(); ++i) {
    if (d.statuses[i] != Status::Orange || d.roles[i] != Role::GiveWay) continue;
    if (hasPendingPlan(world.vessels[i].id(), now)) continue;
    planFor(world, (int)i, cfg);
  }

  for (const Vessel& v : world.vessels) {
    const auto vit = plans_.find(v.id());
    if (vit == plans_.end()) continue;
    const auto sit = vit->second.find(now);
    if (sit == vit->second.end() || sit->second == kMaintainActionIndex) continue;

    const PlannerManeuver m = decodePlannerAction(sit->second, cfg.planner);
    Action a{};
    a.vesselId = v.id();
    a.headingDeltaDeg = m.headingDeltaDeg;
    a.speedDeltaKn = m.speedDeltaKn;
    d.actions.push_back(validateAction(v, a));
  }

  // A vessel with nothing planned and a clear horizon steers back to its
  // destination at max speed.
  for (std::size_t i = 0; i < world.vessels.size(); ++i) {
    const Vessel& v = world.vessels[i];
    if (d.statuses[i] != Status::Green || hasPendingPlan(v.id(), now)) continue;
    if (const auto a = revertAction(v)) {
      d.actions.push_back(*a);
      SEASAFE_LOG_DEBUG("[planner] t=" + std::to_string(now) + " vessel " + std::to_string(v.id()) +
                        " clear, resuming direct course");
    }
  }

  // Entries for this step have been emitted.
  for (auto it = plans_.begin(); it != plans_.end();) {
    auto& steps = it->second;
    steps.erase(steps.begin(), steps.upper_bound(now));
    it = steps.empty() ? plans_.erase(it) : std::next(it);
  }

  return d;
}

} // namespace seasafe::sim
