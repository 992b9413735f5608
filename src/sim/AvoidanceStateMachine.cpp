#include "seasafe/sim/AvoidanceStateMachine.h"

#include "seasafe/core/Log.h"
#include "seasafe/math/Math.h"
#include "seasafe/sim/CollisionPredictor.h"
#include "seasafe/sim/Kinematics.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace seasafe::sim {

std::optional<Action> revertAction(const Vessel& v) {
  Action a{};
  a.vesselId = v.id();
  a.headingDeltaDeg = math::shortestDeltaDeg(v.headingDeg(), bearingToDestinationDeg(v));
  a.speedDeltaKn = v.maxSpeedKn() - v.speedKn();
  if (isNegligible(a)) return std::nullopt;
  return a;
}

static const PairAssessment* findPair(const std::vector<PairAssessment>& pairs, int i, int j) {
  const int lo = std::min(i, j);
  const int hi = std::max(i, j);
  for (const PairAssessment& p : pairs) {
    if (p.a == lo && p.b == hi) return &p;
  }
  return nullptr;
}

bool encounterIsClear(const WorldState& world,
                      const std::vector<PairAssessment>& pairs,
                      int i,
                      int counterpartId) {
  const int j = world.indexOf(counterpartId);
  if (j < 0 || j == i) return true;
  const PairAssessment* p = findPair(pairs, i, j);
  return !p || p->status == Status::Green;
}

static Vessel onRevertCourse(const Vessel& v) {
  Vessel out = v;
  if (const auto a = revertAction(v)) applyAction(out, *a);
  return out;
}

bool revertCourseIsClear(const WorldState& world, int i, const EngineConfig& cfg) {
  const Vessel reverted = onRevertCourse(world.vessels[(std::size_t)i]);
  const double collisionNm = cfg.collisionDistanceNm();

  for (int otherId : world.vessels[(std::size_t)i].avoidingWith()) {
    const int j = world.indexOf(otherId);
    if (j < 0 || j == i) continue;
    const Vessel& other = world.vessels[(std::size_t)j];

    // A counterpart that is itself avoiding may revert in the same step.
    std::vector<Vessel> courses{other};
    if (other.isAvoiding()) courses.push_back(onRevertCourse(other));

    for (const Vessel& o : courses) {
      if (checkImmediate(reverted, o, collisionNm)) return false;
      if (checkFuture(reverted, o, collisionNm, cfg.horizonSteps, cfg.stepSec).conflict) return false;
    }
  }
  return true;
}

namespace {

struct StepScratch {
  std::vector<bool> maneuvered;
  std::vector<std::vector<int>> engagedWith;
};

void emitManeuver(const Vessel& v, double headingDeltaDeg, double speedDeltaKn, StepDecision& decision) {
  Action a{};
  a.vesselId = v.id();
  a.headingDeltaDeg = headingDeltaDeg;
  a.speedDeltaKn = speedDeltaKn;
  decision.actions.push_back(validateAction(v, a));
}

} // namespace

void runAvoidanceStateMachine(const WorldState& world, const EngineConfig& cfg, StepDecision& decision) {
  if (decision.empty()) return;

  const std::size_t n = world.vessels.size();
  StepScratch scratch;
  scratch.maneuvered.assign(n, false);
  scratch.engagedWith.assign(n, {});

  // Avoiding -> Clear.
  for (std::size_t i = 0; i < n; ++i) {
    const Vessel& v = world.vessels[i];
    if (!v.isAvoiding()) continue;

    bool clear = true;
    if (v.avoidingWith().empty()) {
      clear = (decision.statuses[i] == Status::Green);
    } else {
      for (int other : v.avoidingWith()) {
        if (!encounterIsClear(world, decision.pairs, (int)i, other)) {
          clear = false;
          break;
        }
      }
    }
    if (!clear || !revertCourseIsClear(world, (int)i, cfg)) continue;

    if (const auto a = revertAction(v)) {
      decision.actions.push_back(*a);
    }
    decision.commands.push_back({v.id(), AvoidanceCommand::Kind::Release, {}});
    scratch.maneuvered[i] = true;

    std::ostringstream oss;
    oss << "[avoidance] t=" << world.timeStep << " vessel " << v.id()
        << " clear over full horizon, reverting to direct course";
    SEASAFE_LOG_INFO(oss.str());
  }

  // Clear -> Avoiding. Eligibility uses the flags as they were at step start.
  // A vessel that is not underway cannot maneuver and is never engaged.
  for (const Encounter& e : decision.encounters) {
    const std::size_t ia = (std::size_t)e.pair.a;
    const std::size_t ib = (std::size_t)e.pair.b;
    const Vessel& va = world.vessels[ia];
    const Vessel& vb = world.vessels[ib];

    if (e.pair.status == Status::Orange && (va.status() == Status::Green || vb.status() == Status::Green)) {
      std::ostringstream oss;
      oss << "[avoidance] t=" << world.timeStep << " conflict predicted vessels " << va.id() << "/" << vb.id()
          << " first sample k=" << e.pair.firstConflictStep << " sep=" << e.pair.conflictDistanceNm << "nm";
      SEASAFE_LOG_DEBUG(oss.str());
    }

    if (va.isAvoiding() || vb.isAvoiding()) continue;

    const bool red = (e.pair.status == Status::Red);
    const bool aActs = va.isUnderway() && (red || e.roles.a == Role::GiveWay);
    const bool bActs = vb.isUnderway() && (red || e.roles.b == Role::GiveWay);
    if (!aActs && !bActs) continue;

    const double turn = red ? -cfg.maneuvers.redTurnDeg : -cfg.maneuvers.orangeTurnDeg;
    const double dv = red ? cfg.maneuvers.redSpeedDeltaKn : 0.0;

    auto engage = [&](std::size_t self, const Vessel& me, const Vessel& other) {
      if (!scratch.maneuvered[self]) {
        emitManeuver(me, turn, dv, decision);
        scratch.maneuvered[self] = true;
      }
      scratch.engagedWith[self].push_back(other.id());
    };

    if (aActs) engage(ia, va, vb);
    if (bActs) engage(ib, vb, va);

    std::ostringstream oss;
    oss << "[avoidance] t=" << world.timeStep << " " << toString(e.pair.status) << " "
        << toString(e.scenario) << " vessels " << va.id() << "/" << vb.id()
        << " roles " << toString(e.roles.a) << "/" << toString(e.roles.b)
        << " range=" << e.pair.distanceNm << "nm";
    if (!red) oss << " first conflict at k=" << e.pair.firstConflictStep;
    SEASAFE_LOG_INFO(oss.str());
  }

  for (std::size_t i = 0; i < n; ++i) {
    if (scratch.engagedWith[i].empty()) continue;
    decision.commands.push_back({world.vessels[i].id(), AvoidanceCommand::Kind::Engage, scratch.engagedWith[i]});
  }
}

StepDecision ReactiveColregsStrategy::decide(const WorldState& world, const EngineConfig& cfg) {
  StepDecision d = assessWorld(world, cfg);
  runAvoidanceStateMachine(world, cfg, d);
  return d;
}

} // namespace seasafe::sim
