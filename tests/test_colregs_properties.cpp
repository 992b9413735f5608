#include <catch2/catch.hpp>

#include "seasafe/sim/AvoidanceStateMachine.h"
#include "seasafe/sim/BacktrackingPlanner.h"
#include "seasafe/sim/EncounterClassifier.h"
#include "seasafe/sim/RoleAssigner.h"
#include "seasafe/sim/World.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace seasafe;
using namespace seasafe::sim;

namespace {

struct Leg {
  math::Vec2d from;
  math::Vec2d to;
  double maxSpeedKn;
};

EngineConfig makeConfig() {
  EngineConfig cfg{};
  cfg.safetyZoneRadiusNm = 0.1;
  cfg.horizonNm = 5.0;
  cfg.stepSec = 15.0;
  cfg.horizonSteps = deriveHorizonSteps(cfg.horizonNm, 20.0, cfg.stepSec);
  return cfg;
}

std::unique_ptr<World> makeWorld(const std::string& strategy, const std::vector<Leg>& legs) {
  auto w = std::make_unique<World>(makeConfig(), makeStrategy(strategy));
  for (const Leg& l : legs) w->addVessel(l.from, l.to, l.maxSpeedKn);
  return w;
}

const PairAssessment* findPair(const StepDecision& d, int a, int b) {
  for (const PairAssessment& p : d.pairs) {
    if (p.a == a && p.b == b) return &p;
  }
  return nullptr;
}

bool hasRelease(const StepDecision& d, int id) {
  return std::any_of(d.commands.begin(), d.commands.end(), [&](const AvoidanceCommand& c) {
    return c.vesselId == id && c.kind == AvoidanceCommand::Kind::Release;
  });
}

// Steps `w` to goal or `maxSteps`, checking the decision-level invariants after
// every step.
void runAndCheckInvariants(World& w, int maxSteps) {
  const EngineConfig& cfg = w.config();
  const double collisionNm = cfg.collisionDistanceNm();

  while (!w.isGoalState() && w.timeStep() < maxSteps) {
    std::vector<bool> avoidingBefore;
    std::vector<std::vector<int>> withBefore;
    for (const Vessel& v : w.vessels()) {
      avoidingBefore.push_back(v.isAvoiding());
      withBefore.push_back(v.avoidingWith());
    }

    w.step();
    const StepDecision& d = w.lastDecision();
    const auto& vs = w.vessels();

    for (const PairAssessment& p : d.pairs) {
      const Vessel& a = vs[(std::size_t)p.a];
      const Vessel& b = vs[(std::size_t)p.b];
      const double dist = math::distance(a.positionNm(), b.positionNm());
      const bool future = checkFuture(a, b, collisionNm, cfg.horizonSteps, cfg.stepSec).conflict;

      if (dist > cfg.horizonNm) {
        CHECK(p.status == Status::Green);
        CHECK(p.gated);
      } else if (p.status == Status::Red) {
        CHECK(dist < collisionNm);
      } else if (p.status == Status::Orange) {
        CHECK(dist >= collisionNm);
        CHECK(future);
      } else {
        CHECK(dist >= collisionNm);
        CHECK_FALSE(future);
      }
    }

    for (const Encounter& e : d.encounters) {
      CHECK_FALSE(e.pair.gated);
      CHECK(e.pair.status != Status::Green);

      const Vessel& a = vs[(std::size_t)e.pair.a];
      const Vessel& b = vs[(std::size_t)e.pair.b];
      CHECK(classifyEncounter(a, b) == e.scenario);

      const int giveWay = (e.roles.a == Role::GiveWay ? 1 : 0) + (e.roles.b == Role::GiveWay ? 1 : 0);
      if (a.isUnderway() != b.isUnderway()) {
        // Only the vessel that is moving can give way.
        CHECK(giveWay == 1);
        CHECK((e.roles.a == Role::GiveWay) == a.isUnderway());
        continue;
      }
      if (e.scenario == Scenario::HeadOn) CHECK(giveWay == 2);
      if (e.scenario == Scenario::Crossing) CHECK(giveWay == 1);
      if (e.scenario == Scenario::Overtaking) {
        CHECK(giveWay == 1);
        if (isOvertaking(a, b)) CHECK(e.roles.a == Role::GiveWay);
        if (isOvertaking(b, a)) CHECK(e.roles.b == Role::GiveWay);
      }
    }

    for (std::size_t i = 0; i < vs.size(); ++i) {
      const Vessel& v = vs[i];
      CHECK(v.speedKn() >= 0.0);
      CHECK(v.speedKn() <= v.maxSpeedKn());
      CHECK(v.headingDeg() >= 0.0);
      CHECK(v.headingDeg() < 360.0);
      CHECK(v.inDanger() == (v.status() != Status::Green));

      if (!avoidingBefore[i]) continue;

      // Avoiding at step start: the only action allowed is the revert.
      const bool acted = std::any_of(d.actions.begin(), d.actions.end(),
                                     [&](const Action& a) { return a.vesselId == v.id(); });
      if (acted) CHECK(hasRelease(d, v.id()));

      // Released only when every triggering pair is clear over the full horizon.
      if (!v.isAvoiding()) {
        for (int other : withBefore[i]) {
          const int j = w.state().indexOf(other);
          if (j < 0) continue;
          const PairAssessment* p = findPair(d, std::min((int)i, j), std::max((int)i, j));
          REQUIRE(p != nullptr);
          CHECK(p->status == Status::Green);
        }
      }
    }
  }
}

} // namespace

TEST_CASE("Head-on vessels turn starboard and return to Green") {
  auto w = makeWorld("reactive", {{{0.0, 0.0}, {10.0, 0.0}, 20.0}, {{10.0, 0.0}, {0.0, 0.0}, 20.0}});

  while (w->vessel(0)->status() == Status::Green && w->timeStep() < 200) w->step();

  REQUIRE(w->vessel(0)->status() == Status::Orange);
  CHECK(w->vessel(1)->status() == Status::Orange);
  CHECK(w->vessel(0)->scenario() == Scenario::HeadOn);
  CHECK(w->vessel(0)->role() == Role::GiveWay);
  CHECK(w->vessel(1)->role() == Role::GiveWay);
  CHECK(math::distance(w->vessel(0)->positionNm(), w->vessel(1)->positionNm()) > 0.2);

  const auto& actions = w->pendingActions();
  REQUIRE(actions.size() == 2);
  for (const Action& a : actions) CHECK(a.headingDeltaDeg < 0.0);

  runAndCheckInvariants(*w, 400);

  CHECK(w->isGoalState());
  for (const Vessel& v : w->vessels()) {
    CHECK(v.status() == Status::Green);
    CHECK_FALSE(v.isAvoiding());
  }
}

TEST_CASE("Stationary vessel dead ahead is Red for both, only the mover acts") {
  auto w = makeWorld("reactive", {{{0.0, 0.0}, {5.0, 0.0}, 15.0}, {{0.15, 0.0}, {0.15, 0.0}, 0.0}});
  w->step();

  CHECK(w->vessel(0)->status() == Status::Red);
  CHECK(w->vessel(1)->status() == Status::Red);
  CHECK(w->vessel(0)->isAvoiding());
  CHECK_FALSE(w->vessel(1)->isAvoiding());

  const auto& actions = w->pendingActions();
  REQUIRE(actions.size() == 1);
  CHECK(actions[0].vesselId == 0);
  CHECK(actions[0].headingDeltaDeg < 0.0);
  CHECK(actions[0].speedDeltaKn < 0.0);
}

TEST_CASE("Moored vessel never acts") {
  auto w = makeWorld("reactive", {{{2.0, 2.0}, {2.0, 2.0}, 20.0}});
  CHECK(w->isGoalState());

  for (int i = 0; i < 10; ++i) {
    w->step();
    CHECK(w->vessel(0)->status() == Status::Green);
    CHECK(w->pendingActions().empty());
    CHECK(w->vessel(0)->positionNm() == math::Vec2d(2.0, 2.0));
  }
}

TEST_CASE("Vessel underway gives way to a moored vessel and passes clear") {
  auto w = makeWorld("reactive", {{{2.0, 0.0}, {2.0, 0.0}, 20.0}, {{2.0, -3.0}, {2.0, 3.0}, 20.0}});
  w->vessel(0)->setHeadingDeg(345.0);

  const double collisionNm = w->config().collisionDistanceNm();
  double minSep = 1e9;
  bool sawRed = false;
  bool sawGiveWay = false;
  while (!w->isGoalState() && w->timeStep() < 400) {
    w->step();
    const Vessel& moored = *w->vessel(0);
    const Vessel& mover = *w->vessel(1);
    minSep = std::min(minSep, math::distance(moored.positionNm(), mover.positionNm()));
    sawRed = sawRed || moored.status() == Status::Red;

    CHECK(moored.positionNm() == math::Vec2d(2.0, 0.0));
    CHECK(moored.headingDeg() == 345.0);
    CHECK_FALSE(moored.isAvoiding());
    CHECK(moored.role() != Role::GiveWay);
    for (const Action& a : w->lastDecision().actions) CHECK(a.vesselId == 1);

    if (mover.role() == Role::GiveWay) sawGiveWay = true;
  }

  CHECK(w->isGoalState());
  CHECK(sawGiveWay);
  CHECK_FALSE(sawRed);
  CHECK(minSep >= collisionNm);
}

TEST_CASE("Head-on encounter costs each vessel one turn and one revert") {
  auto w = makeWorld("reactive", {{{0.0, 0.0}, {10.0, 0.0}, 20.0}, {{10.0, 0.0}, {0.0, 0.0}, 20.0}});

  std::vector<std::vector<double>> turns(2);
  int engages = 0;
  while (!w->isGoalState() && w->timeStep() < 400) {
    w->step();
    const StepDecision& d = w->lastDecision();
    for (const Action& a : d.actions) turns[(std::size_t)a.vesselId].push_back(a.headingDeltaDeg);
    for (const AvoidanceCommand& c : d.commands) {
      if (c.kind == AvoidanceCommand::Kind::Engage) ++engages;
    }
  }

  CHECK(w->isGoalState());
  CHECK(engages == 2);
  for (const auto& t : turns) {
    REQUIRE(t.size() == 2);
    CHECK(t[0] < 0.0);
    CHECK(t[1] > 0.0);
  }
}

TEST_CASE("Classification is a pure function of the geometry") {
  const Vessel a(0, {0.0, 0.0}, {4.0, 0.0}, 20.0);
  const Vessel b(1, {2.0, -2.0}, {2.0, 2.0}, 20.0);

  const Scenario first = classifyEncounter(a, b);
  CHECK(classifyEncounter(a, b) == first);
  CHECK(classifyEncounter(a, b) == first);

  const Vessel aCopy = a;
  const Vessel bCopy = b;
  CHECK(classifyEncounter(aCopy, bCopy) == first);

  const RolePair r1 = assignRoles(a, b, first);
  const RolePair r2 = assignRoles(a, b, first);
  CHECK(r1.a == r2.a);
  CHECK(r1.b == r2.b);
}

TEST_CASE("Decision invariants hold across scenarios and strategies") {
  const std::vector<std::vector<Leg>> scenarios = {
    {{{0.0, 0.0}, {10.0, 0.0}, 20.0}, {{10.0, 0.0}, {0.0, 0.0}, 20.0}},
    {{{0.0, 0.0}, {4.0, 0.0}, 20.0}, {{2.0, -2.0}, {2.0, 2.0}, 20.0}},
    {{{0.0, 0.0}, {6.0, 0.0}, 20.0}, {{1.0, 0.0}, {8.0, 0.0}, 10.0}},
    {{{0.0, 0.0}, {8.0, 0.0}, 20.0}, {{8.0, 0.5}, {0.0, 0.5}, 18.0}, {{4.0, -4.0}, {4.0, 4.0}, 16.0}},
  };

  for (const char* strategy : {"reactive", "backtracking"}) {
    for (std::size_t s = 0; s < scenarios.size(); ++s) {
      INFO("strategy=" << strategy << " scenario=" << s);
      auto w = makeWorld(strategy, scenarios[s]);
      REQUIRE(w != nullptr);
      runAndCheckInvariants(*w, 600);
    }
  }
}

TEST_CASE("Horizon gating suppresses labels") {
  auto w = makeWorld("reactive", {{{0.0, 0.0}, {20.0, 0.0}, 20.0}, {{12.0, 0.0}, {-8.0, 0.0}, 20.0}});
  w->step();

  const StepDecision& d = w->lastDecision();
  REQUIRE(d.pairs.size() == 1);
  CHECK(d.pairs[0].gated);
  CHECK(d.encounters.empty());
  CHECK(d.actions.empty());
  CHECK(w->vessel(0)->scenario() == Scenario::None);
  CHECK(w->vessel(0)->role() == Role::None);
}

TEST_CASE("Backtracking planner commits a conflict-free single action") {
  WorldState ws;
  ws.vessels.emplace_back(0, math::Vec2d{0.0, 0.0}, math::Vec2d{10.0, 0.0}, 20.0);
  ws.vessels.emplace_back(1, math::Vec2d{4.0, 0.0}, math::Vec2d{-6.0, 0.0}, 20.0);

  const EngineConfig cfg = makeConfig();
  const auto conflict = earliestConflictStep(ws, 0, cfg);
  REQUIRE(conflict.has_value());

  BacktrackingStrategy planner;
  REQUIRE(planner.planFor(ws, 0, cfg));
  CHECK(planAvoidsConflict(ws, planner.plans(), *conflict, cfg));

  // The live world is untouched by the search.
  CHECK(ws.vessels[0].positionNm() == math::Vec2d(0.0, 0.0));
  CHECK(ws.vessels[0].headingDeg() == 0.0);
  CHECK(ws.timeStep == 0);
}
