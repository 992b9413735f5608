#include "seasafe/sim/CollisionPredictor.h"

#include "test_harness.h"

#include <vector>

static seasafe::sim::EngineConfig makeConfig() {
  seasafe::sim::EngineConfig cfg{};
  cfg.safetyZoneRadiusNm = 0.1;
  cfg.horizonNm = 5.0;
  cfg.stepSec = 15.0;
  cfg.horizonSteps = seasafe::sim::deriveHorizonSteps(cfg.horizonNm, 20.0, cfg.stepSec);
  return cfg;
}

int test_collision_predictor() {
  int failures = 0;

  using namespace seasafe::sim;
  const EngineConfig cfg = makeConfig();
  CHECK(cfg.horizonSteps == 60);
  CHECK_NEAR(cfg.collisionDistanceNm(), 0.2, 1e-12);

  // ---- Immediate check is strict ----
  {
    const Vessel a(0, {0.0, 0.0}, {5.0, 0.0}, 15.0);
    const Vessel b(1, {0.15, 0.0}, {0.15, 0.0}, 0.0);
    const Vessel c(2, {0.0, 0.25}, {5.0, 0.25}, 15.0);
    CHECK(checkImmediate(a, b, 0.2));
    CHECK(!checkImmediate(a, c, 0.2));
    CHECK(!checkImmediate(a, b, 0.15));
  }

  // ---- Future sweep: head-on 4 NM apart, closing at 40 kn ----
  {
    const Vessel a(0, {0.0, 0.0}, {10.0, 0.0}, 20.0);
    const Vessel b(1, {4.0, 0.0}, {-6.0, 0.0}, 20.0);

    const FutureConflict fc = checkFuture(a, b, 0.2, cfg.horizonSteps, cfg.stepSec);
    CHECK(fc.conflict);
    CHECK(fc.firstStep == 23);
    CHECK(fc.distanceNm < 0.2);

    // Not enough samples to reach the conflict.
    CHECK(!checkFuture(a, b, 0.2, 22, cfg.stepSec).conflict);
    CHECK(!checkFuture(a, b, 0.2, 0, cfg.stepSec).conflict);

    const std::vector<Vessel> vs{a, b};
    const PairAssessment p = assessPair(vs, 0, 1, cfg);
    CHECK(p.status == Status::Orange);
    CHECK(!p.gated);
    CHECK(p.firstConflictStep == 23);
    CHECK_NEAR(p.distanceNm, 4.0, 1e-12);
  }

  // ---- Horizon gating ----
  {
    const Vessel a(0, {0.0, 0.0}, {10.0, 0.0}, 20.0);
    const Vessel b(1, {6.0, 0.0}, {-4.0, 0.0}, 20.0);
    const std::vector<Vessel> vs{a, b};
    const PairAssessment p = assessPair(vs, 0, 1, cfg);
    CHECK(p.status == Status::Green);
    CHECK(p.gated);
  }

  // ---- Parallel tracks never conflict ----
  {
    const std::vector<Vessel> vs{
      Vessel(0, {0.0, 0.0}, {10.0, 0.0}, 20.0),
      Vessel(1, {0.0, 1.0}, {10.0, 1.0}, 20.0),
    };
    const PairAssessment p = assessPair(vs, 0, 1, cfg);
    CHECK(p.status == Status::Green);
    CHECK(!p.gated);
  }

  // ---- All pairs + aggregation ----
  {
    const std::vector<Vessel> vs{
      Vessel(0, {0.0, 0.0}, {5.0, 0.0}, 15.0),
      Vessel(1, {0.15, 0.0}, {0.15, 0.0}, 0.0),
      Vessel(2, {30.0, 30.0}, {40.0, 30.0}, 20.0),
    };
    const auto pairs = assessAllPairs(vs, cfg);
    CHECK(pairs.size() == 3);
    if (pairs.size() == 3) {
      CHECK(pairs[0].a == 0 && pairs[0].b == 1);
      CHECK(pairs[1].a == 0 && pairs[1].b == 2);
      CHECK(pairs[2].a == 1 && pairs[2].b == 2);
      CHECK(pairs[0].status == Status::Red);
      CHECK(pairs[1].gated);
    }

    const auto st = aggregateStatuses(vs.size(), pairs);
    CHECK(st.size() == 3);
    if (st.size() == 3) {
      CHECK(st[0] == Status::Red);
      CHECK(st[1] == Status::Red);
      CHECK(st[2] == Status::Green);
    }

    std::vector<PairAssessment> mixed(2);
    mixed[0].a = 0; mixed[0].b = 1; mixed[0].status = Status::Red;
    mixed[1].a = 1; mixed[1].b = 2; mixed[1].status = Status::Orange;
    const auto agg = aggregateStatuses(3, mixed);
    CHECK(agg[0] == Status::Red);
    CHECK(agg[1] == Status::Red);
    CHECK(agg[2] == Status::Orange);

    CHECK(assessAllPairs({vs[0]}, cfg).empty());
  }

  return failures;
}
