#include "seasafe/sim/CollisionPredictor.h"

#include "seasafe/sim/Kinematics.h"

namespace seasafe::sim {

bool checkImmediate(const Vessel& a, const Vessel& b, double collisionDistanceNm) {
  return math::distance(a.positionNm(), b.positionNm()) < collisionDistanceNm;
}

FutureConflict checkFuture(const Vessel& a,
                           const Vessel& b,
                           double collisionDistanceNm,
                           int horizonSteps,
                           double stepSec) {
  FutureConflict out{};
  Vessel ga = a;
  Vessel gb = b;
  for (int k = 1; k <= horizonSteps; ++k) {
    advance(ga, stepSec);
    advance(gb, stepSec);
    const double d = math::distance(ga.positionNm(), gb.positionNm());
    if (d < collisionDistanceNm) {
      out.conflict = true;
      out.firstStep = k;
      out.distanceNm = d;
      return out;
    }
  }
  return out;
}

PairAssessment assessPair(const std::vector<Vessel>& vessels, int a, int b, const EngineConfig& cfg) {
  PairAssessment out{};
  out.a = a;
  out.b = b;

  const Vessel& va = vessels[(std::size_t)a];
  const Vessel& vb = vessels[(std::size_t)b];
  out.distanceNm = math::distance(va.positionNm(), vb.positionNm());

  if (out.distanceNm > cfg.horizonNm) {
    out.gated = true;
    return out;
  }

  const double collisionNm = cfg.collisionDistanceNm();
  if (checkImmediate(va, vb, collisionNm)) {
    out.status = Status::Red;
    return out;
  }

  const FutureConflict fc = checkFuture(va, vb, collisionNm, cfg.horizonSteps, cfg.stepSec);
  if (fc.conflict) {
    out.status = Status::Orange;
    out.firstConflictStep = fc.firstStep;
    out.conflictDistanceNm = fc.distanceNm;
  }
  return out;
}

std::vector<PairAssessment> assessAllPairs(const std::vector<Vessel>& vessels, const EngineConfig& cfg) {
  std::vector<PairAssessment> out;
  const int n = (int)vessels.size();
  if (n < 2) return out;

  out.reserve((std::size_t)(n * (n - 1) / 2));
  for (int i = 0; i < n; ++i) {
    for (int j = i + 1; j < n; ++j) {
      out.push_back(assessPair(vessels, i, j, cfg));
    }
  }
  return out;
}

std::vector<Status> aggregateStatuses(std::size_t vesselCount, const std::vector<PairAssessment>& pairs) {
  std::vector<Status> out(vesselCount, Status::Green);
  for (const PairAssessment& p : pairs) {
    if (p.a < 0 || p.b < 0 || (std::size_t)p.a >= vesselCount || (std::size_t)p.b >= vesselCount) continue;
    out[(std::size_t)p.a] = moreSevere(out[(std::size_t)p.a], p.status);
    out[(std::size_t)p.b] = moreSevere(out[(std::size_t)p.b], p.status);
  }
  return out;
}

} // namespace seasafe::sim
