#pragma once

#include "seasafe/sim/EngineConfig.h"
#include "seasafe/sim/Vessel.h"

#include <vector>

namespace seasafe::sim {

// -----------------------------------------------------------------------------
// Collision predictor
// -----------------------------------------------------------------------------
//
// Planar Euclidean distances in NM; no great-circle correction.
//
// Future sampling uses offsets k * stepSec for k = 1..horizonSteps, with each
// sample taken by stepping copies of the vessels through advance(). The zeroth
// offset is the current position and is covered by checkImmediate().

struct FutureConflict {
  bool conflict{false};

  // First offending sample index k (1-based), or 0 when clear.
  int firstStep{0};

  // Separation at that sample (NM).
  double distanceNm{0.0};
};

// Current separation below `collisionDistanceNm`.
bool checkImmediate(const Vessel& a, const Vessel& b, double collisionDistanceNm);

// Sweep the forward samples and stop at the first violation.
// horizonSteps <= 0 means no sampling.
FutureConflict checkFuture(const Vessel& a,
                           const Vessel& b,
                           double collisionDistanceNm,
                           int horizonSteps,
                           double stepSec);

// Result for one unordered vessel pair (indices into the vessel list).
struct PairAssessment {
  int a{-1};
  int b{-1};
  Status status{Status::Green};

  double distanceNm{0.0};

  // Separation larger than the horizon distance; nothing was evaluated.
  bool gated{false};

  // Orange only: first offending sample and the separation there.
  int firstConflictStep{0};
  double conflictDistanceNm{0.0};
};

// Gate on horizon distance, then Red on immediate violation, Orange on a future
// violation, Green otherwise.
PairAssessment assessPair(const std::vector<Vessel>& vessels, int a, int b, const EngineConfig& cfg);

// Every pair i < j, in (i, j) lexical order. Fewer than two vessels yields nothing.
std::vector<PairAssessment> assessAllPairs(const std::vector<Vessel>& vessels, const EngineConfig& cfg);

// Most severe status per vessel across its pairs; vessels in no at-risk pair are Green.
std::vector<Status> aggregateStatuses(std::size_t vesselCount, const std::vector<PairAssessment>& pairs);

} // namespace seasafe::sim
