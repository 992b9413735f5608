#include "seasafe/sim/World.h"

#include "seasafe/core/Log.h"
#include "seasafe/sim/Kinematics.h"

#include <sstream>
#include <utility>

namespace seasafe::sim {

World::World(const EngineConfig& cfg, std::unique_ptr<AvoidanceStrategy> strategy)
  : cfg_(cfg), strategy_(std::move(strategy)) {
  if (!strategy_) strategy_ = makeStrategy("reactive");
}

int World::addVessel(const math::Vec2d& sourceNm, const math::Vec2d& destinationNm, double maxSpeedKn) {
  const int id = (int)state_.vessels.size();
  state_.vessels.emplace_back(id, sourceNm, destinationNm, maxSpeedKn);
  return id;
}

Vessel* World::vessel(int id) {
  const int i = state_.indexOf(id);
  return (i < 0) ? nullptr : &state_.vessels[(std::size_t)i];
}

const Vessel* World::vessel(int id) const {
  const int i = state_.indexOf(id);
  return (i < 0) ? nullptr : &state_.vessels[(std::size_t)i];
}

void World::applyPending() {
  for (const Action& a : pending_) {
    Vessel* v = vessel(a.vesselId);
    if (!v) {
      SEASAFE_LOG_WARN("[world] dropping action for unknown vessel " + std::to_string(a.vesselId));
      continue;
    }
    applyAction(*v, a);
    SEASAFE_LOG_DEBUG("[world] t=" + std::to_string(state_.timeStep) + " apply " + describe(a));
  }
  pending_.clear();
}

void World::commit(const StepDecision& d) {
  if (d.empty()) return;

  for (std::size_t i = 0; i < state_.vessels.size(); ++i) {
    Vessel& v = state_.vessels[i];
    const Status prev = v.status();
    v.setStatus(d.statuses[i]);
    if (d.statuses[i] == Status::Green) {
      v.setScenario(Scenario::None);
      v.setRole(Role::None);
    } else {
      v.setScenario(d.scenarios[i]);
      v.setRole(d.roles[i]);
    }

    if (prev != v.status()) {
      std::ostringstream oss;
      oss << "[world] t=" << state_.timeStep << " vessel " << v.id() << " "
          << toString(prev) << " -> " << toString(v.status());
      SEASAFE_LOG_DEBUG(oss.str());
    }
  }

  for (const AvoidanceCommand& c : d.commands) {
    Vessel* v = vessel(c.vesselId);
    if (!v) continue;
    if (c.kind == AvoidanceCommand::Kind::Engage) {
      v->engageAvoidance(c.counterpartIds);
    } else {
      v->releaseAvoidance();
    }
  }
}

void World::step() {
  applyPending();

  for (Vessel& v : state_.vessels) advance(v, cfg_.stepSec);
  ++state_.timeStep;

  StepDecision d = strategy_->decide(state_, cfg_);
  commit(d);

  pending_ = d.actions;
  lastDecision_ = std::move(d);
}

bool World::isGoalState() const {
  return state_.isGoalState(cfg_.arrivalToleranceNm);
}

std::vector<VesselSnapshot> World::snapshot() const {
  std::vector<VesselSnapshot> out;
  out.reserve(state_.vessels.size());
  for (const Vessel& v : state_.vessels) {
    VesselSnapshot s{};
    s.id = v.id();
    s.positionNm = v.positionNm();
    s.headingDeg = v.headingDeg();
    s.speedKn = v.speedKn();
    s.status = v.status();
    s.destinationNm = v.destinationNm();
    s.role = v.role();
    s.scenario = v.scenario();
    out.push_back(s);
  }
  return out;
}

} // namespace seasafe::sim
