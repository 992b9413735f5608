#include "seasafe/sim/AvoidanceStrategy.h"

#include "seasafe/sim/AvoidanceStateMachine.h"
#include "seasafe/sim/BacktrackingPlanner.h"
#include "seasafe/sim/EncounterClassifier.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace seasafe::sim {

StepDecision assessWorld(const WorldState& world, const EngineConfig& cfg) {
  StepDecision out{};
  const std::size_t n = world.vessels.size();
  if (n < 2) return out;

  out.pairs = assessAllPairs(world.vessels, cfg);
  out.statuses = aggregateStatuses(n, out.pairs);
  out.scenarios.assign(n, Scenario::None);
  out.roles.assign(n, Role::None);

  for (const PairAssessment& p : out.pairs) {
    if (p.status == Status::Green) continue;
    const Vessel& a = world.vessels[(std::size_t)p.a];
    const Vessel& b = world.vessels[(std::size_t)p.b];

    Encounter e{};
    e.pair = p;
    e.scenario = classifyEncounter(a, b);
    e.roles = assignRoles(a, b, e.scenario);
    out.encounters.push_back(e);
  }

  std::stable_sort(out.encounters.begin(), out.encounters.end(), [](const Encounter& x, const Encounter& y) {
    return static_cast<int>(x.pair.status) > static_cast<int>(y.pair.status);
  });

  for (const Encounter& e : out.encounters) {
    const std::size_t ia = (std::size_t)e.pair.a;
    const std::size_t ib = (std::size_t)e.pair.b;
    if (out.scenarios[ia] == Scenario::None) {
      out.scenarios[ia] = e.scenario;
      out.roles[ia] = e.roles.a;
    }
    if (out.scenarios[ib] == Scenario::None) {
      out.scenarios[ib] = e.scenario;
      out.roles[ib] = e.roles.b;
    }
  }

  return out;
}

std::unique_ptr<AvoidanceStrategy> makeStrategy(std::string_view name) {
  std::string k(name);
  for (char& c : k) c = (char)std::tolower((unsigned char)c);

  if (k == "reactive" || k == "colregs") return std::make_unique<ReactiveColregsStrategy>();
  if (k == "backtracking" || k == "tree" || k == "tree_search") return std::make_unique<BacktrackingStrategy>();
  return nullptr;
}

} // namespace seasafe::sim
