#include "seasafe/core/Args.h"
#include "seasafe/core/CVar.h"
#include "seasafe/core/Log.h"
#include "seasafe/sim/EngineConfig.h"
#include "seasafe/sim/Scenario.h"
#include "seasafe/sim/World.h"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace seasafe;

static void printHelp() {
  std::cout << "seasafe_sim_cli\n"
            << "  --scenario <path>      Scenario file (cvar assignments and 'ship' lines)\n"
            << "  --ship <sx,sy dx,dy>   Add a vessel from source to destination in NM (repeatable)\n"
            << "  --strategy <name>      reactive | backtracking (default: reactive)\n"
            << "  --steps <n>            Step limit (default: 2000)\n"
            << "  --horizon <nm>         Look-ahead distance (default: 5)\n"
            << "  --safety <m>           Safety zone radius per vessel (default: 200)\n"
            << "  --step-sec <s>         Simulated seconds per step (default: 15)\n"
            << "  --speed <kn>           Default vessel max speed (default: 20)\n"
            << "  --cvar <name=value>    Set any cvar (repeatable, applied last)\n"
            << "  --list-cvars [filter]  Print the effective settings and exit\n"
            << "  --log <level>          trace | debug | info | warn | error | off (default: info)\n"
            << "  --quiet                Only print the final summary\n"
            << "  --help                 Show this help\n";
}

static void printVessel(const sim::VesselSnapshot& s) {
  std::cout << "  vessel " << s.id << std::fixed << std::setprecision(3)
            << " pos=(" << s.positionNm.x << "," << s.positionNm.y << ")"
            << std::setprecision(1)
            << " hdg=" << s.headingDeg << " spd=" << s.speedKn
            << " status=" << sim::toString(s.status);
  if (s.status != sim::Status::Green) {
    std::cout << " " << sim::toString(s.scenario) << "/" << sim::toString(s.role);
  }
  std::cout << "\n";
}

static void printCVars(const core::CVarRegistry& cvars, std::string_view filter) {
  for (const core::CVar* v : cvars.list(filter)) {
    std::cout << v->name << " = " << core::CVarRegistry::valueToString(*v)
              << "  (" << core::CVarRegistry::typeName(v->type) << ")";
    if (!v->help.empty()) std::cout << "  " << v->help;
    std::cout << "\n";
  }
}

// CLI option -> cvar. Values are parsed by the registry so type errors surface
// the same way as in scenario files.
struct CliOverride {
  const char* option;
  const char* cvar;
};

static constexpr CliOverride kOverrides[] = {
  {"strategy", "sim.strategy"},
  {"steps", "sim.max_steps"},
  {"horizon", "colregs.horizon_nm"},
  {"safety", "colregs.safety_zone_m"},
  {"step-sec", "sim.step_sec"},
  {"speed", "sim.max_speed_kn"},
};

int main(int argc, char** argv) {
  core::Args args;
  args.setArity("ship", 2);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  if (const auto lvl = args.last("log")) {
    core::LogLevel level{};
    if (!core::parseLogLevel(*lvl, level)) {
      std::cerr << "Unknown log level: " << *lvl << "\n";
      return 2;
    }
    core::setLogLevel(level);
  }

  const bool quiet = args.hasFlag("quiet") || args.hasFlag("q");

  core::CVarRegistry cvars;
  sim::installSimCVars(cvars);

  sim::ScenarioSpec spec{};

  std::string scenarioPath;
  if (args.getString("scenario", scenarioPath)) {
    std::string err;
    if (!sim::loadScenarioFile(scenarioPath, cvars, spec, &err)) {
      std::cerr << err << (err.empty() || err.back() == '\n' ? "" : "\n");
      return 2;
    }
  }

  for (const CliOverride& o : kOverrides) {
    const auto v = args.last(o.option);
    if (!v) continue;
    std::string err;
    if (!cvars.setFromString(o.cvar, *v, &err)) {
      std::cerr << "--" << o.option << ": " << err << "\n";
      return 2;
    }
  }

  for (const std::string& a : args.values("cvar")) {
    std::string err;
    if (!cvars.setAssignment(a, &err)) {
      std::cerr << "--cvar " << a << ": " << err << "\n";
      return 2;
    }
  }

  if (args.has("list-cvars")) {
    printCVars(cvars, args.last("list-cvars").value_or(""));
    return 0;
  }

  const std::vector<std::string> ships = args.values("ship");
  if (ships.size() % 2 != 0) {
    std::cerr << "--ship expects two coordinates: <sx,sy> <dx,dy>\n";
    return 2;
  }
  for (std::size_t i = 0; i + 1 < ships.size(); i += 2) {
    std::string err;
    if (!sim::addVesselFromStrings(spec, ships[i], ships[i + 1], -1.0, &err)) {
      std::cerr << "--ship: " << err << "\n";
      return 2;
    }
  }

  if (spec.vessels.empty()) {
    std::cerr << "No vessels (use --scenario or --ship). See --help.\n";
    return 2;
  }

  std::string err;
  std::unique_ptr<sim::World> world = sim::buildWorld(spec, cvars, &err);
  if (!world) {
    std::cerr << err << "\n";
    return 2;
  }

  const std::int64_t maxSteps = cvars.getInt("sim.max_steps", 2000);
  if (maxSteps <= 0) {
    std::cerr << "sim.max_steps must be positive\n";
    return 2;
  }

  if (!quiet) {
    std::cout << "[t=0]\n";
    for (const auto& s : world->snapshot()) printVessel(s);
  }

  std::vector<sim::Status> prev(world->vessels().size(), sim::Status::Green);
  std::vector<int> redSteps(world->vessels().size(), 0);
  std::vector<int> orangeSteps(world->vessels().size(), 0);
  std::size_t actionCount = 0;

  while (!world->isGoalState() && world->timeStep() < maxSteps) {
    world->step();

    const auto snap = world->snapshot();
    const auto& actions = world->lastDecision().actions;
    actionCount += actions.size();

    bool changed = !actions.empty();
    for (std::size_t i = 0; i < snap.size(); ++i) {
      if (snap[i].status == sim::Status::Red) ++redSteps[i];
      if (snap[i].status == sim::Status::Orange) ++orangeSteps[i];
      if (snap[i].status != prev[i]) changed = true;
    }

    if (!quiet && changed) {
      std::cout << "[t=" << world->timeStep() << "]\n";
      for (std::size_t i = 0; i < snap.size(); ++i) {
        if (snap[i].status != prev[i]) printVessel(snap[i]);
      }
      for (const sim::Action& a : actions) {
        std::cout << "  action " << sim::describe(a) << "\n";
      }
    }

    for (std::size_t i = 0; i < snap.size(); ++i) prev[i] = snap[i].status;
  }

  const bool done = world->isGoalState();
  std::cout << "[summary] steps=" << world->timeStep()
            << " strategy=" << world->strategy().name()
            << " goal=" << (done ? "reached" : "step limit")
            << " actions=" << actionCount << "\n";
  for (const auto& s : world->snapshot()) {
    const std::size_t i = (std::size_t)s.id;
    std::cout << "  vessel " << s.id << std::fixed << std::setprecision(3)
              << " pos=(" << s.positionNm.x << "," << s.positionNm.y << ")"
              << " dest=(" << s.destinationNm.x << "," << s.destinationNm.y << ")"
              << " redSteps=" << (i < redSteps.size() ? redSteps[i] : 0)
              << " orangeSteps=" << (i < orangeSteps.size() ? orangeSteps[i] : 0) << "\n";
  }

  return 0;
}
