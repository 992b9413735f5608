#include "seasafe/core/CVar.h"
#include "seasafe/sim/EngineConfig.h"

#include "test_harness.h"

#include <cmath>
#include <string>

int test_cvars() {
  int failures = 0;

  using seasafe::core::CVarRegistry;
  using seasafe::core::CVarType;

  // ---- Define + typed get/set ----
  {
    CVarRegistry r;
    CHECK(r.defineInt("a.int", 42, "test") != nullptr);
    CHECK(r.defineFloat("a.float", 1.5) != nullptr);
    CHECK(r.defineString("a.str", "hello") != nullptr);

    CHECK(r.getInt("a.int", 0) == 42);
    CHECK(r.getFloat("a.float", 0.0) > 1.4);
    CHECK(r.getString("a.str", "") == "hello");

    std::string err;
    CHECK(r.setFromString("a.int", "-7", &err));
    CHECK(r.getInt("a.int", 0) == -7);

    // Whole-number floats are accepted for ints; fractions are not.
    CHECK(r.setFromString("a.int", "5.0", &err));
    CHECK(r.getInt("a.int", 0) == 5);
    CHECK(!r.setFromString("a.int", "5.5", &err));
    CHECK(r.getInt("a.int", 0) == 5);

    CHECK(r.setFromString("a.float", "2.25", &err));
    CHECK(std::fabs(r.getFloat("a.float", 0.0) - 2.25) < 1e-12);
    CHECK(!r.setFromString("a.float", "fast", &err));

    CHECK(r.setFromString("a.str", "\"hi there\"", &err));
    CHECK(r.getString("a.str", "") == "hi there");

    // Redefinition with another type is refused.
    CHECK(r.defineFloat("a.int", 1.0) == nullptr);

    CHECK(!r.setFromString("missing", "1", &err));
    CHECK(!err.empty());

    const auto* f = r.find("a.float");
    CHECK(f != nullptr);
    if (f) CHECK(CVarRegistry::valueToString(*f) == "2.250000");
    CHECK(std::string(CVarRegistry::typeName(CVarType::Int)) == "int");
  }

  // ---- name=value assignments ----
  {
    CVarRegistry r;
    seasafe::sim::installSimCVars(r);

    std::string err;
    CHECK(r.setAssignment("colregs.horizon_nm = 3.5", &err));
    CHECK(std::fabs(r.getFloat("colregs.horizon_nm", 0.0) - 3.5) < 1e-12);
    CHECK(r.setAssignment("sim.strategy=backtracking", &err));
    CHECK(r.getString("sim.strategy", "") == "backtracking");
    CHECK(!r.setAssignment("sim.step_sec", &err));
    CHECK(!r.setAssignment("=3", &err));

    const auto planner = r.list("planner.");
    CHECK(planner.size() == 2);
    if (planner.size() == 2) {
      CHECK(planner[0]->name == "planner.speed_step_kn");
      CHECK(planner[1]->name == "planner.turn_deg");
      CHECK(planner[1]->type == CVarType::Float);
    }
  }

  // ---- Defaults feed the engine config ----
  {
    CVarRegistry r;
    seasafe::sim::installSimCVars(r);

    const seasafe::sim::EngineConfig cfg = seasafe::sim::engineConfigFromCVars(r, 20.0);
    CHECK(std::fabs(cfg.horizonNm - 5.0) < 1e-12);
    CHECK(std::fabs(cfg.stepSec - 15.0) < 1e-12);
    CHECK(std::fabs(cfg.safetyZoneRadiusNm - 200.0 / 1852.0) < 1e-12);
    CHECK(cfg.horizonSteps == 60);
    CHECK(std::fabs(cfg.maneuvers.redTurnDeg - 20.0) < 1e-12);
    CHECK(std::fabs(cfg.maneuvers.redSpeedDeltaKn + 3.0) < 1e-12);
    CHECK(std::fabs(cfg.maneuvers.orangeTurnDeg - 15.0) < 1e-12);
    CHECK(std::fabs(cfg.planner.turnDeg - 10.0) < 1e-12);
    CHECK(std::fabs(cfg.planner.speedStepKn - 2.0) < 1e-12);
    CHECK(r.getInt("sim.max_steps", 0) == 2000);

    std::string err;
    CHECK(seasafe::sim::validateEngineConfig(cfg, &err));

    CHECK(r.setFromString("sim.step_sec", "0", &err));
    const auto bad = seasafe::sim::engineConfigFromCVars(r, 20.0);
    CHECK(bad.horizonSteps == 0);
    CHECK(!seasafe::sim::validateEngineConfig(bad, &err));
    CHECK(!err.empty());
  }

  // ---- Pending assignment (line applied before define) ----
  {
    CVarRegistry r;
    std::string err;
    CHECK(r.applyLine("# test", &err));
    CHECK(r.applyLine("", &err));
    CHECK(r.applyLine("pending.int = 123", &err));
    CHECK(r.applyLine("pending.str = \"hello world\"  # trailing comment", &err));
    CHECK(r.hasPending("pending.int"));
    CHECK(r.hasPending("pending.str"));

    // Defining should apply pending assignments automatically.
    CHECK(r.defineInt("pending.int", 0) != nullptr);
    CHECK(r.defineString("pending.str", "x") != nullptr);

    CHECK(r.getInt("pending.int", 0) == 123);
    CHECK(r.getString("pending.str", "") == "hello world");
    CHECK(!r.hasPending("pending.int"));
  }

  // ---- Bad values are reported for defined names ----
  {
    CVarRegistry r;
    seasafe::sim::installSimCVars(r);
    std::string err;
    CHECK(!r.applyLine("sim.step_sec = soon", &err));
    CHECK(!err.empty());
    CHECK(r.applyLine("colregs.horizon_nm 2", &err));
    CHECK(std::fabs(r.getFloat("colregs.horizon_nm", 0.0) - 2.0) < 1e-12);
    CHECK(std::fabs(r.getFloat("sim.step_sec", 0.0) - 15.0) < 1e-12);
    CHECK(!r.applyLine("= 3", &err));
  }

  return failures;
}
