#pragma once

#include "seasafe/math/Vec2.h"
#include "seasafe/sim/World.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace seasafe::core {
class CVarRegistry;
}

namespace seasafe::sim {

struct VesselSpec {
  math::Vec2d sourceNm{0, 0};
  math::Vec2d destinationNm{0, 0};

  // Negative: use sim.max_speed_kn.
  double maxSpeedKn{-1.0};
};

struct ScenarioSpec {
  std::string name;
  std::vector<VesselSpec> vessels;
};

// "x,y" in NM. Whitespace around either number is allowed.
bool parseCoordinate(std::string_view text, math::Vec2d& out);

bool addVesselFromStrings(ScenarioSpec& spec,
                          std::string_view source,
                          std::string_view destination,
                          double maxSpeedKn = -1.0,
                          std::string* outError = nullptr);

// Scenario text:
//   # comment
//   colregs.horizon_nm = 5
//   ship 0,0 10,0        [max_speed_kn]
//
// Assignment lines go to `cvars`; ship lines append to `spec`. Malformed ship
// lines are skipped with a warning. Bad assignments are reported through
// outError but do not stop the load.
bool loadScenarioText(std::string_view text,
                      core::CVarRegistry& cvars,
                      ScenarioSpec& spec,
                      std::string* outError = nullptr,
                      std::string_view sourceName = "<scenario>");

bool loadScenarioFile(const std::string& path,
                      core::CVarRegistry& cvars,
                      ScenarioSpec& spec,
                      std::string* outError = nullptr);

// Engine config from `cvars` (horizon steps derived from the fastest vessel),
// the strategy named by sim.strategy, and one vessel per spec entry.
// nullptr with a message on an unknown strategy or an unusable config.
std::unique_ptr<World> buildWorld(const ScenarioSpec& spec,
                                  const core::CVarRegistry& cvars,
                                  std::string* outError = nullptr);

} // namespace seasafe::sim
