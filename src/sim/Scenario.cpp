#include "seasafe/sim/Scenario.h"

#include "seasafe/core/CVar.h"
#include "seasafe/core/Log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace seasafe::sim {

static std::string_view trimView(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static bool parseNumber(std::string_view text, double& out) {
  const std::string s(trimView(text));
  if (s.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return false;
  out = v;
  return true;
}

static std::vector<std::string_view> splitWords(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
    const std::size_t start = i;
    while (i < s.size() && !std::isspace((unsigned char)s[i])) ++i;
    if (i > start) out.push_back(s.substr(start, i - start));
  }
  return out;
}

bool parseCoordinate(std::string_view text, math::Vec2d& out) {
  const std::size_t comma = text.find(',');
  if (comma == std::string_view::npos) return false;
  if (text.find(',', comma + 1) != std::string_view::npos) return false;

  double x = 0.0;
  double y = 0.0;
  if (!parseNumber(text.substr(0, comma), x)) return false;
  if (!parseNumber(text.substr(comma + 1), y)) return false;
  out = {x, y};
  return true;
}

bool addVesselFromStrings(ScenarioSpec& spec,
                          std::string_view source,
                          std::string_view destination,
                          double maxSpeedKn,
                          std::string* outError) {
  VesselSpec v{};
  if (!parseCoordinate(source, v.sourceNm)) {
    if (outError) *outError = "Bad source coordinate '" + std::string(source) + "' (expected x,y)";
    return false;
  }
  if (!parseCoordinate(destination, v.destinationNm)) {
    if (outError) *outError = "Bad destination coordinate '" + std::string(destination) + "' (expected x,y)";
    return false;
  }
  v.maxSpeedKn = maxSpeedKn;
  spec.vessels.push_back(v);
  return true;
}

static bool applyShipLine(std::string_view line, ScenarioSpec& spec, std::string* outError) {
  const auto words = splitWords(line);
  if (words.size() < 3 || words.size() > 4) {
    if (outError) *outError = "ship expects <sx,sy> <dx,dy> [max_speed_kn]";
    return false;
  }

  double speed = -1.0;
  if (words.size() == 4) {
    if (!parseNumber(words[3], speed) || speed < 0.0) {
      if (outError) *outError = "Bad max speed '" + std::string(words[3]) + "'";
      return false;
    }
  }
  return addVesselFromStrings(spec, words[1], words[2], speed, outError);
}

bool loadScenarioText(std::string_view text,
                      core::CVarRegistry& cvars,
                      ScenarioSpec& spec,
                      std::string* outError,
                      std::string_view sourceName) {
  bool hadErrors = false;
  std::ostringstream errs;

  int lineNo = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    std::size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) nl = text.size();
    const std::string_view raw = text.substr(pos, nl - pos);
    pos = nl + 1;
    ++lineNo;

    std::string_view line = trimView(raw);
    const std::size_t hash = line.find('#');
    if (hash != std::string_view::npos) line = trimView(line.substr(0, hash));
    if (line.empty()) continue;

    const auto words = splitWords(line);
    if (words.front() == "ship") {
      std::string err;
      if (!applyShipLine(line, spec, &err)) {
        std::ostringstream oss;
        oss << "[scenario] " << sourceName << ":" << lineNo << ": skipping ship: " << err;
        SEASAFE_LOG_WARN(oss.str());
      }
      continue;
    }

    std::string err;
    if (!cvars.applyLine(line, &err)) {
      hadErrors = true;
      errs << sourceName << ":" << lineNo << ": " << err << "\n";
    }
  }

  if (hadErrors && outError) *outError = errs.str();
  return !hadErrors;
}

bool loadScenarioFile(const std::string& path,
                      core::CVarRegistry& cvars,
                      ScenarioSpec& spec,
                      std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open scenario file: " + path;
    return false;
  }

  std::ostringstream buf;
  buf << in.rdbuf();

  if (spec.name.empty()) {
    const std::size_t slash = path.find_last_of("/\\");
    spec.name = (slash == std::string::npos) ? path : path.substr(slash + 1);
  }

  return loadScenarioText(buf.str(), cvars, spec, outError, path);
}

std::unique_ptr<World> buildWorld(const ScenarioSpec& spec,
                                  const core::CVarRegistry& cvars,
                                  std::string* outError) {
  const double defaultSpeed = cvars.getFloat("sim.max_speed_kn", 20.0);

  double fastest = 0.0;
  for (const VesselSpec& v : spec.vessels) {
    fastest = std::max(fastest, (v.maxSpeedKn < 0.0) ? defaultSpeed : v.maxSpeedKn);
  }

  const EngineConfig cfg = engineConfigFromCVars(cvars, fastest);
  if (!validateEngineConfig(cfg, outError)) return nullptr;

  const std::string strategyName = cvars.getString("sim.strategy", "reactive");
  auto strategy = makeStrategy(strategyName);
  if (!strategy) {
    if (outError) *outError = "Unknown strategy '" + strategyName + "' (expected reactive | backtracking)";
    return nullptr;
  }

  auto world = std::make_unique<World>(cfg, std::move(strategy));
  for (const VesselSpec& v : spec.vessels) {
    world->addVessel(v.sourceNm, v.destinationNm, (v.maxSpeedKn < 0.0) ? defaultSpeed : v.maxSpeedKn);
  }

  std::ostringstream oss;
  oss << "[scenario] " << (spec.name.empty() ? "<unnamed>" : spec.name) << ": " << spec.vessels.size()
      << " vessel(s), strategy=" << world->strategy().name() << ", horizon " << cfg.horizonNm << "nm/"
      << cfg.horizonSteps << " steps, collision distance " << cfg.collisionDistanceNm() << "nm";
  SEASAFE_LOG_INFO(oss.str());
  return world;
}

} // namespace seasafe::sim
