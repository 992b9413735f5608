#pragma once

#include "seasafe/math/Vec2.h"

#include <string_view>
#include <vector>

namespace seasafe::sim {

// Proximity status of a vessel, ordered by severity.
enum class Status : int {
  Green  = 0, // clear
  Orange = 1, // a sampled future position violates the collision distance
  Red    = 2, // the collision distance is violated now
};

enum class Scenario : int {
  None = 0,
  HeadOn,
  Crossing,
  Overtaking,
  Unknown,
};

enum class Role : int {
  None = 0,
  GiveWay,
  StandOn,
  Unknown,
};

std::string_view toString(Status s);
std::string_view toString(Scenario s);
std::string_view toString(Role r);

// Closer than this to the destination counts as on it (NM).
constexpr double kOnDestinationNm = 1e-6;

inline Status moreSevere(Status a, Status b) {
  return (static_cast<int>(a) >= static_cast<int>(b)) ? a : b;
}

// A vessel on the nautical plane.
//
// Units:
//   - position: NM
//   - heading: degrees in [0, 360), atan2 convention (0 = +x, counter-clockwise)
//   - speed: knots
//
// Setters keep the invariants: speed in [0, maxSpeed], heading wrapped, direction
// equal to the unit vector of the heading, and inDanger() == (status != Green).
// A vessel created with source == destination has a zero direction and heading 0
// until a heading is explicitly set. A vessel sitting on its destination never
// moves, whatever its heading and speed say.
class Vessel {
public:
  Vessel() = default;
  Vessel(int id, const math::Vec2d& sourceNm, const math::Vec2d& destinationNm, double maxSpeedKn);

  int id() const { return id_; }

  // Kinematics
  math::Vec2d positionNm() const { return posNm_; }
  math::Vec2d sourceNm() const { return sourceNm_; }
  math::Vec2d destinationNm() const { return destNm_; }
  math::Vec2d direction() const { return dir_; }
  double headingDeg() const { return headingDeg_; }
  double speedKn() const { return speedKn_; }
  double maxSpeedKn() const { return maxSpeedKn_; }

  void setPositionNm(const math::Vec2d& p) { posNm_ = p; }
  void setHeadingDeg(double deg);
  void setSpeedKn(double kn);

  bool atDestination() const;

  // True when the vessel would actually move under advance().
  bool isUnderway() const;

  // Speed over ground: 0 for a vessel that is not underway.
  double underwaySpeedKn() const { return isUnderway() ? speedKn_ : 0.0; }

  // COLREGS annotations
  Status status() const { return status_; }
  bool inDanger() const { return inDanger_; }
  Scenario scenario() const { return scenario_; }
  Role role() const { return role_; }

  void setStatus(Status s);
  void setScenario(Scenario s) { scenario_ = s; }
  void setRole(Role r) { role_ = r; }

  // Avoidance bookkeeping.
  //
  // Clear  --engage-->  Avoiding  --release-->  Clear
  //
  // While Avoiding, the ids of the counterpart vessels of the triggering
  // encounter(s) are kept; the vessel may only be released once every one of
  // those pairs is clear over the full look-ahead.
  bool isAvoiding() const { return avoiding_; }
  const std::vector<int>& avoidingWith() const { return avoidingWith_; }

  void engageAvoidance(const std::vector<int>& counterpartIds);
  void releaseAvoidance();

private:
  int id_{-1};

  math::Vec2d posNm_{0, 0};
  math::Vec2d sourceNm_{0, 0};
  math::Vec2d destNm_{0, 0};
  math::Vec2d dir_{0, 0};
  double headingDeg_{0.0};
  double speedKn_{0.0};
  double maxSpeedKn_{0.0};

  Status status_{Status::Green};
  bool inDanger_{false};
  Scenario scenario_{Scenario::None};
  Role role_{Role::None};

  bool avoiding_{false};
  std::vector<int> avoidingWith_;
};

} // namespace seasafe::sim
