#include "seasafe/sim/Vessel.h"

#include "seasafe/math/Math.h"

#include <algorithm>
#include <cmath>

namespace seasafe::sim {

std::string_view toString(Status s) {
  switch (s) {
    case Status::Green: return "Green";
    case Status::Orange: return "Orange";
    case Status::Red: return "Red";
  }
  return "?";
}

std::string_view toString(Scenario s) {
  switch (s) {
    case Scenario::None: return "none";
    case Scenario::HeadOn: return "head-on";
    case Scenario::Crossing: return "crossing";
    case Scenario::Overtaking: return "overtaking";
    case Scenario::Unknown: return "unknown";
  }
  return "?";
}

std::string_view toString(Role r) {
  switch (r) {
    case Role::None: return "none";
    case Role::GiveWay: return "give-way";
    case Role::StandOn: return "stand-on";
    case Role::Unknown: return "unknown";
  }
  return "?";
}

Vessel::Vessel(int id, const math::Vec2d& sourceNm, const math::Vec2d& destinationNm, double maxSpeedKn)
  : id_(id),
    posNm_(sourceNm),
    sourceNm_(sourceNm),
    destNm_(destinationNm),
    maxSpeedKn_(std::max(0.0, maxSpeedKn)) {
  speedKn_ = maxSpeedKn_;

  const math::Vec2d toDest = destNm_ - posNm_;
  if (toDest.length() > 1e-6) {
    dir_ = toDest.normalized();
    headingDeg_ = math::unitToHeading(dir_);
  }
}

void Vessel::setHeadingDeg(double deg) {
  headingDeg_ = math::wrapDeg360(deg);
  dir_ = math::headingToUnit(headingDeg_);
}

void Vessel::setSpeedKn(double kn) {
  speedKn_ = math::clamp(kn, 0.0, maxSpeedKn_);
}

bool Vessel::atDestination() const {
  return math::distance(destNm_, posNm_) <= kOnDestinationNm;
}

bool Vessel::isUnderway() const {
  return speedKn_ > 1e-9 && dir_.lengthSq() > 1e-12 && !atDestination();
}

void Vessel::setStatus(Status s) {
  status_ = s;
  inDanger_ = (s != Status::Green);
}

void Vessel::engageAvoidance(const std::vector<int>& counterpartIds) {
  avoiding_ = true;
  for (int id : counterpartIds) {
    if (id == id_) continue;
    if (std::find(avoidingWith_.begin(), avoidingWith_.end(), id) == avoidingWith_.end()) {
      avoidingWith_.push_back(id);
    }
  }
}

void Vessel::releaseAvoidance() {
  avoiding_ = false;
  avoidingWith_.clear();
}

} // namespace seasafe::sim
