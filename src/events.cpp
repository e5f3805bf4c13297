#include <kartsim/events.hpp>

namespace kartsim {

const char* event_name(KartEventType type) {
  switch (type) {
    case KartEventType::BoostStarted:      return "boost-started";
    case KartEventType::DriftBoostCharged: return "drift-boost-charged";
    case KartEventType::DriftBoostApplied: return "drift-boost-applied";
  }
  return "unknown";
}

std::string describe(const KartEvent& e) {
  std::string s = "kart " + std::to_string(e.kart) + " " + event_name(e.type);
  if (e.type != KartEventType::BoostStarted) s += " level " + std::to_string(e.level);
  return s;
}

} // namespace kartsim
