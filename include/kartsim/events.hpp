#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace kartsim {

using KartId = std::uint32_t;

enum class KartEventType : std::uint8_t {
  BoostStarted,
  DriftBoostCharged,
  DriftBoostApplied,
};

// Fire-and-forget notification for view/race/AI layers.
struct KartEvent {
  KartEventType type = KartEventType::BoostStarted;
  KartId kart = 0;
  int level = 0;  // drift-boost events only
};

const char* event_name(KartEventType type);
std::string describe(const KartEvent& e);  // e.g. "kart 2 drift-boost-charged level 1"

// Appends events for one kart; a null list drops them.
struct EventWriter {
  KartId kart = 0;
  std::vector<KartEvent>* out = nullptr;

  void emit(KartEventType type, int level = 0) const {
    if (out) out->push_back(KartEvent{type, kart, level});
  }
};

} // namespace kartsim
