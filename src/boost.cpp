#include <kartsim/boost.hpp>

namespace kartsim {

void start_boost(BoostState& b, const BoostConfig& config, const EventWriter& events) {
  b.active = config;
  b.remaining = config.duration_s;
  events.emit(KartEventType::BoostStarted);
}

void update_boost(BoostState& b, double dt) {
  if (!b.active) return;
  b.remaining -= dt;
  if (b.remaining <= 0.0) interrupt_boost(b);
}

void interrupt_boost(BoostState& b) {
  b.active.reset();
  b.remaining = 0.0;
}

} // namespace kartsim
