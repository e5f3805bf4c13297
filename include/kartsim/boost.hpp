#pragma once
#include <optional>
#include <kartsim/events.hpp>
#include <kartsim/tuning.hpp>

namespace kartsim {

// At most one boost; a new one replaces the old outright.
struct BoostState {
  std::optional<BoostConfig> active;
  double remaining = 0.0;

  bool is_active() const { return active.has_value(); }
  double accel_bonus() const { return active ? active->accel_bonus : 0.0; }
  double max_speed_bonus() const { return active ? active->max_speed_bonus : 0.0; }
};

void start_boost(BoostState& b, const BoostConfig& config, const EventWriter& events);
void update_boost(BoostState& b, double dt);
void interrupt_boost(BoostState& b);

} // namespace kartsim
