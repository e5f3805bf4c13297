#pragma once

namespace kartsim {

// Steering at or below this magnitude counts as "no steering".
inline constexpr double kSteerDeadzone = 0.05;

// Already-sampled per-tick control record. Values are assumed sanitized.
struct KartInput {
  double throttle = 0.0;          // [-1, 1]
  double steering = 0.0;          // [-1, 1], positive steers right
  bool drift_pressed = false;     // edge: pressed this tick
  bool drift_held = false;
  bool powerup_pressed = false;   // edge; consumed by the weapons layer, not the core
  bool respawn_requested = false;
};

} // namespace kartsim
