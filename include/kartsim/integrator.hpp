#pragma once
#include <kartsim/collision.hpp>
#include <kartsim/input.hpp>
#include <kartsim/tuning.hpp>
#include <kartsim/vehicle.hpp>

namespace kartsim {

// Everything the integrator consumes from the earlier stages of the tick.
struct IntegratorContext {
  CollisionResult collision{};      // this tick; its compensation is applied next tick
  double steering_offset = 0.0;     // drift bias
  bool drifting = false;
  double boost_accel_bonus = 0.0;
  double boost_max_speed_bonus = 0.0;
};

// Advances one kart by dt. Surface data (counts, multipliers, averaged
// ground, air time) must already be applied to `v` for this tick.
void integrate_vehicle(VehicleState& v, const KartStats& stats, const KartInput& in,
                       const IntegratorContext& ctx, double dt);

// Squared length along the kart's right axis.
double sideways_speed_sq(const VehicleState& v);

} // namespace kartsim
