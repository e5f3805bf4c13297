#pragma once
#include <kartsim/math.hpp>
#include <kartsim/vehicle.hpp>
#include <kartsim/wheel_sensor.hpp>

namespace kartsim {

struct SurfaceSample {
  int grounded_wheels = 0;
  int offroad_wheels = 0;
  Vec3 normal{};      // sum over grounded wheels / (grounded + 1)
  Vec3 point{};       // kart position + mean offset, same denominator
  double friction = 0.0;  // sum over grounded wheels / kWheelCount
  double speed = 0.0;     // sum over grounded wheels / (grounded + 1)
  double handling = 0.0;  // sum over grounded wheels / (grounded + 1)
};

// Reduces the four wheel contacts. The uneven denominators are part of the
// tuned handling and must not be unified.
SurfaceSample aggregate_surface(const WheelContacts& wheels, const Vec3& kart_position);

// Writes counts and multipliers into the vehicle and advances air time:
// += dt while at most one wheel is down, reset to 0 otherwise.
void apply_surface(VehicleState& v, const SurfaceSample& s, double dt);

} // namespace kartsim
