#pragma once
#include <kartsim/math.hpp>
#include <kartsim/tuning.hpp>
#include <kartsim/wheel_sensor.hpp>

namespace kartsim {

// Mutable physical state of one kart.
struct VehicleState {
  Vec3 position{};
  Quat rotation{};
  Vec3 velocity{};
  Vec3 external_force{};   // accumulated during a tick, consumed and zeroed by the integrator

  WheelContacts wheels{};
  int grounded_wheels = 0;
  int offroad_wheels = 0;
  double air_time = 0.0;

  double friction_multiplier = 1.0;
  double speed_multiplier = 1.0;
  double handling_multiplier = 1.0;
  Vec3 ground_normal{};    // averaged, not normalized
  Vec3 ground_point{};

  Vec3 compensation{};     // collision push-out from the previous tick
  double sideways_speed_sq = 0.0;

  // Gameplay thresholds: more than one wheel down; all wheels offroad.
  bool grounded() const { return grounded_wheels > 1; }
  bool offroad() const { return offroad_wheels == static_cast<int>(kWheelCount); }
};

} // namespace kartsim
