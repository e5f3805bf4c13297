#pragma once
#include <kartsim/boost.hpp>
#include <kartsim/events.hpp>
#include <kartsim/input.hpp>
#include <kartsim/tuning.hpp>
#include <kartsim/vehicle.hpp>

namespace kartsim {

struct DriftState {
  DriftTuning tuning{};
  int direction = 0;              // -1, +1; 0 = not drifting
  double no_steer_time = 0.0;
  double opposite_steer_time = 0.0;
  double steering_offset = 0.0;   // read by the integrator's yaw step

  bool drifting() const { return direction != 0; }
};

struct DriftBoostState {
  DriftBoostTuning tuning{};
  double duration = 0.0;  // of the current drift
  int level = 0;          // highest threshold index crossed, never decreases mid-drift
  double feedback = 0.0;  // 1 on charge, decays to 0
};

bool can_start_drift(const DriftState& d, const VehicleState& v, const KartInput& in);
bool should_end_drift(const DriftState& d, const VehicleState& v, const KartInput& in);

// One tick of the drift state machine. While drifting, writes the steering
// offset and adds the slide force into v.external_force; on end, grants the
// charged boost into `boost`.
void update_drift(DriftState& d, DriftBoostState& db, BoostState& boost, VehicleState& v,
                  const KartInput& in, double dt, const EventWriter& events);

// Ends the current drift. With grant_boost false the charge is discarded.
void end_drift(DriftState& d, DriftBoostState& db, BoostState& boost, bool grant_boost,
               const EventWriter& events);

} // namespace kartsim
