#include <kartsim/drift.hpp>
#include <algorithm>
#include <cmath>

namespace kartsim {

static int steer_sign(double steering) {
  if (std::abs(steering) <= kSteerDeadzone) return 0;
  return steering > 0.0 ? 1 : -1;
}

bool can_start_drift(const DriftState& d, const VehicleState& v, const KartInput& in) {
  const int desired = steer_sign(in.steering);
  if (desired == 0) return false;
  if (desired == d.direction) return false;
  if (!in.drift_pressed) return false;
  if (v.air_time > d.tuning.max_air_time) return false;
  if (length_sq(v.velocity) < d.tuning.min_speed * d.tuning.min_speed) return false;
  if (v.offroad()) return false;
  return true;
}

bool should_end_drift(const DriftState& d, const VehicleState& v, const KartInput& in) {
  const DriftTuning& t = d.tuning;
  if (v.offroad()) return true;
  if (in.drift_pressed) return true;
  if (v.air_time > t.max_air_time) return true;
  if (length_sq(v.velocity) < t.min_speed * t.min_speed) return true;
  if (v.sideways_speed_sq < t.min_sideways_speed * t.min_sideways_speed &&
      d.no_steer_time > t.max_no_steer_time) {
    return true;
  }
  if (steer_sign(in.steering) == -d.direction && d.opposite_steer_time > t.max_opposite_steer_time) {
    return true;
  }
  return false;
}

void end_drift(DriftState& d, DriftBoostState& db, BoostState& boost, bool grant_boost,
               const EventWriter& events) {
  if (grant_boost && db.level > 0) {
    start_boost(boost, db.tuning.boosts[static_cast<std::size_t>(db.level - 1)], events);
    events.emit(KartEventType::DriftBoostApplied, db.level);
  }
  d.direction = 0;
  d.no_steer_time = 0.0;
  d.opposite_steer_time = 0.0;
  d.steering_offset = 0.0;
  db.duration = 0.0;
  db.level = 0;
}

static void start_drift_(DriftState& d, DriftBoostState& db, int direction) {
  d.direction = direction;
  d.no_steer_time = 0.0;
  d.opposite_steer_time = 0.0;
  db.duration = 0.0;
  db.level = 0;
}

void update_drift(DriftState& d, DriftBoostState& db, BoostState& boost, VehicleState& v,
                  const KartInput& in, double dt, const EventWriter& events) {
  db.feedback = std::max(0.0, db.feedback - db.tuning.feedback_decay * dt);

  if (d.drifting()) {
    const int s = steer_sign(in.steering);
    d.no_steer_time = s == 0 ? d.no_steer_time + dt : 0.0;
    d.opposite_steer_time = (s != 0 && s == -d.direction) ? d.opposite_steer_time + dt : 0.0;
    if (should_end_drift(d, v, in)) end_drift(d, db, boost, true, events);
  } else if (can_start_drift(d, v, in)) {
    start_drift_(d, db, steer_sign(in.steering));
  }

  if (!d.drifting()) {
    d.steering_offset = 0.0;
    return;
  }

  const double dir = double(d.direction);
  d.steering_offset = d.tuning.max_steering_offset * dir;

  const Vec3 side = v.rotation.right() * -dir;
  const Vec3 push = normalized(lerp(side, v.rotation.forward(), d.tuning.forward_factor));
  v.external_force += push * (d.tuning.side_acceleration * in.throttle);

  db.duration += dt;
  for (std::size_t i = 0; i < kDriftBoostLevels; ++i) {
    const int idx = static_cast<int>(i);
    if (db.duration >= db.tuning.thresholds_s[i] && idx > db.level) {
      db.level = idx;
      db.feedback = 1.0;
      events.emit(KartEventType::DriftBoostCharged, db.level);
    }
  }
}

} // namespace kartsim
