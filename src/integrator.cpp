#include <kartsim/integrator.hpp>
#include <algorithm>
#include <cmath>

namespace kartsim {

// Ground tilt beyond the limit is pulled back toward world up.
static Vec3 clamp_tilt_(const Vec3& ground_normal, double max_tilt_deg) {
  Vec3 n = normalized(ground_normal);
  if (length_sq(n) <= kZeroLengthSq) return kWorldUp;
  const double tilt = detmath::acos(std::clamp(dot(n, kWorldUp), -1.0, 1.0));
  const double limit = max_tilt_deg * kDegToRad;
  if (tilt > limit) {
    const double t = 1.0 - limit / tilt;
    n = normalized(lerp(n, kWorldUp, t));
  }
  return n;
}

double sideways_speed_sq(const VehicleState& v) {
  const double side = dot(v.velocity, v.rotation.right());
  return side * side;
}

void integrate_vehicle(VehicleState& v, const KartStats& stats, const KartInput& in,
                       const IntegratorContext& ctx, double dt) {
  // 1. surface data was applied by the caller
  const bool grounded = v.grounded();

  // 2. previous push-out now, this tick's for the next one
  const Vec3 compensation = v.compensation;
  v.compensation = ctx.collision.compensation;

  // 3.
  const Vec3 clamped_normal = clamp_tilt_(v.ground_normal, stats.max_tilt_angle);

  // 4.
  Vec3 candidate = v.position + compensation + v.velocity * dt;
  const Vec3 right = v.rotation.right();

  // 5. / 6.
  Vec3 up;
  if (grounded) {
    // Snap against the raw averaged plane; only the alignment uses the clamped normal.
    const Vec3 plane_n = normalized(v.ground_normal);
    const double dist = dot(candidate - v.ground_point, plane_n);
    if (dist < stats.ground_distance) {
      const double toward = dot(v.velocity, plane_n);
      if (toward < 0.0) v.velocity -= plane_n * toward;
      candidate += plane_n * (stats.ground_distance - dist);
    }
    up = clamped_normal;
  } else {
    up = normalized(lerp(v.rotation.up(), kWorldUp, clamp01(stats.rotation_correction_rate * dt)));
  }
  const Vec3 target_forward = cross(right, up);

  // 7.
  Quat rotation = v.rotation;
  if (auto target = look_rotation(target_forward, up)) {
    const double angle_deg = angle_between(rotation, *target) * kRadToDeg;
    const double smoothing = clamp01(angle_deg / stats.rotation_smoothing_threshold);
    const double wheel_factor = 0.25 + 0.75 * double(v.grounded_wheels) / double(kWheelCount);
    rotation = slerp(rotation, *target, 0.5 * smoothing * wheel_factor);
  }

  // Curves are sampled at one speed for the whole tick.
  const double normalized_speed = length(v.velocity) / stats.max_speed;

  // 8.
  if (std::abs(in.steering) > kSteerDeadzone) {
    const double steer = in.steering + ctx.steering_offset;
    const double turning = stats.turning.evaluate(ctx.drifting ? 1.0 : normalized_speed);
    const double direction = sign(dot(v.velocity, rotation.forward()));
    const double yaw = steer * v.handling_multiplier * direction * turning * kDegToRad * dt;
    rotation = normalized(Quat::from_axis_angle(rotation.up(), yaw) * rotation);
  }

  // 9.
  v.position = candidate;
  v.rotation = rotation;
  const Vec3 forward = rotation.forward();
  const Vec3 kart_right = rotation.right();
  v.sideways_speed_sq = sideways_speed_sq(v);

  // 10.
  if (grounded) {
    const double accel = stats.acceleration.evaluate(normalized_speed) * v.speed_multiplier
                       + ctx.boost_accel_bonus;
    const double throttle = std::clamp(in.throttle, stats.min_throttle, 1.0);
    v.velocity += forward * (accel * throttle * dt);
  }

  // 11.
  v.velocity += v.external_force * dt;
  v.external_force = Vec3{};

  // 12.
  const double gravity = grounded ? stats.gravity * 0.1 : stats.gravity;
  v.velocity -= up * (gravity * dt);

  // 13.
  if (grounded) {
    const double lateral = dot(v.velocity, kart_right);
    v.velocity -= kart_right * (lateral * v.friction_multiplier * stats.friction.evaluate(normalized_speed));
  }

  // 14.
  const double drag = grounded ? stats.drag : stats.drag * 0.1;
  v.velocity -= v.velocity * (drag * dt);

  // 15.
  const double cap = stats.max_speed + ctx.boost_max_speed_bonus;
  v.velocity = move_towards(v.velocity, clamp_magnitude(v.velocity, cap), stats.soft_clamp_step);
}

} // namespace kartsim
