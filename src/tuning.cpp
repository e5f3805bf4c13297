#include <kartsim/tuning.hpp>
#include <cmath>

namespace kartsim {

static bool finite_nonneg(double v) { return std::isfinite(v) && v >= 0.0; }
static bool finite_pos(double v)    { return std::isfinite(v) && v > 0.0; }

static std::optional<std::string> validate_curve(const ResponseCurve& c, const char* name) {
  if (c.empty()) return std::string(name) + " curve has no keys";
  for (const auto& k : c.keys()) {
    if (!std::isfinite(k.x) || !std::isfinite(k.y)) {
      return std::string(name) + " curve has a non-finite key";
    }
  }
  return std::nullopt;
}

std::optional<std::string> validate_surface(const SurfaceDefinition& s) {
  if (s.key.empty()) return std::string("surface key is empty");
  if (!finite_nonneg(s.friction))  return "surface '" + s.key + "': friction must be >= 0";
  if (!finite_nonneg(s.speed))     return "surface '" + s.key + "': speed must be >= 0";
  if (!finite_nonneg(s.handling))  return "surface '" + s.key + "': handling must be >= 0";
  return std::nullopt;
}

std::optional<std::string> validate_boost(const BoostConfig& b) {
  if (b.key.empty()) return std::string("boost key is empty");
  if (!finite_pos(b.duration_s))         return "boost '" + b.key + "': duration must be > 0";
  if (!finite_nonneg(b.accel_bonus))     return "boost '" + b.key + "': accel_bonus must be >= 0";
  if (!finite_nonneg(b.max_speed_bonus)) return "boost '" + b.key + "': max_speed_bonus must be >= 0";
  return std::nullopt;
}

std::optional<std::string> validate_stats(const KartStats& s) {
  const std::string who = "stats '" + s.key + "': ";
  if (s.key.empty()) return std::string("stats key is empty");

  if (auto e = validate_curve(s.acceleration, "acceleration")) return who + *e;
  if (auto e = validate_curve(s.turning, "turning"))           return who + *e;
  if (auto e = validate_curve(s.friction, "friction"))         return who + *e;

  if (!finite_pos(s.max_speed)) return who + "max_speed must be > 0";
  if (!std::isfinite(s.min_throttle) || s.min_throttle < -1.0 || s.min_throttle > 1.0) {
    return who + "min_throttle must be in [-1, 1]";
  }
  if (!finite_nonneg(s.gravity))                  return who + "gravity must be >= 0";
  if (!finite_nonneg(s.drag))                     return who + "drag must be >= 0";
  if (!finite_nonneg(s.rotation_correction_rate)) return who + "rotation_correction_rate must be >= 0";
  if (!finite_pos(s.rotation_smoothing_threshold)) return who + "rotation_smoothing_threshold must be > 0";
  if (!finite_pos(s.max_tilt_angle) || s.max_tilt_angle > 90.0) {
    return who + "max_tilt_angle must be in (0, 90]";
  }
  if (!finite_pos(s.ground_distance))   return who + "ground_distance must be > 0";
  if (!finite_pos(s.soft_clamp_step))   return who + "soft_clamp_step must be > 0";
  if (!finite_pos(s.collision_radius))  return who + "collision_radius must be > 0";
  if (!finite_nonneg(s.suspension_travel)) return who + "suspension_travel must be >= 0";
  if (!finite_pos(s.suspension_length))    return who + "suspension_length must be > 0";

  const DriftTuning& d = s.drift;
  if (!finite_nonneg(d.side_acceleration) || !finite_nonneg(d.max_steering_offset) ||
      !finite_nonneg(d.min_speed) || !finite_nonneg(d.min_sideways_speed) ||
      !finite_nonneg(d.max_air_time) || !finite_nonneg(d.max_no_steer_time) ||
      !finite_nonneg(d.max_opposite_steer_time)) {
    return who + "drift parameters must be finite and >= 0";
  }
  if (!std::isfinite(d.forward_factor) || d.forward_factor < 0.0 || d.forward_factor > 1.0) {
    return who + "drift forward_factor must be in [0, 1]";
  }

  const DriftBoostTuning& db = s.drift_boost;
  double prev = 0.0;
  for (std::size_t i = 0; i < kDriftBoostLevels; ++i) {
    if (!finite_pos(db.thresholds_s[i]) || db.thresholds_s[i] <= prev) {
      return who + "drift boost thresholds must be positive and strictly ascending";
    }
    prev = db.thresholds_s[i];
    if (auto e = validate_boost(db.boosts[i])) return who + "drift boost: " + *e;
  }
  if (!finite_nonneg(db.feedback_decay)) return who + "drift boost feedback_decay must be >= 0";

  return std::nullopt;
}

} // namespace kartsim
