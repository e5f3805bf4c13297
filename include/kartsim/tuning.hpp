#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <kartsim/curve.hpp>
#include <kartsim/math.hpp>

namespace kartsim {

inline constexpr std::size_t kWheelCount = 4;
inline constexpr std::size_t kDriftBoostLevels = 3;

using SurfaceId = std::uint16_t;

struct SurfaceDefinition {
  std::string key;        // e.g., "asphalt"
  double friction = 1.0;  // lateral grip multiplier
  double speed = 1.0;     // acceleration multiplier
  double handling = 1.0;  // steering multiplier
  bool offroad = false;
};

struct BoostConfig {
  std::string key;               // e.g., "mini"
  double duration_s = 0.0;
  double accel_bonus = 0.0;      // m/s^2 added to forward acceleration
  double max_speed_bonus = 0.0;  // m/s added to the soft speed cap
};

struct DriftTuning {
  double side_acceleration = 0.0;      // m/s^2
  double forward_factor = 0.0;         // 0 = pure sideways push, 1 = pure forward
  double max_steering_offset = 0.0;    // added to steering input while drifting
  double min_speed = 0.0;              // m/s
  double min_sideways_speed = 0.0;     // m/s, below this the drift may lapse
  double max_air_time = 0.0;           // s
  double max_no_steer_time = 0.0;      // s
  double max_opposite_steer_time = 0.0;// s
};

struct DriftBoostTuning {
  std::array<double, kDriftBoostLevels> thresholds_s{};  // ascending
  std::array<BoostConfig, kDriftBoostLevels> boosts{};
  double feedback_decay = 0.0;  // per second
};

// Static per-kart tuning. Angles in degrees, distances in meters.
struct KartStats {
  std::string key;

  ResponseCurve acceleration;   // m/s^2 over normalized speed
  ResponseCurve turning;        // deg/s over normalized speed
  ResponseCurve friction;       // fraction of lateral velocity removed per tick

  double max_speed = 0.0;
  double min_throttle = 0.0;
  double gravity = 0.0;
  double drag = 0.0;
  double rotation_correction_rate = 0.0;      // 1/s, airborne up-vector recovery
  double rotation_smoothing_threshold = 0.0;  // deg
  double max_tilt_angle = 0.0;                // deg
  double ground_distance = 0.0;
  double soft_clamp_step = 0.0;               // m/s per tick

  double collision_radius = 0.0;
  Vec3 collision_offset{};

  std::array<Vec3, kWheelCount> wheel_offsets{};  // FL, FR, RL, RR (kart local)
  double suspension_travel = 0.0;
  double suspension_length = 0.0;

  DriftTuning drift{};
  DriftBoostTuning drift_boost{};
};

// nullopt when valid, otherwise a description of the first problem found.
std::optional<std::string> validate_surface(const SurfaceDefinition& s);
std::optional<std::string> validate_boost(const BoostConfig& b);
std::optional<std::string> validate_stats(const KartStats& s);

} // namespace kartsim
