#pragma once
#include <cstdint>
#include <vector>
#include <kartsim/events.hpp>
#include <kartsim/math.hpp>

namespace kartsim {

class KartWorld;

// Per-kart view state; everything a renderer or HUD needs.
struct KartPose {
  KartId id = 0;
  Vec3 position{};
  double heading_rad = 0.0;   // 0 faces +z, positive toward +x
  double speed_mps = 0.0;
  int drift_direction = 0;
  int drift_level = 0;
  double drift_feedback = 0.0;
  bool boost_active = false;
  double boost_remaining_s = 0.0;
  int grounded_wheels = 0;
  bool offroad = false;
  double air_time = 0.0;
};

// Immutable sample of the world for the client.
struct SimSnapshot {
  std::uint64_t tick = 0;
  double sim_time = 0.0;
  std::uint64_t checksum = 0;
  std::vector<KartPose> karts;
  std::vector<KartEvent> events;  // emitted by this tick
};

SimSnapshot make_snapshot(const KartWorld& world);

} // namespace kartsim
