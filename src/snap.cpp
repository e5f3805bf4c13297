#include <kartsim/snap.hpp>
#include <cmath>
#include <kartsim/world.hpp>

namespace kartsim {

SimSnapshot make_snapshot(const KartWorld& world) {
  SimSnapshot s;
  s.tick = world.tick();
  s.sim_time = world.sim_time();
  s.checksum = world.checksum();
  s.events = world.events();

  s.karts.reserve(world.kart_count());
  for (std::size_t i = 0; i < world.kart_count(); ++i) {
    const Kart* k = world.kart_by_index(i);
    const VehicleState& v = k->vehicle;
    const Vec3 f = v.rotation.forward();

    KartPose p;
    p.id = k->id;
    p.position = v.position;
    // View only; the simulation never reads this back.
    p.heading_rad = std::atan2(f.x, f.z);
    p.speed_mps = length(v.velocity);
    p.drift_direction = k->drift.direction;
    p.drift_level = k->drift_boost.level;
    p.drift_feedback = k->drift_boost.feedback;
    p.boost_active = k->boost.is_active();
    p.boost_remaining_s = k->boost.remaining;
    p.grounded_wheels = v.grounded_wheels;
    p.offroad = v.offroad();
    p.air_time = v.air_time;
    s.karts.push_back(p);
  }
  return s;
}

} // namespace kartsim
