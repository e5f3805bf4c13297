#include <kartsim/surface.hpp>

namespace kartsim {

SurfaceSample aggregate_surface(const WheelContacts& wheels, const Vec3& kart_position) {
  SurfaceSample out;
  Vec3 normal_sum{};
  Vec3 offset_sum{};
  double friction_sum = 0.0;
  double speed_sum = 0.0;
  double handling_sum = 0.0;

  for (const auto& w : wheels) {
    if (!w.grounded || !w.surface) continue;
    ++out.grounded_wheels;
    if (w.surface->offroad) ++out.offroad_wheels;
    normal_sum += w.normal;
    offset_sum += w.point - kart_position;
    friction_sum += w.surface->friction;
    speed_sum += w.surface->speed;
    handling_sum += w.surface->handling;
  }

  const double denom = double(out.grounded_wheels + 1);
  out.normal = normal_sum / denom;
  out.point = kart_position + offset_sum / denom;
  out.friction = friction_sum / double(kWheelCount);
  out.speed = speed_sum / denom;
  out.handling = handling_sum / denom;
  return out;
}

void apply_surface(VehicleState& v, const SurfaceSample& s, double dt) {
  v.grounded_wheels = s.grounded_wheels;
  v.offroad_wheels = s.offroad_wheels;
  v.ground_normal = s.normal;
  v.ground_point = s.point;
  v.friction_multiplier = s.friction;
  v.speed_multiplier = s.speed;
  v.handling_multiplier = s.handling;
  if (s.grounded_wheels <= 1) v.air_time += dt;
  else v.air_time = 0.0;
}

} // namespace kartsim
