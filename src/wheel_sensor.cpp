#include <kartsim/wheel_sensor.hpp>

namespace kartsim {

WheelContacts sense_wheels(const Arena& arena, const Vec3& position, const Quat& rotation,
                           const KartStats& stats) {
  WheelContacts out{};
  const Vec3 up = rotation.up();
  const Vec3 down = -up;
  const double reach = stats.suspension_travel + stats.suspension_length;

  for (std::size_t i = 0; i < kWheelCount; ++i) {
    const Vec3 mount = position + rotation.rotate(stats.wheel_offsets[i]);
    const Vec3 origin = mount + up * stats.suspension_travel;
    auto hit = arena.raycast(origin, down, reach);
    if (!hit) continue;

    WheelContact& w = out[i];
    w.grounded = true;
    w.point = hit->point;
    w.normal = hit->normal;
    w.compression = 1.0 - hit->distance / reach;
    w.surface = &arena.surface(hit->surface);
  }
  return out;
}

} // namespace kartsim
