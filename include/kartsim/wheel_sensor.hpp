#pragma once
#include <array>
#include <kartsim/arena.hpp>
#include <kartsim/math.hpp>
#include <kartsim/tuning.hpp>

namespace kartsim {

// One wheel's probe result. Recomputed every tick.
struct WheelContact {
  bool grounded = false;
  Vec3 point{};
  Vec3 normal{};
  double compression = 0.0;                     // 0..1
  const SurfaceDefinition* surface = nullptr;   // into the arena table; null when airborne
};

using WheelContacts = std::array<WheelContact, kWheelCount>;

// Casts one probe per wheel mount along the kart's down axis, from
// suspension_travel above the mount to suspension_length below it.
WheelContacts sense_wheels(const Arena& arena, const Vec3& position, const Quat& rotation,
                           const KartStats& stats);

} // namespace kartsim
