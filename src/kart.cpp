#include <kartsim/kart.hpp>
#include <stdexcept>

namespace kartsim {

Kart make_kart(KartId id, std::shared_ptr<const KartStats> stats, const SpawnPoint& spawn) {
  if (!stats) throw std::invalid_argument("kart " + std::to_string(id) + ": missing stats");
  if (auto err = validate_stats(*stats)) {
    throw std::invalid_argument("kart " + std::to_string(id) + ": " + *err);
  }
  Kart k;
  k.id = id;
  k.stats = std::move(stats);
  k.spawn = spawn;
  reset_kart(k);
  return k;
}

void reset_kart(Kart& k) {
  k.vehicle = VehicleState{};
  k.vehicle.position = k.spawn.position;
  k.vehicle.rotation = yaw_rotation(k.spawn.heading_rad);
  k.vehicle.ground_normal = kWorldUp;

  k.drift = DriftState{};
  k.drift.tuning = k.stats->drift;
  k.drift_boost = DriftBoostState{};
  k.drift_boost.tuning = k.stats->drift_boost;
  interrupt_boost(k.boost);
}

} // namespace kartsim
