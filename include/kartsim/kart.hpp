#pragma once
#include <memory>
#include <kartsim/arena.hpp>
#include <kartsim/boost.hpp>
#include <kartsim/drift.hpp>
#include <kartsim/events.hpp>
#include <kartsim/tuning.hpp>
#include <kartsim/vehicle.hpp>

namespace kartsim {

// One owning record per kart. Sub-states are only ever handed out by
// exclusive reference for the duration of one kart's update.
struct Kart {
  KartId id = 0;
  std::shared_ptr<const KartStats> stats;  // immutable, shared between copies
  SpawnPoint spawn{};

  VehicleState vehicle{};
  DriftState drift{};
  DriftBoostState drift_boost{};
  BoostState boost{};
};

// Validated construction; throws std::invalid_argument on bad stats.
Kart make_kart(KartId id, std::shared_ptr<const KartStats> stats, const SpawnPoint& spawn);

// Back to the spawn transform at rest. Any drift charge is discarded and
// an active boost is interrupted.
void reset_kart(Kart& k);

} // namespace kartsim
