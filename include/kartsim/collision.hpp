#pragma once
#include <vector>
#include <kartsim/arena.hpp>
#include <kartsim/math.hpp>

namespace kartsim {

struct CollisionResult {
  int contacts = 0;        // overlaps that survived the filters
  Vec3 bounce{};           // horizontal, unit; zero when no contact or cancelled out
  double max_depth = 0.0;
  Vec3 compensation{};     // bounce * max_depth, applied on the next tick
};

// Soft response against this tick's overlap set. Damps the horizontal
// velocity in place; returns the positional push-out for the next tick.
CollisionResult resolve_collisions(const std::vector<Overlap>& overlaps, Vec3& velocity);

} // namespace kartsim
