#include <kartsim/collision.hpp>

namespace kartsim {

CollisionResult resolve_collisions(const std::vector<Overlap>& overlaps, Vec3& velocity) {
  CollisionResult out;
  Vec3 bounce_sum{};

  for (const auto& o : overlaps) {
    const double d = dot(normalized(velocity), o.normal);
    // Moving away from the obstacle.
    if (d > 0.0) continue;
    // Push-out normals point at the kart; one facing up is ground-like
    // (kart on top of a box or another kart), not a wall.
    if (dot(o.normal, kWorldUp) > 0.5) continue;

    ++out.contacts;
    bounce_sum += o.normal;
    const Vec3 horizontal{velocity.x, 0.0, velocity.z};
    velocity -= horizontal * (d * d * 0.5);
    if (o.depth > out.max_depth) out.max_depth = o.depth;
  }

  if (out.contacts == 0) return out;

  bounce_sum.y = 0.0;
  // Opposing normals can cancel; then nothing is pushed.
  if (length_sq(bounce_sum) <= kZeroLengthSq) return out;
  out.bounce = normalized(bounce_sum);
  out.compensation = out.bounce * out.max_depth;
  return out;
}

} // namespace kartsim
