#include <kartsim/arena.hpp>
#include <kartsim/config.hpp>
#include <stdexcept>
#include <string>

namespace kartsim {

std::optional<Overlap> sphere_overlap(const Vec3& center, double radius,
                                      const Vec3& other_center, double other_radius) {
  const Vec3 d = center - other_center;
  const double reach = radius + other_radius;
  const double d2 = length_sq(d);
  if (d2 >= reach * reach) return std::nullopt;
  const double dist = std::sqrt(d2);
  // Coincident centers: push straight up.
  const Vec3 n = dist > 1e-9 ? d / dist : kWorldUp;
  return Overlap{n, reach - dist};
}

std::optional<Overlap> box_overlap(const Vec3& center, double radius, const BoxObstacle& box) {
  const Vec3 closest{std::clamp(center.x, box.min.x, box.max.x),
                     std::clamp(center.y, box.min.y, box.max.y),
                     std::clamp(center.z, box.min.z, box.max.z)};
  const Vec3 d = center - closest;
  const double d2 = length_sq(d);
  if (d2 >= radius * radius) return std::nullopt;
  if (d2 > 1e-18) {
    const double dist = std::sqrt(d2);
    return Overlap{d / dist, radius - dist};
  }

  // Center inside the box: leave through the nearest face.
  const double faces[6] = {
    center.x - box.min.x, box.max.x - center.x,
    center.y - box.min.y, box.max.y - center.y,
    center.z - box.min.z, box.max.z - center.z,
  };
  static const Vec3 kFaceNormals[6] = {
    Vec3{-1, 0, 0}, Vec3{1, 0, 0}, Vec3{0, -1, 0}, Vec3{0, 1, 0}, Vec3{0, 0, -1}, Vec3{0, 0, 1},
  };
  int best = 0;
  for (int i = 1; i < 6; ++i) {
    if (faces[i] < faces[best]) best = i;
  }
  return Overlap{kFaceNormals[best], radius + faces[best]};
}

Arena::Arena(std::vector<SurfaceDefinition> surfaces)
  : surfaces_(surfaces.empty() ? surface_catalog() : std::move(surfaces)) {
  for (const auto& s : surfaces_) {
    if (auto err = validate_surface(s)) throw std::invalid_argument(*err);
  }
}

std::optional<SurfaceId> Arena::surface_id(const std::string& key) const {
  for (std::size_t i = 0; i < surfaces_.size(); ++i) {
    if (surfaces_[i].key == key) return static_cast<SurfaceId>(i);
  }
  return std::nullopt;
}

const SurfaceDefinition& Arena::surface(SurfaceId id) const {
  return surfaces_.at(id);
}

void Arena::add_ground_triangle(const Vec3& a, const Vec3& b, const Vec3& c, SurfaceId surface) {
  if (surface >= surfaces_.size()) {
    throw std::invalid_argument("arena: surface id " + std::to_string(surface) + " out of range");
  }
  if (length_sq(cross(b - a, c - a)) <= kZeroLengthSq) {
    throw std::invalid_argument("arena: degenerate ground triangle");
  }
  ground_.push_back(GroundTriangle{a, b, c, surface});
}

void Arena::add_ground_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d,
                            SurfaceId surface) {
  add_ground_triangle(a, b, c, surface);
  add_ground_triangle(a, c, d, surface);
}

void Arena::add_ground_rect(double x0, double z0, double x1, double z1, double y, SurfaceId surface) {
  add_ground_quad(Vec3{x0, y, z0}, Vec3{x1, y, z0}, Vec3{x1, y, z1}, Vec3{x0, y, z1}, surface);
}

void Arena::add_sphere(const Vec3& center, double radius) {
  if (!(radius > 0.0)) throw std::invalid_argument("arena: sphere radius must be > 0");
  spheres_.push_back(SphereObstacle{center, radius});
}

void Arena::add_box(const Vec3& min, const Vec3& max) {
  if (!(min.x < max.x && min.y < max.y && min.z < max.z)) {
    throw std::invalid_argument("arena: box min must be below max on every axis");
  }
  boxes_.push_back(BoxObstacle{min, max});
}

std::optional<RayHit> Arena::raycast(const Vec3& origin, const Vec3& dir, double max_distance) const {
  std::optional<RayHit> best;
  for (const auto& tri : ground_) {
    // Moller-Trumbore, double sided.
    const Vec3 e1 = tri.b - tri.a;
    const Vec3 e2 = tri.c - tri.a;
    const Vec3 p = cross(dir, e2);
    const double det = dot(e1, p);
    if (std::abs(det) < 1e-12) continue;
    const double inv = 1.0 / det;
    const Vec3 s = origin - tri.a;
    const double u = dot(s, p) * inv;
    if (u < 0.0 || u > 1.0) continue;
    const Vec3 q = cross(s, e1);
    const double v = dot(dir, q) * inv;
    if (v < 0.0 || u + v > 1.0) continue;
    const double t = dot(e2, q) * inv;
    if (t < 0.0 || t > max_distance) continue;
    if (best && t >= best->distance) continue;

    Vec3 n = normalized(cross(e1, e2));
    if (dot(n, dir) > 0.0) n = -n;
    best = RayHit{origin + dir * t, n, t, tri.surface};
  }
  return best;
}

std::size_t Arena::overlaps(const Vec3& center, double radius, std::vector<Overlap>& out) const {
  const std::size_t before = out.size();
  for (const auto& s : spheres_) {
    if (auto o = sphere_overlap(center, radius, s.center, s.radius)) out.push_back(*o);
  }
  for (const auto& b : boxes_) {
    if (auto o = box_overlap(center, radius, b)) out.push_back(*o);
  }
  return out.size() - before;
}

// ---- Presets ----

// Two-wide grid: `row_step` between rows, `lane_step` to the second lane.
static void add_grid_spawns_(Arena& a, std::size_t n, const Vec3& pole, const Vec3& row_step,
                             const Vec3& lane_step, double heading) {
  for (std::size_t i = 0; i < n; ++i) {
    const double row  = double(i / 2);
    const double lane = double(i % 2);
    a.add_spawn(SpawnPoint{pole + row_step * row + lane_step * lane, heading});
  }
}

static Arena make_flat_() {
  Arena a;
  const auto asphalt = *a.surface_id("asphalt");
  const auto grass   = *a.surface_id("grass");
  a.add_ground_rect(-60.0, -60.0, 60.0, 60.0, 0.0, asphalt);
  a.add_ground_rect(-100.0, 60.0, 100.0, 100.0, 0.0, grass);
  a.add_ground_rect(-100.0, -100.0, 100.0, -60.0, 0.0, grass);
  a.add_ground_rect(-100.0, -60.0, -60.0, 60.0, 0.0, grass);
  a.add_ground_rect(60.0, -60.0, 100.0, 60.0, 0.0, grass);
  add_grid_spawns_(a, 8, Vec3{-4.0, 0.6, 0.0}, Vec3{0.0, 0.0, -6.0}, Vec3{8.0, 0.0, 0.0}, 0.0);
  return a;
}

// Rectangular loop: asphalt ring with dirt and ice sections, grass infield
// and border, a ramp, perimeter walls and two pillars.
static Arena make_test_track_() {
  Arena a;
  const auto asphalt = *a.surface_id("asphalt");
  const auto dirt    = *a.surface_id("dirt");
  const auto grass   = *a.surface_id("grass");
  const auto ice     = *a.surface_id("ice");

  // South straight (driven toward +x)
  a.add_ground_rect(-100.0, -60.0, -20.0, -20.0, 0.0, asphalt);
  a.add_ground_rect(-20.0, -60.0, 20.0, -20.0, 0.0, dirt);
  a.add_ground_rect(20.0, -60.0, 100.0, -20.0, 0.0, asphalt);
  // North straight
  a.add_ground_rect(-100.0, 20.0, -20.0, 60.0, 0.0, asphalt);
  a.add_ground_rect(-20.0, 20.0, 20.0, 60.0, 0.0, ice);
  a.add_ground_rect(20.0, 20.0, 100.0, 60.0, 0.0, asphalt);
  // Ends
  a.add_ground_rect(-100.0, -20.0, -60.0, 20.0, 0.0, asphalt);
  a.add_ground_rect(60.0, -20.0, 100.0, 20.0, 0.0, asphalt);
  // Infield and border
  a.add_ground_rect(-60.0, -20.0, 60.0, 20.0, 0.0, grass);
  a.add_ground_rect(-140.0, 60.0, 140.0, 100.0, 0.0, grass);
  a.add_ground_rect(-140.0, -100.0, 140.0, -60.0, 0.0, grass);
  a.add_ground_rect(-140.0, -60.0, -100.0, 60.0, 0.0, grass);
  a.add_ground_rect(100.0, -60.0, 140.0, 60.0, 0.0, grass);

  // Ramp on the south straight, rising toward +x
  a.add_ground_quad(Vec3{40.0, 0.0, -50.0}, Vec3{56.0, 1.6, -50.0},
                    Vec3{56.0, 1.6, -30.0}, Vec3{40.0, 0.0, -30.0}, asphalt);

  a.add_box(Vec3{-141.0, 0.0, 100.0}, Vec3{141.0, 2.0, 101.0});
  a.add_box(Vec3{-141.0, 0.0, -101.0}, Vec3{141.0, 2.0, -100.0});
  a.add_box(Vec3{-141.0, 0.0, -100.0}, Vec3{-140.0, 2.0, 100.0});
  a.add_box(Vec3{140.0, 0.0, -100.0}, Vec3{141.0, 2.0, 100.0});
  a.add_sphere(Vec3{-40.0, 1.0, -40.0}, 1.5);
  a.add_sphere(Vec3{0.0, 1.0, 40.0}, 1.5);

  add_grid_spawns_(a, 8, Vec3{-70.0, 0.6, -45.0}, Vec3{-6.0, 0.0, 0.0}, Vec3{0.0, 0.0, 10.0},
                   kHalfPI);
  return a;
}

Arena Arena::make_preset(ArenaPreset p) {
  switch (p) {
    case ArenaPreset::TestTrack: return make_test_track_();
    case ArenaPreset::Flat:
    default:                     return make_flat_();
  }
}

const char* Arena::preset_name(ArenaPreset p) {
  switch (p) {
    case ArenaPreset::Flat:      return "Flat";
    case ArenaPreset::TestTrack: return "Test Track";
    default:                     return "Unknown";
  }
}

} // namespace kartsim
