#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <kartsim/math.hpp>
#include <kartsim/tuning.hpp>

namespace kartsim {

struct GroundTriangle {
  Vec3 a{};
  Vec3 b{};
  Vec3 c{};
  SurfaceId surface = 0;
};

struct SphereObstacle {
  Vec3 center{};
  double radius = 1.0;
};

// Axis-aligned box.
struct BoxObstacle {
  Vec3 min{};
  Vec3 max{};
};

struct SpawnPoint {
  Vec3 position{};
  double heading_rad = 0.0;  // 0 faces +z, positive turns toward +x
};

struct RayHit {
  Vec3 point{};
  Vec3 normal{};       // faces the side the ray came from
  double distance = 0.0;
  SurfaceId surface = 0;
};

// Contact between a collision sphere and one obstacle.
struct Overlap {
  Vec3 normal{};       // unit, points from the obstacle toward the sphere
  double depth = 0.0;  // penetration, > 0
};

// Sphere vs sphere; nullopt when they do not intersect.
std::optional<Overlap> sphere_overlap(const Vec3& center, double radius,
                                      const Vec3& other_center, double other_radius);
std::optional<Overlap> box_overlap(const Vec3& center, double radius, const BoxObstacle& box);

enum class ArenaPreset : int {
  Flat = 0,
  TestTrack = 1,
  Count
};

// Immutable-once-built static world: ground, obstacles, surfaces, spawns.
// All queries are const and iterate in insertion order.
class Arena {
public:
  explicit Arena(std::vector<SurfaceDefinition> surfaces = {});

  static Arena make_preset(ArenaPreset p);
  static const char* preset_name(ArenaPreset p);

  std::optional<SurfaceId> surface_id(const std::string& key) const;
  const SurfaceDefinition& surface(SurfaceId id) const;  // throws std::out_of_range
  const std::vector<SurfaceDefinition>& surfaces() const { return surfaces_; }

  // Throw std::invalid_argument on an unknown surface or degenerate shape.
  void add_ground_triangle(const Vec3& a, const Vec3& b, const Vec3& c, SurfaceId surface);
  void add_ground_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d, SurfaceId surface);
  void add_ground_rect(double x0, double z0, double x1, double z1, double y, SurfaceId surface);
  void add_sphere(const Vec3& center, double radius);
  void add_box(const Vec3& min, const Vec3& max);
  void add_spawn(const SpawnPoint& s) { spawns_.push_back(s); }

  // Nearest ground hit within [0, max_distance]; dir must be unit length.
  std::optional<RayHit> raycast(const Vec3& origin, const Vec3& dir, double max_distance) const;

  // Appends one Overlap per obstacle intersecting the sphere; returns the count appended.
  std::size_t overlaps(const Vec3& center, double radius, std::vector<Overlap>& out) const;

  const std::vector<GroundTriangle>& ground() const { return ground_; }
  const std::vector<SphereObstacle>& spheres() const { return spheres_; }
  const std::vector<BoxObstacle>& boxes() const { return boxes_; }
  const std::vector<SpawnPoint>& spawns() const { return spawns_; }

private:
  std::vector<SurfaceDefinition> surfaces_;
  std::vector<GroundTriangle> ground_;
  std::vector<SphereObstacle> spheres_;
  std::vector<BoxObstacle> boxes_;
  std::vector<SpawnPoint> spawns_;
};

} // namespace kartsim
