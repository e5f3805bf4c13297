#include <kartsim/world.hpp>
#include <algorithm>
#include <bit>
#include <sstream>
#include <stdexcept>
#include <string>
#include <kartsim/collision.hpp>
#include <kartsim/integrator.hpp>
#include <kartsim/surface.hpp>
#include <kartsim/wheel_sensor.hpp>

namespace kartsim {

namespace {

class Fnv1a {
public:
  void bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h_ ^= p[i];
      h_ *= 0x100000001b3ull;
    }
  }
  void u64(std::uint64_t v) { bytes(&v, sizeof v); }
  void i64(std::int64_t v)  { u64(static_cast<std::uint64_t>(v)); }
  void f64(double v)        { u64(std::bit_cast<std::uint64_t>(v)); }
  void vec(const Vec3& v)   { f64(v.x); f64(v.y); f64(v.z); }
  void quat(const Quat& q)  { f64(q.w); f64(q.x); f64(q.y); f64(q.z); }
  void str(const std::string& s) { u64(s.size()); bytes(s.data(), s.size()); }

  std::uint64_t value() const { return h_; }

private:
  std::uint64_t h_ = 0xcbf29ce484222325ull;
};

// Karts are kept sorted by id.
template <class It>
It find_by_id(It first, It last, KartId id) {
  auto it = std::lower_bound(first, last, id, [](const Kart& k, KartId v){ return k.id < v; });
  return (it != last && it->id == id) ? it : last;
}

} // namespace

KartWorld::KartWorld(std::shared_ptr<const Arena> arena, double dt, LogSinkPtr log)
  : arena_(std::move(arena)), dt_(dt), log_(std::move(log)) {
  if (!arena_) throw std::invalid_argument("world: arena is required");
  if (!(dt_ > 0.0)) throw std::invalid_argument("world: dt must be > 0");
}

KartId KartWorld::add_kart(const KartStats& stats) {
  const auto& spawns = arena_->spawns();
  const SpawnPoint spawn = spawns.empty() ? SpawnPoint{} : spawns[karts_.size() % spawns.size()];
  return add_kart(stats, spawn);
}

KartId KartWorld::add_kart(const KartStats& stats, const SpawnPoint& spawn) {
  if (auto err = validate_stats(stats)) {
    log(log_, LogLevel::Error, "rejected kart: " + *err);
    throw std::invalid_argument(*err);
  }
  const KartId id = next_id_++;
  karts_.push_back(make_kart(id, std::make_shared<const KartStats>(stats), spawn));

  std::ostringstream msg;
  msg << "kart " << id << " spawned with stats '" << stats.key << "' at ("
      << spawn.position.x << ", " << spawn.position.y << ", " << spawn.position.z << ")";
  log(log_, LogLevel::Info, msg.str());
  return id;
}

bool KartWorld::remove_kart(KartId id) {
  auto it = find_by_id(karts_.begin(), karts_.end(), id);
  if (it == karts_.end()) return false;
  karts_.erase(it);
  log(log_, LogLevel::Info, "kart " + std::to_string(id) + " removed");
  return true;
}

Kart* KartWorld::find_(KartId id) {
  auto it = find_by_id(karts_.begin(), karts_.end(), id);
  return it == karts_.end() ? nullptr : &*it;
}

const Kart* KartWorld::kart_by_id(KartId id) const {
  auto it = find_by_id(karts_.cbegin(), karts_.cend(), id);
  return it == karts_.cend() ? nullptr : &*it;
}

const Kart* KartWorld::kart_by_index(std::size_t i) const {
  if (i >= karts_.size()) return nullptr;
  return &karts_[i];
}

bool KartWorld::start_boost(KartId id, const BoostConfig& config) {
  Kart* k = find_(id);
  if (!k) return false;
  kartsim::start_boost(k->boost, config, EventWriter{id, &events_});
  log(log_, LogLevel::Debug, "kart " + std::to_string(id) + " boost '" + config.key + "'");
  return true;
}

bool KartWorld::interrupt_boost(KartId id) {
  Kart* k = find_(id);
  if (!k) return false;
  kartsim::interrupt_boost(k->boost);
  return true;
}

bool KartWorld::respawn(KartId id) {
  Kart* k = find_(id);
  if (!k) return false;
  reset_kart(*k);
  log(log_, LogLevel::Info, "kart " + std::to_string(id) + " respawned");
  return true;
}

void KartWorld::step(const InputMap& inputs) {
  events_.clear();
  powerup_requests_.clear();

  // Positions of every kart before anyone moves.
  bodies_.clear();
  for (const auto& k : karts_) {
    const Vec3 center = k.vehicle.position + k.vehicle.rotation.rotate(k.stats->collision_offset);
    bodies_.push_back(Body{k.id, center, k.stats->collision_radius});
  }

  for (auto& k : karts_) {
    auto it = inputs.find(k.id);
    const KartInput in = it != inputs.end() ? it->second : KartInput{};
    if (in.powerup_pressed) powerup_requests_.push_back(k.id);
    if (in.respawn_requested) {
      respawn(k.id);
      continue;
    }
    step_kart_(k, in);
  }
  ++tick_;
}

void KartWorld::step_kart_(Kart& k, const KartInput& in) {
  const KartStats& stats = *k.stats;
  VehicleState& v = k.vehicle;
  const EventWriter ev{k.id, &events_};

  v.wheels = sense_wheels(*arena_, v.position, v.rotation, stats);

  apply_surface(v, aggregate_surface(v.wheels, v.position), dt_);

  overlaps_.clear();
  const Vec3 center = v.position + v.rotation.rotate(stats.collision_offset);
  arena_->overlaps(center, stats.collision_radius, overlaps_);
  for (const auto& b : bodies_) {
    if (b.id == k.id) continue;
    if (auto o = sphere_overlap(center, stats.collision_radius, b.center, b.radius)) {
      overlaps_.push_back(*o);
    }
  }
  const CollisionResult collision = resolve_collisions(overlaps_, v.velocity);

  const int drift_before = k.drift.direction;
  update_drift(k.drift, k.drift_boost, k.boost, v, in, dt_, ev);
  if (k.drift.direction != drift_before) {
    log(log_, LogLevel::Debug, "kart " + std::to_string(k.id) +
        (k.drift.drifting() ? " drift start dir " + std::to_string(k.drift.direction)
                            : std::string(" drift end")));
  }

  update_boost(k.boost, dt_);

  IntegratorContext ctx;
  ctx.collision = collision;
  ctx.steering_offset = k.drift.steering_offset;
  ctx.drifting = k.drift.drifting();
  ctx.boost_accel_bonus = k.boost.accel_bonus();
  ctx.boost_max_speed_bonus = k.boost.max_speed_bonus();
  integrate_vehicle(v, stats, in, ctx, dt_);
}

std::uint64_t KartWorld::checksum() const {
  Fnv1a h;
  h.u64(tick_);
  h.u64(karts_.size());
  for (const auto& k : karts_) {
    const VehicleState& v = k.vehicle;
    h.u64(k.id);
    h.vec(v.position);
    h.quat(v.rotation);
    h.vec(v.velocity);
    h.vec(v.external_force);
    for (const auto& w : v.wheels) {
      h.u64(w.grounded ? 1u : 0u);
      h.vec(w.point);
      h.vec(w.normal);
      h.f64(w.compression);
    }
    h.i64(v.grounded_wheels);
    h.i64(v.offroad_wheels);
    h.f64(v.air_time);
    h.f64(v.friction_multiplier);
    h.f64(v.speed_multiplier);
    h.f64(v.handling_multiplier);
    h.vec(v.ground_normal);
    h.vec(v.ground_point);
    h.vec(v.compensation);
    h.f64(v.sideways_speed_sq);

    h.i64(k.drift.direction);
    h.f64(k.drift.no_steer_time);
    h.f64(k.drift.opposite_steer_time);
    h.f64(k.drift.steering_offset);
    h.f64(k.drift_boost.duration);
    h.i64(k.drift_boost.level);
    h.f64(k.drift_boost.feedback);

    h.u64(k.boost.is_active() ? 1u : 0u);
    if (k.boost.active) h.str(k.boost.active->key);
    h.f64(k.boost.remaining);
  }
  return h.value();
}

} // namespace kartsim
