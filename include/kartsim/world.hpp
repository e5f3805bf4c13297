#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>
#include <kartsim/arena.hpp>
#include <kartsim/events.hpp>
#include <kartsim/input.hpp>
#include <kartsim/kart.hpp>
#include <kartsim/logging.hpp>
#include <kartsim/tuning.hpp>

namespace kartsim {

inline constexpr double kDefaultTickDt = 1.0 / 60.0;

using InputMap = std::map<KartId, KartInput>;

// Fixed-step simulation of every kart on one arena. Copyable: a copy is a
// full rollback snapshot (the arena and stats are shared and immutable).
class KartWorld {
public:
  explicit KartWorld(std::shared_ptr<const Arena> arena, double dt = kDefaultTickDt,
                     LogSinkPtr log = nullptr);

  // Throw std::invalid_argument if the stats fail validation.
  KartId add_kart(const KartStats& stats);                           // next arena spawn slot
  KartId add_kart(const KartStats& stats, const SpawnPoint& spawn);
  bool remove_kart(KartId id);

  // One tick. Karts without an entry in `inputs` get a neutral input.
  void step(const InputMap& inputs = {});

  bool start_boost(KartId id, const BoostConfig& config);  // false for unknown id
  bool interrupt_boost(KartId id);
  bool respawn(KartId id);

  const Kart* kart_by_id(KartId id) const;
  const Kart* kart_by_index(std::size_t i) const;
  std::size_t kart_count() const { return karts_.size(); }

  // Produced by the last step() (and by start_boost since then).
  const std::vector<KartEvent>& events() const { return events_; }
  // Karts that pressed the powerup button in the last step, ascending id.
  const std::vector<KartId>& powerup_requests() const { return powerup_requests_; }

  std::uint64_t tick() const { return tick_; }
  double dt() const { return dt_; }
  double sim_time() const { return double(tick_) * dt_; }
  const Arena& arena() const { return *arena_; }

  // FNV-1a over the bit patterns of the tick counter and all kart state.
  std::uint64_t checksum() const;

  void set_log_sink(LogSinkPtr log) { log_ = std::move(log); }

private:
  Kart* find_(KartId id);
  void step_kart_(Kart& k, const KartInput& in);

  std::shared_ptr<const Arena> arena_;
  double dt_;
  LogSinkPtr log_;

  std::vector<Kart> karts_;  // ascending id
  KartId next_id_ = 0;
  std::uint64_t tick_ = 0;
  std::vector<KartEvent> events_;
  std::vector<KartId> powerup_requests_;

  // Collision volumes captured at the start of the tick.
  struct Body { KartId id; Vec3 center; double radius; };
  std::vector<Body> bodies_;
  std::vector<Overlap> overlaps_;
};

} // namespace kartsim
