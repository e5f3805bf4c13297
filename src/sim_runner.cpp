#include <kartsim/sim_runner.hpp>
#include <chrono>
#include <string>
#include <kartsim/config.hpp>
#include <kartsim/script.hpp>
#include <kartsim/snap.hpp>
#include <kartsim/world.hpp>

namespace kartsim {

static std::shared_ptr<const Arena> make_arena_(ArenaPreset p) {
  return std::make_shared<const Arena>(Arena::make_preset(p));
}

static void populate_(KartWorld& world, std::size_t n, const KartStats& stats) {
  for (std::size_t i = 0; i < n; ++i) world.add_kart(stats);
}

bool SimRunner::set_kart_stats(const KartStats& stats) {
  if (auto err = validate_stats(stats)) {
    log(log_, LogLevel::Error, "runner: rejected kart stats: " + *err);
    return false;
  }
  stats_ = stats;
  return true;
}

void SimRunner::request_reseed(std::size_t n) {
  pending_reset_n_.store(n == 0 ? 1 : n, std::memory_order_relaxed);
  pending_reset_.store(true, std::memory_order_release);
}

void SimRunner::request_arena_preset(ArenaPreset p) {
  pending_preset_.store(static_cast<int>(p), std::memory_order_relaxed);
  pending_preset_change_.store(true, std::memory_order_release);
}

void SimRunner::set_player_input(const KartInput& in) {
  std::lock_guard<std::mutex> lock(input_mu_);
  // Edges stay latched until the sim thread takes them.
  const bool drift = player_input_.drift_pressed || in.drift_pressed;
  const bool powerup = player_input_.powerup_pressed || in.powerup_pressed;
  const bool respawn = player_input_.respawn_requested || in.respawn_requested;
  player_input_ = in;
  player_input_.drift_pressed = drift;
  player_input_.powerup_pressed = powerup;
  player_input_.respawn_requested = respawn;
}

KartInput SimRunner::take_player_input_() {
  std::lock_guard<std::mutex> lock(input_mu_);
  const KartInput out = player_input_;
  player_input_.drift_pressed = false;
  player_input_.powerup_pressed = false;
  player_input_.respawn_requested = false;
  return out;
}

std::shared_ptr<const Arena> SimRunner::arena() const {
  std::lock_guard<std::mutex> lock(arena_mu_);
  return arena_;
}

void SimRunner::start() {
  if (running_.load()) return;
  {
    std::lock_guard<std::mutex> lock(arena_mu_);
    arena_ = make_arena_(current_preset());
  }
  running_.store(true);
  th_ = std::thread(&SimRunner::thread_main_, this);
}

void SimRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
}

void SimRunner::thread_main_() {
  const KartStats stats = stats_;
  std::size_t n = kart_count_;

  auto world = std::make_unique<KartWorld>(arena(), kDefaultTickDt, log_);
  populate_(*world, n, stats);
  log(log_, LogLevel::Info, std::string("sim started on ") + preset_name());

  using clock = std::chrono::steady_clock;
  const auto tick_ns = std::chrono::nanoseconds((long long)(kDefaultTickDt * 1e9));
  auto next = clock::now();

  while (running_.load(std::memory_order_relaxed)) {
    // Arena change rebuilds the world
    if (pending_preset_change_.load(std::memory_order_acquire)) {
      pending_preset_change_.store(false, std::memory_order_relaxed);
      const int ip = pending_preset_.load(std::memory_order_relaxed);
      if (ip >= 0 && ip < static_cast<int>(ArenaPreset::Count)) {
        preset_.store(ip);
        auto a = make_arena_(static_cast<ArenaPreset>(ip));
        {
          std::lock_guard<std::mutex> lock(arena_mu_);
          arena_ = a;
        }
        world = std::make_unique<KartWorld>(a, kDefaultTickDt, log_);
        populate_(*world, n, stats);
        log(log_, LogLevel::Info, std::string("arena switched to ") + preset_name());
      }
    }

    // Kart count change keeps the arena
    if (pending_reset_.load(std::memory_order_acquire)) {
      pending_reset_.store(false, std::memory_order_relaxed);
      n = pending_reset_n_.load(std::memory_order_relaxed);
      world = std::make_unique<KartWorld>(arena(), kDefaultTickDt, log_);
      populate_(*world, n, stats);
      log(log_, LogLevel::Info, "reseeded with " + std::to_string(n) + " karts");
    }

    const double warp = time_scale.load(std::memory_order_relaxed);
    if (warp > 0.0) {
      InputMap inputs;
      for (std::size_t i = 0; i < world->kart_count(); ++i) {
        const KartId id = world->kart_by_index(i)->id;
        inputs[id] = (i == 0) ? take_player_input_() : scripted_input(id, world->tick());
      }
      world->step(inputs);
      next += std::chrono::duration_cast<clock::duration>(tick_ns / warp);
    } else {
      next += tick_ns;  // paused: keep publishing heartbeats
    }

    mailbox_.publish(make_snapshot(*world));
    std::this_thread::sleep_until(next);
  }
}

} // namespace kartsim
