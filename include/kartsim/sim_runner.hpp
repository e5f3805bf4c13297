#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <kartsim/arena.hpp>
#include <kartsim/config.hpp>
#include <kartsim/input.hpp>
#include <kartsim/logging.hpp>
#include <kartsim/snap_buffer.hpp>
#include <kartsim/tuning.hpp>

namespace kartsim {

// Owns the simulation thread: steps a KartWorld at a fixed 60 Hz and
// publishes snapshots. Kart 0 is driven by set_player_input(), the rest by
// scripted_input().
class SimRunner {
public:
  SimRunner() = default;
  ~SimRunner() { stop(); }
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Call before start()
  void set_kart_count(std::size_t n) { kart_count_ = n == 0 ? 1 : n; }
  // Rejects (and logs) stats that fail validate_stats; the previous ones stay.
  bool set_kart_stats(const KartStats& stats);
  const KartStats& kart_stats() const { return stats_; }
  void set_log_sink(LogSinkPtr log) { log_ = std::move(log); }

  // Safe to call from the UI thread
  void request_reseed(std::size_t n);
  void request_arena_preset(ArenaPreset p);
  void set_player_input(const KartInput& in);

  ArenaPreset current_preset() const { return static_cast<ArenaPreset>(preset_.load()); }
  const char* preset_name() const { return Arena::preset_name(current_preset()); }
  std::shared_ptr<const Arena> arena() const;

  SnapshotMailbox& mailbox() { return mailbox_; }
  const SnapshotMailbox& mailbox() const { return mailbox_; }

  // Wall-clock rate multiplier; 0 = paused. The tick length never changes.
  std::atomic<double> time_scale{1.0};

private:
  void thread_main_();
  KartInput take_player_input_();

  std::thread th_;
  std::atomic<bool> running_{false};
  SnapshotMailbox mailbox_;

  std::size_t kart_count_ = 8;
  KartStats stats_ = default_kart_stats();
  LogSinkPtr log_;

  mutable std::mutex arena_mu_;
  std::shared_ptr<const Arena> arena_;
  std::atomic<int> preset_{static_cast<int>(ArenaPreset::TestTrack)};

  std::mutex input_mu_;
  KartInput player_input_{};

  std::atomic<bool> pending_reset_{false};
  std::atomic<std::size_t> pending_reset_n_{0};
  std::atomic<bool> pending_preset_change_{false};
  std::atomic<int>  pending_preset_{-1};
};

} // namespace kartsim
