#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <kartsim/snap.hpp>

namespace kartsim {

class SimRunner;

// Top-down debug view of the running simulation. Samples the keyboard into
// the player's KartInput every frame.
class ViewerApp {
public:
  explicit ViewerApp(SimRunner& sim);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_arena_();
  void draw_karts_(const SimSnapshot& draw);
  void draw_hud_(const SimSnapshot& draw);

  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double z) const;

  SimRunner& sim_;
  SimSnapshot last_snap_{};
  std::uint64_t cursor_{0};
  std::deque<std::string> event_log_;

  // UI state
  float scale_px_per_m_{4.0f};
  bool  follow_player_{true};
  float cam_x_m_{0.0f};
  float cam_z_m_{0.0f};

  int n_cycle_idx_{3}; // 1, 2, 4, 8
};

} // namespace kartsim
