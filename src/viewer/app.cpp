#include <raylib.h>
#include <cmath>
#include <cstdio>
#include <string>

#include <kartsim/viewer/app.hpp>
#include <kartsim/arena.hpp>
#include <kartsim/input.hpp>
#include <kartsim/sim_runner.hpp>

namespace kartsim {

namespace {

static constexpr std::size_t kEventLogLines = 6;

static const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 0.25) return "0.25x";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  return "custom";
}

static Color colorFor(KartId id) {
  static const Color PAL[] = {
    {231, 76, 60, 255},   // red
    {52, 152, 219, 255},  // blue
    {46, 204, 113, 255},  // green
    {241, 196, 15, 255},  // yellow
    {155, 89, 182, 255},  // purple
    {26, 188, 156, 255},  // teal
    {230, 126, 34, 255},  // orange
    {236, 112, 99, 255},  // salmon
  };
  return PAL[id % (sizeof(PAL) / sizeof(PAL[0]))];
}

static Color surfaceColor(const SurfaceDefinition& s) {
  if (s.key == "asphalt") return Color{48, 48, 54, 255};
  if (s.key == "dirt")    return Color{120, 84, 50, 255};
  if (s.key == "grass")   return Color{40, 92, 40, 255};
  if (s.key == "ice")     return Color{170, 210, 230, 255};
  return s.offroad ? Color{60, 80, 50, 255} : Color{90, 90, 90, 255};
}

static const char* driftLabel(int dir) {
  if (dir < 0) return "left";
  if (dir > 0) return "right";
  return "-";
}

} // namespace

ViewerApp::ViewerApp(SimRunner& sim) : sim_(sim) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double z) const {
  const float cx = GetScreenWidth()  * 0.5f;
  const float cy = GetScreenHeight() * 0.5f;
  return { cx + float(x - cam_x_m_) * scale_px_per_m_,
           cy - float(z - cam_z_m_) * scale_px_per_m_ };
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "kartsim - viewer");
  SetTargetFPS(144);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Driving (kart 0)
  KartInput in;
  if (IsKeyDown(KEY_UP)   || IsKeyDown(KEY_W)) in.throttle += 1.0;
  if (IsKeyDown(KEY_DOWN) || IsKeyDown(KEY_S)) in.throttle -= 1.0;
  if (IsKeyDown(KEY_RIGHT) || IsKeyDown(KEY_D)) in.steering += 1.0;
  if (IsKeyDown(KEY_LEFT)  || IsKeyDown(KEY_A)) in.steering -= 1.0;
  in.drift_pressed = IsKeyPressed(KEY_LEFT_SHIFT) || IsKeyPressed(KEY_SPACE);
  in.drift_held = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_SPACE);
  in.powerup_pressed = IsKeyPressed(KEY_E);
  in.respawn_requested = IsKeyPressed(KEY_R);
  sim_.set_player_input(in);

  // Time warp controls
  if (IsKeyPressed(KEY_P)) {
    double cur = sim_.time_scale.load();
    sim_.time_scale.store(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   sim_.time_scale.store(0.25);
  if (IsKeyPressed(KEY_TWO))   sim_.time_scale.store(0.5);
  if (IsKeyPressed(KEY_THREE)) sim_.time_scale.store(1.0);
  if (IsKeyPressed(KEY_FOUR))  sim_.time_scale.store(2.0);
  if (IsKeyPressed(KEY_FIVE))  sim_.time_scale.store(4.0);

  // Zoom
  if (IsKeyDown(KEY_KP_ADD) || IsKeyDown(KEY_EQUAL))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_KP_SUBTRACT) || IsKeyDown(KEY_MINUS)) scale_px_per_m_ *= 0.99f;

  if (IsKeyPressed(KEY_C)) follow_player_ = !follow_player_;

  // Cycle kart count 1 -> 2 -> 4 -> 8
  if (IsKeyPressed(KEY_N)) {
    static const int N_CYCLE[4] = {1, 2, 4, 8};
    n_cycle_idx_ = (n_cycle_idx_ + 1) % 4;
    sim_.request_reseed(N_CYCLE[n_cycle_idx_]);
  }

  if (IsKeyPressed(KEY_T)) {
    const int next = (static_cast<int>(sim_.current_preset()) + 1) % static_cast<int>(ArenaPreset::Count);
    sim_.request_arena_preset(static_cast<ArenaPreset>(next));
  }
}

void ViewerApp::pump_snapshots_() {
  auto& box = sim_.mailbox();
  if (!box.try_consume_latest(cursor_, last_snap_)) return;
  for (const auto& e : last_snap_.events) {
    event_log_.push_back(describe(e));
    if (event_log_.size() > kEventLogLines) event_log_.pop_front();
  }
}

void ViewerApp::render_frame_() {
  const SimSnapshot& draw = last_snap_;
  if (follow_player_ && !draw.karts.empty()) {
    cam_x_m_ = float(draw.karts.front().position.x);
    cam_z_m_ = float(draw.karts.front().position.z);
  }

  BeginDrawing();
  ClearBackground(Color{18, 22, 18, 255});
  draw_arena_();
  draw_karts_(draw);
  draw_hud_(draw);
  EndDrawing();
}

void ViewerApp::draw_arena_() {
  const auto arena = sim_.arena();
  if (!arena) return;

  for (const auto& tri : arena->ground()) {
    const auto a = worldToScreen_(tri.a.x, tri.a.z);
    const auto b = worldToScreen_(tri.b.x, tri.b.z);
    const auto c = worldToScreen_(tri.c.x, tri.c.z);
    const Color col = surfaceColor(arena->surface(tri.surface));
    // raylib wants counter-clockwise on screen; draw both windings.
    DrawTriangle({a.x, a.y}, {b.x, b.y}, {c.x, c.y}, col);
    DrawTriangle({a.x, a.y}, {c.x, c.y}, {b.x, b.y}, col);
    // Raised ground (ramps) gets an outline
    if (tri.a.y != 0.0 || tri.b.y != 0.0 || tri.c.y != 0.0) {
      DrawTriangleLines({a.x, a.y}, {b.x, b.y}, {c.x, c.y}, Color{230, 200, 60, 255});
    }
  }

  for (const auto& box : arena->boxes()) {
    const auto p0 = worldToScreen_(box.min.x, box.max.z);
    const auto p1 = worldToScreen_(box.max.x, box.min.z);
    DrawRectangleV({p0.x, p0.y}, {p1.x - p0.x, p1.y - p0.y}, Color{200, 200, 210, 255});
  }
  for (const auto& s : arena->spheres()) {
    const auto c = worldToScreen_(s.center.x, s.center.z);
    DrawCircleV({c.x, c.y}, float(s.radius) * scale_px_per_m_, Color{200, 70, 70, 255});
  }
}

void ViewerApp::draw_karts_(const SimSnapshot& draw) {
  for (const auto& k : draw.karts) {
    const auto p = worldToScreen_(k.position.x, k.position.z);
    const float len = 1.2f * scale_px_per_m_, wid = 0.7f * scale_px_per_m_;
    // Forward on screen: world (sin h, cos h) in x/z, screen y points down.
    const float fx = std::sin(float(k.heading_rad)), fy = -std::cos(float(k.heading_rad));
    const float rx = -fy, ry = fx;
    Vector2 nose  = { p.x + fx*len,           p.y + fy*len };
    Vector2 tailL = { p.x - fx*len - rx*wid,  p.y - fy*len - ry*wid };
    Vector2 tailR = { p.x - fx*len + rx*wid,  p.y - fy*len + ry*wid };
    DrawTriangle(nose, tailR, tailL, colorFor(k.id));
    DrawTriangle(nose, tailL, tailR, colorFor(k.id));

    if (k.boost_active) {
      DrawCircleLines(int(p.x), int(p.y), len * 1.4f, Color{255, 160, 20, 255});
    }
    if (k.drift_direction != 0) {
      const unsigned char a = (unsigned char)(80 + 175 * k.drift_feedback);
      const Color spark = k.drift_level >= 2 ? Color{255, 120, 40, a}
                        : k.drift_level == 1 ? Color{80, 160, 255, a}
                                             : Color{230, 230, 230, a};
      DrawCircleV({tailL.x, tailL.y}, 0.25f * scale_px_per_m_, spark);
      DrawCircleV({tailR.x, tailR.y}, 0.25f * scale_px_per_m_, spark);
    }
  }
}

void ViewerApp::draw_hud_(const SimSnapshot& draw) {
  const double warp = sim_.time_scale.load();

  DrawText(TextFormat("arena=%s  karts=%d  tick=%llu  sim=%.2fs  warp=%s  crc=%016llx",
                      sim_.preset_name(),
                      (int)draw.karts.size(),
                      (unsigned long long)draw.tick,
                      draw.sim_time,
                      warpLabel(warp),
                      (unsigned long long)draw.checksum),
           20, 20, 20, Color{220, 235, 220, 255});

  if (!draw.karts.empty()) {
    const KartPose& me = draw.karts.front();
    DrawText(TextFormat("speed %5.1f km/h  drift %s L%d  boost %.2fs  air %.2fs  wheels %d%s",
                        me.speed_mps * 3.6,
                        driftLabel(me.drift_direction),
                        me.drift_level,
                        me.boost_remaining_s,
                        me.air_time,
                        me.grounded_wheels,
                        me.offroad ? "  OFFROAD" : ""),
             20, 46, 18, Color{235, 220, 220, 255});
  }

  int y = 72;
  for (const auto& line : event_log_) {
    DrawText(line.c_str(), 20, y, 14, Color{200, 200, 120, 255});
    y += 16;
  }

  DrawText("Arrows/WASD: Drive | Shift/Space: Drift | E: Item | R: Respawn | P: Pause | 1..5: Warp | +/-: Zoom | C: Follow | N: Karts | T: Arena",
           20, GetScreenHeight() - 24, 14, Color{190, 205, 190, 255});
}

} // namespace kartsim
