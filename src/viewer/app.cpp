#include <raylib.h>
#include <cmath>
#include <cstdio>

#include <tdw/viewer/app.hpp>
#include <tdw/sim_runner.hpp>

namespace tdw {

namespace {

// Palette
static constexpr Color kGrass      = {76, 153, 80, 255};
static constexpr Color kRoad       = {45, 45, 45, 255};
static constexpr Color kRoadEdge   = {60, 60, 60, 255};
static constexpr Color kLaneLine   = {255, 255, 100, 255};
static constexpr Color kPlayer     = {50, 200, 255, 255};
static constexpr Color kCar        = {200, 50, 50, 255};
static constexpr Color kNpc        = {230, 200, 60, 255};
static constexpr Color kMarker     = {255, 100, 255, 255};
static constexpr Color kBuilding   = {150, 140, 130, 255};
static constexpr Color kShadow     = {0, 0, 0, 40};
static constexpr Color kText       = {255, 255, 255, 255};

// Boost color cycling: one full hue turn every 1/rate seconds.
static Color boostColor(double phase, double rate) {
  const double hue = std::fmod(phase * rate, 1.0);
  return ColorFromHSV(float(hue * 360.0), 1.0f, 1.0f);
}

static Keystroke toKeystroke(int key) {
  switch (key) {
    case KEY_UP:    return Keystroke::Up;
    case KEY_DOWN:  return Keystroke::Down;
    case KEY_LEFT:  return Keystroke::Left;
    case KEY_RIGHT: return Keystroke::Right;
    case KEY_A:     return Keystroke::A;
    case KEY_B:     return Keystroke::B;
    default:        return Keystroke::Other;
  }
}

static const char* possessionLabel(PossessionEvent e) {
  switch (e) {
    case PossessionEvent::Entered: return "entered";
    case PossessionEvent::Exited:  return "exited";
    default: return "none";
  }
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(SimRunner& runner) : runner_(runner), next_seed_(runner.seed() + 1) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y) const {
  const Simulation* sim = runner_.sim();
  if (!sim) return {float(x), float(y)};
  const Vec2 s = sim->camera().world_to_screen(Vec2{x, y});
  return {float(s.x), float(s.y)};
}

int ViewerApp::run() {
  const auto& cfg = runner_.config();
  InitWindow(int(cfg.view_w), int(cfg.view_h), "tdworld");
  SetTargetFPS(60);
  TraceLog(LOG_INFO, "TDW: session seed=%u buildings=%d npcs=%d",
           runner_.seed(),
           runner_.sim() ? int(runner_.sim()->obstacles().size()) : 0,
           runner_.sim() ? int(runner_.sim()->npcs().size()) : 0);

  while (!WindowShouldClose()) {
    const TickInput in = process_input_();
    const SimSnapshot& draw = runner_.advance(in, GetFrameTime(), double(GetFPS()));
    if (runner_.reseed_failed()) {
      TraceLog(LOG_WARNING, "TDW: reseed failed, keeping seed=%u", runner_.seed());
    }
    log_events_(runner_.last_events());
    render_frame_(draw);
  }

  CloseWindow();
  return 0;
}

TickInput ViewerApp::process_input_() {
  TickInput in{};
  in.move.up    = IsKeyDown(KEY_W) || IsKeyDown(KEY_UP);
  in.move.down  = IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN);
  in.move.left  = IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT);
  in.move.right = IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT);
  in.interact   = IsKeyPressed(KEY_E);
  in.relocate   = IsKeyDown(KEY_R);

  // Ordered keystroke log for the sequence matcher
  for (int key = GetKeyPressed(); key != 0; key = GetKeyPressed()) {
    in.keys.push_back(toKeystroke(key));
  }

  if (IsKeyPressed(KEY_F1)) show_debug_ = !show_debug_;
  if (IsKeyPressed(KEY_SPACE)) {
    runner_.time_scale = runner_.paused() ? 1.0 : 0.0;
  }
  if (IsKeyPressed(KEY_N)) {
    TraceLog(LOG_INFO, "TDW: reseed requested seed=%u", next_seed_);
    runner_.request_reseed(next_seed_++);
  }
  return in;
}

void ViewerApp::log_events_(const TickEvents& ev) const {
  if (ev.possession != PossessionEvent::None) {
    TraceLog(LOG_INFO, "TDW: player %s vehicle", possessionLabel(ev.possession));
  }
  if (ev.boost_triggered) TraceLog(LOG_INFO, "TDW: boost mode active");
  if (ev.marker_relocated) {
    if (const Simulation* sim = runner_.sim()) {
      TraceLog(LOG_INFO, "TDW: marker relocated to (%.0f, %.0f)", sim->marker().x, sim->marker().y);
    }
  }
  if (ev.vehicle_hits > 0) TraceLog(LOG_DEBUG, "TDW: vehicle bounced off a building");
}

void ViewerApp::render_frame_(const SimSnapshot& draw) {
  const Rect view{draw.camera_x, draw.camera_y, draw.view_w, draw.view_h};

  BeginDrawing();
  ClearBackground(kGrass);

  draw_ground_(view);
  draw_buildings_(view);
  draw_agents_(draw);
  if (show_debug_) draw_debug_(draw);
  draw_hud_(draw);
  EndDrawing();
}

void ViewerApp::draw_ground_(const Rect& view) {
  const Simulation* sim = runner_.sim();
  if (!sim) return;

  for (const auto& r : sim->world().roads) {
    if (!r.overlaps(view)) continue;
    const auto tl = worldToScreen_(r.left, r.top);
    const int x = int(tl.x), y = int(tl.y), w = int(r.width), h = int(r.height);
    DrawRectangle(x, y, w, h, kRoad);
    // Edge strips
    DrawRectangle(x, y, w, 4, kRoadEdge);
    DrawRectangle(x, y + h - 4, w, 4, kRoadEdge);

    // Dashed center line along the long axis
    if (w > h) {
      const int cy = y + h / 2;
      for (int dx = x + 20; dx < x + w - 20; dx += 40) DrawRectangle(dx, cy - 3, 24, 6, kLaneLine);
    } else {
      const int cx = x + w / 2;
      for (int dy = y + 20; dy < y + h - 20; dy += 40) DrawRectangle(cx - 3, dy, 6, 24, kLaneLine);
    }
  }
}

void ViewerApp::draw_buildings_(const Rect& view) {
  const Simulation* sim = runner_.sim();
  if (!sim) return;
  const auto& obs = sim->obstacles().items();

  // Shadows first so no shadow lands on a neighbouring roof
  for (const auto& o : obs) {
    if (!o.rect.overlaps(view)) continue;
    const auto tl = worldToScreen_(o.rect.left, o.rect.top);
    DrawRectangle(int(tl.x) + 8, int(tl.y) + 10, int(o.rect.width), int(o.rect.height), kShadow);
  }
  for (const auto& o : obs) {
    if (!o.rect.overlaps(view)) continue;
    const auto tl = worldToScreen_(o.rect.left, o.rect.top);
    DrawRectangle(int(tl.x), int(tl.y), int(o.rect.width), int(o.rect.height), kBuilding);
    const Color roof{o.roof.r, o.roof.g, o.roof.b, 255};
    DrawRectangle(int(tl.x) + 6, int(tl.y) + 6, int(o.rect.width) - 12, 16, roof);
  }
}

void ViewerApp::draw_agents_(const SimSnapshot& draw) {
  // Marker
  const auto m = worldToScreen_(draw.marker_x, draw.marker_y);
  DrawCircleV({m.x, m.y}, 14.0f, kMarker);
  DrawCircleLines(int(m.x), int(m.y), 20.0f, kMarker);

  for (const auto& n : draw.npcs) {
    const auto p = worldToScreen_(n.x, n.y);
    const float s = float(n.size);
    DrawRectangleV({p.x - s * 0.5f, p.y - s * 0.5f}, {s, s}, kNpc);
  }

  for (const auto& v : draw.vehicles) {
    const auto p = worldToScreen_(v.x, v.y);
    const Color body = (draw.boost_active && v.occupied && draw.player_in_vehicle)
                       ? boostColor(draw.boost_phase, 2.5) : kCar;
    Rectangle box{p.x, p.y, float(v.width), float(v.height)};
    // Shadow, then body rotated about its center
    DrawRectanglePro({p.x + 6.0f, p.y + 8.0f, box.width, box.height},
                     {box.width * 0.5f, box.height * 0.5f}, float(v.heading_deg), kShadow);
    DrawRectanglePro(box, {box.width * 0.5f, box.height * 0.5f}, float(v.heading_deg), body);
    if (v.occupied) DrawCircleV({p.x, p.y}, 4.0f, Color{8, 8, 8, 255});
  }

  if (!draw.player_in_vehicle) {
    const auto p = worldToScreen_(draw.player.x, draw.player.y);
    const float s = float(draw.player.size);
    const Color c = draw.boost_active ? boostColor(draw.boost_phase, 2.0) : kPlayer;
    DrawRectangleV({p.x - s * 0.5f, p.y - s * 0.5f}, {s, s}, c);
    DrawCircleV({p.x, p.y}, 4.0f, Color{8, 8, 8, 255});
  }
}

void ViewerApp::draw_debug_(const SimSnapshot& draw) {
  const Simulation* sim = runner_.sim();
  if (!sim) return;
  for (const auto& o : sim->obstacles().items()) {
    const auto tl = worldToScreen_(o.rect.left, o.rect.top);
    DrawRectangleLines(int(tl.x), int(tl.y), int(o.rect.width), int(o.rect.height), RED);
  }
  const Rect pr = sim->player().rect();
  const auto ptl = worldToScreen_(pr.left, pr.top);
  DrawRectangleLines(int(ptl.x), int(ptl.y), int(pr.width), int(pr.height), BLUE);
  for (const auto& v : sim->vehicles()) {
    const Rect vr = v.rect();
    const auto vtl = worldToScreen_(vr.left, vr.top);
    DrawRectangleLines(int(vtl.x), int(vtl.y), int(vr.width), int(vr.height), YELLOW);
  }
  DrawText(TextFormat("tick=%llu  sim=%.2fs  seed=%u",
                      (unsigned long long)draw.tick, draw.sim_time, runner_.seed()),
           8, int(draw.view_h) - 24, 18, kText);
}

void ViewerApp::draw_hud_(const SimSnapshot& draw) {
  DrawText(TextFormat("FPS: %d   World: %d,%d   Press E to enter/exit car%s",
                      int(draw.fps), int(draw.camera_x), int(draw.camera_y),
                      runner_.paused() ? "   [PAUSED]" : ""),
           8, 8, 20, kText);
  DrawText("Press R near marker to move it. F1 toggles debug. Space pauses, N reseeds.",
           8, 28, 20, kText);
  DrawText("Use WASD or arrows to move/drive.", 8, 48, 20, kText);

  DrawText(TextFormat("Distance to marker: %d", int(draw.marker_distance)), 8, 72, 20, kText);
  if (draw.objective_reached) {
    DrawText("Mission: Reached marker! Press R to teleport it elsewhere.", 8, 96, 20, kText);
  }
}

} // namespace tdw
