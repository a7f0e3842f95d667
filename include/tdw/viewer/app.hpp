#pragma once
#include <cstdint>
#include <tdw/geom.hpp>
#include <tdw/sim.hpp>
#include <tdw/snap.hpp>

namespace tdw {

class SimRunner;

// RAII application that feeds input to the runner and renders its snapshots.
class ViewerApp {
public:
  explicit ViewerApp(SimRunner& runner);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  TickInput process_input_();
  void log_events_(const TickEvents& ev) const;
  // Rendering
  void render_frame_(const SimSnapshot& draw);
  void draw_ground_(const Rect& view);
  void draw_buildings_(const Rect& view);
  void draw_agents_(const SimSnapshot& draw);
  void draw_debug_(const SimSnapshot& draw);
  void draw_hud_(const SimSnapshot& draw);

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y) const;

  // Dependencies
  SimRunner& runner_;

  // UI state
  bool show_debug_{false};
  std::uint32_t next_seed_{0};
};

} // namespace tdw
