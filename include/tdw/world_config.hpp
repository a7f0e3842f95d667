#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <tdw/geom.hpp>
#include <tdw/world.hpp>
#include <tdw/vehicle.hpp>
#include <tdw/wander.hpp>
#include <tdw/possession.hpp>

namespace tdw {

struct Range {
  double lo = 0.0;
  double hi = 0.0;
};

// Jittered grid of buildings near the city center.
struct BuildingGrid {
  double x0 = 900.0,  x1 = 1700.0, x_step = 320.0;   // x in [x0, x1)
  double y0 = 500.0,  y1 = 1100.0, y_step = 260.0;   // y in [y0, y1)
  double jitter = 30.0;
  Range  width{120.0, 180.0};
  Range  height{100.0, 180.0};
};

// Buildings dropped anywhere in the world.
struct ScatteredBuildings {
  std::size_t count = 6;
  double edge_margin = 100.0;   // min distance from left/top edges
  double far_margin = 300.0;    // min distance from right/bottom edges
  Range  size{80.0, 180.0};
};

// Everything needed to build a session; defaults reproduce the stock city.
struct WorldConfig {
  WorldBounds bounds{};
  double view_w = 1280.0;
  double view_h = 720.0;

  BuildingGrid        grid{};
  ScatteredBuildings  scattered{};
  Rgb                 roof_base{170, 160, 150};
  int                 roof_jitter = 10;
  std::vector<Rect>   buildings{};  // explicit layout; replaces procedural buildings when non-empty
  std::vector<Rect>   roads{};      // cosmetic only

  Vec2   marker{2200.0, 1600.0};
  double objective_radius = 100.0;
  double marker_margin = 200.0;

  // Player spawn region is [lo, W - hi] x [lo, H - hi]
  double player_spawn_lo = 100.0;
  double player_spawn_hi = 1000.0;
  double player_size = 24.0;
  double player_speed = 300.0;
  double boost_speed = 1200.0;

  std::size_t npc_count = 10;
  double npc_spawn_margin = 100.0;
  double npc_size = 20.0;
  Range  npc_speed{30.0, 110.0};
  WanderParams wander{};

  Vec2 vehicle_spawn{430.0, 30.0};
  VehicleParams vehicle{};
  PossessionParams possession{};

  std::size_t spawn_attempts = 10000;  // rejection-sampling budget per agent
};

// Stock configuration including the four default roads.
WorldConfig default_world_config();

// Stream-based loader (test-friendly; no filesystem required).
// Starts from default_world_config() and applies "key = value" lines.
// Blank lines and '#' comments are ignored; unknown keys and malformed values are skipped.
// "road = x,y,w,h" and "building = x,y,w,h" append rectangles.
// Out-of-range values (non-positive sizes, negative speeds or radii, friction
// outside (0, 1], counts that are fractional or too large) are skipped, and a
// min/max pair given in the wrong order reverts to the stock pair.
// Lines that were not applied are appended to *rejected when it is given.
WorldConfig world_config_from_stream(std::istream& in,
                                     std::vector<std::string>* rejected = nullptr);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<WorldConfig> load_world_config(const std::string& path,
                                             std::vector<std::string>* rejected = nullptr);

} // namespace tdw
