#pragma once
#include <cstdint>
#include <optional>
#include <tdw/geom.hpp>
#include <tdw/world.hpp>

namespace tdw {

using AgentId   = std::uint32_t;
using VehicleId = std::uint32_t;

// Per-tick movement flags for whichever agent the player controls.
struct MoveIntent {
  bool up{false};
  bool down{false};
  bool left{false};
  bool right{false};

  bool any() const { return up || down || left || right; }

  // Raw (unnormalized) direction; up is -y.
  Vec2 direction() const {
    Vec2 d{};
    if (up)    d.y -= 1.0;
    if (down)  d.y += 1.0;
    if (left)  d.x -= 1.0;
    if (right) d.x += 1.0;
    return d;
  }
};

// Player or NPC on foot.
struct Pedestrian {
  AgentId id = 0;
  Vec2    pos{};
  double  speed = 300.0;   // units per second
  double  size = 24.0;     // square box edge
  std::optional<VehicleId> vehicle{};  // set while driving

  bool on_foot() const { return !vehicle.has_value(); }
  Rect rect() const { return rect_at(pos); }
  Rect rect_at(const Vec2& p) const { return Rect::centered_at(p, size, size); }
};

// All-or-nothing walk step: the move is rejected outright if the candidate box
// overlaps any obstacle, then the position is clamped to the world.
// No-op for a pedestrian that is inside a vehicle.
void walk(Pedestrian& p, const Vec2& direction, double dt,
          const ObstacleSet& obstacles, const WorldBounds& bounds);

} // namespace tdw
